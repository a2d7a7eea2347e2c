#include "commands/CliArgs.hpp"

#include <stdexcept>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::vector<std::string> get_all_args(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) out.push_back(argv[++i]);
    }
    return out;
}

bool get_arg_int(int argc, char** argv, const std::string& key, int def, int& out) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) {
        out = def;
        return true;
    }
    try {
        size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool get_int_either(int argc, char** argv, const std::string& a, const std::string& b, int& value) {
    const std::string key = has_flag(argc, argv, a) ? a : b;
    return get_arg_int(argc, argv, key, value, value);
}

bool parse_length_bounds(int argc, char** argv, int& min_length, int& max_length) {
    return get_int_either(argc, argv, "--min_length", "--min-length", min_length) &&
           get_int_either(argc, argv, "--max_length", "--max-length", max_length);
}

}  // namespace cli
