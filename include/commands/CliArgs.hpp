#pragma once
#include <string>
#include <vector>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);

// value following the first `key`, or `def`
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// values following every occurrence of `key`, in order
std::vector<std::string> get_all_args(int argc, char** argv, const std::string& key);

// false when the value is present but not a whole integer; `out` = `def` when absent
bool get_arg_int(int argc, char** argv, const std::string& key, int def, int& out);

// --min_length/--max_length, also spelled --min-length/--max-length.
// Both values keep their incoming defaults when absent.
bool parse_length_bounds(int argc, char** argv, int& min_length, int& max_length);

}  // namespace cli
