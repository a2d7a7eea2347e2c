#include "summ/OllamaSummarizer.hpp"
#include "io/ProcUtil.hpp"
#include "nlohmann/json.hpp"
#include "paper/TextUtil.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace summ {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool ensure_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    return !ec;
}

std::string fnv1a64_hex(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= static_cast<uint64_t>(c);
        h *= 1099511628211ull;
    }

    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[h & 0xF];
        h >>= 4;
    }
    return out;
}

OllamaSummarizer::OllamaSummarizer(const std::string& model, const std::string& cache_dir,
                                   const std::string& endpoint, size_t max_input_chars)
    : model_(model), cache_dir_(cache_dir), endpoint_(endpoint), max_input_chars_(max_input_chars) {
    ensure_dir(cache_dir_);
}

std::string OllamaSummarizer::cache_key(const std::string& text, int min_length, int max_length) const {
    std::ostringstream s;
    s << model_ << "\n" << min_length << "-" << max_length << "\n" << text;
    return "summary_v1-" + fnv1a64_hex(s.str());
}

bool OllamaSummarizer::load_cache(const std::string& key, std::string& out) const {
    fs::path p = cache_dir_ / (key + ".txt");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return !out.empty();
}

void OllamaSummarizer::save_cache(const std::string& key, const std::string& content) const {
    fs::path p = cache_dir_ / (key + ".txt");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) return;
    f << content;
}

std::string OllamaSummarizer::prompt_summary(const std::string& key, const std::string& text, int min_length,
                                             int max_length) const {
    std::ostringstream p;
    p << "Summarize the following " << (key == "summary" ? std::string("research paper") : "\"" + key + "\" section of a research paper")
      << ".\n"
      << "Return ONLY the summary as plain text. No markdown. No commentary.\n"
      << "Use between " << min_length << " and " << max_length << " words.\n"
      << "Keep technical terms and numbers exactly as written.\n\n"
      << "Text:\n"
      << text;
    return p.str();
}

std::string OllamaSummarizer::run_ollama(const std::string& prompt, int max_length) const {
    if (!ensure_dir(cache_dir_)) throw SummarizeError("backend_failure", "cannot create cache dir: " + cache_dir_.string());

    fs::path payload = cache_dir_ / "ollama_payload.tmp.json";
    fs::path resp    = cache_dir_ / "ollama_response.tmp.json";
    fs::path err     = cache_dir_ / "ollama_curl_error.tmp.txt";

    {
        std::ofstream f(payload, std::ios::out | std::ios::trunc);
        if (!f) throw SummarizeError("backend_failure", "cannot write " + payload.string());

        json body = {
            {"model", model_},
            {"prompt", prompt},
            {"stream", false},
            {"options", {{"temperature", 0}, {"num_predict", max_length * 2}}},
        };
        f << body.dump();
    }

    // write response to a file to keep quoting simple
    std::ostringstream cmd;
    cmd << "curl -s -o " << procutil::shell_quote(resp.string()) << " " << procutil::shell_quote(endpoint_)
        << " -H 'Content-Type: application/json'"
        << " --data-binary @" << procutil::shell_quote(payload.string())
        << " 2> " << procutil::shell_quote(err.string());

    const int code = procutil::run_wait_exitcode(cmd.str());
    if (code != 0) throw SummarizeError("backend_failure", "curl exited with code " + std::to_string(code));

    std::ifstream rf(resp, std::ios::in);
    if (!rf) throw SummarizeError("backend_failure", "no response file from ollama");
    const std::string out = read_all(rf);

    json j;
    try {
        j = json::parse(out);
    } catch (const std::exception& e) {
        throw SummarizeError("backend_failure", std::string("bad ollama response: ") + e.what());
    }

    if (j.contains("error") && j["error"].is_string()) {
        throw SummarizeError("backend_failure", "ollama: " + j["error"].get<std::string>());
    }
    if (!j.contains("response") || !j["response"].is_string()) {
        throw SummarizeError("backend_failure", "ollama response has no text");
    }
    return textutil::trim(j["response"].get<std::string>());
}

std::string OllamaSummarizer::summarize(const std::string& key, const std::string& text, int min_length,
                                        int max_length) {
    check_request(text, min_length, max_length);

    const std::string ck = cache_key(text, min_length, max_length);

    std::string cached;
    if (load_cache(ck, cached)) return cached;

    std::string out = run_ollama(prompt_summary(key, text, min_length, max_length), max_length);
    if (out.empty()) throw SummarizeError("backend_failure", "ollama returned an empty summary");

    save_cache(ck, out);
    return out;
}

} // namespace summ
