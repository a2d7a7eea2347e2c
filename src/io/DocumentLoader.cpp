#include "io/DocumentLoader.hpp"
#include "io/ProcUtil.hpp"
#include "paper/LineNormalizer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string lower_ext(const fs::path& p) {
    std::string e = p.extension().string();
    for (char& c : e) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return e;
}

std::string loadDocumentText(const std::string& path) {
    fs::path p(path);
    if (!fs::exists(p)) throw std::runtime_error("input not found: " + path);

    if (lower_ext(p) != ".pdf") return read_all(p);

    const std::string cmd = "pdftotext -enc UTF-8 " + procutil::shell_quote(p.string()) + " - 2>/dev/null";
    std::string text = procutil::run_capture_stdout(cmd);
    if (text.empty()) throw std::runtime_error("pdftotext failed or produced no text for: " + path);
    return text;
}

std::vector<paper::RawLine> loadDocumentLines(const std::string& path) {
    return paper::split_raw_lines(loadDocumentText(path));
}
