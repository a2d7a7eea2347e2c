#include "commands/sections.hpp"
#include "commands/CliArgs.hpp"

#include "io/DocumentLoader.hpp"
#include "io/JsonIO.hpp"
#include "paper/Segmenter.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int sections_usage() {
    std::cerr
        << "usage:\n"
        << "  paper-deconstructor sections --input <pdf|txt> [--config <path>] [--json <path>] [--verbose]\n";
    return 2;
}

static std::string preview(const std::string& text, size_t n) {
    std::string s;
    for (char c : text) {
        if (s.size() >= n) break;
        s.push_back(c == '\n' ? ' ' : c);
    }
    if (text.size() > n) s += "...";
    return s;
}

int cmd_sections(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) {
        sections_usage();
        return 0;
    }

    const std::string input = cli::get_arg(argc, argv, "--input", "");
    if (input.empty()) {
        std::cerr << "error: missing --input\n";
        return sections_usage();
    }

    paper::SegmentationResult seg;
    try {
        paper::SegmenterConfig cfg;
        const std::string config_path = cli::get_arg(argc, argv, "--config", "");
        if (!config_path.empty()) cfg = loadSegmenterConfig(config_path);

        seg = paper::segment_document(loadDocumentLines(input), cfg);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "LINES: " << seg.lines.size() << "\n";
    for (const auto& s : seg.map.entries()) {
        std::cout << "[" << paper::section_key(s.name) << "]";
        if (s.is_virtual) std::cout << " (virtual)";
        if (s.low_confidence) std::cout << " (low confidence)";
        std::cout << " lines " << s.start_line << "-" << s.end_line << "\n";
        std::cout << "  " << preview(s.text, 100) << "\n";
    }

    if (cli::has_flag(argc, argv, "--verbose")) {
        for (const auto& c : seg.candidates) {
            std::cout << "  candidate line " << c.line_index << " -> " << paper::section_key(c.name)
                      << " (" << c.matched_alias << ", " << c.confidence << "): " << seg.lines[c.line_index].text << "\n";
        }
        for (const auto& d : seg.diagnostics) {
            std::cerr << "[warn] " << paper::error_code_str(d.code) << ": " << d.message << "\n";
        }
    }

    const std::string json_path = cli::get_arg(argc, argv, "--json", "");
    if (!json_path.empty()) {
        try {
            writeJsonFile(fs::path(json_path), segmentationToJson(seg));
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
        std::cout << "OUT_JSON: " << json_path << "\n";
    }

    return 0;
}
