#include "commands/deconstruct.hpp"
#include "commands/CliArgs.hpp"

#include "io/DocumentLoader.hpp"
#include "io/JsonIO.hpp"
#include "paper/Segmenter.hpp"
#include "report/MarkdownRenderer.hpp"
#include "report/Report.hpp"
#include "summ/LeadSummarizer.hpp"
#include "summ/MockSummarizer.hpp"
#include "summ/OllamaSummarizer.hpp"
#include "summ/Summarizer.hpp"

#ifdef PAPERDECON_WITH_ONNX
#include "emb/MiniLmEmbedder.hpp"
#include "summ/EmbeddingSummarizer.hpp"
#endif

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int deconstruct_usage() {
    std::cerr
        << "usage:\n"
        << "  paper-deconstructor deconstruct --input <pdf|txt> --output <md> --section <name> [--section <name> ...]\n"
        << "\n"
        << "sections:\n"
        << "  title abstract summary introduction method results conclusion\n"
        << "  contribution literature_review references all\n"
        << "\n"
        << "options:\n"
        << "  --min_length <n>             default: 40 (also --min-length)\n"
        << "  --max_length <n>             default: 150 (also --max-length)\n"
        << "  --summarizer <name>          lead|none|mock|ollama|embedding (default: lead)\n"
        << "  --config <path>              segmenter config overrides (JSON)\n"
        << "  --json <path>                also write the section map as JSON\n"
        << "  --flag_missing               keep absent sections in the report as a note\n"
        << "  --omit_low_confidence        drop a fallback contribution\n"
        << "  --verbose                    print heading diagnostics\n"
        << "\n"
        << "summarizer back ends:\n"
        << "  --mock_dir <dir>             canned <key>.txt summaries (mock)\n"
        << "  --ollama_model <str>         default: llama3.1:8b\n"
        << "  --ollama_cache <dir>         default: out/ollama_cache\n"
        << "  --emb_model <path>           default: models/emb/model.onnx\n"
        << "  --emb_vocab <path>           default: models/emb/vocab.txt\n";
    return 2;
}

struct SummarizerHolder {
#ifdef PAPERDECON_WITH_ONNX
    std::unique_ptr<emb::MiniLmEmbedder> embedder;
#endif
    std::unique_ptr<summ::Summarizer> summarizer;
};

static bool make_summarizer(int argc, char** argv, const std::string& name, SummarizerHolder& h) {
    if (name == "lead") {
        h.summarizer = std::make_unique<summ::LeadSummarizer>();
        return true;
    }
    if (name == "none") {
        h.summarizer = std::make_unique<summ::NullSummarizer>();
        return true;
    }
    if (name == "mock") {
        const std::string dir = cli::get_arg(argc, argv, "--mock_dir", "");
        if (dir.empty()) {
            std::cerr << "[error] --summarizer mock requires --mock_dir\n";
            return false;
        }
        h.summarizer = std::make_unique<summ::MockSummarizer>(dir);
        return true;
    }
    if (name == "ollama") {
        h.summarizer = std::make_unique<summ::OllamaSummarizer>(cli::get_arg(argc, argv, "--ollama_model", "llama3.1:8b"),
                                                                cli::get_arg(argc, argv, "--ollama_cache", "out/ollama_cache"));
        return true;
    }
    if (name == "embedding") {
#ifdef PAPERDECON_WITH_ONNX
        h.embedder = std::make_unique<emb::MiniLmEmbedder>();
        if (!h.embedder->init(cli::get_arg(argc, argv, "--emb_model", "models/emb/model.onnx"),
                              cli::get_arg(argc, argv, "--emb_vocab", "models/emb/vocab.txt"))) {
            std::cerr << "[error] failed to load embedding model\n";
            return false;
        }
        h.summarizer = std::make_unique<summ::EmbeddingSummarizer>(*h.embedder);
        return true;
#else
        std::cerr << "[error] this build has no onnxruntime; --summarizer embedding is unavailable\n";
        return false;
#endif
    }

    std::cerr << "[error] unknown summarizer: " << name << "\n";
    return false;
}

static void print_diagnostics(const paper::SegmentationResult& r) {
    for (const auto& d : r.diagnostics) {
        std::cerr << "[warn] " << paper::error_code_str(d.code) << ": " << d.message << "\n";
    }
}

int cmd_deconstruct(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) {
        deconstruct_usage();
        return 0;
    }

    const std::string input = cli::get_arg(argc, argv, "--input", "");
    const std::string output = cli::get_arg(argc, argv, "--output", "");
    const std::vector<std::string> requested = cli::get_all_args(argc, argv, "--section");

    if (input.empty()) {
        std::cerr << "error: missing --input\n";
        return deconstruct_usage();
    }
    if (output.empty()) {
        std::cerr << "error: missing --output\n";
        return deconstruct_usage();
    }
    if (requested.empty()) {
        std::cerr << "error: at least one --section is required\n";
        return deconstruct_usage();
    }
    for (const auto& key : requested) {
        if (!paper::is_request_key(key)) {
            std::cerr << "error: invalid --section: " << key << "\n";
            return deconstruct_usage();
        }
    }

    report::ReportConfig rcfg;
    if (!cli::parse_length_bounds(argc, argv, rcfg.min_length, rcfg.max_length)) {
        std::cerr << "error: --min_length/--max_length must be integers\n";
        return deconstruct_usage();
    }
    rcfg.flag_missing = cli::has_flag(argc, argv, "--flag_missing");
    rcfg.omit_low_confidence = cli::has_flag(argc, argv, "--omit_low_confidence");
    const bool verbose = cli::has_flag(argc, argv, "--verbose");

    SummarizerHolder holder;
    if (!make_summarizer(argc, argv, cli::get_arg(argc, argv, "--summarizer", "lead"), holder)) return 2;

    paper::SegmenterConfig cfg;
    const std::string config_path = cli::get_arg(argc, argv, "--config", "");
    if (!config_path.empty()) {
        try {
            cfg = loadSegmenterConfig(config_path);
        } catch (const std::exception& e) {
            std::cerr << "[error] failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "Processing " << input << "...\n";

    paper::SegmentationResult seg;
    try {
        seg = paper::segment_document(loadDocumentLines(input), cfg);
    } catch (const paper::SegmentationError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to read input: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Found sections:";
    for (auto name : seg.map.names()) std::cout << " " << paper::section_key(name);
    std::cout << "\n";
    if (verbose) print_diagnostics(seg);

    std::cout << "Generating report for sections:";
    for (const auto& k : requested) std::cout << " " << k;
    std::cout << "\n";

    const report::Report rep = report::build_report(seg.map, requested, *holder.summarizer, rcfg);

    for (const auto& s : rep.sections) {
        std::cout << "Processing section: " << s.heading << "...\n";
        if (s.status == report::SectionStatus::NotFound) {
            std::cout << "  - Section not found or extracted.\n";
        } else if (s.status == report::SectionStatus::SummaryFailed) {
            std::cerr << "[warn] " << s.key << ": " << s.error_message << "\n";
        } else if (s.status == report::SectionStatus::Omitted) {
            std::cout << "  - Omitted (low confidence).\n";
        }
    }

    try {
        report::write_markdown(fs::path(output), report::render_markdown(rep, rcfg.flag_missing));

        const std::string json_path = cli::get_arg(argc, argv, "--json", "");
        if (!json_path.empty()) {
            writeJsonFile(fs::path(json_path), segmentationToJson(seg));
            std::cout << "OUT_JSON: " << json_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "OUT_REPORT: " << output << "\n";
    return 0;
}
