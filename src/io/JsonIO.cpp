#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::vector<std::string> require_string_array(const json& arr, const std::string& where) {
    if (!arr.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static void read_bool(const json& j, const char* key, const std::string& where, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    out = j.at(key).get<bool>();
}

static void read_double(const json& j, const char* key, const std::string& where, double& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    out = j.at(key).get<double>();
}

static void read_count(const json& j, const char* key, const std::string& where, size_t& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_unsigned()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a non-negative integer");
    }
    out = j.at(key).get<size_t>();
}

static void read_int(const json& j, const char* key, const std::string& where, int& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    out = j.at(key).get<int>();
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    out = j.at(key).get<std::string>();
}

static std::vector<std::string> lowercase_all(std::vector<std::string> v) {
    for (auto& s : v) {
        for (char& c : s) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return v;
}

paper::SegmenterConfig parseSegmenterConfig(const json& j) {
    require_object(j, "config");

    paper::SegmenterConfig cfg;

    if (j.contains("normalizer")) {
        const json& n = j.at("normalizer");
        require_object(n, "config.normalizer");
        read_int(n, "page_number_max_digits", "config.normalizer", cfg.normalizer.page_number_max_digits);
        read_bool(n, "dehyphenate", "config.normalizer", cfg.normalizer.dehyphenate);
    }

    if (j.contains("detector")) {
        const json& d = j.at("detector");
        require_object(d, "config.detector");
        read_count(d, "max_heading_length", "config.detector", cfg.detector.max_heading_length);
        read_bool(d, "require_boundary", "config.detector", cfg.detector.require_boundary);
        read_double(d, "min_candidate_confidence", "config.detector", cfg.detector.min_candidate_confidence);
        read_double(d, "exact_match_weight", "config.detector", cfg.detector.exact_match_weight);
        read_double(d, "format_weight", "config.detector", cfg.detector.format_weight);
        read_double(d, "enumerator_bonus", "config.detector", cfg.detector.enumerator_bonus);
    }

    if (j.contains("resolver")) {
        const json& r = j.at("resolver");
        require_object(r, "config.resolver");
        read_count(r, "min_content_words", "config.resolver", cfg.resolver.min_content_words);
    }

    if (j.contains("virtual")) {
        const json& v = j.at("virtual");
        require_object(v, "config.virtual");
        read_count(v, "author_line_max_length", "config.virtual", cfg.virtuals.author_line_max_length);
        read_count(v, "running_header_max_length", "config.virtual", cfg.virtuals.running_header_max_length);
        read_int(v, "running_header_min_pages", "config.virtual", cfg.virtuals.running_header_min_pages);
        read_double(v, "contribution_scope_fraction", "config.virtual", cfg.virtuals.contribution_scope_fraction);
        read_count(v, "fallback_sentences", "config.virtual", cfg.virtuals.fallback_sentences);
        read_string(v, "contribution_separator", "config.virtual", cfg.virtuals.contribution_separator);

        const double f = cfg.virtuals.contribution_scope_fraction;
        if (f <= 0.0 || f > 1.0) {
            throw std::runtime_error("config.virtual.contribution_scope_fraction must be in (0, 1]");
        }
    }

    if (j.contains("aliases")) {
        const json& a = j.at("aliases");
        require_object(a, "config.aliases");
        for (const auto& item : a.items()) {
            paper::SectionName name;
            if (!paper::parse_section_key(item.key(), name)) {
                throw std::runtime_error("config.aliases has unknown section: " + item.key());
            }
            auto patterns = lowercase_all(require_string_array(item.value(), "config.aliases." + item.key()));
            for (auto& entry : cfg.aliases) {
                if (entry.name == name) entry.patterns = std::move(patterns);
            }
        }
    }

    if (j.contains("contribution_cues")) {
        cfg.contribution_cues = require_string_array(j.at("contribution_cues"), "config.contribution_cues");
    }

    if (j.contains("affiliation_keywords")) {
        cfg.affiliation_keywords =
            lowercase_all(require_string_array(j.at("affiliation_keywords"), "config.affiliation_keywords"));
    }

    return cfg;
}

paper::SegmenterConfig loadSegmenterConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parseSegmenterConfig(j);
}

static json span_to_json(const paper::SectionSpan& s) {
    return {
        {"name", paper::section_key(s.name)},
        {"start_line", s.start_line},
        {"end_line", s.end_line},
        {"heading_line", s.heading_line},
        {"virtual", s.is_virtual},
        {"low_confidence", s.low_confidence},
        {"text", s.text},
    };
}

json segmentationToJson(const paper::SegmentationResult& r) {
    json j;
    j["line_count"] = r.lines.size();

    json sections = json::array();
    for (const auto& s : r.map.entries()) sections.push_back(span_to_json(s));
    j["sections"] = sections;

    json cands = json::array();
    for (const auto& c : r.candidates) {
        cands.push_back({
            {"line_index", c.line_index},
            {"name", paper::section_key(c.name)},
            {"confidence", c.confidence},
            {"matched_alias", c.matched_alias},
            {"text", c.line_index < r.lines.size() ? r.lines[c.line_index].text : std::string()},
        });
    }
    j["candidates"] = cands;

    json diags = json::array();
    for (const auto& d : r.diagnostics) {
        diags.push_back({
            {"code", paper::error_code_str(d.code)},
            {"message", d.message},
            {"line_index", d.line_index},
        });
    }
    j["diagnostics"] = diags;

    return j;
}

void writeJsonFile(const std::filesystem::path& path, const json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}
