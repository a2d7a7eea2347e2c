#include "paper/HeadingDetector.hpp"
#include "paper/TextUtil.hpp"

#include <cctype>

namespace paper {

static bool is_roman_char(char c) {
    return c == 'I' || c == 'V' || c == 'X' || c == 'L' || c == 'C' || c == 'D' || c == 'M';
}

static bool is_space_char(char c) {
    return c == ' ' || c == '\t';
}

// Returns the position right after the enumerator and its separator, or 0.
static size_t enumerator_end(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();

    if (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) {
        while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        // dotted sub-levels: 2.1, 2.1.3
        while (i + 1 < n && s[i] == '.' && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
            ++i;
            while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
    } else {
        while (i < n && i < 5 && is_roman_char(s[i])) ++i;
        if (i == 0) return 0;
    }

    if (i < n && (s[i] == '.' || s[i] == ')')) ++i;
    if (i >= n || !is_space_char(s[i])) return 0;
    while (i < n && is_space_char(s[i])) ++i;
    return i;
}

StrippedHeading strip_enumerator(const std::string& line) {
    StrippedHeading out;
    std::string t = textutil::trim(line);

    const size_t cut = enumerator_end(t);
    if (cut > 0 && cut < t.size()) {
        t = t.substr(cut);
        out.enumerated = true;
    }

    while (!t.empty() && (t.back() == ':' || t.back() == ' ')) t.pop_back();
    out.text = t;
    return out;
}

static bool ends_like_sentence(const std::string& s) {
    if (s.empty()) return false;
    const char c = s.back();
    return c == '.' || c == ',' || c == ';';
}

static double format_score(const std::string& text, const DetectorConfig& cfg) {
    if (textutil::is_all_caps(text)) return cfg.all_caps_score;
    if (textutil::is_title_case(text)) return cfg.title_case_score;
    return cfg.plain_case_score;
}

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

std::vector<Candidate> detect_heading_candidates(const std::vector<Line>& lines, const SegmenterConfig& cfg) {
    const DetectorConfig& dc = cfg.detector;
    std::vector<Candidate> out;

    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& line = lines[i];

        if (line.text.size() > dc.max_heading_length) continue;

        const bool page_start = i == 0 || lines[i - 1].page_index != line.page_index;
        if (dc.require_boundary && !line.blank_before && !page_start) continue;

        if (ends_like_sentence(line.text)) continue;

        const StrippedHeading sh = strip_enumerator(line.text);
        const AliasMatch m = match_heading_alias(cfg.aliases, textutil::to_lower_ascii(sh.text));
        if (!m.matched) continue;

        double conf = dc.exact_match_weight * (m.exact ? 1.0 : dc.prefix_match_score) +
                      dc.format_weight * format_score(sh.text, dc);
        if (sh.enumerated) conf += dc.enumerator_bonus;
        conf = clamp01(conf);

        if (conf < dc.min_candidate_confidence) continue;

        Candidate c;
        c.line_index = i;
        c.name = m.name;
        c.confidence = conf;
        c.matched_alias = m.alias;
        out.push_back(std::move(c));
    }

    return out;
}

}  // namespace paper
