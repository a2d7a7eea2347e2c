#include "paper/VirtualSections.hpp"
#include "paper/TextUtil.hpp"

#include <cctype>
#include <cmath>
#include <map>
#include <set>

namespace paper {

static std::string strip_name_marks(const std::string& w) {
    // "Doe1*" -> "Doe", "(Smith)" -> "Smith"; inner dots and hyphens stay
    size_t a = 0, b = w.size();
    while (a < b && !std::isalpha(static_cast<unsigned char>(w[a]))) ++a;
    while (b > a && !std::isalpha(static_cast<unsigned char>(w[b - 1]))) --b;
    return w.substr(a, b - a);
}

static bool is_name_word(const std::string& w) {
    static const std::set<std::string> particles = {"van", "von", "de", "der", "den", "da", "di", "del", "la", "le"};
    if (particles.count(w)) return true;
    return std::isupper(static_cast<unsigned char>(w[0])) != 0;
}

// digits, '*' or "J." style initials attached to a name
static bool has_name_mark(const std::string& raw, const std::string& stripped) {
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '*') return true;
    }
    return stripped.size() == 1 && raw.find('.') != std::string::npos;
}

static bool looks_like_author_list(const std::string& text) {
    std::vector<std::vector<std::string>> parts(1);
    bool comma = false;
    bool marks = false;

    for (const auto& raw : textutil::split_words(text)) {
        if (raw == "and" || raw == "&") {
            if (!parts.back().empty()) parts.emplace_back();
            continue;
        }
        const bool closes = raw.back() == ',';
        const std::string w = strip_name_marks(raw);
        if (closes) comma = true;
        if (has_name_mark(raw, w)) marks = true;
        if (!w.empty()) parts.back().push_back(w);
        if (closes && !parts.back().empty()) parts.emplace_back();
    }
    if (parts.back().empty()) parts.pop_back();

    // "Graph Neural Networks and Deep Learning" is a title, not two names
    if (!comma && !marks) return false;
    if (parts.size() < 2) return false;
    for (const auto& p : parts) {
        if (p.size() < 2 || p.size() > 4) return false;
        for (const auto& w : p) {
            if (!is_name_word(w)) return false;
        }
    }
    return true;
}

bool is_author_line(const std::string& text, const SegmenterConfig& cfg) {
    if (text.find('@') != std::string::npos) return true;

    const std::string lc = textutil::to_lower_ascii(text);
    for (const auto& kw : cfg.affiliation_keywords) {
        if (!kw.empty() && lc.find(kw) != std::string::npos) return true;
    }

    if (text.size() > cfg.virtuals.author_line_max_length) return false;
    return looks_like_author_list(text);
}

std::unordered_set<std::string> find_running_headers(const std::vector<Line>& lines, const VirtualConfig& cfg) {
    std::map<std::string, std::set<int>> pages_by_text;
    for (const auto& l : lines) {
        if (l.text.size() > cfg.running_header_max_length) continue;
        if (!textutil::is_all_caps(l.text)) continue;
        pages_by_text[l.text].insert(l.page_index);
    }

    std::unordered_set<std::string> out;
    for (const auto& [text, pages] : pages_by_text) {
        if (static_cast<int>(pages.size()) >= cfg.running_header_min_pages) out.insert(text);
    }
    return out;
}

bool extract_title(const std::vector<Line>& lines, const std::vector<SectionSpan>& resolved,
                   const SegmenterConfig& cfg, SectionSpan& out) {
    if (lines.empty()) return false;

    out = SectionSpan{};
    out.name = SectionName::Title;
    out.is_virtual = true;

    if (resolved.empty()) {
        out.start_line = 0;
        out.end_line = 1;
        out.heading_line = 0;
        out.text = lines[0].text;
        return true;
    }

    const size_t region_end = resolved.front().start_line;
    const auto running = find_running_headers(lines, cfg.virtuals);

    size_t best_start = 0, best_end = 0, best_chars = 0;
    size_t run_start = 0, run_chars = 0;
    bool in_run = false;

    auto close_run = [&](size_t end) {
        if (in_run && run_chars > best_chars) {
            best_start = run_start;
            best_end = end;
            best_chars = run_chars;
        }
        in_run = false;
        run_chars = 0;
    };

    for (size_t i = 0; i < region_end && i < lines.size(); ++i) {
        const Line& l = lines[i];
        const bool excluded = running.count(l.text) > 0 || is_author_line(l.text, cfg);

        if (excluded) {
            close_run(i);
            continue;
        }
        if (l.blank_before) close_run(i);
        if (!in_run) {
            in_run = true;
            run_start = i;
        }
        run_chars += l.text.size();
    }
    close_run(region_end);

    if (best_chars == 0) {
        // everything ahead of the first heading looked like metadata; take the
        // first line that is not an address or a running header
        for (size_t i = 0; i < region_end && i < lines.size(); ++i) {
            const Line& l = lines[i];
            if (l.text.find('@') != std::string::npos || running.count(l.text) > 0) continue;
            out.start_line = i;
            out.end_line = i + 1;
            out.heading_line = i;
            out.text = l.text;
            return true;
        }
        return false;
    }

    std::vector<std::string> parts;
    for (size_t i = best_start; i < best_end; ++i) parts.push_back(lines[i].text);

    out.start_line = best_start;
    out.end_line = best_end;
    out.heading_line = best_start;
    out.text = textutil::join(parts, " ");
    return true;
}

static const SectionSpan* find_span(const std::vector<SectionSpan>& spans, SectionName name) {
    for (const auto& s : spans) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

struct ScopedText {
    size_t first_line = 0;
    std::string text;    // lines joined with single spaces
};

static std::string flatten(const std::vector<Line>& lines, size_t begin, size_t end) {
    std::vector<std::string> parts;
    for (size_t i = begin; i < end && i < lines.size(); ++i) parts.push_back(lines[i].text);
    return textutil::join(parts, " ");
}

static std::vector<ScopedText> contribution_scope(const std::vector<Line>& lines,
                                                  const std::vector<SectionSpan>& resolved,
                                                  const VirtualConfig& cfg) {
    std::vector<ScopedText> scope;
    for (const auto& s : resolved) {
        if (s.name != SectionName::Abstract && s.name != SectionName::Introduction) continue;
        scope.push_back(ScopedText{s.heading_line + 1, flatten(lines, s.heading_line + 1, s.end_line)});
    }
    if (!scope.empty()) return scope;

    size_t head = static_cast<size_t>(std::ceil(static_cast<double>(lines.size()) * cfg.contribution_scope_fraction));
    if (head == 0) head = 1;
    scope.push_back(ScopedText{0, flatten(lines, 0, head)});
    return scope;
}

bool extract_contribution(const std::vector<Line>& lines, const std::vector<SectionSpan>& resolved,
                          const SegmenterConfig& cfg, SectionSpan& out) {
    // a document without any heading only gets title and summary
    if (lines.empty() || resolved.empty()) return false;

    out = SectionSpan{};
    out.name = SectionName::Contribution;
    out.is_virtual = true;

    std::vector<std::string> cues;
    cues.reserve(cfg.contribution_cues.size());
    for (const auto& c : cfg.contribution_cues) cues.push_back(textutil::normalize(c));

    std::vector<std::string> hits;
    std::set<std::string> seen;
    size_t first_line = 0;

    for (const auto& part : contribution_scope(lines, resolved, cfg.virtuals)) {
        for (const auto& sentence : textutil::split_sentences(part.text)) {
            const std::string norm = textutil::normalize(sentence);
            bool cued = false;
            for (const auto& cue : cues) {
                if (textutil::contains_phrase(norm, cue)) {
                    cued = true;
                    break;
                }
            }
            if (!cued || !seen.insert(sentence).second) continue;
            if (hits.empty()) first_line = part.first_line;
            hits.push_back(sentence);
        }
    }

    if (!hits.empty()) {
        out.text = textutil::join(hits, cfg.virtuals.contribution_separator);
        out.start_line = out.end_line = out.heading_line = first_line;
        return true;
    }

    const SectionSpan* abstract = find_span(resolved, SectionName::Abstract);
    if (!abstract) return false;

    const auto sentences = textutil::split_sentences(flatten(lines, abstract->heading_line + 1, abstract->end_line));
    if (sentences.empty()) return false;

    std::vector<std::string> lead;
    for (size_t i = 0; i < sentences.size() && i < cfg.virtuals.fallback_sentences; ++i) lead.push_back(sentences[i]);

    out.text = textutil::join(lead, cfg.virtuals.contribution_separator);
    out.start_line = out.end_line = out.heading_line = abstract->heading_line + 1;
    out.low_confidence = true;
    return true;
}

}  // namespace paper
