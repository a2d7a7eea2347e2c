#include "paper/LineNormalizer.hpp"
#include "paper/TextUtil.hpp"

#include <cctype>

namespace paper {

std::vector<RawLine> split_raw_lines(const std::string& text) {
    std::vector<RawLine> lines;
    std::string cur;
    cur.reserve(128);
    int page = 0;

    for (char ch : text) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            lines.push_back(RawLine{cur, page});
            cur.clear();
        } else if (ch == '\f') {
            if (!cur.empty()) lines.push_back(RawLine{cur, page});
            cur.clear();
            ++page;
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) lines.push_back(RawLine{cur, page});
    return lines;
}

static bool blank_at(const std::vector<std::string>& cleaned, size_t i) {
    return cleaned[i].empty();
}

static bool is_page_number(const std::vector<RawLine>& raw, const std::vector<std::string>& cleaned, size_t i,
                           const NormalizerConfig& cfg) {
    const std::string& t = cleaned[i];
    if (!textutil::is_all_digits(t)) return false;
    if (static_cast<int>(t.size()) > cfg.page_number_max_digits) return false;

    const bool isolated_before = i == 0 || raw[i - 1].page_index != raw[i].page_index || blank_at(cleaned, i - 1);
    const bool isolated_after =
        i + 1 >= raw.size() || raw[i + 1].page_index != raw[i].page_index || blank_at(cleaned, i + 1);
    return isolated_before && isolated_after;
}

static bool ends_with_split_word(const std::string& s) {
    if (s.size() < 2 || s.back() != '-') return false;
    return std::isalpha(static_cast<unsigned char>(s[s.size() - 2])) != 0;
}

std::vector<Line> normalize_lines(const std::vector<RawLine>& raw, const NormalizerConfig& cfg) {
    std::vector<std::string> cleaned;
    cleaned.reserve(raw.size());
    for (const auto& r : raw) cleaned.push_back(textutil::collapse_whitespace(r.text));

    std::vector<Line> out;
    out.reserve(raw.size());
    bool pending_blank = true;

    for (size_t i = 0; i < raw.size(); ++i) {
        const std::string& t = cleaned[i];

        if (t.empty() || is_page_number(raw, cleaned, i, cfg)) {
            pending_blank = true;
            continue;
        }

        if (cfg.dehyphenate && !pending_blank && !out.empty() && ends_with_split_word(out.back().text) &&
            std::islower(static_cast<unsigned char>(t[0]))) {
            out.back().text.pop_back();
            out.back().text += t;
            continue;
        }

        Line line;
        line.text = t;
        line.page_index = raw[i].page_index;
        line.blank_before = pending_blank;
        out.push_back(std::move(line));
        pending_blank = false;
    }

    return out;
}

std::string join_lines(const std::vector<Line>& lines, size_t begin, size_t end) {
    std::string out;
    if (end > lines.size()) end = lines.size();
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) out += lines[i].blank_before ? "\n\n" : "\n";
        out += lines[i].text;
    }
    return out;
}

}  // namespace paper
