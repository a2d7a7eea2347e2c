#include "paper/TextUtil.hpp"
#include <cctype>
#include <unordered_set>

namespace textutil {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_space(s[i])) ++i;
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (char c : s) {
        if (is_space(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(c);
            prev_space = false;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        // bytes >= 0x80 are kept so UTF-8 words survive intact
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c >= 0x80;

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool contains_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase) {
    if (normalized_phrase.empty()) return false;
    std::string h = " " + normalized_haystack + " ";
    std::string p = " " + normalized_phrase + " ";
    return h.find(p) != std::string::npos;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : s) {
        if (is_space(c)) {
            if (!cur.empty()) {
                words.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

size_t count_words(const std::string& s) {
    size_t n = 0;
    bool in_word = false;
    for (char c : s) {
        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

bool is_all_caps(const std::string& s) {
    int letters = 0;
    for (unsigned char c : s) {
        if (std::islower(c)) return false;
        if (std::isupper(c)) ++letters;
    }
    return letters >= 2;
}

bool is_title_case(const std::string& s) {
    bool first_letter_seen = false;
    for (const auto& w : split_words(s)) {
        size_t k = 0;
        while (k < w.size() && !std::isalpha(static_cast<unsigned char>(w[k]))) ++k;
        if (k == w.size()) continue;

        const bool upper = std::isupper(static_cast<unsigned char>(w[k])) != 0;
        if (!first_letter_seen) {
            if (!upper) return false;
            first_letter_seen = true;
            continue;
        }
        if (w.size() - k > 3 && !upper) return false;
    }
    return first_letter_seen;
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

// the word ending right before position `dot`, lowercased, dots kept
static std::string word_before(const std::string& text, size_t dot) {
    size_t a = dot;
    while (a > 0 && !is_space(text[a - 1])) --a;
    return to_lower_ascii(text.substr(a, dot - a));
}

static bool is_abbreviation(const std::string& word) {
    static const std::unordered_set<std::string> abbrev = {
        "e.g", "i.e", "fig", "figs", "eq", "eqs", "vs", "cf", "sec", "no", "resp", "approx", "ref", "dr", "mr", "ms",
    };
    return abbrev.count(word) > 0;
}

// "J. " or "J." at the end of the text, starting at `p`
static bool starts_initial(const std::string& text, size_t p) {
    if (p + 1 >= text.size() || !std::isupper(static_cast<unsigned char>(text[p])) || text[p + 1] != '.') {
        return false;
    }
    return p + 2 == text.size() || is_space(text[p + 2]);
}

// "J." is an initial at the start of the text, after a sentence, next to
// another initial ("J. R. Smith"). "for Y." and "Net B." are not.
static bool is_initial(const std::string& text, size_t dot, size_t next) {
    size_t a = dot;
    while (a > 0 && !is_space(text[a - 1])) --a;
    if (dot - a != 1 || !std::isupper(static_cast<unsigned char>(text[a]))) return false;

    if (next < text.size() && starts_initial(text, next)) return true;

    size_t e = a;
    while (e > 0 && is_space(text[e - 1])) --e;
    if (e == 0) return true;

    size_t b = e;
    while (b > 0 && !is_space(text[b - 1])) --b;
    if (starts_initial(text, b) && b + 2 == e) return true;
    const char last = text[e - 1];
    return last == '.' || last == '!' || last == '?';
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    const size_t n = text.size();

    for (size_t i = 0; i < n; ++i) {
        const char c = text[i];
        if (c != '.' && c != '!' && c != '?') continue;

        size_t end = i + 1;
        while (end < n && (text[end] == '"' || text[end] == '\'' || text[end] == ')')) ++end;

        if (end < n && !is_space(text[end])) continue;

        size_t next = end;
        while (next < n && is_space(text[next])) ++next;

        if (next < n) {
            const unsigned char nc = static_cast<unsigned char>(text[next]);
            const bool opens = std::isupper(nc) || std::isdigit(nc) || nc == '"' || nc == '(' || nc == '[';
            if (!opens) continue;
        }

        if (c == '.') {
            const std::string w = word_before(text, i);
            if (w == "al") {
                // "et al. (2020)" and "et al. 3" continue; "et al. We" ends
                const bool capital = next < n && std::isupper(static_cast<unsigned char>(text[next]));
                if (next < n && (!capital || starts_initial(text, next))) continue;
            } else if (is_abbreviation(w) || is_initial(text, i, next)) {
                continue;
            }
        }

        std::string s = trim(text.substr(start, end - start));
        if (!s.empty()) out.push_back(s);
        start = end;
        i = end - 1;
    }

    std::string tail = trim(text.substr(start));
    if (!tail.empty()) out.push_back(tail);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace textutil
