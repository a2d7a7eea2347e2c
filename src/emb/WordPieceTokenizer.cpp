#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace emb {

// words longer than this map straight to [UNK]
static const size_t kMaxWordChars = 100;

static bool is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        tokens.push_back(line);
    }
    set_vocab(tokens);
    return !m_id_to_tok.empty();
}

void WordPieceTokenizer::set_vocab(const std::vector<std::string>& tokens) {
    m_id_to_tok = tokens;
    m_tok_to_id.clear();
    m_tok_to_id.reserve(tokens.size() * 2);
    for (size_t i = 0; i < tokens.size(); ++i) m_tok_to_id.emplace(tokens[i], static_cast<int64_t>(i));
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;

    for (unsigned char c : text) {
        if (is_ws(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else if (is_punct(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
            words.emplace_back(1, static_cast<char>(c));
        } else {
            cur.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > kMaxWordChars) {
        out.push_back("[UNK]");
        return;
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        bool found = false;

        for (; end > start; --end) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub.insert(0, "##");
            if (m_tok_to_id.count(sub)) {
                pieces.push_back(std::move(sub));
                found = true;
                break;
            }
        }

        // one unmatchable piece turns the whole word into [UNK]
        if (!found) {
            out.push_back("[UNK]");
            return;
        }
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : basic_tokenize(text)) wordpiece(w, out);
    return out;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(cls_id());

    const int64_t unk = unk_id();
    for (const auto& piece : tokenize(text)) {
        if (ids.size() + 1 >= max_len) break;  // room for [SEP]
        ids.push_back(id_or(unk, piece));
    }

    ids.push_back(sep_id());
    return ids;
}

} // namespace emb
