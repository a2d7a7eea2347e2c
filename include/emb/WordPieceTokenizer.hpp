#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// BERT-style uncased WordPiece over a vocab.txt (one token per line, id = line number).
class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);
    void set_vocab(const std::vector<std::string>& tokens);

    // lowercase, split on whitespace and ASCII punctuation, then greedy longest-match pieces
    std::vector<std::string> tokenize(const std::string& text) const;

    // [CLS] pieces... [SEP], truncated to max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }
    int64_t unk_id() const { return id_or(0, "[UNK]"); }
    int64_t cls_id() const { return id_or(0, "[CLS]"); }
    int64_t sep_id() const { return id_or(0, "[SEP]"); }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<std::string>& out) const;
    int64_t id_or(int64_t def, const std::string& tok) const;
};

} // namespace emb
