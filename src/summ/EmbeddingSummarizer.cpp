#include "summ/EmbeddingSummarizer.hpp"
#include "paper/TextUtil.hpp"
#include "summ/CentroidRanker.hpp"

namespace summ {

EmbeddingSummarizer::EmbeddingSummarizer(const emb::MiniLmEmbedder& embedder, size_t max_sentences)
    : embedder_(embedder), max_sentences_(max_sentences) {}

std::string EmbeddingSummarizer::summarize(const std::string&, const std::string& text, int min_length,
                                           int max_length) {
    check_request(text, min_length, max_length);
    if (!embedder_.ready()) throw SummarizeError("backend_failure", "embedding model not loaded");

    auto sentences = textutil::split_sentences(textutil::collapse_whitespace(text));
    if (sentences.size() > max_sentences_) sentences.resize(max_sentences_);

    std::vector<std::vector<float>> vecs;
    std::vector<size_t> tokens;
    vecs.reserve(sentences.size());
    tokens.reserve(sentences.size());
    for (const auto& s : sentences) {
        vecs.push_back(embedder_.embed(s));
        tokens.push_back(textutil::count_words(s));
    }

    const auto picked = pick_within_bounds(rank_by_centroid(vecs), tokens, static_cast<size_t>(min_length),
                                           static_cast<size_t>(max_length));
    if (picked.empty()) throw SummarizeError("length_bounds", "no sentence fits into " + std::to_string(max_length) + " tokens");

    std::vector<std::string> out;
    for (size_t k : picked) out.push_back(sentences[k]);
    return textutil::join(out, " ");
}

} // namespace summ
