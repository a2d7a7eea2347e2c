#pragma once

#include "emb/MiniLmEmbedder.hpp"
#include "summ/Summarizer.hpp"

namespace summ {

// Extractive: embeds every sentence and keeps the ones closest to the text's
// centroid, in document order, within the token bounds.
class EmbeddingSummarizer final : public Summarizer {
    const emb::MiniLmEmbedder& embedder_;
    size_t max_sentences_;

public:
    explicit EmbeddingSummarizer(const emb::MiniLmEmbedder& embedder, size_t max_sentences = 200);

    std::string summarize(const std::string& key, const std::string& text, int min_length, int max_length) override;
};

} // namespace summ
