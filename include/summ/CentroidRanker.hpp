#pragma once
#include <cstddef>
#include <vector>

namespace summ {

// Sentence indices ordered by cosine similarity to the mean vector, highest
// first; equal scores keep document order. Empty vectors rank last.
std::vector<size_t> rank_by_centroid(const std::vector<std::vector<float>>& vecs);

// Greedily takes ranked sentences that fit into max_tokens until min_tokens
// are covered; returns the picks in document order.
std::vector<size_t> pick_within_bounds(const std::vector<size_t>& ranked, const std::vector<size_t>& token_counts,
                                       size_t min_tokens, size_t max_tokens);

} // namespace summ
