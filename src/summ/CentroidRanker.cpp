#include "summ/CentroidRanker.hpp"

#include <algorithm>
#include <cmath>

namespace summ {

static double cosine(const std::vector<float>& a, const std::vector<double>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        dot += a[i] * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += b[i] * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return -2.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<size_t> rank_by_centroid(const std::vector<std::vector<float>>& vecs) {
    size_t dim = 0;
    for (const auto& v : vecs) dim = std::max(dim, v.size());

    std::vector<double> centroid(dim, 0.0);
    size_t used = 0;
    for (const auto& v : vecs) {
        if (v.size() != dim) continue;
        for (size_t i = 0; i < dim; ++i) centroid[i] += v[i];
        ++used;
    }
    if (used > 0) {
        for (double& x : centroid) x /= static_cast<double>(used);
    }

    std::vector<double> score(vecs.size(), -2.0);
    for (size_t k = 0; k < vecs.size(); ++k) {
        if (vecs[k].size() == dim && dim > 0) score[k] = cosine(vecs[k], centroid);
    }

    std::vector<size_t> order(vecs.size());
    for (size_t k = 0; k < order.size(); ++k) order[k] = k;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return score[a] > score[b]; });
    return order;
}

std::vector<size_t> pick_within_bounds(const std::vector<size_t>& ranked, const std::vector<size_t>& token_counts,
                                       size_t min_tokens, size_t max_tokens) {
    std::vector<size_t> picked;
    size_t tokens = 0;

    for (size_t k : ranked) {
        if (k >= token_counts.size()) continue;
        if (tokens + token_counts[k] > max_tokens) continue;
        picked.push_back(k);
        tokens += token_counts[k];
        if (tokens >= min_tokens) break;
    }

    std::sort(picked.begin(), picked.end());
    return picked;
}

} // namespace summ
