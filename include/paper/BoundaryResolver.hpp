#pragma once
#include <vector>

#include "paper/Models.hpp"
#include "paper/SegmenterConfig.hpp"

namespace paper {

struct ResolveResult {
    std::vector<SectionSpan> spans;          // document order, one per name
    std::vector<Diagnostic> diagnostics;     // AMBIGUOUS_HEADING notes
};

// Words of content between candidates[k] and the next candidate of any name
// (or end of document).
size_t content_words_after(const std::vector<Candidate>& candidates, size_t k, const std::vector<Line>& lines);

// Index (into `group`) of the occurrence with the most following content;
// ties go to the later occurrence. `group` holds candidate indices in document order.
size_t select_best_occurrence(const std::vector<size_t>& group, const std::vector<size_t>& content_words);

ResolveResult resolve_boundaries(const std::vector<Candidate>& candidates, const std::vector<Line>& lines,
                                 const ResolverConfig& cfg = {});

}  // namespace paper
