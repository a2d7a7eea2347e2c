#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"
#include "paper/SectionMap.hpp"
#include "paper/SegmenterConfig.hpp"

namespace paper {

struct SegmentationResult {
    std::vector<Line> lines;
    std::vector<Candidate> candidates;
    SectionMap map;
    std::vector<Diagnostic> diagnostics;
};

// Normalizer -> detector -> resolver -> virtual extractor -> map builder.
// Throws SegmentationError(EMPTY_INPUT) when normalization leaves no line.
SegmentationResult segment_document(const std::vector<RawLine>& raw, const SegmenterConfig& cfg = {});

SegmentationResult segment_text(const std::string& text, const SegmenterConfig& cfg = {});

}  // namespace paper
