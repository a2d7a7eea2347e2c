#include "paper/Segmenter.hpp"

#include "paper/BoundaryResolver.hpp"
#include "paper/HeadingDetector.hpp"
#include "paper/LineNormalizer.hpp"
#include "paper/VirtualSections.hpp"

namespace paper {

SegmentationResult segment_document(const std::vector<RawLine>& raw, const SegmenterConfig& cfg) {
    SegmentationResult r;

    r.lines = normalize_lines(raw, cfg.normalizer);
    if (r.lines.empty()) throw SegmentationError(ErrorCode::EmptyInput, "no text left after normalization");

    r.candidates = detect_heading_candidates(r.lines, cfg);

    ResolveResult resolved = resolve_boundaries(r.candidates, r.lines, cfg.resolver);
    r.diagnostics = std::move(resolved.diagnostics);

    std::vector<SectionSpan> virtuals;
    SectionSpan v;
    if (extract_title(r.lines, resolved.spans, cfg, v)) virtuals.push_back(v);
    if (extract_contribution(r.lines, resolved.spans, cfg, v)) virtuals.push_back(v);

    r.map = build_section_map(resolved.spans, virtuals, r.lines);
    return r;
}

SegmentationResult segment_text(const std::string& text, const SegmenterConfig& cfg) {
    return segment_document(split_raw_lines(text), cfg);
}

}  // namespace paper
