#pragma once
#include <string>
#include <unordered_set>
#include <vector>

#include "paper/Models.hpp"
#include "paper/SegmenterConfig.hpp"

namespace paper {

// Author lists, e-mail addresses and affiliation lines.
bool is_author_line(const std::string& text, const SegmenterConfig& cfg);

// Short all-caps lines whose exact text recurs on several pages.
std::unordered_set<std::string> find_running_headers(const std::vector<Line>& lines, const VirtualConfig& cfg);

// Title from the lines ahead of the first resolved span. `resolved` must be in
// document order. When every such line looks like author metadata, the first
// line without an e-mail address is used. Returns false when none is left.
bool extract_title(const std::vector<Line>& lines, const std::vector<SectionSpan>& resolved,
                   const SegmenterConfig& cfg, SectionSpan& out);

// Cue-phrase sentences from abstract + introduction (or the document head),
// falling back to the abstract's opening sentences with low_confidence set.
bool extract_contribution(const std::vector<Line>& lines, const std::vector<SectionSpan>& resolved,
                          const SegmenterConfig& cfg, SectionSpan& out);

}  // namespace paper
