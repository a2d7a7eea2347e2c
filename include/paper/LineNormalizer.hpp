#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"
#include "paper/SegmenterConfig.hpp"

namespace paper {

// Splits extracted text into raw lines; '\f' starts a new page.
std::vector<RawLine> split_raw_lines(const std::string& text);

// Whitespace cleanup, page-number removal, dehyphenation, blank-line marking.
// Returns an empty vector when nothing but whitespace/artifacts is left.
std::vector<Line> normalize_lines(const std::vector<RawLine>& raw, const NormalizerConfig& cfg = {});

// Lines joined with '\n'; a line with blank_before starts a new paragraph ("\n\n").
std::string join_lines(const std::vector<Line>& lines, size_t begin, size_t end);

}  // namespace paper
