#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"
#include "paper/SegmenterConfig.hpp"

namespace paper {

struct StrippedHeading {
    std::string text;        // enumerator and trailing ':' removed
    bool enumerated = false;
};

// Removes "1.", "1.2", "3)", "IV.", bare digits or roman numerals followed by
// punctuation or whitespace.
StrippedHeading strip_enumerator(const std::string& line);

// Candidates in document order; duplicates are left for the resolver.
std::vector<Candidate> detect_heading_candidates(const std::vector<Line>& lines, const SegmenterConfig& cfg);

}  // namespace paper
