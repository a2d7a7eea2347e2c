#pragma once
#include <string>
#include <vector>

#include "paper/HeadingAliases.hpp"

namespace paper {

struct NormalizerConfig {
    // isolated all-digit lines up to this many characters are page numbers
    int page_number_max_digits = 4;
    bool dehyphenate = true;
};

struct DetectorConfig {
    size_t max_heading_length = 60;
    // heading must follow a blank line or open a page
    bool require_boundary = true;
    double min_candidate_confidence = 0.4;

    double exact_match_weight = 0.6;
    double format_weight = 0.4;
    double prefix_match_score = 0.6;
    double all_caps_score = 1.0;
    double title_case_score = 0.7;
    double plain_case_score = 0.3;
    double enumerator_bonus = 0.1;
};

struct ResolverConfig {
    // fewer content words than this before the next candidate rejects a candidate
    size_t min_content_words = 8;
};

struct VirtualConfig {
    size_t author_line_max_length = 100;
    size_t running_header_max_length = 80;
    int running_header_min_pages = 2;
    // share of the document scanned for contribution cues without abstract/introduction
    double contribution_scope_fraction = 0.4;
    size_t fallback_sentences = 2;
    std::string contribution_separator = " ";
};

struct SegmenterConfig {
    std::vector<HeadingAlias> aliases = default_heading_aliases();
    std::vector<std::string> contribution_cues = default_contribution_cues();
    std::vector<std::string> affiliation_keywords = default_affiliation_keywords();

    NormalizerConfig normalizer;
    DetectorConfig detector;
    ResolverConfig resolver;
    VirtualConfig virtuals;
};

}  // namespace paper
