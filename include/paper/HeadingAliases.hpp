#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"

namespace paper {

struct HeadingAlias {
    SectionName name = SectionName::Abstract;
    std::vector<std::string> patterns;   // lowercase, single-spaced
};

// One entry per canonical name, in canonical order. Title and contribution have
// no patterns: they are only ever inferred.
const std::vector<HeadingAlias>& default_heading_aliases();

// Cue phrases that mark a sentence as stating the paper's contribution.
const std::vector<std::string>& default_contribution_cues();

// Lowercase substrings that mark a line as affiliation metadata.
const std::vector<std::string>& default_affiliation_keywords();

struct AliasMatch {
    bool matched = false;
    bool exact = false;
    SectionName name = SectionName::Abstract;
    std::string alias;
};

// Exact match beats prefix match; among prefix matches the longest alias wins.
// `key` must already be lowercased with the enumerator stripped.
AliasMatch match_heading_alias(const std::vector<HeadingAlias>& aliases, const std::string& key);

}  // namespace paper
