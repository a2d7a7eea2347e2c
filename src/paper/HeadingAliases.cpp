#include "paper/HeadingAliases.hpp"

namespace paper {

const std::vector<HeadingAlias>& default_heading_aliases() {
    static const std::vector<HeadingAlias> table = {
        {SectionName::Title, {}},
        {SectionName::Abstract, {"abstract"}},
        {SectionName::Introduction, {"introduction", "motivation"}},
        {SectionName::Method, {
            "method", "methods", "methodology", "approach", "proposed method", "proposed approach",
            "our approach", "materials and methods", "model", "framework",
        }},
        {SectionName::Results, {
            "results", "result", "experiments", "experiment", "experimental results", "experimental setup",
            "evaluation", "results and discussion",
        }},
        {SectionName::Conclusion, {
            "conclusion", "conclusions", "concluding remarks", "discussion", "summary and conclusion",
            "future work",
        }},
        {SectionName::Contribution, {}},
        {SectionName::LiteratureReview, {
            "related work", "related works", "literature review", "background", "prior work", "previous work",
        }},
        {SectionName::References, {"references", "bibliography", "works cited", "literature cited"}},
    };
    return table;
}

const std::vector<std::string>& default_contribution_cues() {
    static const std::vector<std::string> cues = {
        "we propose",
        "we present",
        "we introduce",
        "we develop",
        "our contribution",
        "our contributions",
        "this paper presents",
        "this paper proposes",
        "this paper introduces",
        "in this work",
        "in this paper",
    };
    return cues;
}

const std::vector<std::string>& default_affiliation_keywords() {
    static const std::vector<std::string> keywords = {
        "university", "institute", "department", "laboratory", "school of", "college", "faculty of",
        "inc.", "corporation", "research center", "research centre",
    };
    return keywords;
}

static bool is_word_boundary(char c) {
    return !((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'));
}

AliasMatch match_heading_alias(const std::vector<HeadingAlias>& aliases, const std::string& key) {
    AliasMatch best;
    if (key.empty()) return best;

    for (const auto& entry : aliases) {
        for (const auto& pat : entry.patterns) {
            if (pat.empty() || key.size() < pat.size()) continue;
            if (key.compare(0, pat.size(), pat) != 0) continue;

            const bool exact = key.size() == pat.size();
            if (!exact && !is_word_boundary(key[pat.size()])) continue;

            if (exact) {
                if (!best.exact || pat.size() > best.alias.size()) {
                    best = AliasMatch{true, true, entry.name, pat};
                }
            } else if (!best.exact && (!best.matched || pat.size() > best.alias.size())) {
                best = AliasMatch{true, false, entry.name, pat};
            }
        }
    }

    return best;
}

}  // namespace paper
