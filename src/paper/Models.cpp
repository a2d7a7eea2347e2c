#include "paper/Models.hpp"

namespace paper {

const std::vector<SectionName>& canonical_order() {
    static const std::vector<SectionName> order = {
        SectionName::Title,
        SectionName::Abstract,
        SectionName::Introduction,
        SectionName::Method,
        SectionName::Results,
        SectionName::Conclusion,
        SectionName::Contribution,
        SectionName::LiteratureReview,
        SectionName::References,
    };
    return order;
}

const char* section_key(SectionName name) {
    switch (name) {
        case SectionName::Title: return "title";
        case SectionName::Abstract: return "abstract";
        case SectionName::Introduction: return "introduction";
        case SectionName::Method: return "method";
        case SectionName::Results: return "results";
        case SectionName::Conclusion: return "conclusion";
        case SectionName::Contribution: return "contribution";
        case SectionName::LiteratureReview: return "literature_review";
        case SectionName::References: return "references";
        default: return "unknown";
    }
}

std::string section_display_name(SectionName name) {
    std::string s = section_key(name);
    for (char& c : s) {
        if (c == '_') c = ' ';
    }
    if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') s[0] = static_cast<char>(s[0] - 'a' + 'A');
    return s;
}

bool parse_section_key(const std::string& key, SectionName& out) {
    for (SectionName n : canonical_order()) {
        if (key == section_key(n)) {
            out = n;
            return true;
        }
    }
    return false;
}

const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptyInput: return "EMPTY_INPUT";
        case ErrorCode::SectionNotFound: return "SECTION_NOT_FOUND";
        case ErrorCode::AmbiguousHeading: return "AMBIGUOUS_HEADING";
        default: return "UNKNOWN";
    }
}

SegmentationError::SegmentationError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_str(code)) + ": " + message), m_code(code) {}

}  // namespace paper
