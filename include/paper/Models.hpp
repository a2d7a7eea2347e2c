#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace paper {

// Canonical structural roles, declared in report order.
enum class SectionName {
    Title,
    Abstract,
    Introduction,
    Method,
    Results,
    Conclusion,
    Contribution,
    LiteratureReview,
    References
};

const std::vector<SectionName>& canonical_order();

// "literature_review", "abstract", ...
const char* section_key(SectionName name);

// "Literature review", "Abstract", ...
std::string section_display_name(SectionName name);

bool parse_section_key(const std::string& key, SectionName& out);

struct RawLine {
    std::string text;
    int page_index = 0;
};

struct Line {
    std::string text;
    int page_index = 0;
    bool blank_before = false;   // one or more empty lines (or document start) precede it
};

struct Candidate {
    size_t line_index = 0;
    SectionName name = SectionName::Abstract;
    double confidence = 0.0;     // 0..1
    std::string matched_alias;
};

struct SectionSpan {
    SectionName name = SectionName::Title;
    size_t start_line = 0;       // first owned line
    size_t end_line = 0;         // exclusive
    size_t heading_line = 0;     // == start_line unless an empty heading was merged in
    std::string text;
    bool is_virtual = false;
    bool low_confidence = false;
};

enum class ErrorCode {
    EmptyInput,
    SectionNotFound,
    AmbiguousHeading
};

// "EMPTY_INPUT", "SECTION_NOT_FOUND", "AMBIGUOUS_HEADING"
const char* error_code_str(ErrorCode code);

struct Diagnostic {
    ErrorCode code = ErrorCode::AmbiguousHeading;
    std::string message;
    size_t line_index = 0;
};

class SegmentationError : public std::runtime_error {
public:
    SegmentationError(ErrorCode code, const std::string& message);
    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

}  // namespace paper
