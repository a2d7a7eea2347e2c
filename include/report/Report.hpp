#pragma once

#include <string>
#include <vector>

#include "paper/SectionMap.hpp"
#include "summ/Summarizer.hpp"

namespace report {

struct ReportConfig {
    int min_length = 40;
    int max_length = 150;
    bool flag_missing = false;           // render absent sections as a note instead of skipping them
    bool omit_low_confidence = false;    // drop a fallback contribution
};

enum class SectionStatus {
    Ok,
    NotFound,
    SummaryFailed,
    Omitted
};

struct ReportSection {
    std::string key;
    std::string heading;
    std::string body;
    SectionStatus status = SectionStatus::Ok;
    bool summarized = false;
    bool low_confidence = false;
    std::string error_code;      // SECTION_NOT_FOUND or the summarizer's code
    std::string error_message;
};

struct Report {
    std::string title;
    std::vector<ReportSection> sections;
};

// title, abstract, references and contribution are copied verbatim; summary
// and the remaining sections go through the summarizer.
Report build_report(const paper::SectionMap& map, const std::vector<std::string>& requested, summ::Summarizer& summarizer,
                    const ReportConfig& cfg);

} // namespace report
