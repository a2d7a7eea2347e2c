#include "report/Report.hpp"

namespace report {

static bool copied_verbatim(const std::string& key) {
    return key == "title" || key == "abstract" || key == "references" || key == "contribution";
}

static std::string heading_for(const paper::SectionLookup& l) {
    if (l.is_summary) return "Summary";
    return paper::section_display_name(l.name);
}

Report build_report(const paper::SectionMap& map, const std::vector<std::string>& requested, summ::Summarizer& summarizer,
                    const ReportConfig& cfg) {
    Report r;

    const paper::SectionSpan* title = map.find(paper::SectionName::Title);
    r.title = title ? title->text : "Unknown Paper";

    for (const auto& l : paper::lookup_sections(map, requested)) {
        ReportSection s;
        s.key = l.key;
        s.heading = heading_for(l);
        s.low_confidence = l.low_confidence;

        if (!l.found) {
            s.status = SectionStatus::NotFound;
            s.error_code = paper::error_code_str(l.error);
            s.error_message = "section not found or not extracted";
            r.sections.push_back(std::move(s));
            continue;
        }

        if (l.low_confidence && cfg.omit_low_confidence) {
            s.status = SectionStatus::Omitted;
            r.sections.push_back(std::move(s));
            continue;
        }

        if (copied_verbatim(l.key)) {
            s.body = l.text;
            r.sections.push_back(std::move(s));
            continue;
        }

        try {
            s.body = summ::summarize_chunked(summarizer, l.key, l.text, cfg.min_length, cfg.max_length);
            s.summarized = true;
        } catch (const summ::SummarizeError& e) {
            s.status = SectionStatus::SummaryFailed;
            s.error_code = e.code();
            s.error_message = e.what();
        }
        r.sections.push_back(std::move(s));
    }

    return r;
}

} // namespace report
