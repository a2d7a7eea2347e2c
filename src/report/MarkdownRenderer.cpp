#include "report/MarkdownRenderer.hpp"

#include <fstream>
#include <stdexcept>

namespace report {

std::string render_markdown(const Report& r, bool flag_missing) {
    std::string out = "# Analysis of " + r.title + "\n\n";

    for (const auto& s : r.sections) {
        switch (s.status) {
            case SectionStatus::Omitted:
                continue;
            case SectionStatus::NotFound:
                if (!flag_missing) continue;
                out += "## " + s.heading + "\n";
                out += "_Section not found (" + s.error_code + ")._\n\n";
                continue;
            case SectionStatus::SummaryFailed:
                out += "## " + s.heading + "\n";
                out += "_Summary unavailable (" + s.error_code + ")._\n\n";
                continue;
            case SectionStatus::Ok:
                break;
        }

        out += "## " + s.heading + "\n";
        if (s.low_confidence) {
            out += "_Low confidence: no explicit contribution statement found; showing the abstract's opening sentences._\n\n";
        }
        out += s.body + "\n\n";
    }

    out += "---\n*Report generated by paper-deconstructor.*\n";
    return out;
}

void write_markdown(const std::filesystem::path& out_path, const std::string& md) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << md;
    if (md.empty() || md.back() != '\n') out << "\n";
}

} // namespace report
