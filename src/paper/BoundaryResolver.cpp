#include "paper/BoundaryResolver.hpp"
#include "paper/LineNormalizer.hpp"
#include "paper/TextUtil.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace paper {

size_t content_words_after(const std::vector<Candidate>& candidates, size_t k, const std::vector<Line>& lines) {
    const size_t begin = candidates[k].line_index + 1;
    const size_t end = (k + 1 < candidates.size()) ? candidates[k + 1].line_index : lines.size();

    size_t words = 0;
    for (size_t i = begin; i < end && i < lines.size(); ++i) words += textutil::count_words(lines[i].text);
    return words;
}

size_t select_best_occurrence(const std::vector<size_t>& group, const std::vector<size_t>& content_words) {
    size_t best = 0;
    for (size_t g = 1; g < group.size(); ++g) {
        // >= : a later occurrence wins ties
        if (content_words[group[g]] >= content_words[group[best]]) best = g;
    }
    return best;
}

static Diagnostic ambiguity_note(const std::vector<Candidate>& candidates, const std::vector<size_t>& group,
                                 size_t chosen, const std::vector<size_t>& content_words) {
    const Candidate& kept = candidates[group[chosen]];

    std::ostringstream oss;
    oss << section_key(kept.name) << ": " << group.size() << " heading candidates, kept line " << kept.line_index
        << " (" << content_words[group[chosen]] << " words)";

    bool tie = false;
    for (size_t g = 0; g < group.size(); ++g) {
        if (g == chosen) continue;
        oss << ", dropped line " << candidates[group[g]].line_index;
        if (content_words[group[g]] == content_words[group[chosen]]) tie = true;
    }
    if (tie) oss << "; tie broken by later position";

    Diagnostic d;
    d.code = ErrorCode::AmbiguousHeading;
    d.message = oss.str();
    d.line_index = kept.line_index;
    return d;
}

ResolveResult resolve_boundaries(const std::vector<Candidate>& candidates, const std::vector<Line>& lines,
                                 const ResolverConfig& cfg) {
    ResolveResult out;
    if (candidates.empty() || lines.empty()) return out;

    std::vector<size_t> words(candidates.size(), 0);
    for (size_t k = 0; k < candidates.size(); ++k) words[k] = content_words_after(candidates, k, lines);

    // gap rejection; the last candidate runs to end of document and is exempt
    std::map<SectionName, std::vector<size_t>> groups;
    for (size_t k = 0; k < candidates.size(); ++k) {
        const bool last = k + 1 == candidates.size();
        if (!last && words[k] < cfg.min_content_words) continue;
        groups[candidates[k].name].push_back(k);
    }

    std::vector<size_t> survivors;
    survivors.reserve(groups.size());
    for (const auto& entry : groups) {
        const auto& group = entry.second;
        const size_t chosen = select_best_occurrence(group, words);
        if (group.size() > 1) out.diagnostics.push_back(ambiguity_note(candidates, group, chosen, words));
        survivors.push_back(group[chosen]);
    }

    std::sort(survivors.begin(), survivors.end(), [&](size_t a, size_t b) {
        return candidates[a].line_index < candidates[b].line_index;
    });

    bool have_pending = false;
    size_t pending_start = 0;

    for (size_t j = 0; j < survivors.size(); ++j) {
        const Candidate& c = candidates[survivors[j]];
        const size_t heading = c.line_index;
        const size_t end = (j + 1 < survivors.size()) ? candidates[survivors[j + 1]].line_index : lines.size();

        const std::string text = (end > heading + 1) ? join_lines(lines, heading + 1, end) : std::string();

        if (textutil::trim(text).empty()) {
            Diagnostic d;
            d.code = ErrorCode::AmbiguousHeading;
            d.message = std::string(section_key(c.name)) + ": empty section at line " + std::to_string(heading) +
                        " treated as a false heading";
            d.line_index = heading;
            out.diagnostics.push_back(std::move(d));

            if (j + 1 < survivors.size()) {
                if (!have_pending) {
                    pending_start = heading;
                    have_pending = true;
                }
            } else if (!out.spans.empty()) {
                SectionSpan& prev = out.spans.back();
                prev.end_line = lines.size();
                prev.text = join_lines(lines, prev.heading_line + 1, lines.size());
            }
            continue;
        }

        SectionSpan span;
        span.name = c.name;
        span.start_line = have_pending ? pending_start : heading;
        span.heading_line = heading;
        span.end_line = end;
        span.text = text;
        have_pending = false;
        out.spans.push_back(std::move(span));
    }

    return out;
}

}  // namespace paper
