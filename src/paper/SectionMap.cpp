#include "paper/SectionMap.hpp"
#include "paper/LineNormalizer.hpp"

#include <stdexcept>
#include <unordered_set>

namespace paper {

SectionMap::SectionMap(std::vector<SectionSpan> spans, std::string full_text)
    : m_entries(std::move(spans)), m_full_text(std::move(full_text)) {}

const SectionSpan* SectionMap::find(SectionName name) const {
    for (const auto& s : m_entries) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

std::vector<SectionName> SectionMap::names() const {
    std::vector<SectionName> out;
    out.reserve(m_entries.size());
    for (const auto& s : m_entries) out.push_back(s.name);
    return out;
}

SectionMap build_section_map(const std::vector<SectionSpan>& resolved, const std::vector<SectionSpan>& virtuals,
                             const std::vector<Line>& lines) {
    std::vector<SectionSpan> ordered;

    for (SectionName name : canonical_order()) {
        const SectionSpan* pick = nullptr;
        for (const auto& s : resolved) {
            if (s.name == name) pick = &s;
        }
        // an explicit heading always beats an inferred span
        if (!pick) {
            for (const auto& s : virtuals) {
                if (s.name == name) pick = &s;
            }
        }
        if (pick) ordered.push_back(*pick);
    }

    return SectionMap(std::move(ordered), join_lines(lines, 0, lines.size()));
}

bool is_request_key(const std::string& key) {
    SectionName ignored;
    return key == "all" || key == "summary" || parse_section_key(key, ignored);
}

static SectionLookup lookup_one(const SectionMap& map, SectionName name) {
    SectionLookup l;
    l.key = section_key(name);
    l.name = name;

    const SectionSpan* s = map.find(name);
    if (!s) {
        l.found = false;
        l.error = ErrorCode::SectionNotFound;
        return l;
    }
    l.found = true;
    l.text = s->text;
    l.low_confidence = s->low_confidence;
    return l;
}

std::vector<SectionLookup> lookup_sections(const SectionMap& map, const std::vector<std::string>& requested) {
    std::vector<SectionLookup> out;
    std::unordered_set<std::string> seen;

    for (const auto& key : requested) {
        if (key == "all") {
            for (SectionName name : map.names()) {
                if (seen.insert(section_key(name)).second) out.push_back(lookup_one(map, name));
            }
            continue;
        }

        if (key == "summary") {
            if (!seen.insert(key).second) continue;
            SectionLookup l;
            l.key = key;
            l.is_summary = true;
            l.found = true;
            l.text = map.full_text();
            out.push_back(std::move(l));
            continue;
        }

        SectionName name;
        if (!parse_section_key(key, name)) throw std::invalid_argument("unknown section key: " + key);
        if (seen.insert(key).second) out.push_back(lookup_one(map, name));
    }

    return out;
}

}  // namespace paper
