#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"

namespace paper {

// Ordered name -> span mapping in canonical report order, plus the whole
// normalized document for the "summary" request. Immutable once built.
class SectionMap {
public:
    SectionMap() = default;
    SectionMap(std::vector<SectionSpan> spans, std::string full_text);

    const std::vector<SectionSpan>& entries() const { return m_entries; }
    const std::string& full_text() const { return m_full_text; }

    const SectionSpan* find(SectionName name) const;
    bool contains(SectionName name) const { return find(name) != nullptr; }
    std::vector<SectionName> names() const;

private:
    std::vector<SectionSpan> m_entries;
    std::string m_full_text;
};

// Resolved and virtual spans in any order; at most one span per name.
SectionMap build_section_map(const std::vector<SectionSpan>& resolved, const std::vector<SectionSpan>& virtuals,
                             const std::vector<Line>& lines);

struct SectionLookup {
    std::string key;              // request key as asked ("summary", "method", ...)
    bool is_summary = false;      // whole-document synthetic entry
    SectionName name = SectionName::Title;
    bool found = false;
    ErrorCode error = ErrorCode::SectionNotFound;   // meaningful only when !found
    std::string text;
    bool low_confidence = false;
};

// Expands "all" into every name present in the map and "summary" into the
// synthetic whole-document entry. Duplicate keys are kept once. Throws
// std::invalid_argument on a key that is neither a canonical name nor a request key.
std::vector<SectionLookup> lookup_sections(const SectionMap& map, const std::vector<std::string>& requested);

bool is_request_key(const std::string& key);

}  // namespace paper
