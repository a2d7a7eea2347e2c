#pragma once

#include "summ/Summarizer.hpp"

#include <filesystem>
#include <string>

namespace summ {

// Canned summaries from <root>/<key>.txt, for tests and offline runs.
class MockSummarizer final : public Summarizer {
    std::filesystem::path root_;

public:
    explicit MockSummarizer(const std::string& root_dir);

    std::string summarize(const std::string& key, const std::string& text, int min_length, int max_length) override;
};

} // namespace summ
