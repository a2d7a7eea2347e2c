#pragma once

#include "summ/Summarizer.hpp"

namespace summ {

// Extractive, model-free: leading sentences until min_length tokens are
// covered, never past max_length tokens (a single over-long first sentence is
// cut at max_length).
class LeadSummarizer final : public Summarizer {
public:
    std::string summarize(const std::string& key, const std::string& text, int min_length, int max_length) override;
};

} // namespace summ
