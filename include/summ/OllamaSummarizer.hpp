#pragma once

#include "summ/Summarizer.hpp"

#include <filesystem>
#include <string>

namespace summ {

// Abstractive summaries from a local Ollama server (/api/generate via curl).
// Responses are cached on disk keyed by model, bounds and input text.
class OllamaSummarizer final : public Summarizer {
    std::string model_;
    std::filesystem::path cache_dir_;
    std::string endpoint_;
    size_t max_input_chars_;

public:
    OllamaSummarizer(const std::string& model, const std::string& cache_dir,
                     const std::string& endpoint = "http://127.0.0.1:11434/api/generate",
                     size_t max_input_chars = 4000);

    std::string summarize(const std::string& key, const std::string& text, int min_length, int max_length) override;
    size_t max_input_chars() const override { return max_input_chars_; }

    std::string cache_key(const std::string& text, int min_length, int max_length) const;

private:
    std::string prompt_summary(const std::string& key, const std::string& text, int min_length, int max_length) const;
    std::string run_ollama(const std::string& prompt, int max_length) const;

    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

// FNV-1a 64-bit, rendered as 16 hex digits.
std::string fnv1a64_hex(const std::string& s);

} // namespace summ
