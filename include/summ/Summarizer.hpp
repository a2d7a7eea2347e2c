#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace summ {

// code: "empty_input" | "length_bounds" | "backend_failure"
class SummarizeError : public std::runtime_error {
public:
    SummarizeError(const std::string& code, const std::string& message)
        : std::runtime_error(code + ": " + message), m_code(code) {}

    const std::string& code() const { return m_code; }

private:
    std::string m_code;
};

class Summarizer {
public:
    virtual ~Summarizer() = default;

    // `key` names what is summarized ("summary", "method", ...); lengths are
    // whitespace token bounds. Throws SummarizeError.
    virtual std::string summarize(const std::string& key, const std::string& text, int min_length,
                                  int max_length) = 0;

    // Longest input passed to one summarize() call; 0 means unlimited.
    virtual size_t max_input_chars() const { return 0; }
};

// Passes text through unchanged.
class NullSummarizer final : public Summarizer {
public:
    std::string summarize(const std::string& key, const std::string& text, int min_length, int max_length) override;
};

// Throws empty_input / length_bounds.
void check_request(const std::string& text, int min_length, int max_length);

// Pieces of at most max_chunk_chars, cut at whitespace where possible.
std::vector<std::string> split_chunks(const std::string& text, size_t max_chunk_chars);

// Splits text by s.max_input_chars(), summarizes each chunk and joins the
// partial summaries with a space.
std::string summarize_chunked(Summarizer& s, const std::string& key, const std::string& text, int min_length,
                              int max_length);

} // namespace summ
