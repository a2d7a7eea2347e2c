#include "summ/Summarizer.hpp"
#include "paper/TextUtil.hpp"

namespace summ {

void check_request(const std::string& text, int min_length, int max_length) {
    if (textutil::trim(text).empty()) throw SummarizeError("empty_input", "nothing to summarize");
    if (min_length < 0 || max_length <= 0 || min_length > max_length) {
        throw SummarizeError("length_bounds", "invalid bounds min_length=" + std::to_string(min_length) +
                                                  " max_length=" + std::to_string(max_length));
    }
}

std::string NullSummarizer::summarize(const std::string&, const std::string& text, int min_length, int max_length) {
    check_request(text, min_length, max_length);
    return text;
}

std::vector<std::string> split_chunks(const std::string& text, size_t max_chunk_chars) {
    std::vector<std::string> chunks;
    if (max_chunk_chars == 0) max_chunk_chars = 1;

    size_t pos = 0;
    const size_t n = text.size();
    while (pos < n) {
        size_t end = pos + max_chunk_chars;
        if (end >= n) {
            end = n;
        } else {
            size_t cut = text.find_last_of(" \n\t", end);
            if (cut != std::string::npos && cut > pos) end = cut;
        }

        std::string piece = textutil::trim(text.substr(pos, end - pos));
        if (!piece.empty()) chunks.push_back(piece);
        pos = end;
    }
    return chunks;
}

std::string summarize_chunked(Summarizer& s, const std::string& key, const std::string& text, int min_length,
                              int max_length) {
    check_request(text, min_length, max_length);

    const size_t limit = s.max_input_chars();
    if (limit == 0 || text.size() <= limit) return s.summarize(key, text, min_length, max_length);

    std::vector<std::string> parts;
    for (const auto& chunk : split_chunks(text, limit)) {
        std::string part = textutil::trim(s.summarize(key, chunk, min_length, max_length));
        if (!part.empty()) parts.push_back(part);
    }
    return textutil::join(parts, " ");
}

} // namespace summ
