#include "summ/LeadSummarizer.hpp"
#include "paper/TextUtil.hpp"

namespace summ {

static std::string first_tokens(const std::string& sentence, size_t n) {
    auto words = textutil::split_words(sentence);
    if (words.size() > n) words.resize(n);
    return textutil::join(words, " ");
}

std::string LeadSummarizer::summarize(const std::string&, const std::string& text, int min_length, int max_length) {
    check_request(text, min_length, max_length);

    const size_t lo = static_cast<size_t>(min_length);
    const size_t hi = static_cast<size_t>(max_length);

    std::vector<std::string> picked;
    size_t tokens = 0;

    for (const auto& sentence : textutil::split_sentences(textutil::collapse_whitespace(text))) {
        const size_t n = textutil::count_words(sentence);
        if (tokens + n > hi) {
            if (picked.empty()) picked.push_back(first_tokens(sentence, hi));
            break;
        }
        picked.push_back(sentence);
        tokens += n;
        if (tokens >= lo) break;
    }

    return textutil::join(picked, " ");
}

} // namespace summ
