#include "summ/MockSummarizer.hpp"
#include "paper/TextUtil.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace summ {

MockSummarizer::MockSummarizer(const std::string& root_dir) : root_(root_dir) {}

std::string MockSummarizer::summarize(const std::string& key, const std::string& text, int min_length,
                                      int max_length) {
    check_request(text, min_length, max_length);

    fs::path p = root_ / (key + ".txt");
    std::ifstream f(p);
    if (!f) throw SummarizeError("backend_failure", "no mock summary at " + p.string());

    std::ostringstream ss;
    ss << f.rdbuf();
    return textutil::trim(ss.str());
}

} // namespace summ
