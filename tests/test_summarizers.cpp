#include <gtest/gtest.h>
#include "summ/CentroidRanker.hpp"
#include "summ/LeadSummarizer.hpp"
#include "summ/MockSummarizer.hpp"
#include "summ/OllamaSummarizer.hpp"
#include "summ/Summarizer.hpp"

#include <filesystem>
#include <fstream>

using namespace summ;
namespace fs = std::filesystem;

static std::string code_of(Summarizer& s, const std::string& text, int lo, int hi) {
    try {
        s.summarize("method", text, lo, hi);
    } catch (const SummarizeError& e) {
        return e.code();
    }
    return "";
}

// Wraps every chunk in brackets so chunk boundaries stay visible.
class BracketSummarizer final : public Summarizer {
public:
    explicit BracketSummarizer(size_t limit) : limit_(limit) {}

    std::string summarize(const std::string&, const std::string& text, int, int) override {
        ++calls;
        return "[" + text + "]";
    }
    size_t max_input_chars() const override { return limit_; }

    int calls = 0;

private:
    size_t limit_;
};

TEST(SummarizerTest, BoundsAreChecked) {
    NullSummarizer s;
    EXPECT_EQ(code_of(s, "  ", 1, 10), "empty_input");
    EXPECT_EQ(code_of(s, "text", -1, 10), "length_bounds");
    EXPECT_EQ(code_of(s, "text", 0, 0), "length_bounds");
    EXPECT_EQ(code_of(s, "text", 20, 10), "length_bounds");
    EXPECT_EQ(code_of(s, "text", 0, 10), "");
}

TEST(SummarizerTest, NullPassesThrough) {
    NullSummarizer s;
    EXPECT_EQ(s.summarize("abstract", "Keep me as is.", 1, 5), "Keep me as is.");
}

TEST(SummarizerTest, LeadStopsAtMinimum) {
    LeadSummarizer s;
    const std::string text = "One two three. Four five six seven. Eight nine.";
    EXPECT_EQ(s.summarize("method", text, 3, 10), "One two three.");
    EXPECT_EQ(s.summarize("method", text, 5, 10), "One two three. Four five six seven.");
    EXPECT_EQ(s.summarize("method", text, 5, 6), "One two three.");
}

TEST(SummarizerTest, LeadCutsLongFirstSentence) {
    LeadSummarizer s;
    EXPECT_EQ(s.summarize("method", "One two three four five.", 1, 2), "One two");
}

TEST(SummarizerTest, SplitChunksCutsAtWhitespace) {
    auto chunks = split_chunks("aaa bbb ccc", 7);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "aaa bbb");
    EXPECT_EQ(chunks[1], "ccc");
}

TEST(SummarizerTest, ChunkedJoinsPartialSummaries) {
    BracketSummarizer limited(7);
    EXPECT_EQ(summarize_chunked(limited, "method", "aaa bbb ccc", 1, 10), "[aaa bbb] [ccc]");
    EXPECT_EQ(limited.calls, 2);

    BracketSummarizer unlimited(0);
    EXPECT_EQ(summarize_chunked(unlimited, "method", "aaa bbb ccc", 1, 10), "[aaa bbb ccc]");
    EXPECT_EQ(unlimited.calls, 1);

    EXPECT_THROW(summarize_chunked(unlimited, "method", "", 1, 10), SummarizeError);
}

class MockSummarizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "paperdecon_mock_test";
        fs::create_directories(dir);
        std::ofstream(dir / "method.txt") << "  canned method summary \n";
    }
    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
};

TEST_F(MockSummarizerTest, ReadsCannedSummary) {
    MockSummarizer s(dir.string());
    EXPECT_EQ(s.summarize("method", "any text", 1, 10), "canned method summary");
}

TEST_F(MockSummarizerTest, MissingKeyIsBackendFailure) {
    MockSummarizer s(dir.string());
    try {
        s.summarize("results", "any text", 1, 10);
        FAIL() << "expected SummarizeError";
    } catch (const SummarizeError& e) {
        EXPECT_EQ(e.code(), "backend_failure");
    }
}

TEST(OllamaSummarizerTest, CacheKeyIsStable) {
    EXPECT_EQ(fnv1a64_hex(""), "cbf29ce484222325");

    fs::path dir = fs::temp_directory_path() / "paperdecon_ollama_test";
    OllamaSummarizer s("llama3.1:8b", dir.string());

    const std::string k = s.cache_key("text", 10, 20);
    EXPECT_EQ(k, s.cache_key("text", 10, 20));
    EXPECT_NE(k, s.cache_key("text", 10, 30));
    EXPECT_EQ(k.rfind("summary_v1-", 0), 0u);
    EXPECT_EQ(k.size(), std::string("summary_v1-").size() + 16);

    fs::remove_all(dir);
}

TEST(OllamaSummarizerTest, CachedResponseSkipsServer) {
    fs::path dir = fs::temp_directory_path() / "paperdecon_ollama_cache_test";
    // unroutable endpoint: only the cache can answer
    OllamaSummarizer s("llama3.1:8b", dir.string(), "http://127.0.0.1:9/api/generate");

    std::ofstream(dir / (s.cache_key("Some section text.", 5, 20) + ".txt")) << "cached summary";
    EXPECT_EQ(s.summarize("method", "Some section text.", 5, 20), "cached summary");

    fs::remove_all(dir);
}

TEST(CentroidRankerTest, RanksByCentroidSimilarity) {
    std::vector<std::vector<float>> vecs = {{1.0f, 0.0f}, {0.9f, 0.1f}, {0.0f, 1.0f}};
    auto ranked = rank_by_centroid(vecs);
    std::vector<size_t> expected = {1, 0, 2};
    EXPECT_EQ(ranked, expected);
}

TEST(CentroidRankerTest, EmptyVectorsRankLast) {
    std::vector<std::vector<float>> vecs = {{}, {1.0f, 0.0f}, {1.0f, 0.0f}};
    auto ranked = rank_by_centroid(vecs);
    std::vector<size_t> expected = {1, 2, 0};
    EXPECT_EQ(ranked, expected);
}

TEST(CentroidRankerTest, PicksWithinBoundsInDocumentOrder) {
    std::vector<size_t> counts = {5, 5, 5};

    std::vector<size_t> two = {0, 1};
    EXPECT_EQ(pick_within_bounds({1, 0, 2}, counts, 8, 12), two);

    std::vector<size_t> one = {1};
    EXPECT_EQ(pick_within_bounds({1, 0, 2}, counts, 8, 7), one);
}
