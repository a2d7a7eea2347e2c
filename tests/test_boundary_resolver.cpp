#include <gtest/gtest.h>
#include "SamplePapers.hpp"
#include "paper/BoundaryResolver.hpp"
#include "paper/HeadingDetector.hpp"
#include "paper/LineNormalizer.hpp"
#include "paper/Segmenter.hpp"
#include "paper/TextUtil.hpp"

#include <algorithm>

using namespace paper;

class BoundaryResolverTest : public ::testing::Test {
protected:
    ResolveResult resolve(const std::string& text, const SegmenterConfig& cfg = {}) {
        lines = normalize_lines(split_raw_lines(text));
        candidates = detect_heading_candidates(lines, cfg);
        return resolve_boundaries(candidates, lines, cfg.resolver);
    }

    static const SectionSpan* span_of(const ResolveResult& r, SectionName name) {
        for (const auto& s : r.spans) {
            if (s.name == name) return &s;
        }
        return nullptr;
    }

    std::vector<Line> lines;
    std::vector<Candidate> candidates;
};

TEST_F(BoundaryResolverTest, SpansAreOrderedAndDisjoint) {
    auto r = resolve(samples::basic_paper());
    ASSERT_EQ(r.spans.size(), 6u);

    for (size_t i = 0; i < r.spans.size(); ++i) {
        EXPECT_LT(r.spans[i].start_line, r.spans[i].end_line);
        if (i + 1 < r.spans.size()) EXPECT_LE(r.spans[i].end_line, r.spans[i + 1].start_line);
    }
    EXPECT_EQ(r.spans.back().name, SectionName::References);
    EXPECT_EQ(r.spans.back().end_line, lines.size());
}

TEST_F(BoundaryResolverTest, TableOfContentsLosesToBody) {
    auto r = resolve(samples::paper_with_toc());

    // TOC entries are candidates but own no content
    EXPECT_EQ(candidates.size(), 8u);

    const SectionSpan* abs = span_of(r, SectionName::Abstract);
    ASSERT_NE(abs, nullptr);
    EXPECT_EQ(abs->heading_line, 5u);
    EXPECT_EQ(abs->text, "This abstract has more than eight words of real content inside it.");

    const SectionSpan* res = span_of(r, SectionName::Results);
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(res->heading_line, 11u);
}

TEST_F(BoundaryResolverTest, ContentsBlockBeforeRealHeading) {
    std::string body;
    for (int i = 0; i < 40; ++i) body += "Each sentence here adds words. ";

    auto r = resolve("A Paper With Contents\n"
                     "\n"
                     "Introduction\n"
                     "\n"
                     "Method\n"
                     "\n"
                     "Results\n"
                     "\n"
                     "Introduction\n" +
                     body + "\n");

    ASSERT_EQ(r.spans.size(), 1u);
    EXPECT_EQ(r.spans[0].name, SectionName::Introduction);
    EXPECT_EQ(r.spans[0].heading_line, 4u);
    EXPECT_GE(textutil::count_words(r.spans[0].text), 200u);
}

TEST_F(BoundaryResolverTest, TieGoesToLaterOccurrence) {
    EXPECT_EQ(select_best_occurrence({0, 1}, {10, 10}), 1u);
    EXPECT_EQ(select_best_occurrence({0, 1}, {12, 10}), 0u);
    EXPECT_EQ(select_best_occurrence({0, 2}, {9, 0, 30}), 1u);

    auto r = resolve("Method\n"
                     "alpha beta gamma delta epsilon zeta eta theta.\n"
                     "\n"
                     "Method\n"
                     "alpha beta gamma delta epsilon zeta eta theta.\n");
    ASSERT_EQ(r.spans.size(), 1u);
    EXPECT_EQ(r.spans[0].heading_line, 2u);

    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, ErrorCode::AmbiguousHeading);
    EXPECT_NE(r.diagnostics[0].message.find("tie broken by later position"), std::string::npos);
}

TEST_F(BoundaryResolverTest, ShortGapRejectsCandidate) {
    auto r = resolve("Abstract\n"
                     "Short text here.\n"
                     "\n"
                     "Introduction\n"
                     "The introduction has plenty of words to count as real content.\n");
    ASSERT_EQ(r.spans.size(), 1u);
    EXPECT_EQ(r.spans[0].name, SectionName::Introduction);
    EXPECT_TRUE(r.diagnostics.empty());
}

TEST_F(BoundaryResolverTest, EmptyTrailingHeadingExtendsPrevious) {
    auto r = resolve("Conclusion\n"
                     "The conclusion has plenty of words to count as real content.\n"
                     "\n"
                     "References\n");
    ASSERT_EQ(r.spans.size(), 1u);
    EXPECT_EQ(r.spans[0].name, SectionName::Conclusion);
    EXPECT_EQ(r.spans[0].end_line, lines.size());

    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].line_index, 2u);
}

TEST_F(BoundaryResolverTest, EmptyHeadingMergesIntoNextSpan) {
    SegmenterConfig cfg;
    cfg.resolver.min_content_words = 0;

    auto r = resolve("Abstract\n"
                     "\n"
                     "Introduction\n"
                     "Body of the introduction.\n",
                     cfg);
    ASSERT_EQ(r.spans.size(), 1u);
    EXPECT_EQ(r.spans[0].name, SectionName::Introduction);
    EXPECT_EQ(r.spans[0].start_line, 0u);
    EXPECT_EQ(r.spans[0].heading_line, 1u);
    EXPECT_EQ(r.spans[0].text, "Body of the introduction.");
}

TEST_F(BoundaryResolverTest, NoCandidatesNoSpans) {
    auto r = resolve("Nothing here looks like a heading.\nAt all.");
    EXPECT_TRUE(r.spans.empty());
    EXPECT_TRUE(r.diagnostics.empty());
}
