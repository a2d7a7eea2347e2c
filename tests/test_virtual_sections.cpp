#include <gtest/gtest.h>
#include "SamplePapers.hpp"
#include "paper/LineNormalizer.hpp"
#include "paper/Segmenter.hpp"
#include "paper/VirtualSections.hpp"

using namespace paper;

TEST(VirtualSectionsTest, AuthorLineHeuristics) {
    SegmenterConfig cfg;
    EXPECT_TRUE(is_author_line("jane@example.org", cfg));
    EXPECT_TRUE(is_author_line("Department of Computer Science", cfg));
    EXPECT_TRUE(is_author_line("Alice Brown, Bob White and Carol Green", cfg));
    EXPECT_TRUE(is_author_line("Ludwig van Beethoven, Johann Bach", cfg));
    EXPECT_TRUE(is_author_line("Jane Doe1*, John Smith2", cfg));
    EXPECT_TRUE(is_author_line("Alice Brown1 and Bob White2", cfg));
    EXPECT_TRUE(is_author_line("J. Doe and A. Smith", cfg));

    EXPECT_FALSE(is_author_line("Deep Learning for Segmentation", cfg));
    EXPECT_FALSE(is_author_line("Results, Discussion and Outlook", cfg));
}

TEST(VirtualSectionsTest, TitleCaseTitleWithAndIsNotAnAuthorList) {
    SegmenterConfig cfg;
    EXPECT_FALSE(is_author_line("Graph Neural Networks and Deep Learning", cfg));
    EXPECT_FALSE(is_author_line("Alice Brown and Bob White", cfg));

    auto r = segment_text("Graph Neural Networks and Deep Learning\n"
                          "Jane Doe, John Smith\n"
                          "jane@example.com\n"
                          "\n"
                          "Abstract\n"
                          "We look at the structure of papers and how headings can be found.\n");
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, "Graph Neural Networks and Deep Learning");
}

TEST(VirtualSectionsTest, TitleFallsBackWhenOnlyMetadataPrecedesHeading) {
    auto r = segment_text("Jane Doe, John Smith\n"
                          "jane@example.com\n"
                          "\n"
                          "Abstract\n"
                          "We look at the structure of papers and how headings can be found.\n");
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, "Jane Doe, John Smith");
    EXPECT_EQ(title->start_line, 0u);
    EXPECT_EQ(title->end_line, 1u);
}

TEST(VirtualSectionsTest, RunningHeadersNeedSeveralPages) {
    auto lines = normalize_lines(split_raw_lines("JOURNAL OF TESTING\nbody\fJOURNAL OF TESTING\nbody\nONCE ONLY"));
    auto headers = find_running_headers(lines, VirtualConfig{});
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.count("JOURNAL OF TESTING"), 1u);
}

TEST(VirtualSectionsTest, TitleSkipsAuthorsAndEmail) {
    auto r = segment_text(samples::basic_paper());
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_TRUE(title->is_virtual);
    EXPECT_EQ(title->text, "A Study of Structure Recovery in Papers");
    EXPECT_EQ(title->start_line, 0u);
    EXPECT_EQ(title->end_line, 1u);
}

TEST(VirtualSectionsTest, TitleSpanningLinesIsJoined) {
    auto r = segment_text("Deep Structure Recovery\n"
                          "for Scientific Papers\n"
                          "Alice Brown, Bob White\n"
                          "\n"
                          "Abstract\n"
                          "The abstract text has enough words to count as content here.\n");
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, "Deep Structure Recovery for Scientific Papers");
}

TEST(VirtualSectionsTest, TitleSkipsRunningHeaderAndAffiliation) {
    auto r = segment_text("JOURNAL OF TESTING\n"
                          "A Compact Title For Testing\n"
                          "Alice Brown1 and Bob White2\n"
                          "Department of Physics, Example University\n"
                          "\n"
                          "Abstract\n"
                          "The abstract text has enough words to count as content here.\n"
                          "\f"
                          "JOURNAL OF TESTING\n"
                          "\n"
                          "Introduction\n"
                          "We present a new approach to testing the extraction of titles today.\n");
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, "A Compact Title For Testing");

    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_EQ(contrib->text, "We present a new approach to testing the extraction of titles today.");
    EXPECT_FALSE(contrib->low_confidence);
}

TEST(VirtualSectionsTest, ContributionIsVerbatimCueSentence) {
    auto r = segment_text(samples::basic_paper());
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_TRUE(contrib->is_virtual);
    EXPECT_FALSE(contrib->low_confidence);
    EXPECT_EQ(contrib->text, "In this paper, we propose a heading detector for extracted text.");
    EXPECT_EQ(contrib->start_line, contrib->end_line);
}

TEST(VirtualSectionsTest, RepeatedCueSentenceAppearsOnce) {
    auto r = segment_text("Dedup Title Line Here\n"
                          "\n"
                          "Abstract\n"
                          "We propose a compact segmenter for papers. It is fast enough.\n"
                          "\n"
                          "Introduction\n"
                          "We propose a compact segmenter for papers. Other work is slower than ours today.\n");
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_EQ(contrib->text, "We propose a compact segmenter for papers.");
}

TEST(VirtualSectionsTest, ContributionFallsBackToAbstractLead) {
    auto r = segment_text(samples::paper_without_cues());
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_TRUE(contrib->low_confidence);
    EXPECT_EQ(contrib->text, "Segmentation of documents is a classic problem. Headings are short lines.");
}

TEST(VirtualSectionsTest, NoHeadingsNoContribution) {
    auto lines = normalize_lines(split_raw_lines("In this paper we propose nothing at all.\nSecond line."));
    SectionSpan out;
    EXPECT_FALSE(extract_contribution(lines, {}, SegmenterConfig{}, out));

    ASSERT_TRUE(extract_title(lines, {}, SegmenterConfig{}, out));
    EXPECT_EQ(out.text, "In this paper we propose nothing at all.");
}

TEST(VirtualSectionsTest, TitleAboveAuthorBlock) {
    auto r = segment_text("Deep Learning for X\n"
                          "Jane Doe, John Smith\n"
                          "jane@example.com\n"
                          "\n"
                          "Abstract\n"
                          "We look at the structure of papers and how headings can be found.\n");
    const SectionSpan* title = r.map.find(SectionName::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text, "Deep Learning for X");
}

TEST(VirtualSectionsTest, ContributionKeepsOnlyCueSentence) {
    auto r = segment_text("Segmenting Flat Text\n"
                          "\n"
                          "Abstract\n"
                          "Segmentation matters for readers. In this work, we propose a novel method for Y. "
                          "Experiments follow later in the text.\n"
                          "\n"
                          "Introduction\n"
                          "Extracted text loses layout, so section structure has to be recovered by heuristics.\n");
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_FALSE(contrib->low_confidence);
    EXPECT_EQ(contrib->text, "In this work, we propose a novel method for Y.");
}

TEST(VirtualSectionsTest, ContributionStartsAfterEtAlCitation) {
    auto r = segment_text("Fast Heading Detection\n"
                          "\n"
                          "Abstract\n"
                          "Headings were studied by Smith et al. We propose a faster detector for flat text. "
                          "It runs in linear time.\n"
                          "\n"
                          "Introduction\n"
                          "Extracted text loses layout, so section structure has to be recovered by heuristics.\n");
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_FALSE(contrib->low_confidence);
    EXPECT_EQ(contrib->text, "We propose a faster detector for flat text.");
}

TEST(VirtualSectionsTest, ContributionEndsAtCapitalizedModelName) {
    auto r = segment_text("Model Naming Matters\n"
                          "\n"
                          "Abstract\n"
                          "In this paper, we propose a model called Net B. Experiments on ten datasets show large gains.\n"
                          "\n"
                          "Introduction\n"
                          "Extracted text loses layout, so section structure has to be recovered by heuristics.\n");
    const SectionSpan* contrib = r.map.find(SectionName::Contribution);
    ASSERT_NE(contrib, nullptr);
    EXPECT_EQ(contrib->text, "In this paper, we propose a model called Net B.");
}
