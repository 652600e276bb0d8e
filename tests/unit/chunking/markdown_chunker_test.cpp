#include "lens_core/chunking/markdown_chunker.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "lens_core/errors.hpp"

namespace lens_tests {

// Test-only subclass that exposes the protected stages for direct testing
class TestableChunker : public lens_core::MarkdownChunker {
 public:
  using lens_core::MarkdownChunker::MarkdownChunker;
  using lens_core::MarkdownChunker::merge_small_sections;
  using lens_core::MarkdownChunker::Section;
  using lens_core::MarkdownChunker::split_by_headings;
  using lens_core::MarkdownChunker::split_by_paragraphs;
};

class MarkdownChunkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tokenizer_ = std::make_shared<const lens_core::WordPieceTokenizer>();
  }

  TestableChunker make_chunker(int max_tokens = 1000, int merge_threshold = 750) {
    return TestableChunker(tokenizer_, lens_core::ChunkerOptions{
                                           .max_chunk_tokens = max_tokens,
                                           .merge_threshold_tokens = merge_threshold});
  }

  static std::string collapse_whitespace(const std::string &text) {
    std::istringstream stream(text);
    std::string word;
    std::string out;
    while (stream >> word) {
      if (!out.empty()) {
        out += ' ';
      }
      out += word;
    }
    return out;
  }

  static std::string paragraphs(size_t count, size_t words_each, const std::string &word) {
    std::string text;
    for (size_t i = 0; i < count; ++i) {
      if (i > 0) {
        text += "\n\n";
      }
      text += TestUtilities::repeat_words(words_each, word);
    }
    return text;
  }

  lens_core::TokenizerPtr tokenizer_;
};

TEST_F(MarkdownChunkerTest, RejectsNonPositiveBudgets) {
  EXPECT_THROW(make_chunker(0, 750), lens_core::ConfigurationError);
  EXPECT_THROW(make_chunker(1000, 0), lens_core::ConfigurationError);
  EXPECT_THROW(make_chunker(-5, 750), lens_core::ConfigurationError);
}

TEST_F(MarkdownChunkerTest, RejectsMissingTokenizer) {
  EXPECT_THROW(lens_core::MarkdownChunker(nullptr, lens_core::ChunkerOptions{}),
               lens_core::ConfigurationError);
}

TEST_F(MarkdownChunkerTest, EmptyOrWhitespaceInputYieldsNoChunks) {
  auto chunker = make_chunker();
  EXPECT_TRUE(chunker.chunk("").empty());
  EXPECT_TRUE(chunker.chunk("  \n\n \t\n").empty());
}

TEST_F(MarkdownChunkerTest, TextWithoutHeadingsIsOneHeadinglessChunk) {
  auto chunker = make_chunker();
  auto chunks = chunker.chunk("Just a short note.\n\nWith two paragraphs.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_FALSE(chunks[0].heading.has_value());
  EXPECT_EQ(chunks[0].content, "Just a short note.\n\nWith two paragraphs.");
  EXPECT_EQ(chunks[0].token_count, tokenizer_->count_tokens(chunks[0].content));
}

TEST_F(MarkdownChunkerTest, SmallSectionsMergeUnderFirstHeading) {
  auto chunker = make_chunker(1000, 750);
  std::string text = "## First\n\n" + TestUtilities::repeat_words(200) + "\n\n## Second\n\n" +
                     TestUtilities::repeat_words(100);

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 1u);
  ASSERT_TRUE(chunks[0].heading.has_value());
  EXPECT_EQ(*chunks[0].heading, "First");
  EXPECT_EQ(chunks[0].token_count, 300u);
}

TEST_F(MarkdownChunkerTest, OversizedSectionSplitsOnParagraphs) {
  auto chunker = make_chunker(1000, 750);
  std::string text = paragraphs(5, 500, "alpha");
  ASSERT_EQ(tokenizer_->count_tokens(text), 2500u);

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 3u);
  size_t total = 0;
  for (const auto &chunk : chunks) {
    EXPECT_LE(chunk.token_count, 1000u);
    EXPECT_FALSE(chunk.heading.has_value());
    total += chunk.token_count;
  }
  EXPECT_EQ(total, 2500u);
}

TEST_F(MarkdownChunkerTest, SectionsAboveMergeThresholdStaySeparate) {
  auto chunker = make_chunker(1000, 750);
  std::string text = "## One\n\n" + TestUtilities::repeat_words(500) + "\n\n## Two\n\n" +
                     TestUtilities::repeat_words(400, "beta");

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(*chunks[0].heading, "One");
  EXPECT_EQ(*chunks[1].heading, "Two");
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[1].chunk_index, 1);
}

TEST_F(MarkdownChunkerTest, PreambleTakesTheFollowingHeadingWhenMerged) {
  auto chunker = make_chunker();
  auto chunks = chunker.chunk("Intro words here.\n\n## Setup\n\nInstall the tool.");

  ASSERT_EQ(chunks.size(), 1u);
  ASSERT_TRUE(chunks[0].heading.has_value());
  EXPECT_EQ(*chunks[0].heading, "Setup");
  EXPECT_EQ(chunks[0].content, "Intro words here.\n\nInstall the tool.");
}

TEST_F(MarkdownChunkerTest, SingleOversizedParagraphIsKeptWhole) {
  auto chunker = make_chunker(100, 50);
  std::string text = TestUtilities::repeat_words(30) + "\n\n" + TestUtilities::repeat_words(250) +
                     "\n\n" + TestUtilities::repeat_words(30);

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].token_count, 30u);
  EXPECT_EQ(chunks[1].token_count, 250u);
  EXPECT_EQ(chunks[2].token_count, 30u);
}

TEST_F(MarkdownChunkerTest, OnlyLevelTwoAndThreeHeadingsStartSections) {
  auto chunker = make_chunker();
  std::string text =
      "# Title\n\nLead.\n\n## Level two\n\nBody two.\n\n### Level three\n\nBody three.\n\n"
      "#### Level four\n\nStill three.";

  auto sections = chunker.split_by_headings(text);

  ASSERT_EQ(sections.size(), 3u);
  EXPECT_FALSE(sections[0].heading.has_value());
  EXPECT_EQ(sections[0].text, "# Title\n\nLead.");
  EXPECT_EQ(*sections[1].heading, "Level two");
  EXPECT_EQ(sections[1].text, "Body two.");
  EXPECT_EQ(*sections[2].heading, "Level three");
  EXPECT_EQ(sections[2].text, "Body three.\n\n#### Level four\n\nStill three.");
}

TEST_F(MarkdownChunkerTest, HeadingWithoutBodyProducesNoSection) {
  auto chunker = make_chunker();
  auto sections = chunker.split_by_headings("## Empty\n## Filled\nSome body.");

  ASSERT_EQ(sections.size(), 1u);
  EXPECT_EQ(*sections[0].heading, "Filled");
  EXPECT_EQ(sections[0].text, "Some body.");
}

TEST_F(MarkdownChunkerTest, HeadingsOnlyInputFallsBackToWholeText) {
  auto chunker = make_chunker();
  auto chunks = chunker.chunk("## Alone\n### Also alone");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_FALSE(chunks[0].heading.has_value());
  EXPECT_EQ(chunks[0].content, "## Alone\n### Also alone");
}

TEST_F(MarkdownChunkerTest, MergeIsGreedyAgainstTheRunningSection) {
  auto chunker = make_chunker(1000, 10);
  std::vector<TestableChunker::Section> sections = {
      {std::string("A"), TestUtilities::repeat_words(6)},
      {std::string("B"), TestUtilities::repeat_words(6)},
      {std::string("C"), TestUtilities::repeat_words(3)},
  };

  auto merged = chunker.merge_small_sections(sections);

  // A+B exceeds 10, B+C fits: only the later pair merges
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(*merged[0].heading, "A");
  EXPECT_EQ(*merged[1].heading, "B");
  EXPECT_EQ(tokenizer_->count_tokens(merged[1].text), 9u);
}

TEST_F(MarkdownChunkerTest, ParagraphPackingNeverExceedsBudget) {
  auto chunker = make_chunker(25, 10);
  std::string text = paragraphs(9, 7, "word");

  auto pieces = chunker.split_by_paragraphs(text);

  // 7 + 7 + 7 = 21 fits, a fourth paragraph would not
  ASSERT_EQ(pieces.size(), 3u);
  for (const auto &piece : pieces) {
    EXPECT_LE(tokenizer_->count_tokens(piece), 25u);
  }
}

TEST_F(MarkdownChunkerTest, IndicesAreContiguousAndContentIsPreserved) {
  auto chunker = make_chunker(40, 20);
  std::string body_one = paragraphs(4, 15, "lorem");
  std::string body_two = paragraphs(3, 12, "ipsum");
  std::string text = "Preamble sentence.\n\n## Part one\n\n" + body_one + "\n\n### Part two\n\n" +
                     body_two + "\n\n\n\n";

  auto chunks = chunker.chunk(text);

  ASSERT_FALSE(chunks.empty());
  std::string joined;
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
    EXPECT_FALSE(chunks[i].content.empty());
    EXPECT_LE(chunks[i].token_count, 40u);
    joined += chunks[i].content + "\n";
  }
  EXPECT_EQ(collapse_whitespace(joined),
            collapse_whitespace("Preamble sentence.\n" + body_one + "\n" + body_two));
}

TEST_F(MarkdownChunkerTest, RechunkingIsIdempotent) {
  auto chunker = make_chunker(60, 30);
  std::string text = "## Alpha\n\n" + paragraphs(5, 20, "alpha") + "\n\n## Beta\n\n" +
                     paragraphs(2, 10, "beta");

  auto first = chunker.chunk(text);
  auto second = chunker.chunk(text);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].chunk_index, second[i].chunk_index);
    EXPECT_EQ(first[i].content, second[i].content);
    EXPECT_EQ(first[i].heading, second[i].heading);
  }
}

TEST_F(MarkdownChunkerTest, HandlesWindowsLineEndings) {
  auto chunker = make_chunker();
  auto sections = chunker.split_by_headings("## Heading\r\nBody line\r\n");

  ASSERT_EQ(sections.size(), 1u);
  EXPECT_EQ(*sections[0].heading, "Heading");
  EXPECT_EQ(sections[0].text, "Body line");
}

TEST_F(MarkdownChunkerTest, VeryLongHeadingLineIsKeptWhole) {
  auto chunker = make_chunker();
  std::string heading(100000, 'a');

  auto chunks = chunker.chunk("## " + heading + "\n\nbody text\n");

  ASSERT_EQ(chunks.size(), 1u);
  ASSERT_TRUE(chunks[0].heading.has_value());
  EXPECT_EQ(chunks[0].heading->size(), heading.size());
  EXPECT_EQ(chunks[0].content, "body text");
}

TEST_F(MarkdownChunkerTest, LongNewlineRunSeparatesParagraphs) {
  auto chunker = make_chunker(1000, 750);
  std::string text = "para one\n" + std::string(100000, '\n') + "para two\n" +
                     TestUtilities::repeat_words(1200);

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content, "para one");
  EXPECT_EQ(chunks[1].content.rfind("para two\n", 0), 0u);
}

TEST_F(MarkdownChunkerTest, BlankHeadingIsTreatedAsNoHeading) {
  auto chunker = make_chunker();

  auto sections = chunker.split_by_headings("##   \nintro words\n## Named\nmore words");
  ASSERT_EQ(sections.size(), 2u);
  EXPECT_FALSE(sections[0].heading.has_value());

  // The merged section picks up the next real heading
  auto chunks = chunker.chunk("##   \nintro words\n## Named\nmore words");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].heading, std::optional<std::string>("Named"));
}

TEST_F(MarkdownChunkerTest, HeadingNeedsTwoOrThreeHashesAndWhitespace) {
  auto chunker = make_chunker();

  auto sections = chunker.split_by_headings("#### Deep\n##NoSpace\n### Third\nbody");

  ASSERT_EQ(sections.size(), 2u);
  EXPECT_FALSE(sections[0].heading.has_value());
  EXPECT_EQ(sections[0].text, "#### Deep\n##NoSpace");
  EXPECT_EQ(sections[1].heading, std::optional<std::string>("Third"));
}

TEST(StripTest, TrimsBothEnds) {
  EXPECT_EQ(lens_core::strip("  \n text \t\n"), "text");
  EXPECT_EQ(lens_core::strip("   "), "");
  EXPECT_EQ(lens_core::strip("inner  space"), "inner  space");
}

}  // namespace lens_tests
