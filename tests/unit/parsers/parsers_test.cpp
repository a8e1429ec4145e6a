#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "common/utilities_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/parsers/csv_parser.hpp"
#include "rag_core/parsers/markdown_parser.hpp"
#include "rag_core/parsers/text_parser.hpp"

namespace rag_tests {

using namespace rag_core;

class ParsersTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("rag_parsers");
  }

  void TearDown() override {
    TestUtilities::cleanup_dir(temp_dir_);
  }

  std::filesystem::path write(const std::string& name, const std::string& content) {
    return TestUtilities::write_file(temp_dir_ / name, content);
  }

  std::filesystem::path temp_dir_;
};

TEST_F(ParsersTest, TextParser_SplitsParagraphs) {
  auto path = write("notes.txt", "First paragraph here.\n\nSecond paragraph here.\n");

  TextParser parser({{"chunk_size", 30}, {"chunk_overlap", 0}});
  auto chunks = parser.parse(path);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "First paragraph here.");
  EXPECT_EQ(chunks[1].text, "Second paragraph here.");
}

TEST_F(ParsersTest, TextParser_StripsBomAndCarriageReturns) {
  auto path = write("bom.txt", "\xEF\xBB\xBFHello world\r\nsecond line\r\n");

  auto chunks = TextParser().parse(path);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "Hello world\nsecond line");
}

TEST_F(ParsersTest, TextParser_InvalidUtf8IsParseError) {
  auto path = write("bad.txt", "valid line\n\xFF\xFE broken\n");

  EXPECT_THROW(TextParser().parse(path), ParseError);
}

TEST_F(ParsersTest, TextParser_MissingFileIsParseError) {
  EXPECT_THROW(TextParser().parse(temp_dir_ / "missing.txt"), ParseError);
}

TEST_F(ParsersTest, TextParser_RejectsBadChunking) {
  EXPECT_THROW(TextParser({{"chunk_size", 100}, {"chunk_overlap", 100}}), ConfigurationError);
}

TEST_F(ParsersTest, MarkdownParser_SectionsAndFrontMatter) {
  auto path = write("guide.md",
                    "---\n"
                    "title: Notes\n"
                    "---\n"
                    "# Intro\n"
                    "Intro text here.\n"
                    "\n"
                    "## Details\n"
                    "Detail text.\n");

  auto chunks = MarkdownParser().parse(path);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].metadata["section"], "Intro");
  EXPECT_EQ(chunks[0].text, "# Intro\nIntro text here.");
  EXPECT_EQ(chunks[1].metadata["section"], "Details");
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.text.find("title: Notes"), std::string::npos);
  }
}

TEST_F(ParsersTest, MarkdownParser_HeadingsInsideCodeFencesAreText) {
  auto path = write("setup.md",
                    "# Setup\n"
                    "```bash\n"
                    "# not a heading\n"
                    "make install\n"
                    "```\n");

  auto chunks = MarkdownParser().parse(path);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].metadata["section"], "Setup");
  EXPECT_NE(chunks[0].text.find("# not a heading"), std::string::npos);
}

TEST_F(ParsersTest, CSVParser_RendersRecordsWithColumnNames) {
  auto path = write("people.csv",
                    "name,age,notes\n"
                    "alice,30,\"likes, commas\"\n"
                    "bob,25,\"multi\nline\"\n");

  auto chunks = CSVParser().parse(path);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_NE(chunks[0].text.find("name: alice\nage: 30\nnotes: likes, commas"), std::string::npos);
  EXPECT_NE(chunks[0].text.find("notes: multi\nline"), std::string::npos);
  EXPECT_EQ(chunks[0].metadata["row_start"], 1);
  EXPECT_EQ(chunks[0].metadata["row_end"], 2);
  EXPECT_EQ(chunks[0].metadata["columns"], nlohmann::json({"name", "age", "notes"}));
}

TEST_F(ParsersTest, CSVParser_PacksWholeRecordsPerChunk) {
  auto path = write("words.csv", "id,word\n1,alpha\n2,beta\n3,gamma\n");

  CSVParser parser({{"chunk_size", 30}, {"chunk_overlap", 0}});
  auto chunks = parser.parse(path);

  ASSERT_EQ(chunks.size(), 3u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_LE(chunks[i].text.size(), 30u);
    EXPECT_EQ(chunks[i].metadata["row_start"], i + 1);
    EXPECT_EQ(chunks[i].metadata["row_end"], i + 1);
  }
  EXPECT_EQ(chunks[1].text, "id: 2\nword: beta");
}

TEST_F(ParsersTest, CSVParser_UnterminatedQuoteIsParseError) {
  auto path = write("broken.csv", "name,notes\nalice,\"never closed\n");

  EXPECT_THROW(CSVParser().parse(path), ParseError);
}

TEST_F(ParsersTest, CSVParser_TabDelimiter) {
  auto path = write("table.tsv", "key\tvalue\ncolor\tblue\n");

  auto chunks = CSVParser({{"delimiter", "tab"}}).parse(path);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "key: color\nvalue: blue");
}

TEST_F(ParsersTest, CSVParser_TsvExtensionSplitsOnTabs) {
  auto path = write("table.TSV", "key\tvalue\ncolor\tblue, green\n");

  auto chunks = CSVParser().parse(path);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "key: color\nvalue: blue, green");
  EXPECT_EQ(chunks[0].metadata["columns"], nlohmann::json({"key", "value"}));
}

TEST_F(ParsersTest, CSVParser_ConfiguredDelimiterWinsOverExtension) {
  CSVParser semicolons({{"delimiter", ";"}});
  CSVParser defaults;

  EXPECT_EQ(semicolons.delimiter_for("rows.tsv"), ';');
  EXPECT_EQ(defaults.delimiter_for("rows.tsv"), '\t');
  EXPECT_EQ(defaults.delimiter_for("rows.csv"), ',');
}

TEST_F(ParsersTest, CSVParser_SplitRecordHandlesEscapedQuotes) {
  auto fields = CSVParser::split_record("a,\"say \"\"hi\"\"\",c", ',');

  std::vector<std::string> expected = {"a", "say \"hi\"", "c"};
  EXPECT_EQ(fields, expected);
  EXPECT_THROW(CSVParser::split_record("a,\"open", ','), ParseError);
}

TEST_F(ParsersTest, CSVParser_RejectsMultiCharacterDelimiter) {
  EXPECT_THROW(CSVParser({{"delimiter", ";;"}}), ConfigurationError);
}

}  // namespace rag_tests
