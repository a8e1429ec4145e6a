#include <gtest/gtest.h>

#include <string>

#include "rag_core/parsers/csv_parser.hpp"
#include "rag_core/parsers/markdown_parser.hpp"
#include "rag_core/parsers/text_parser.hpp"
#include "rag_core/routing/format_router.hpp"
#include "rag_core/routing/format_sniffer.hpp"

namespace rag_tests {

using namespace rag_core;

namespace {

ComponentConfig parser_entry(const std::string& type, std::vector<std::string> includes,
                             int priority, size_t position,
                             std::vector<std::string> excludes = {}) {
  ComponentConfig entry;
  entry.type = type;
  entry.file_include_patterns = std::move(includes);
  entry.file_exclude_patterns = std::move(excludes);
  entry.priority = priority;
  entry.position = position;
  return entry;
}

FormatRouter::FormatTable builtin_formats() {
  return {{TextParser::TYPE, TextParser::supported_formats()},
          {MarkdownParser::TYPE, MarkdownParser::supported_formats()},
          {CSVParser::TYPE, CSVParser::supported_formats()}};
}

std::vector<std::string> types_of(const RouteDecision& decision) {
  std::vector<std::string> types;
  for (const auto& parser : decision.parsers) {
    types.push_back(parser.type);
  }
  return types;
}

}  // namespace

class FormatRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    strategy_.name = "standard";
    strategy_.parsers = {parser_entry("MarkdownParser", {"*.md"}, 10, 0),
                         parser_entry("CSVParser", {"*.csv"}, 10, 1),
                         parser_entry("TextParser", {}, 0, 2)};
  }

  ProcessingStrategyConfig strategy_;
};

TEST_F(FormatRouterTest, Route_ExtensionMatchSelectsIncludingParser) {
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("docs/guide.md", "# Title\n");

  EXPECT_TRUE(decision.supported());
  EXPECT_EQ(decision.matched_by, "extension");
  EXPECT_EQ(decision.format, formats::MARKDOWN);
  EXPECT_EQ(types_of(decision), std::vector<std::string>({"MarkdownParser"}));
}

TEST_F(FormatRouterTest, Route_PatternsAreCaseInsensitive) {
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("REPORT.CSV", "a,b\n1,2\n");

  EXPECT_EQ(types_of(decision), std::vector<std::string>({"CSVParser"}));
}

TEST_F(FormatRouterTest, Route_HigherPriorityFirst) {
  strategy_.parsers = {parser_entry("TextParser", {"*.md"}, 1, 0),
                       parser_entry("MarkdownParser", {"*.md"}, 5, 1)};
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("notes.md", "text");

  EXPECT_EQ(types_of(decision), std::vector<std::string>({"MarkdownParser", "TextParser"}));
}

TEST_F(FormatRouterTest, Route_NoExtensionMatchFallsBackToContent) {
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("README", "Just some plain words.\n");

  EXPECT_EQ(decision.matched_by, "content");
  EXPECT_EQ(decision.format, formats::TEXT);
  // Both read text; priority decides the order.
  EXPECT_EQ(types_of(decision), std::vector<std::string>({"MarkdownParser", "TextParser"}));
}

TEST_F(FormatRouterTest, Route_BinaryContentIsUnsupported) {
  FormatRouter router(strategy_, builtin_formats());

  const std::string png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
  RouteDecision decision = router.route("image.png", png);

  EXPECT_FALSE(decision.supported());
  EXPECT_EQ(decision.format, formats::BINARY);
}

TEST_F(FormatRouterTest, Route_DirectoryRuleRestrictsCandidates) {
  strategy_.directory_rules = {{"logs/*", {"TextParser"}}};
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("logs/today.md", "# not really markdown\n");

  EXPECT_EQ(decision.matched_by, "directory");
  EXPECT_EQ(types_of(decision), std::vector<std::string>({"TextParser"}));
}

TEST_F(FormatRouterTest, Route_DirectoryRuleWithoutReadableParserIsUnsupported) {
  strategy_.directory_rules = {{"tables/*", {"CSVParser"}}};
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("tables/readme.txt", "plain text\n");

  EXPECT_EQ(decision.matched_by, "directory");
  EXPECT_FALSE(decision.supported());
}

TEST_F(FormatRouterTest, Route_ExcludePatternSkipsParser) {
  strategy_.parsers = {parser_entry("MarkdownParser", {"*.md"}, 10, 0, {"drafts/*"}),
                       parser_entry("TextParser", {}, 0, 1)};
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("drafts/idea.md", "# Idea\n");

  EXPECT_EQ(decision.matched_by, "content");
  EXPECT_EQ(types_of(decision), std::vector<std::string>({"TextParser"}));
}

TEST_F(FormatRouterTest, Route_KeepsPositionForInstantiation) {
  FormatRouter router(strategy_, builtin_formats());

  RouteDecision decision = router.route("data.csv", "a,b\n");

  ASSERT_EQ(decision.parsers.size(), 1u);
  EXPECT_EQ(decision.parsers[0].position, 1u);
}

TEST(MatchesAnyPatternTest, MatchesBaseNameOrFullPath) {
  EXPECT_TRUE(matches_any_pattern("a/b/c.txt", {"*.txt"}));
  EXPECT_TRUE(matches_any_pattern("a/b/c.txt", {"a/*"}));
  EXPECT_FALSE(matches_any_pattern("a/b/c.txt", {"*.md", "b/*"}));
  EXPECT_FALSE(matches_any_pattern("a/b/c.txt", {}));
}

TEST(FormatSnifferTest, FormatFromExtension) {
  EXPECT_EQ(FormatSniffer::format_from_extension("x.MD"), formats::MARKDOWN);
  EXPECT_EQ(FormatSniffer::format_from_extension("x.tsv"), formats::CSV);
  EXPECT_EQ(FormatSniffer::format_from_extension("x.jsonl"), formats::JSON);
  EXPECT_EQ(FormatSniffer::format_from_extension("x.png"), "");
  EXPECT_EQ(FormatSniffer::format_from_extension("Makefile"), "");
}

TEST(FormatSnifferTest, SniffMagicBytes) {
  EXPECT_EQ(FormatSniffer::sniff("%PDF-1.7\n"), formats::PDF);
  EXPECT_EQ(FormatSniffer::sniff(std::string("PK\x03\x04rest", 8)), formats::ZIP);
  EXPECT_EQ(FormatSniffer::sniff(std::string("ab\0cd", 5)), formats::BINARY);
}

TEST(FormatSnifferTest, SniffTextualFormats) {
  EXPECT_EQ(FormatSniffer::sniff("  {\"a\": 1}"), formats::JSON);
  EXPECT_EQ(FormatSniffer::sniff("<!DOCTYPE html><html></html>"), formats::HTML);
  EXPECT_EQ(FormatSniffer::sniff("a,b,c\n1,2,3\n4,5,6\n"), formats::CSV);
  EXPECT_EQ(FormatSniffer::sniff("# Title\n\n- item\n- other\n\n**bold** words\n"),
            formats::MARKDOWN);
  EXPECT_EQ(FormatSniffer::sniff("Nothing special here.\n"), formats::TEXT);
}

TEST(FormatSnifferTest, SniffToleratesCodePointCutAtWindowEnd) {
  // "hé" with the second byte of é cut off by the sniff window.
  EXPECT_EQ(FormatSniffer::sniff("h\xC3"), formats::TEXT);
  EXPECT_EQ(FormatSniffer::sniff("\xFF\xFF\xFF\xFF\xFF plain"), formats::BINARY);
}

TEST(FormatSnifferTest, DetectPrefersExtension) {
  EXPECT_EQ(FormatSniffer::detect("data.csv", "no commas at all"), formats::CSV);
  EXPECT_EQ(FormatSniffer::detect("data.bin", std::string("\0\1", 2)), formats::BINARY);
}

}  // namespace rag_tests
