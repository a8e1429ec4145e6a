#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "rag_core/config/rag_config.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

class RagConfigTest : public ::testing::Test {
 protected:
  nlohmann::json config_ = TestUtilities::rag_config_json(16);
};

TEST_F(RagConfigTest, ParsesDatabasesStrategiesAndDatasets) {
  config_["datasets"] = {
      {{"name", "notes"}, {"data_processing_strategy", "standard"}, {"database", "docs_db"}}};

  RagConfig config = RagConfig::from_json(config_);

  ASSERT_EQ(config.databases.size(), 1u);
  const DatabaseConfig* db = config.find_database("docs_db");
  ASSERT_NE(db, nullptr);
  EXPECT_EQ(db->type, "MemoryStore");
  EXPECT_EQ(db->retrieval_strategies.size(), 4u);
  EXPECT_TRUE(db->find_retrieval_strategy("semantic")->is_default);
  EXPECT_EQ(db->find_retrieval_strategy("missing"), nullptr);
  EXPECT_EQ(db->find_embedding_strategy("hashing")->type, "HashingEmbedder");

  const ProcessingStrategyConfig* strategy = config.find_strategy("standard");
  ASSERT_NE(strategy, nullptr);
  ASSERT_EQ(strategy->parsers.size(), 3u);
  EXPECT_EQ(strategy->parsers[1].type, "CSVParser");
  EXPECT_EQ(strategy->parsers[1].position, 1u);
  EXPECT_EQ(strategy->parsers[0].priority, 10);
  EXPECT_EQ(strategy->parsers[0].file_include_patterns,
            (std::vector<std::string>{"*.md", "*.markdown"}));
  EXPECT_EQ(strategy->extractors[1].config["max_keywords"], 3);
  EXPECT_EQ(strategy->merge_policy, MergePolicy::LAST_WRITE_WINS);
  EXPECT_FALSE(strategy->deduplicate_chunks);

  ASSERT_EQ(config.datasets.size(), 1u);
  EXPECT_EQ(config.datasets[0].database, "docs_db");
}

TEST_F(RagConfigTest, ParsesDirectoryRulesAndMergePolicy) {
  config_["data_processing_strategies"][0]["directory_rules"] = {
      {{"pattern", "exports/*"}, {"parsers", {"CSVParser", "TextParser"}}}};
  config_["data_processing_strategies"][0]["metadata_merge_policy"] = "reject_conflicts";
  config_["data_processing_strategies"][0]["deduplicate_chunks"] = true;

  const ProcessingStrategyConfig* strategy =
      RagConfig::from_json(config_).find_strategy("standard");

  ASSERT_EQ(strategy->directory_rules.size(), 1u);
  EXPECT_EQ(strategy->directory_rules[0].parsers,
            (std::vector<std::string>{"CSVParser", "TextParser"}));
  EXPECT_EQ(strategy->merge_policy, MergePolicy::REJECT_CONFLICTS);
  EXPECT_TRUE(strategy->deduplicate_chunks);
}

TEST_F(RagConfigTest, RootMustBeObject) {
  EXPECT_THROW(RagConfig::from_json(nlohmann::json::array()), ConfigurationError);
}

TEST_F(RagConfigTest, DuplicateDatabaseNamesRejected) {
  config_["databases"].push_back(config_["databases"][0]);

  EXPECT_THROW(RagConfig::from_json(config_), ConfigurationError);
}

TEST_F(RagConfigTest, DuplicateRetrievalNamesRejected) {
  auto& retrievals = config_["databases"][0]["retrieval_strategies"];
  retrievals.push_back(retrievals[1]);

  EXPECT_THROW(RagConfig::from_json(config_), ConfigurationError);
}

TEST_F(RagConfigTest, DuplicateStrategyNamesRejected) {
  config_["data_processing_strategies"].push_back(config_["data_processing_strategies"][0]);

  EXPECT_THROW(RagConfig::from_json(config_), ConfigurationError);
}

TEST_F(RagConfigTest, MissingNamesAndTypesRejected) {
  nlohmann::json no_db_type = config_;
  no_db_type["databases"][0].erase("type");
  EXPECT_THROW(RagConfig::from_json(no_db_type), ConfigurationError);

  nlohmann::json no_parser_type = config_;
  no_parser_type["data_processing_strategies"][0]["parsers"][0].erase("type");
  EXPECT_THROW(RagConfig::from_json(no_parser_type), ConfigurationError);

  nlohmann::json incomplete_dataset = config_;
  incomplete_dataset["datasets"] = {{{"name", "notes"}, {"database", "docs_db"}}};
  EXPECT_THROW(RagConfig::from_json(incomplete_dataset), ConfigurationError);
}

TEST_F(RagConfigTest, UnknownMergePolicyRejected) {
  config_["data_processing_strategies"][0]["metadata_merge_policy"] = "newest";

  EXPECT_THROW(RagConfig::from_json(config_), ConfigurationError);
}

TEST_F(RagConfigTest, WrongShapesRejected) {
  nlohmann::json patterns_not_list = config_;
  patterns_not_list["data_processing_strategies"][0]["parsers"][0]["file_include_patterns"] = "*.md";
  EXPECT_THROW(RagConfig::from_json(patterns_not_list), ConfigurationError);

  nlohmann::json config_not_object = config_;
  config_not_object["databases"][0]["config"] = 5;
  EXPECT_THROW(RagConfig::from_json(config_not_object), ConfigurationError);

  nlohmann::json priority_not_int = config_;
  priority_not_int["data_processing_strategies"][0]["parsers"][0]["priority"] = "high";
  EXPECT_THROW(RagConfig::from_json(priority_not_int), ConfigurationError);
}

TEST_F(RagConfigTest, FromFileMissingThrows) {
  EXPECT_THROW(RagConfig::from_file("/nonexistent/rag_config.json"), ConfigurationError);
}

TEST_F(RagConfigTest, FromFileRoundTrip) {
  auto dir = TestUtilities::create_temp_dir("rag_config");
  auto path = TestUtilities::write_file(dir / "rag.json", config_.dump(2));

  RagConfig config = RagConfig::from_file(path.string());

  EXPECT_NE(config.find_strategy("standard"), nullptr);
  TestUtilities::cleanup_dir(dir);
}

TEST(MergePolicyTest, StringConversions) {
  EXPECT_EQ(to_string(MergePolicy::FIRST_WRITE_WINS), "first_write_wins");
  EXPECT_EQ(merge_policy_from_string("reject_conflicts"), MergePolicy::REJECT_CONFLICTS);
  EXPECT_THROW(merge_policy_from_string("LAST_WRITE_WINS"), ConfigurationError);
}

}  // namespace rag_tests
