#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <swipe/batch/config.hpp>

using namespace std::chrono_literals;
using swipe::batch::BatchConfig;
using swipe::clustering::DistanceKind;

TEST(BatchConfigTest, Defaults) {
  BatchConfig config;
  EXPECT_EQ(config.embedding_update_interval, 12h);
  EXPECT_EQ(config.clustering_interval, 24h);
  EXPECT_EQ(config.batch_size, 100u);
  EXPECT_EQ(config.max_items_per_run, 5000u);
  EXPECT_FLOAT_EQ(config.clustering.epsilon, 0.25f);
  EXPECT_EQ(config.clustering.min_points, 3);
  EXPECT_EQ(config.clustering.distance, DistanceKind::Cosine);
  EXPECT_NO_THROW(config.validate());
}

TEST(BatchConfigTest, EmptyObjectKeepsDefaults) {
  auto config = BatchConfig::from_json_string("{}");
  EXPECT_EQ(config.batch_size, 100u);
  EXPECT_EQ(config.clustering_interval, 24h);
}

TEST(BatchConfigTest, ParsesAllKeys) {
  auto config = BatchConfig::from_json_string(R"({
    "embedding_update_interval_ms": 60000,
    "clustering_interval_ms": 120000,
    "batch_size": 50,
    "max_items_per_run": 700,
    "clustering": {"epsilon": 0.4, "min_points": 6, "distance": "euclidean"}
  })");

  EXPECT_EQ(config.embedding_update_interval, 1min);
  EXPECT_EQ(config.clustering_interval, 2min);
  EXPECT_EQ(config.batch_size, 50u);
  EXPECT_EQ(config.max_items_per_run, 700u);
  EXPECT_FLOAT_EQ(config.clustering.epsilon, 0.4f);
  EXPECT_EQ(config.clustering.min_points, 6);
  EXPECT_EQ(config.clustering.distance, DistanceKind::Euclidean);
}

TEST(BatchConfigTest, PartialClusteringBlock) {
  auto config = BatchConfig::from_json_string(R"({"clustering": {"min_points": 8}})");
  EXPECT_FLOAT_EQ(config.clustering.epsilon, 0.25f);
  EXPECT_EQ(config.clustering.min_points, 8);
}

TEST(BatchConfigTest, RejectsNonPositiveValues) {
  EXPECT_THROW((void)BatchConfig::from_json_string(R"({"batch_size": 0})"),
               std::invalid_argument);
  EXPECT_THROW((void)BatchConfig::from_json_string(R"({"batch_size": -5})"),
               std::invalid_argument);
  EXPECT_THROW((void)BatchConfig::from_json_string(R"({"max_items_per_run": 0})"),
               std::invalid_argument);
  EXPECT_THROW((void)BatchConfig::from_json_string(R"({"clustering_interval_ms": 0})"),
               std::invalid_argument);
  EXPECT_THROW((void)BatchConfig::from_json_string(R"({"clustering": {"epsilon": 0}})"),
               std::invalid_argument);
}

TEST(BatchConfigTest, RejectsUnknownDistance) {
  EXPECT_THROW(
      (void)BatchConfig::from_json_string(R"({"clustering": {"distance": "hamming"}})"),
      std::invalid_argument);
}

TEST(BatchConfigTest, MalformedJsonThrows) {
  EXPECT_THROW((void)BatchConfig::from_json_string("{not json"), nlohmann::json::parse_error);
}

TEST(BatchConfigTest, RoundTripThroughJson) {
  BatchConfig original;
  original.batch_size = 42;
  original.clustering_interval = 90min;
  original.clustering.distance = DistanceKind::Euclidean;

  auto parsed = BatchConfig::from_json_string(original.to_json_string());
  EXPECT_EQ(parsed.batch_size, 42u);
  EXPECT_EQ(parsed.clustering_interval, 90min);
  EXPECT_EQ(parsed.clustering.distance, DistanceKind::Euclidean);
}

TEST(BatchConfigTest, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "swipe_batch_config_test.json";
  {
    std::ofstream file(path);
    file << R"({"batch_size": 7})";
  }

  auto config = BatchConfig::from_json(path.string());
  EXPECT_EQ(config.batch_size, 7u);
  std::filesystem::remove(path);
}

TEST(BatchConfigTest, MissingFileThrows) {
  EXPECT_THROW((void)BatchConfig::from_json("/nonexistent/swipe/batch.json"),
               std::runtime_error);
}
