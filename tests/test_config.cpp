#include "config/sentinel_config.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace sentinel;
using observability::LogLevel;

TEST(SentinelConfigTest, EmptyDocumentKeepsDefaults) {
  auto config = SentinelConfig::fromJson(nlohmann::json::object());

  EXPECT_EQ(config.logging.level, LogLevel::INFO);
  EXPECT_TRUE(config.pipeline.ingest.day_first);
  EXPECT_EQ(config.pipeline.enrichment_workers, 1u);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.epsilon, 1e-9);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.amount_z_threshold, 2.0);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.distance_sigma_multiplier, 2.0);
  EXPECT_EQ(config.pipeline.scoring.stddev_kind, StddevKind::POPULATION);
  EXPECT_TRUE(config.filter.categories.empty());
  EXPECT_FALSE(config.filter.anomalies_only);
  EXPECT_EQ(config.report.top_alerts, 20u);
  EXPECT_FALSE(config.report.include_transactions);
  EXPECT_FALSE(config.evaluation_instant.has_value());
}

TEST(SentinelConfigTest, ReadsEverySection) {
  auto document = nlohmann::json::parse(R"({
    "logging": {"level": "debug"},
    "ingest": {"day_first": false, "max_logged_warnings": 3},
    "enrichment": {"worker_threads": 4},
    "scoring": {"epsilon": 1e-6, "amount_z_threshold": 3, "distance_sigma_multiplier": 2.5,
                "stddev": "sample"},
    "filter": {"categories": ["travel", "grocery_pos"], "anomalies_only": true},
    "report": {"top_alerts": 5, "include_transactions": true},
    "evaluation_date": "2020-06-21",
    "unknown_section": {"ignored": 1}
  })");

  auto config = SentinelConfig::fromJson(document);
  EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
  EXPECT_FALSE(config.pipeline.ingest.day_first);
  EXPECT_EQ(config.pipeline.ingest.max_logged_warnings, 3u);
  EXPECT_EQ(config.pipeline.enrichment_workers, 4u);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.epsilon, 1e-6);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.amount_z_threshold, 3.0);
  EXPECT_DOUBLE_EQ(config.pipeline.scoring.distance_sigma_multiplier, 2.5);
  EXPECT_EQ(config.pipeline.scoring.stddev_kind, StddevKind::SAMPLE);
  EXPECT_EQ(config.filter.categories.size(), 2u);
  EXPECT_EQ(config.filter.categories.count("travel"), 1u);
  EXPECT_TRUE(config.filter.anomalies_only);
  EXPECT_EQ(config.report.top_alerts, 5u);
  EXPECT_TRUE(config.report.include_transactions);
  EXPECT_EQ(config.evaluation_instant.value_or(0), 1592697600);
}

TEST(SentinelConfigTest, InvalidValuesAreRejected) {
  auto reject = [](const char* text) {
    EXPECT_THROW(SentinelConfig::fromJson(nlohmann::json::parse(text)), ConfigError) << text;
  };

  reject(R"([1, 2])");
  reject(R"({"logging": "debug"})");
  reject(R"({"logging": {"level": "verbose"}})");
  reject(R"({"enrichment": {"worker_threads": 0}})");
  reject(R"({"enrichment": {"worker_threads": -2}})");
  reject(R"({"enrichment": {"worker_threads": 1.5}})");
  reject(R"({"scoring": {"epsilon": 0}})");
  reject(R"({"scoring": {"epsilon": "small"}})");
  reject(R"({"scoring": {"stddev": "median"}})");
  reject(R"({"filter": {"categories": "travel"}})");
  reject(R"({"report": {"top_alerts": -1}})");
  reject(R"({"evaluation_date": "someday"})");
}

TEST(SentinelConfigTest, FromFile) {
  std::string path = ::testing::TempDir() + "sentinel_config_test.json";
  {
    std::ofstream file(path);
    file << R"({"report": {"top_alerts": 7}})";
  }
  auto config = SentinelConfig::fromFile(path);
  EXPECT_EQ(config.report.top_alerts, 7u);

  {
    std::ofstream file(path);
    file << "{ not json";
  }
  EXPECT_THROW(SentinelConfig::fromFile(path), ConfigError);
  std::remove(path.c_str());

  EXPECT_THROW(SentinelConfig::fromFile("/nonexistent/sentinel.json"), ConfigError);
}
