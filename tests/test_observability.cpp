#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace sentinel::observability;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  }

  void TearDown() override {
    static std::ostringstream discard;
    Logger::getInstance().setOutputStream(discard);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  std::vector<nlohmann::json> entries() const {
    std::vector<nlohmann::json> parsed;
    std::istringstream lines(output_.str());
    std::string line;
    while (std::getline(lines, line)) {
      parsed.push_back(nlohmann::json::parse(line));
    }
    return parsed;
  }

  std::ostringstream output_;
};

TEST_F(LoggerTest, EmitsOneJsonObjectPerLine) {
  Logger::getInstance().info("Batch \"loaded\"\n", "ingest");
  Logger::getInstance().warn("second");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 2u);
  EXPECT_EQ(logged[0]["level"], "INFO");
  EXPECT_EQ(logged[0]["message"], "Batch \"loaded\"\n");
  EXPECT_EQ(logged[0]["component"], "ingest");
  EXPECT_TRUE(logged[0].contains("timestamp"));
  EXPECT_TRUE(logged[0].contains("thread"));
  EXPECT_EQ(logged[1]["level"], "WARN");
  EXPECT_FALSE(logged[1].contains("component"));
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::WARN);

  Logger::getInstance().debug("hidden");
  Logger::getInstance().info("hidden");
  Logger::getInstance().error("shown");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 1u);
  EXPECT_EQ(logged[0]["level"], "ERROR");
}

TEST_F(LoggerTest, BuilderAttachesTypedFields) {
  {
    Logger::LogBuilder(LogLevel::INFO, "Scored batch", "scoring")
        .field("rows", size_t{42})
        .field("workers", 3)
        .field("ratio", 0.25)
        .field("undefined", std::numeric_limits<double>::quiet_NaN())
        .field("parallel", true)
        .field("source", "inline.csv");
  }

  auto logged = entries();
  ASSERT_EQ(logged.size(), 1u);
  EXPECT_EQ(logged[0]["rows"], 42);
  EXPECT_EQ(logged[0]["workers"], 3);
  EXPECT_DOUBLE_EQ(logged[0]["ratio"].get<double>(), 0.25);
  EXPECT_TRUE(logged[0]["undefined"].is_null());
  EXPECT_EQ(logged[0]["parallel"], true);
  EXPECT_EQ(logged[0]["source"], "inline.csv");
}

TEST_F(LoggerTest, InvalidUtf8IsReplacedNotThrown) {
  EXPECT_NO_THROW({
    Logger::LogBuilder(LogLevel::WARN, "Unparsable field", "ingest")
        .field("value", std::string("12\xE9"));
  });
  Logger::getInstance().error("bad byte \xFF in message");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 2u);
  EXPECT_EQ(logged[0]["value"], "12\xEF\xBF\xBD");
  EXPECT_EQ(logged[1]["message"], "bad byte \xEF\xBF\xBD in message");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(parseLogLevel("debug").value_or(LogLevel::FATAL), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("Warning").value_or(LogLevel::FATAL), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("ERROR").value_or(LogLevel::FATAL), LogLevel::ERROR);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(MetricsTest, CountersAndGauges) {
  MetricsCollector metrics;
  metrics.incrementCounter("rows_total");
  metrics.incrementCounter("rows_total", 4.0);
  metrics.setGauge("anomalies", 7.0);
  metrics.setGauge("anomalies", 3.0);

  EXPECT_DOUBLE_EQ(metrics.counterValue("rows_total"), 5.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("anomalies"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("missing"), 0.0);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("rows_total"), 0.0);
}

TEST(MetricsTest, HistogramExportIsCumulative) {
  MetricsCollector metrics;
  metrics.describe("stage_seconds", "Stage duration");
  metrics.observeHistogram("stage_seconds", 0.002);
  metrics.observeHistogram("stage_seconds", 0.2);
  metrics.observeHistogram("stage_seconds", 60.0);
  EXPECT_EQ(metrics.histogramCount("stage_seconds"), 3u);

  std::string exported = metrics.exportMetrics();
  EXPECT_NE(exported.find("# HELP stage_seconds Stage duration"), std::string::npos);
  EXPECT_NE(exported.find("# TYPE stage_seconds histogram"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_bucket{le=\"0.001\"} 0"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_bucket{le=\"0.005\"} 1"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_bucket{le=\"0.25\"} 2"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_bucket{le=\"10\"} 2"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_bucket{le=\"+Inf\"} 3"), std::string::npos);
  EXPECT_NE(exported.find("stage_seconds_count 3"), std::string::npos);
}

TEST(MetricsTest, TimerObservesOnScopeExit) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "scoped_seconds");
    EXPECT_EQ(metrics.histogramCount("scoped_seconds"), 0u);
  }
  EXPECT_EQ(metrics.histogramCount("scoped_seconds"), 1u);
}
