#include "core/errors.hpp"
#include "observability/metrics.hpp"
#include "pipeline/risk_pipeline.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

using namespace sentinel;
using namespace sentinel::pipeline;
using sentinel::testing::kEvaluationInstant;
using sentinel::testing::makeRaw;

class RiskPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability::getGlobalMetrics().reset();
    csv_path_ = ::testing::TempDir() + "sentinel_pipeline_test.csv";
  }

  void TearDown() override {
    std::remove(csv_path_.c_str());
  }

  void writeCsv(const std::string& contents) {
    std::ofstream file(csv_path_);
    file << contents;
  }

  std::vector<RawTransaction> sampleBatch() const {
    std::vector<RawTransaction> batch;
    for (int i = 0; i < 12; ++i) {
      RawTransaction tx = makeRaw(i % 2 == 0 ? "grocery" : "travel", 20.0 + i,
                                  40.0, -75.0, 40.0 + 0.01 * i, -75.0);
      tx.transaction_time = kEvaluationInstant - 3600 * i;
      tx.date_of_birth = EpochSeconds{573868800};
      batch.push_back(tx);
    }
    batch.push_back(makeRaw("grocery", 5000.0, 40.0, -75.0, 10.0, 10.0));
    batch.back().fraud_label = true;
    return batch;
  }

  std::string csv_path_;
};

TEST_F(RiskPipelineTest, RunProducesOneScoredRowPerInput) {
  RiskPipeline pipeline;
  auto batch = sampleBatch();
  auto snapshot = pipeline.run(batch, kEvaluationInstant);

  ASSERT_NE(snapshot, nullptr);
  ASSERT_EQ(snapshot->size(), batch.size());
  for (size_t i = 0; i < batch.size(); ++i) {
    EXPECT_EQ(snapshot->transactions()[i].category, batch[i].category);
    EXPECT_DOUBLE_EQ(snapshot->transactions()[i].amount, batch[i].amount);
  }
  EXPECT_EQ(snapshot->evaluationInstant(), kEvaluationInstant);
  EXPECT_EQ(snapshot->ingestReport().rows_read, batch.size());

  const auto& last = snapshot->transactions().back();
  EXPECT_TRUE(last.is_amount_anomaly);
  EXPECT_TRUE(last.is_distance_anomaly);
  EXPECT_TRUE(last.isAnomalous());

  const auto& first = snapshot->transactions().front();
  EXPECT_EQ(first.age.value_or(-1), 32);
  EXPECT_EQ(first.hour_of_day.value_or(-1), 0);
}

TEST_F(RiskPipelineTest, StatisticsAreExposed) {
  RiskPipeline pipeline;
  auto snapshot = pipeline.run(sampleBatch(), kEvaluationInstant);

  ASSERT_EQ(snapshot->categoryStatistics().size(), 2u);
  const CategoryStatistic* grocery = snapshot->findCategory("grocery");
  ASSERT_NE(grocery, nullptr);
  EXPECT_EQ(grocery->count, 7u);
  EXPECT_EQ(snapshot->findCategory("gas"), nullptr);

  ASSERT_TRUE(snapshot->distanceStatistic().has_value());
  EXPECT_EQ(snapshot->distanceStatistic()->count, 13u);

  auto categories = snapshot->categories();
  ASSERT_EQ(categories.size(), 2u);
  EXPECT_EQ(categories[0], "grocery");
  EXPECT_EQ(categories[1], "travel");
}

TEST_F(RiskPipelineTest, RepeatedRunsAreIdentical) {
  PipelineConfig config;
  config.enrichment_workers = 3;
  RiskPipeline pipeline(config);
  auto batch = sampleBatch();

  auto first = pipeline.run(batch, kEvaluationInstant);
  auto second = pipeline.run(batch, kEvaluationInstant);

  ASSERT_EQ(first->size(), second->size());
  for (size_t i = 0; i < first->size(); ++i) {
    const auto& a = first->transactions()[i];
    const auto& b = second->transactions()[i];
    EXPECT_EQ(a.amount_z_score, b.amount_z_score);
    EXPECT_EQ(a.distance_km, b.distance_km);
    EXPECT_EQ(a.is_amount_anomaly, b.is_amount_anomaly);
    EXPECT_EQ(a.is_distance_anomaly, b.is_distance_anomaly);
  }
}

TEST_F(RiskPipelineTest, EmptyBatch) {
  RiskPipeline pipeline;
  auto snapshot = pipeline.run({}, kEvaluationInstant);
  EXPECT_TRUE(snapshot->empty());
  EXPECT_TRUE(snapshot->categoryStatistics().empty());
  EXPECT_FALSE(snapshot->distanceStatistic().has_value());
}

TEST_F(RiskPipelineTest, RecordsStageMetrics) {
  RiskPipeline pipeline;
  pipeline.run(sampleBatch(), kEvaluationInstant);

  auto& metrics = observability::getGlobalMetrics();
  EXPECT_DOUBLE_EQ(metrics.counterValue("sentinel_rows_enriched_total"), 13.0);
  EXPECT_EQ(metrics.histogramCount("sentinel_enrichment_duration_seconds"), 1u);
  EXPECT_EQ(metrics.histogramCount("sentinel_scoring_duration_seconds"), 1u);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("sentinel_categories"), 2.0);
  EXPECT_GE(metrics.gaugeValue("sentinel_amount_anomalies"), 1.0);

  std::string exported = metrics.exportMetrics();
  EXPECT_NE(exported.find("# HELP sentinel_rows_enriched_total Rows passed through enrichment"),
            std::string::npos);
  EXPECT_NE(exported.find("sentinel_scoring_duration_seconds_count 1"), std::string::npos);
}

TEST_F(RiskPipelineTest, RunFileReadsCsv) {
  writeCsv(
      "trans_date_trans_time,category,amt,lat,long,merch_lat,merch_long,dob,is_fraud,merchant\n"
      "21/06/2020 12:14,grocery,10,40,-75,40,-75,09/03/1988,0,m1\n"
      "21/06/2020 13:00,grocery,1010,40,-75,40.5,-75,09/03/1988,1,m2\n"
      "21/06/2020 14:30,travel,oops,40,-75,41,-75,09/03/1988,0,m3\n");

  RiskPipeline pipeline;
  auto snapshot = pipeline.runFile(csv_path_, kEvaluationInstant);

  ASSERT_EQ(snapshot->size(), 3u);
  EXPECT_EQ(snapshot->ingestReport().source, csv_path_);
  EXPECT_EQ(snapshot->ingestReport().malformed_fields, 1u);

  const auto& rows = snapshot->transactions();
  EXPECT_NEAR(rows[1].amount_z_score, 1.0, 1e-9);
  EXPECT_EQ(rows[1].hour_of_day.value_or(-1), 13);
  EXPECT_EQ(rows[0].age.value_or(-1), 32);
  EXPECT_TRUE(std::isnan(rows[2].amount_z_score));
  EXPECT_FALSE(rows[2].is_amount_anomaly);

  EXPECT_EQ(observability::getGlobalMetrics().histogramCount("sentinel_ingest_duration_seconds"),
            1u);
}

TEST_F(RiskPipelineTest, RunFileMissingColumnsIsFatal) {
  writeCsv("category,amt\ngrocery,10\n");
  RiskPipeline pipeline;
  EXPECT_THROW(pipeline.runFile(csv_path_, kEvaluationInstant), IngestError);
}

TEST_F(RiskPipelineTest, RunFileMissingFileIsFatal) {
  RiskPipeline pipeline;
  EXPECT_THROW(pipeline.runFile("/nonexistent/transactions.csv", kEvaluationInstant),
               IngestError);
}
