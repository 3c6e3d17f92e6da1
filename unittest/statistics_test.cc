#include "energygraph/statistics.h"
#include "gtest/gtest.h"

using namespace ::egraph;

/// @p count samples one minute apart whose value is their chronological
/// index.
static std::vector<Sample> indexSamples(size_t count) {
  std::vector<Sample> samples;
  for (size_t i = 0; i < count; ++i)
    samples.push_back({1000 + static_cast<int64_t>(i) * 60,
                       static_cast<double>(i)});
  return samples;
}

TEST(StatisticsTest, StrideWindows) {
  StatisticsAggregator aggregator(indexSamples(40), 4);
  std::vector<StatSample> stats = aggregator.collect();
  ASSERT_EQ(stats.size(), 4u);
  EXPECT_FALSE(aggregator.ranOutOfHistory());

  // Bucket 0 holds the newest sample and every fourth one before it:
  // 39, 35, ..., 3
  EXPECT_EQ(stats[0].timestamp, 1000 + 39 * 60);
  EXPECT_DOUBLE_EQ(stats[0].current, 39.);
  EXPECT_DOUBLE_EQ(stats[0].average, 21.);
  EXPECT_DOUBLE_EQ(stats[0].q1, 11.);
  EXPECT_DOUBLE_EQ(stats[0].q3, 31.);

  EXPECT_EQ(stats[3].timestamp, 1000 + 36 * 60);
  EXPECT_DOUBLE_EQ(stats[3].current, 36.);
  EXPECT_DOUBLE_EQ(stats[3].average, 18.);
}

TEST(StatisticsTest, UnevenWindows) {
  // 10 samples over 4 buckets: windows of 3, 3, 2 and 2 values
  StatisticsAggregator aggregator(indexSamples(10), 4);
  std::vector<StatSample> stats = aggregator.collect();
  ASSERT_EQ(stats.size(), 4u);
  EXPECT_DOUBLE_EQ(stats[0].average, (9. + 5. + 1.) / 3);
  EXPECT_DOUBLE_EQ(stats[3].average, (6. + 2.) / 2);
}

TEST(StatisticsTest, RunsOutOfHistory) {
  StatisticsAggregator aggregator(indexSamples(3), 4);
  std::vector<StatSample> stats = aggregator.collect();
  ASSERT_EQ(stats.size(), 3u);
  EXPECT_TRUE(aggregator.ranOutOfHistory());
  EXPECT_EQ(aggregator.getProducedBuckets(), 3u);
  EXPECT_EQ(aggregator.getRequestedBuckets(), 4u);
  EXPECT_DOUBLE_EQ(stats[2].current, 0.);
}

TEST(StatisticsTest, ProduceOnce) {
  StatisticsAggregator aggregator(indexSamples(8), 2);
  ASSERT_TRUE(aggregator.next());
  ASSERT_TRUE(aggregator.next());
  EXPECT_FALSE(aggregator.next());
  EXPECT_FALSE(aggregator.next());
  EXPECT_TRUE(aggregator.collect().empty());
}

TEST(StatisticsTest, NoSamples) {
  StatisticsAggregator aggregator({}, 4);
  EXPECT_TRUE(aggregator.collect().empty());
  EXPECT_TRUE(aggregator.ranOutOfHistory());
}

TEST(StatisticsTest, QuartilesMayCrossAverage) {
  std::vector<Sample> samples{{0, 0}, {60, 0}, {120, 0}, {180, 100}};
  StatisticsAggregator aggregator(samples, 1);
  auto stat = aggregator.next();
  ASSERT_TRUE(stat);
  EXPECT_DOUBLE_EQ(stat->current, 100.);
  EXPECT_DOUBLE_EQ(stat->average, 25.);
  EXPECT_DOUBLE_EQ(stat->q1, 0.);
  EXPECT_DOUBLE_EQ(stat->q3, 0.);
  EXPECT_LT(stat->q3, stat->average);
}

TEST(StatisticsTest, Columns) {
  StatSample sample{0, 1., 2., 3., 4.};
  EXPECT_DOUBLE_EQ(sample.get(StatSample::CONSUMPTION), 1.);
  EXPECT_DOUBLE_EQ(sample.get(StatSample::Q3), 4.);
  for (StatSample::Column column : StatSample::AllColumns)
    EXPECT_EQ(StatSample::parseColumn(StatSample::getColumnName(column)),
              column);
  EXPECT_EQ(StatSample::parseColumn("current"), StatSample::CONSUMPTION);
  EXPECT_FALSE(StatSample::parseColumn("median"));
}
