#ifndef ENERGYGRAPH_STATISTICS_H
#define ENERGYGRAPH_STATISTICS_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace egraph {

/// A raw power reading as delivered by the data source.
struct Sample {
  int64_t timestamp; ///< unix seconds
  double value;
};

/// Summary of one bucket: the most recent reading at this position of the
/// period together with statistics over all historical periods.
/// Note that q1 <= average <= q3 does not hold in general.
struct StatSample {
  enum Column { CONSUMPTION, AVERAGE, Q1, Q3 };
  static constexpr Column AllColumns[] = {CONSUMPTION, AVERAGE, Q1, Q3};

  int64_t timestamp;
  double current;
  double average;
  double q1;
  double q3;

  double get(Column column) const;
  static const char *getColumnName(Column column);
  /// Looks up a column by name. "current" is accepted as an alias of
  /// "consumption".
  static std::optional<Column> parseColumn(std::string_view name);
};

/// Turns an over-fetched sample series into per-bucket statistics.
///
/// The samples are indexed newest-first. Bucket i collects the samples at
/// indices i, i + bucketCount, i + 2 * bucketCount, ..., i.e. the same
/// position within every historical period. Buckets are produced in
/// ascending i, so the most recent bucket comes first. The first empty
/// bucket ends the sequence: fewer than bucketCount results mean the
/// history ran out.
class StatisticsAggregator {
public:
  /// The series is materialized since windows are selected by stride.
  /// @p samples must be ordered oldest to newest.
  StatisticsAggregator(std::vector<Sample> samples, size_t bucketCount)
      : samples(std::move(samples)), bucketCount(bucketCount) {}

  /// Produces the next bucket or std::nullopt once the sequence has ended.
  /// The sequence cannot be restarted.
  std::optional<StatSample> next();
  /// Drains all remaining buckets.
  std::vector<StatSample> collect();

  size_t getRequestedBuckets() const { return bucketCount; }
  size_t getProducedBuckets() const { return bucket; }
  /// True if the sequence ended before bucketCount buckets were produced.
  bool ranOutOfHistory() const { return done && bucket < bucketCount; }

private:
  const Sample &newest(size_t idx) const {
    return samples[samples.size() - 1 - idx];
  }

  std::vector<Sample> samples;
  size_t bucketCount;
  size_t bucket = 0;
  bool done = false;
};

} // namespace egraph
#endif // ENERGYGRAPH_STATISTICS_H
