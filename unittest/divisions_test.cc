#include "energygraph/divisions.h"
#include "gtest/gtest.h"

#include <limits>
#include <string>

using namespace ::egraph;

static std::vector<Division> drain(DivisionStream &stream) {
  std::vector<Division> res;
  while (auto div = stream.next())
    res.push_back(*div);
  return res;
}

TEST(DivisionsTest, FixedInterval) {
  FixedIntervalDivisionSource hours(3600, "%H:%M");
  auto stream = hours.divide(5400, 9000);
  std::vector<Division> divs = drain(*stream);
  ASSERT_EQ(divs.size(), 3u);
  EXPECT_EQ(divs[0].boundary, 3600);
  EXPECT_EQ(divs[0].label, "01:00");
  EXPECT_EQ(divs[1].boundary, 7200);
  EXPECT_EQ(divs[2].boundary, 10800);
  EXPECT_EQ(divs[2].label, "03:00");
  // The stream is exhausted for good
  EXPECT_FALSE(stream->next());
}

TEST(DivisionsTest, FixedIntervalAligned) {
  FixedIntervalDivisionSource days(86400, "%a %d %b");
  auto stream = days.divide(86400, 2 * 86400);
  std::vector<Division> divs = drain(*stream);
  ASSERT_EQ(divs.size(), 3u);
  EXPECT_EQ(divs[0].boundary, 86400);
  EXPECT_EQ(divs[0].label, "Fri 02 Jan");
  EXPECT_EQ(divs[2].boundary, 3 * 86400);
}

TEST(DivisionsTest, FixedIntervalBeforeEpoch) {
  FixedIntervalDivisionSource hours(3600, "%H");
  auto stream = hours.divide(-5400, 0);
  std::vector<Division> divs = drain(*stream);
  ASSERT_EQ(divs.size(), 4u);
  EXPECT_EQ(divs.front().boundary, -7200);
  EXPECT_EQ(divs.front().label, "22");
  EXPECT_EQ(divs.back().boundary, 3600);
}

TEST(DivisionsTest, List) {
  ListDivisionSource list(
      {{100, "a"}, {200, "b"}, {300, "c"}, {400, "d"}, {500, "e"}});
  auto stream = list.divide(250, 310);
  std::vector<Division> divs = drain(*stream);
  ASSERT_EQ(divs.size(), 3u);
  EXPECT_EQ(divs[0].label, "b");
  EXPECT_EQ(divs[1].label, "c");
  EXPECT_EQ(divs[2].label, "d");

  // Every call starts a fresh stream
  auto early = list.divide(50, 120);
  std::vector<Division> earlyDivs = drain(*early);
  ASSERT_EQ(earlyDivs.size(), 2u);
  EXPECT_EQ(earlyDivs[0].label, "a");
  EXPECT_EQ(earlyDivs[1].label, "b");
}

TEST(DivisionsTest, ListRunsOut) {
  ListDivisionSource list({{100, "a"}, {200, "b"}});
  auto stream = list.divide(150, 1000);
  std::vector<Division> divs = drain(*stream);
  ASSERT_EQ(divs.size(), 2u);
  EXPECT_EQ(divs[1].boundary, 200);
}

TEST(DivisionsTest, FormatUTC) {
  EXPECT_EQ(formatUTC(0, "%Y-%m-%d %H:%M"), "1970-01-01 00:00");
  EXPECT_EQ(formatUTC(1700000000, "%Y-%m-%d %H:%M:%S"),
            "2023-11-14 22:13:20");
}

TEST(DivisionsTest, FormatUTCOutOfRange) {
  constexpr int64_t latest = std::numeric_limits<int64_t>::max();
  EXPECT_EQ(formatUTC(latest, "%Y-%m-%d"), std::to_string(latest));
  constexpr int64_t earliest = std::numeric_limits<int64_t>::min();
  EXPECT_EQ(formatUTC(earliest, "%Y-%m-%d"), std::to_string(earliest));
}
