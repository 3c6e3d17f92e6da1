#include "energygraph/energy_graph.h"
#include "gtest/gtest.h"

#include <sstream>

using namespace ::egraph;

static std::vector<Sample> indexSamples(size_t count) {
  std::vector<Sample> samples;
  for (size_t i = 0; i < count; ++i)
    samples.push_back({1000 + static_cast<int64_t>(i) * 60,
                       static_cast<double>(i)});
  return samples;
}

static size_t countOf(const std::string &haystack, const std::string &needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size()))
    ++count;
  return count;
}

static GraphOptions smallOptions() {
  GraphOptions options;
  options.bucketCount = 4;
  options.statsDuration = 10;
  return options;
}

TEST(EnergyGraphTest, Markup) {
  auto markup = renderEnergyGraph(indexSamples(40), nullptr, smallOptions());
  ASSERT_FALSE(markup) << markup.to_error();
  EXPECT_EQ(markup->rfind("<svg version=\"1.1\" width=\"840\" height=\"630\" "
                          "viewBox=\"0 0 840 630\"",
                          0),
            0u);
  EXPECT_EQ(countOf(*markup, "class=\"energy-graph\""), 1u);
  EXPECT_EQ(countOf(*markup, "<path class=\"region\""), 1u);
  for (const char *column : {"consumption", "average", "q1", "q3"})
    EXPECT_EQ(countOf(*markup, std::string("<path class=\"") + column + "\""),
              1u)
        << column;
  // Values reach 39, so gridlines sit at 0, 10, ..., 40
  EXPECT_EQ(countOf(*markup, "<g class=\"gridline\">"), 5u);
  EXPECT_NE(markup->find(">40 kW</text>"), std::string::npos);
  EXPECT_EQ(countOf(*markup, "<g class=\"energy-graph-overlay\">"), 4u);
  EXPECT_EQ(countOf(*markup, "<circle"), 16u);
  EXPECT_EQ(countOf(*markup, "interval-block"), 0u);
  EXPECT_EQ(markup->find("<style>"), std::string::npos);
  EXPECT_EQ(markup->substr(markup->size() - 6), "</svg>");
}

TEST(EnergyGraphTest, ZOrder) {
  ListDivisionSource divisions({{0, "A"}, {3200, "B"}, {4000, "C"}});
  auto markup = renderEnergyGraph(indexSamples(40), &divisions,
                                  smallOptions());
  ASSERT_FALSE(markup) << markup.to_error();
  const char *order[] = {"<g class=\"interval-blocks\">",
                         "<g class=\"gridlines\">",
                         "<path class=\"region\"",
                         "<path class=\"consumption\"",
                         "<path class=\"average\"",
                         "<path class=\"q1\"",
                         "<path class=\"q3\"",
                         "<g class=\"overlays\">"};
  size_t last = 0;
  for (const char *marker : order) {
    size_t pos = markup->find(marker);
    ASSERT_NE(pos, std::string::npos) << marker;
    EXPECT_GT(pos, last) << marker;
    last = pos;
  }
}

TEST(EnergyGraphTest, DocumentStructure) {
  ListDivisionSource divisions({{0, "A"}, {3200, "B"}, {4000, "C"}});
  auto doc = buildEnergyGraph(indexSamples(40), &divisions, smallOptions());
  ASSERT_FALSE(doc) << doc.to_error();
  EXPECT_DOUBLE_EQ(doc->width, 840.);
  EXPECT_EQ(doc->cssClass, "energy-graph");
  ASSERT_EQ(doc->children.size(), 8u);

  const auto &blocks = std::get<Group>(doc->children[0].value);
  EXPECT_EQ(blocks.cssClass, "interval-blocks");
  ASSERT_EQ(blocks.children.size(), 2u);
  EXPECT_EQ(std::get<IntervalBlock>(blocks.children[0].value).label.content,
            "A");
  EXPECT_EQ(std::get<IntervalBlock>(blocks.children[1].value).label.content,
            "B");
  // Blocks are clipped to the plotted time range
  const Rect &first = std::get<IntervalBlock>(blocks.children[0].value)
                          .background;
  EXPECT_NEAR(first.x, 60., 1e-6);

  EXPECT_TRUE(std::holds_alternative<GraphRegion>(doc->children[2].value));
  const StatSample::Column columns[] = {StatSample::CONSUMPTION,
                                        StatSample::AVERAGE, StatSample::Q1,
                                        StatSample::Q3};
  for (size_t i = 0; i < 4; ++i)
    EXPECT_EQ(std::get<GraphLine>(doc->children[3 + i].value).column,
              columns[i]);
  const auto &overlays = std::get<Group>(doc->children[7].value);
  EXPECT_EQ(overlays.children.size(), 4u);
}

TEST(EnergyGraphTest, PlotsOldestFirst) {
  auto doc = buildEnergyGraph(indexSamples(40), nullptr, smallOptions());
  ASSERT_FALSE(doc) << doc.to_error();
  const auto &line = std::get<GraphLine>(doc->children[2].value);
  const auto &points = std::get<CubicPath>(line.path.segments[0]).getPoints();
  ASSERT_EQ(points.size(), 4u);
  GraphOptions defaults;
  EXPECT_NEAR(points.front().x, defaults.marginLeft, 1e-6);
  EXPECT_NEAR(points.back().x, defaults.width - defaults.marginRight,
              1e-6);
  // Consumption 36 .. 39 on a 0 .. 40 axis, higher values further up
  EXPECT_GT(points.front().y, points.back().y);
}

TEST(EnergyGraphTest, HoverStyles) {
  GraphOptions options = smallOptions();
  options.embedHoverStyles = true;
  auto markup = renderEnergyGraph(indexSamples(40), nullptr, options);
  ASSERT_FALSE(markup) << markup.to_error();
  EXPECT_NE(markup->find("<style>.energy-graph-overlay { opacity: 0; }\n"
                         ".energy-graph-overlay:hover { opacity: 1; }\n"
                         "</style>"),
            std::string::npos);
}

TEST(EnergyGraphTest, FormattedMarkup) {
  GraphOptions options = smallOptions();
  options.formatted = true;
  auto markup = renderEnergyGraph(indexSamples(40), nullptr, options);
  ASSERT_FALSE(markup) << markup.to_error();
  EXPECT_NE(markup->find("\n  <g class=\"gridlines\">\n"), std::string::npos);
}

TEST(EnergyGraphTest, InsufficientData) {
  std::stringstream log;
  GraphOptions options = smallOptions();
  options.log = &log;
  auto markup = renderEnergyGraph(indexSamples(3), nullptr, options);
  ASSERT_FALSE(markup) << markup.to_error();
  EXPECT_EQ(countOf(*markup, "<g class=\"energy-graph-overlay\">"), 3u);
  EXPECT_NE(log.str().find("Warning: InsufficientDataError: produced 3 of 4"),
            std::string::npos);
  EXPECT_NE(log.str().find("Plotted 3 buckets"), std::string::npos);
}

TEST(EnergyGraphTest, DegenerateRanges) {
  // A single bucket spans no time
  GraphOptions single = smallOptions();
  single.bucketCount = 1;
  auto oneBucket = renderEnergyGraph(indexSamples(40), nullptr, single);
  ASSERT_TRUE(oneBucket);
  EXPECT_EQ(oneBucket.to_error().getKind(), GraphError::DEGENERATE_RANGE);

  std::vector<Sample> zeros = indexSamples(40);
  for (Sample &sample : zeros)
    sample.value = 0;
  auto flat = renderEnergyGraph(zeros, nullptr, smallOptions());
  ASSERT_TRUE(flat);
  EXPECT_EQ(flat.to_error().getKind(), GraphError::DEGENERATE_RANGE);

  auto empty = buildEnergyGraph({}, nullptr, smallOptions());
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty.to_error().getKind(), GraphError::DEGENERATE_RANGE);
}
