#include "energygraph/svg_logging_writer.h"
#include "gtest/gtest.h"

#include <sstream>

using namespace ::egraph::svg;

TEST(LoggingWriterTest, Simple) {
  std::stringstream ss;
  SVGLoggingWriter<SVGDummyWriter> svg(ss);
  svg.svg()->enter()->text()->enter()->content("Blah")->finish();
  EXPECT_EQ(ss.str(), "svg\nenter\ntext\nenter\ncontent: \"Blah\"\nfinish\n");
}

TEST(LoggingWriterTest, Attributes) {
  std::stringstream ss;
  SVGLoggingWriter<SVGDummyWriter> svg(ss);
  svg.rect(x(1), fill("red"));
  EXPECT_EQ(ss.str(), "rect(x=\"1\", fill=\"red\")\n");
}

TEST(LoggingWriterTest, ForwardsOutput) {
  std::stringstream log, out;
  SVGLoggingWriter<SVGWriter> svg(log, out);
  svg.g(class_("a"))->enter()->circle(r(2))->finish();
  EXPECT_EQ(out.str(), "<g class=\"a\"><circle r=\"2\"></circle></g>");
  EXPECT_EQ(log.str(), "g(class=\"a\")\nenter\ncircle(r=\"2\")\nfinish\n");
}

TEST(LoggingWriterTest, ForwardsErrors) {
  std::stringstream log;
  SVGLoggingWriter<SVGDummyWriter> svg(log);
  auto res = svg.leave();
  EXPECT_TRUE(res);
  EXPECT_EQ(log.str(), "leave\n");
}
