#include "energygraph/svg_formatted_writer.h"
#include "energygraph/svg_writer.h"
#include "gtest/gtest.h"

#include <memory>
#include <sstream>

using namespace ::egraph::svg;

TEST(SVGWriterTest, Compact) {
  std::stringstream ss;
  SVGWriter svg(ss);
  svg.svg(width(10), height(20))->enter()->rect()->line()->finish();
  EXPECT_EQ(ss.str(), "<svg width=\"10\" height=\"20\"><rect></rect>"
                      "<line></line></svg>");
}

TEST(SVGWriterTest, EscapesAttributes) {
  std::stringstream ss;
  SVGWriter svg(ss);
  svg.text(class_("a\"b&c"))->enter()->content("x")->finish();
  EXPECT_EQ(ss.str(), "<text class=\"a&quot;b&amp;c\">x</text>");
}

TEST(SVGWriterTest, UnbalancedCalls) {
  std::stringstream ss;
  SVGWriter svg(ss);
  auto enterErr = svg.enter();
  ASSERT_TRUE(enterErr);
  EXPECT_EQ(enterErr.to_error().what(), "Cannot enter without an open tag");
  EXPECT_TRUE(svg.leave());
}

TEST(SVGWriterTest, Formatted) {
  std::stringstream ss;
  SVGFormattedWriter svg(ss);
  svg.svg(width(10))->enter()->rect()->finish();
  EXPECT_EQ(ss.str(), "<svg width=\"10\">\n  <rect></rect>\n</svg>\n");
}

TEST(SVGWriterTest, VirtualDispatch) {
  std::stringstream ss;
  std::unique_ptr<WriterConcept> writer =
      std::make_unique<WriterModel<SVGWriter>>(ss);
  EXPECT_FALSE(writer->path({d("M 0 0 L 1 1")}));
  EXPECT_FALSE(writer->finish());
  EXPECT_EQ(ss.str(), "<path d=\"M 0 0 L 1 1\"></path>");
}

TEST(SVGWriterTest, AttributeValues) {
  std::stringstream ss;
  SVGAttribute fractional = stroke_width(1.5);
  SVGAttribute whole = stroke_width(3u);
  EXPECT_EQ(fractional.getName(), whole.getName());
  EXPECT_STREQ(whole.getName(), "stroke-width");
  fractional.writeValue(ss);
  ss << ' ';
  whole.writeValue(ss);
  ss << ' ';
  SVGAttribute(font_family("a<b")).writeValue(ss);
  EXPECT_EQ(ss.str(), "1.5 3 a&lt;b");
}
