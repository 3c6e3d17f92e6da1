#ifndef ENERGYGRAPH_STYLE_H
#define ENERGYGRAPH_STYLE_H

#include "energygraph/svg_writer.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace egraph {

/// Stroke and fill properties of a primitive. Styles are immutable and
/// shared between the nodes that use them.
struct Style final {
  Style(std::string stroke = "black", std::string fill = "black",
        double strokeWidth = 1, double strokeOpacity = 1,
        double fillOpacity = 1)
      : stroke(std::move(stroke)), fill(std::move(fill)),
        strokeWidth(strokeWidth), strokeOpacity(strokeOpacity),
        fillOpacity(fillOpacity) {}

  const std::string stroke;
  const std::string fill;
  const double strokeWidth;
  const double strokeOpacity;
  const double fillOpacity;

  /// Appends the presentation attributes. The attributes refer to this
  /// style's strings.
  void appendAttrs(std::vector<svg::SVGAttribute> &attrs) const;
};

using StyleRef = std::shared_ptr<const Style>;

template <typename... args_t> StyleRef makeStyle(args_t &&... args) {
  return std::make_shared<const Style>(std::forward<args_t>(args)...);
}

/// Simple estimate of font metrics, used for sizing caption boxes.
struct FontInfo {
  FontInfo() = default;
  FontInfo(std::string font, double fontSize)
      : font(std::move(font)), fontSize(fontSize) {}

  const std::string &getFont() const { return font; }
  double getSize() const { return fontSize; }

  double getWidth(std::string_view text) const {
    return text.size() * fontSize * 0.6;
  }
  double getHeight() const { return fontSize; }

private:
  std::string font = "sans-serif";
  double fontSize = 12;
};

} // namespace egraph
#endif // ENERGYGRAPH_STYLE_H
