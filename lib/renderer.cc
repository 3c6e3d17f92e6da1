#include "energygraph/renderer.h"
#include "energygraph/svg_formatted_writer.h"

#include <memory>
#include <sstream>

using namespace egraph;
using RetTy = svg::WriterConcept::RetTy;

void Style::appendAttrs(std::vector<svg::SVGAttribute> &attrs) const {
  attrs.insert(attrs.end(),
               {svg::stroke(stroke.c_str()), svg::fill(fill.c_str()),
                svg::stroke_width(strokeWidth),
                svg::stroke_opacity(strokeOpacity),
                svg::fill_opacity(fillOpacity)});
}

namespace {
/// Dispatches on the node alternative. Every overload writes exactly one
/// element (with its subtree) so that siblings keep their order.
struct NodeRenderer {
  svg::WriterConcept &writer;

  RetTy renderChildren(const NodeList &children) {
    for (const Node &child : children)
      if (auto err = std::visit(*this, child.value))
        return err;
    return {};
  }
  RetTy renderContainer(RetTy opened, const NodeList &children) {
    if (opened)
      return opened;
    if (auto err = writer.enter())
      return err;
    if (auto err = renderChildren(children))
      return err;
    return writer.leave();
  }
  RetTy renderText(const char *text) {
    if (auto err = writer.enter())
      return err;
    std::string escaped = xml_escape(text);
    if (auto err = writer.content(escaped.c_str()))
      return err;
    return writer.leave();
  }
  RetTy renderPath(const Path &path, const char *cssClass) {
    std::vector<svg::SVGAttribute> attrs;
    if (cssClass)
      attrs.push_back(svg::class_(cssClass));
    if (path.style)
      path.style->appendAttrs(attrs);
    std::string data = formatPathData(path.segments, path.closed);
    attrs.push_back(svg::d(data.c_str()));
    return writer.path(attrs);
  }

  RetTy operator()(const Document &doc) {
    std::string vBox;
    {
      std::stringstream ss;
      ss << 0 << " " << 0 << " " << doc.width << " " << doc.height;
      vBox = ss.str();
    }
    std::vector<svg::SVGAttribute> attrs{
        svg::version(), svg::width(doc.width), svg::height(doc.height),
        svg::viewBox(vBox.c_str()), svg::xmlns()};
    if (!doc.cssClass.empty())
      attrs.push_back(svg::class_(doc.cssClass.c_str()));
    if (auto err = writer.svg(attrs))
      return err;
    if (auto err = writer.enter())
      return err;
    if (!doc.styleSheet.empty()) {
      std::string css;
      for (const std::string &rule : doc.styleSheet)
        css += rule + "\n";
      if (auto err = writer.style({}))
        return err;
      if (auto err = renderText(css.c_str()))
        return err;
    }
    if (auto err = renderChildren(doc.children))
      return err;
    return writer.leave();
  }
  RetTy operator()(const Group &group) {
    std::vector<svg::SVGAttribute> attrs;
    if (!group.cssClass.empty())
      attrs.push_back(svg::class_(group.cssClass.c_str()));
    return renderContainer(writer.g(attrs), group.children);
  }
  RetTy operator()(const Rect &rect) {
    std::vector<svg::SVGAttribute> attrs;
    if (rect.style)
      rect.style->appendAttrs(attrs);
    attrs.insert(attrs.end(), {svg::x(rect.x), svg::y(rect.y),
                               svg::width(rect.width),
                               svg::height(rect.height)});
    return writer.rect(attrs);
  }
  RetTy operator()(const Line &line) {
    std::vector<svg::SVGAttribute> attrs;
    if (line.style)
      line.style->appendAttrs(attrs);
    attrs.insert(attrs.end(), {svg::x1(line.x1), svg::y1(line.y1),
                               svg::x2(line.x2), svg::y2(line.y2)});
    if (!line.dashes.empty())
      attrs.push_back(svg::stroke_dasharray(line.dashes.c_str()));
    return writer.line(attrs);
  }
  RetTy operator()(const Text &text) {
    std::vector<svg::SVGAttribute> attrs{svg::x(text.x), svg::y(text.y)};
    if (!text.anchor.empty())
      attrs.push_back(svg::text_anchor(text.anchor.c_str()));
    if (!text.fontFamily.empty())
      attrs.push_back(svg::font_family(text.fontFamily.c_str()));
    if (text.fontSize > 0)
      attrs.push_back(svg::font_size(text.fontSize));
    if (!text.cssClass.empty())
      attrs.push_back(svg::class_(text.cssClass.c_str()));
    if (auto err = writer.text(attrs))
      return err;
    return renderText(text.content.c_str());
  }
  RetTy operator()(const Path &path) { return renderPath(path, nullptr); }
  RetTy operator()(const DataPoint &point) {
    std::vector<svg::SVGAttribute> attrs;
    if (point.style)
      point.style->appendAttrs(attrs);
    attrs.insert(attrs.end(), {svg::cx(point.center.x),
                               svg::cy(point.center.y), svg::r(point.radius)});
    if (auto err = writer.circle(attrs))
      return err;
    if (auto err = writer.enter())
      return err;
    if (auto err = writer.title({}))
      return err;
    if (auto err = renderText(point.title.c_str()))
      return err;
    return writer.leave();
  }
  RetTy operator()(const IntervalBlock &block) {
    if (auto err = writer.g({svg::class_("interval-block")}))
      return err;
    if (auto err = writer.enter())
      return err;
    if (auto err = (*this)(block.background))
      return err;
    if (auto err = (*this)(block.captionBox))
      return err;
    if (auto err = (*this)(block.label))
      return err;
    return writer.leave();
  }
  RetTy operator()(const HorizontalAxis &axis) {
    if (auto err = writer.g({svg::class_("gridline")}))
      return err;
    if (auto err = writer.enter())
      return err;
    if (auto err = (*this)(axis.gridline))
      return err;
    if (auto err = (*this)(axis.label))
      return err;
    return writer.leave();
  }
  RetTy operator()(const GraphLine &line) {
    return renderPath(line.path, StatSample::getColumnName(line.column));
  }
  RetTy operator()(const GraphRegion &region) {
    return renderPath(region.path, "region");
  }
  RetTy operator()(const GraphInfoOverlay &overlay) {
    return renderContainer(writer.g({svg::class_(overlay.cssClass.c_str())}),
                           overlay.children);
  }
};
} // namespace

RetTy egraph::renderNode(const Node &node, svg::WriterConcept &writer) {
  NodeRenderer renderer{writer};
  return std::visit(renderer, node.value);
}

GraphErrorOr<void> egraph::writeNode(const Node &node,
                                     svg::WriterConcept &writer) {
  RetTy err = renderNode(node, writer);
  if (!err)
    err = writer.finish();
  if (err)
    return GraphError(GraphError::WRITER_FAILURE, err.to_error().what());
  return {};
}

GraphErrorOr<std::string> egraph::render(const Node &node, bool formatted) {
  std::stringstream ss;
  std::unique_ptr<svg::WriterConcept> writer;
  if (formatted)
    writer = std::make_unique<svg::WriterModel<svg::SVGFormattedWriter>>(ss);
  else
    writer = std::make_unique<svg::WriterModel<svg::SVGWriter>>(ss);
  if (auto err = writeNode(node, *writer))
    return err.to_error();
  return ss.str();
}
