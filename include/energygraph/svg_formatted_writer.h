#ifndef ENERGYGRAPH_SVG_FORMATTED_WRITER_H
#define ENERGYGRAPH_SVG_FORMATTED_WRITER_H

#include "energygraph/svg_writer.h"

#include <stack>

namespace egraph {
namespace svg {
/// SVG document writer that puts every tag on its own line and indents
/// children below their parent.
struct SVGFormattedWriter : public SVGWriterBase<SVGFormattedWriter> {
  using self_t = SVGFormattedWriter;
  using base_t = SVGWriterBase<self_t>;
  using RetTy = SVGWriterErrorOr<self_t *>;

  SVGFormattedWriter(outstream_t &os) : base_t(os) {}

  RetTy enter() {
    if (auto err = base_t::enter())
      return err.to_error();
    base_t::output() << "\n";
    ++indent;
    wasEntered.top() = true;
    return this;
  }
  RetTy leave() {
    if (auto err = base_t::leave())
      return err.to_error();
    --indent;
    return this;
  }
  RetTy content(const char *text) {
    closeTag();
    writeIndent();
    base_t::output() << text << "\n";
    return this;
  }

private:
  static inline outstream_t &repeat(outstream_t &os, char c, size_t count) {
    for (size_t i = 0; i < count; ++i)
      os << c;
    return os;
  }
  void writeIndent() {
    repeat(base_t::output(), indentChar, indentWidth * indent);
  }

  friend base_t;
  void openTag(const char *tagname, const std::vector<SVGAttribute> &attrs) {
    closeTag();
    writeIndent();
    base_t::output() << "<" << tagname;
    base_t::writeAttrs(attrs);
    base_t::output() << ">";
    base_t::pendingTag = tagname;
    wasEntered.push(false);
  }
  void closeTag() {
    if (base_t::pendingTag) {
      if (wasEntered.top())
        writeIndent();
      base_t::output() << "</" << base_t::pendingTag << ">";
      base_t::pendingTag = nullptr;
      base_t::output() << "\n";
      wasEntered.pop();
    }
  }

  static constexpr char indentChar = ' ';
  static constexpr size_t indentWidth = 2;
  size_t indent = 0;
  std::stack<bool> wasEntered;
};
} // namespace svg
} // namespace egraph
#endif // ENERGYGRAPH_SVG_FORMATTED_WRITER_H
