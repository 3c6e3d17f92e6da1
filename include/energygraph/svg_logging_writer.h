#ifndef ENERGYGRAPH_SVG_LOGGING_WRITER_H
#define ENERGYGRAPH_SVG_LOGGING_WRITER_H

#include "energygraph/svg_writer.h"

namespace egraph {
namespace svg {

/// Writer that accepts all calls and produces no output.
struct SVGDummyWriter : public SVGWriterBase<SVGDummyWriter> {
  using base_t = SVGWriterBase<SVGDummyWriter>;
  using RetTy = SVGWriterErrorOr<SVGDummyWriter *>;
  SVGDummyWriter() : base_t(/* could be anything */ std::cout) {}

  RetTy content(const char *) {
    closeTag();
    return this;
  }

private:
  friend base_t;
  void openTag(const char *tagname, const std::vector<SVGAttribute> &) {
    closeTag();
    base_t::pendingTag = tagname;
  }
  void closeTag() { base_t::pendingTag = nullptr; }
};

/// Traces every call to a stream before forwarding it to the wrapped
/// writer.
template <typename WrappedTy> struct SVGLoggingWriter {
  using self_t = SVGLoggingWriter<WrappedTy>;
  using RetTy = SVGWriterErrorOr<SVGLoggingWriter *>;
  template <typename... args_t>
  SVGLoggingWriter(outstream_t &os, args_t &&... args)
      : os(&os), writer(std::forward<args_t>(args)...) {}
  SVGLoggingWriter(self_t &&) = default;
  self_t &operator=(self_t &&) = default;

#define SVG_TAG(NAME, STR)                                                     \
  template <typename... attrs_t> RetTy NAME(attrs_t... attrs) {                \
    std::vector<SVGAttribute> attrsVec{SVGAttribute(attrs)...};                \
    return NAME(attrsVec);                                                     \
  }                                                                            \
  RetTy NAME(const std::vector<SVGAttribute> &attrs) {                         \
    log(#NAME, &attrs);                                                        \
    return writer.NAME(attrs).with_value(this);                                \
  }
#include "energygraph/svg_entities.def"

  RetTy content(const char *text) {
    log("content", nullptr, text);
    return writer.content(text).with_value(this);
  }

  RetTy enter() {
    log("enter");
    return writer.enter().with_value(this);
  }
  RetTy leave() {
    log("leave");
    return writer.leave().with_value(this);
  }
  RetTy finish() {
    log("finish");
    return writer.finish().with_value(this);
  }

  WrappedTy &getWriter() { return writer; }

  void log(const char *action,
           const std::vector<SVGAttribute> *attrs = nullptr,
           const char *text = nullptr) {
    outs() << action;
    if (attrs && attrs->size()) {
      outs() << '(';
      auto It = attrs->begin(), End = attrs->end();
      outs() << *(It++);
      for (; It != End; ++It)
        outs() << ", " << *It;
      outs() << ')';
    }
    if (text)
      outs() << ": \"" << text << "\"";
    outs() << std::endl;
  }

private:
  outstream_t &outs() { return *os; }

  outstream_t *os;
  WrappedTy writer;
};
} // namespace svg
} // namespace egraph
#endif // ENERGYGRAPH_SVG_LOGGING_WRITER_H
