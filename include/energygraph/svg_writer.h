#ifndef ENERGYGRAPH_SVG_WRITER_H
#define ENERGYGRAPH_SVG_WRITER_H
/// Streaming svg output for the scene renderer.
///
/// Tags and attributes come from svg_entities.def. A tag call writes the
/// opening tag; the element stays pending until the next call. enter()
/// makes the pending element the parent of the following calls, leave()
/// closes the innermost parent. finish() closes everything still open.

#include "energygraph/utils.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace egraph {
namespace svg {
using outstream_t = std::ostream;

/// A presentation or geometry attribute of a graph element: a name out of
/// svg_entities.def and a string, integer or floating point value. String
/// values are borrowed from the scene node being rendered.
struct SVGAttribute final {
  /// Names are the static tagName strings of the attribute structs, so
  /// duplicates can be detected by pointer.
  const char *getName() const { return name; }

  /// Writes the value, xml-escaping string values.
  void writeValue(outstream_t &os) const {
    if (auto str = std::get_if<const char *>(&value))
      os << xml_escape(*str);
    else if (auto i = std::get_if<int64_t>(&value))
      os << *i;
    else
      os << std::get<double>(value);
  }

  friend outstream_t &operator<<(outstream_t &os, const SVGAttribute &attr) {
    os << attr.name << "=\"";
    attr.writeValue(os);
    return os << "\"";
  }

private:
  using value_t = std::variant<const char *, int64_t, double>;

  template <typename T> static value_t toValue(T value) {
    if constexpr (std::is_pointer_v<T>)
      return static_cast<const char *>(value);
    else if constexpr (std::is_integral_v<T>)
      return static_cast<int64_t>(value);
    else
      return static_cast<double>(value);
  }

  template <typename T>
  SVGAttribute(const char *name, T value) : name(name), value(toValue(value)) {}

#define SVG_ATTR(NAME, STR, DEFAULT) friend struct NAME;
#include "energygraph/svg_entities.def"

  const char *name;
  value_t value;
};

// One helper struct per attribute, e.g. svg::width(840) or svg::xmlns().
#define SVG_ATTR(NAME, STR, DEFAULT)                                           \
  struct NAME {                                                                \
    template <typename T> NAME(T value) : attr(tagName, value) {}              \
    NAME() : attr(tagName, DEFAULT) {}                                         \
    operator SVGAttribute() const { return attr; }                             \
                                                                               \
  private:                                                                     \
    SVGAttribute attr;                                                         \
    static const char *tagName;                                                \
  };
#include "energygraph/svg_entities.def"

/// A writer call that doesn't fit the current nesting.
struct SVGWriterError {
  explicit SVGWriterError(std::string msg) : msg(std::move(msg)) {}
  const std::string &what() const { return msg; }

private:
  std::string msg;
};

template <typename T> struct SVGWriterErrorOr;

template <> struct SVGWriterErrorOr<void> {
  SVGWriterErrorOr() = default;
  SVGWriterErrorOr(const SVGWriterError &err) : err(err) {}

  /// Returns true if an error occurred
  operator bool() const { return err.has_value(); }
  const SVGWriterError &to_error() const {
    assert(*this && "No error in SVGWriterErrorOr<>");
    return *err;
  }
  template <typename U> SVGWriterErrorOr<U> with_value(U val) const {
    if (*this)
      return to_error();
    return val;
  }

private:
  std::optional<SVGWriterError> err;
};

/// Result of a chainable writer call: the writer itself or an error.
template <typename T> struct SVGWriterErrorOr {
  SVGWriterErrorOr(T val) : val(val) {}
  SVGWriterErrorOr(const SVGWriterError &err) : val(err) {}

  /// Returns true if an error occurred
  operator bool() const { return std::holds_alternative<SVGWriterError>(val); }
  T operator->() const {
    assert(!*this && "Unchecked value extraction from SVGWriterErrorOr<>");
    return std::get<T>(val);
  }
  const SVGWriterError &to_error() const {
    assert(*this && "No error in SVGWriterErrorOr<>");
    return std::get<SVGWriterError>(val);
  }
  template <typename U> SVGWriterErrorOr<U> with_value(U val) const {
    if (*this)
      return to_error();
    return val;
  }
  SVGWriterErrorOr<void> without_value() const {
    if (*this)
      return to_error();
    return {};
  }

private:
  std::variant<SVGWriterError, T> val;
};

/// Compact writer. Derived writers change the output by shadowing
/// openTag, closeTag, content, enter or leave (CRTP).
template <typename DerivedTy> class SVGWriterBase {
public:
  SVGWriterBase(outstream_t &output) : outstream(&output) {}

  using RetTy = SVGWriterErrorOr<DerivedTy *>;
#define SVG_TAG(NAME, STR)                                                     \
  template <typename... attrs_t> RetTy NAME(attrs_t... attrs) {                \
    return NAME(std::vector<SVGAttribute>{SVGAttribute(attrs)...});            \
  }                                                                            \
  RetTy NAME(const std::vector<SVGAttribute> &attrs) {                         \
    derived().openTag(STR, attrs);                                             \
    return &derived();                                                         \
  }
#include "energygraph/svg_entities.def"

  /// Text between the tags of the current parent. Escaping is up to the
  /// caller.
  RetTy content(const char *text) {
    derived().closeTag();
    output() << text;
    return &derived();
  }

  RetTy enter() {
    if (!pendingTag)
      return SVGWriterError("Cannot enter without an open tag");
    openScopes.push_back(pendingTag);
    pendingTag = nullptr;
    return &derived();
  }
  RetTy leave() {
    if (openScopes.empty())
      return SVGWriterError("Cannot leave: No parent tag");
    derived().closeTag();
    pendingTag = openScopes.back();
    openScopes.pop_back();
    return &derived();
  }
  RetTy finish() {
    while (!openScopes.empty())
      if (auto err = derived().leave())
        return err.to_error();
    derived().closeTag();
    return &derived();
  }

protected:
  DerivedTy &derived() { return *static_cast<DerivedTy *>(this); }

  void writeAttrs(const std::vector<SVGAttribute> &attrs) {
    for (auto it = attrs.begin(); it != attrs.end(); ++it) {
      assert(std::none_of(attrs.begin(), it,
                          [&](const SVGAttribute &prev) {
                            return prev.getName() == it->getName();
                          }) &&
             "Duplicate attribute key");
      output() << " " << *it;
    }
  }
  void openTag(const char *tagname, const std::vector<SVGAttribute> &attrs) {
    derived().closeTag();
    output() << "<" << tagname;
    derived().writeAttrs(attrs);
    output() << ">";
    pendingTag = tagname;
  }
  void closeTag() {
    if (!pendingTag)
      return;
    output() << "</" << pendingTag << ">";
    pendingTag = nullptr;
  }
  outstream_t &output() const { return *outstream; }

  /// Element written last and not yet closed, if any.
  const char *pendingTag = nullptr;
  /// Entered elements, innermost last.
  std::vector<const char *> openScopes;

private:
  outstream_t *outstream;
};

struct SVGWriter : public SVGWriterBase<SVGWriter> {
  SVGWriter(outstream_t &os) : SVGWriterBase<SVGWriter>(os) {}
};

/// Runtime interface over the writers, so the renderer is compiled once.
struct WriterConcept {
  virtual ~WriterConcept() = default;
  using RetTy = SVGWriterErrorOr<void>;

#define SVG_TAG(NAME, STR)                                                     \
  virtual RetTy NAME(const std::vector<SVGAttribute> &attrs) = 0;
#include "energygraph/svg_entities.def"
  virtual RetTy enter() = 0;
  virtual RetTy leave() = 0;
  virtual RetTy content(const char *) = 0;
  virtual RetTy finish() = 0;
};

/// Adapts any CRTP writer to WriterConcept.
template <typename WriterTy> struct WriterModel : public WriterConcept {
  using RetTy = WriterConcept::RetTy;

  template <typename... args_t>
  WriterModel(args_t &&... args) : Writer(std::forward<args_t>(args)...) {}
#define SVG_TAG(NAME, STR)                                                     \
  RetTy NAME(const std::vector<SVGAttribute> &attrs) override {                \
    return Writer.NAME(attrs).without_value();                                 \
  }
#include "energygraph/svg_entities.def"
  RetTy enter() override { return Writer.enter().without_value(); }
  RetTy leave() override { return Writer.leave().without_value(); }
  RetTy content(const char *text) override {
    return Writer.content(text).without_value();
  }
  RetTy finish() override { return Writer.finish().without_value(); }
  WriterTy &getWriter() { return Writer; }

protected:
  WriterTy Writer;
};
} // namespace svg
} // namespace egraph
#endif // ENERGYGRAPH_SVG_WRITER_H
