#ifndef ENERGYGRAPH_ERRORS_H
#define ENERGYGRAPH_ERRORS_H

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace egraph {

/// Errors raised while building or rendering an energy graph.
struct GraphError {
  enum Kind {
    /// An axis transform was requested over a zero-width range.
    DEGENERATE_RANGE,
    /// A composite was asked to plot a column a sample doesn't have.
    MISSING_FIELD,
    /// Neighbouring points of a cubic segment share an x coordinate.
    UNDEFINED_TANGENT,
    /// Fewer buckets than requested. Informational, never returned as a
    /// failure.
    INSUFFICIENT_DATA,
    /// The svg writer rejected a call, e.g. an unbalanced enter/leave.
    WRITER_FAILURE,
  };

  GraphError(Kind kind, std::string msg) : kind(kind), msg(std::move(msg)) {}
  GraphError(const GraphError &) = default;
  GraphError &operator=(const GraphError &) = default;
  GraphError(GraphError &&) = default;
  GraphError &operator=(GraphError &&) = default;

  Kind getKind() const { return kind; }
  const std::string &what() const { return msg; }
  static const char *getKindName(Kind kind);

  friend inline std::ostream &operator<<(std::ostream &os,
                                         const GraphError &err) {
    os << getKindName(err.kind) << ": " << err.msg;
    return os;
  }

private:
  Kind kind;
  std::string msg;
};

/// Either a value or the GraphError that prevented producing it.
template <typename T> struct GraphErrorOr {
  GraphErrorOr(T val) : val(std::move(val)) {}
  GraphErrorOr(const GraphError &err) : val(err) {}

  GraphErrorOr(const GraphErrorOr &) = default;
  GraphErrorOr &operator=(const GraphErrorOr &) = default;
  GraphErrorOr(GraphErrorOr &&) = default;
  GraphErrorOr &operator=(GraphErrorOr &&) = default;

  /// Returns true if an error occurred
  operator bool() const { return std::holds_alternative<GraphError>(val); }
  const T *operator->() const {
    assert(!*this && "Unchecked value extraction from GraphErrorOr<>");
    return &std::get<T>(val);
  }
  const T &operator*() const & {
    assert(!*this && "Unchecked value extraction from GraphErrorOr<>");
    return std::get<T>(val);
  }
  T &operator*() & {
    assert(!*this && "Unchecked value extraction from GraphErrorOr<>");
    return std::get<T>(val);
  }
  const GraphError &to_error() const {
    assert(*this &&
           "Trying to extract error from GraphErrorOr<> in non-error state");
    return std::get<GraphError>(val);
  }

private:
  std::variant<GraphError, T> val;
};

template <> struct GraphErrorOr<void> {
  GraphErrorOr() = default;
  GraphErrorOr(const GraphError &err) : err(err) {}

  /// Returns true if an error occurred
  operator bool() const { return !!err; }
  const GraphError &to_error() const {
    assert(*this &&
           "Trying to extract error from GraphErrorOr<> in non-error state");
    return *err;
  }

private:
  std::optional<GraphError> err;
};

} // namespace egraph
#endif // ENERGYGRAPH_ERRORS_H
