#ifndef ENERGYGRAPH_SAMPLE_READER_H
#define ENERGYGRAPH_SAMPLE_READER_H

#include "energygraph/statistics.h"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace egraph {
using instream_t = std::istream;

/// Reads `timestamp,value` lines (unix seconds, power). Blank lines and
/// lines starting with '#' are skipped, as is a header line whose first
/// field is not a number.
struct SampleReader {
  struct ParseError {
    ParseError(std::string what) : what(std::move(what)) {}
    ParseError(const char *what) : what(what) {}
    friend inline std::ostream &operator<<(std::ostream &os,
                                           const ParseError &err) {
      os << err.what;
      return os;
    }
    std::string what;
  };
  using MaybeError = std::optional<ParseError>;

  /// Appends the samples read from @p is to @p out. Timestamps must not
  /// decrease.
  MaybeError read(instream_t &is, /* out */ std::vector<Sample> &out);

private:
  static constexpr std::nullopt_t ParseSuccess = std::nullopt;
  MaybeError parseLine(std::string_view line, /* out */ Sample &sample);

  size_t lineNum = 0;
};

} // namespace egraph
#endif // ENERGYGRAPH_SAMPLE_READER_H
