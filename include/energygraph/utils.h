#ifndef ENERGYGRAPH_UTILS_H
#define ENERGYGRAPH_UTILS_H
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace egraph {
[[noreturn]] inline void unreachable_internal(const char *msg = nullptr,
                                              const char *file = nullptr,
                                              unsigned line = 0) {
  if (msg)
    std::cerr << msg << "\n";
  std::cerr << "UNREACHABLE executed";
  if (file)
    std::cerr << " at " << file << ":" << line;
  std::cerr << "!\n";
  std::abort();
}

inline std::string_view strview_trim(std::string_view str) {
  auto isSpace = [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  };
  while (!str.empty() && isSpace(str.front()))
    str = str.substr(1);
  while (!str.empty() && isSpace(str.back()))
    str = str.substr(0, str.size() - 1);
  return str;
}

/// Parses the whole of @p str as a double. Trailing garbage is an error.
inline std::optional<double> strview_to_double(std::string_view str) {
  std::string realStr(str.data(), str.size());
  char *parseEnd;
  double d = std::strtod(realStr.c_str(), &parseEnd);
  bool error = parseEnd == realStr.c_str() ||
               parseEnd != realStr.c_str() + realStr.size();
  if (error)
    return std::nullopt;
  return d;
}

/// Escapes the characters that may not appear verbatim in xml attribute
/// values or text content.
inline std::string xml_escape(std::string_view str) {
  std::string res;
  res.reserve(str.size());
  for (char c : str) {
    switch (c) {
    case '&':
      res += "&amp;";
      break;
    case '<':
      res += "&lt;";
      break;
    case '>':
      res += "&gt;";
      break;
    case '"':
      res += "&quot;";
      break;
    default:
      res += c;
    }
  }
  return res;
}
} // namespace egraph

#ifndef NDEBUG
#define egraph_unreachable(msg)                                                \
  ::egraph::unreachable_internal(msg, __FILE__, __LINE__)
#else
#define egraph_unreachable(msg) ::egraph::unreachable_internal()
#endif // NDEBUG

#endif // ENERGYGRAPH_UTILS_H
