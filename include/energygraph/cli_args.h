#ifndef ENERGYGRAPH_CLI_ARGS_H
#define ENERGYGRAPH_CLI_ARGS_H
/// Declarative command line options for the energygraph tools.
///
/// * cl::opt<T> declares an option variable. Options register themselves
///   on construction and unregister when they go out of scope.
/// * cl::name gives the flag name; options without a name take the
///   positional argument.
/// * cl::meta names the value in the help output, cl::desc describes it.
/// * cl::init sets the value used when the flag is absent.
/// * cl::required makes the flag mandatory.
/// * cl::ParseArgs parses argv into the registered options.
///
/// Support for new value types is added by specializing CliParseValue.

#include "energygraph/utils.h"

#include <cassert>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace egraph {
namespace cl {

struct CliName {
  constexpr CliName(std::string_view name) : name(name) {}
  std::string_view name;
};

struct CliMetaName {
  constexpr CliMetaName(std::string_view name) : name(name) {}
  std::string_view name;
};

struct CliDesc {
  constexpr CliDesc(std::string_view desc) : desc(desc) {}
  std::string_view desc;
};

template <typename ValTy> struct CliInit {
  constexpr CliInit(ValTy val) : val(val) {}
  const ValTy &getValue() const { return val; }

private:
  ValTy val;
};

struct CliRequired {};

/// Converts a command line string into an option value.
template <typename T> std::optional<T> CliParseValue(std::string_view value);

/// Definition of CliParseValue<bool>
template <> inline std::optional<bool> CliParseValue(std::string_view value) {
  std::string lower;
  for (char c : value)
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "true" || lower == "on" || lower == "yes")
    return true;
  if (lower == "false" || lower == "off" || lower == "no")
    return false;
  return std::nullopt;
}
/// Definition of CliParseValue<std::string>
template <>
inline std::optional<std::string> CliParseValue(std::string_view value) {
  return std::string(value);
}
/// Definition of CliParseValue<std::filesystem::path>
template <>
inline std::optional<std::filesystem::path>
CliParseValue(std::string_view value) {
  return std::filesystem::path(value);
}
/// Definition of CliParseValue<unsigned>
template <>
inline std::optional<unsigned> CliParseValue(std::string_view value) {
  unsigned u;
  auto result = std::from_chars(value.data(), value.data() + value.size(), u);
  if (result.ec != std::errc() || result.ptr != value.data() + value.size())
    return std::nullopt;
  return u;
}
/// Definition of CliParseValue<int64_t>
template <>
inline std::optional<int64_t> CliParseValue(std::string_view value) {
  int64_t i;
  auto result = std::from_chars(value.data(), value.data() + value.size(), i);
  if (result.ec != std::errc() || result.ptr != value.data() + value.size())
    return std::nullopt;
  return i;
}
/// Definition of CliParseValue<double>
template <> inline std::optional<double> CliParseValue(std::string_view value) {
  return strview_to_double(value);
}

/// Interface the parser uses to talk to options of any value type.
struct CliOptConcept {
  virtual ~CliOptConcept() = default;
  /// Consumes values from the front of @p values. Returns the number of
  /// values used or std::nullopt on a parse error.
  [[nodiscard]] virtual std::optional<size_t>
  parse(std::deque<std::string_view> &values, bool isInline) = 0;
  [[nodiscard]] virtual bool validate() const = 0;
  [[nodiscard]] virtual bool required() const = 0;
  virtual void display(std::ostream &os) const = 0;
  virtual std::string_view getDesc() const = 0;
};

/// Entry point to the cli_args library.
struct ParseArgs {
  /// Parses @p argv into all currently registered options. Prints the
  /// help text and exits on errors or when -help is given.
  ParseArgs(const char *tool, const char *desc, int argc, const char **argv);

  void printHelp(std::ostream &os) const;

  static void addOption(std::string_view name, CliOptConcept *opt) {
    assert(!options().count(name) && "Registered option more than once");
    options()[name] = opt;
  }
  static void removeOption(std::string_view name) {
    assert(options().count(name) && "Tried to remove unregistered option");
    options().erase(name);
  }

private:
  using optionmap_t = std::map<std::string_view, CliOptConcept *>;
  /// Wrapping the map in a function fixes initialization order issues
  /// with statically initialized options.
  static optionmap_t &options() {
    static optionmap_t opts;
    return opts;
  }
  static std::string_view parseOptName(std::string_view opt) {
    if (opt.front() == '-')
      opt = opt.substr(1);
    if (!opt.empty() && opt.front() == '-')
      opt = opt.substr(1);
    if (auto eqPos = opt.find("="); eqPos != std::string_view::npos)
      opt = opt.substr(0, eqPos);
    return opt;
  }
  [[noreturn]] void bail() const {
    std::cerr << '\n';
    printHelp(std::cerr);
    std::exit(1);
  }

  const char *tool;
  const char *desc;
};

/// Implementation of a single-value command line option.
template <typename ValTy> struct CliOpt : public CliOptConcept {
  template <typename... args_t> CliOpt(args_t &&... args) {
    consume(std::forward<args_t>(args)...);
    ParseArgs::addOption(name, this);
  }
  ~CliOpt() override { ParseArgs::removeOption(name); }
  CliOpt(const CliOpt &) = delete;
  CliOpt &operator=(const CliOpt &) = delete;

  /// Automatic conversion to the option's underlying value.
  operator const ValTy &() const { return value; }
  const ValTy *operator->() const { return &value; }
  const ValTy &operator*() const { return value; }

  std::optional<size_t> parse(std::deque<std::string_view> &values,
                              bool isInline) override;
  bool validate() const override {
    if (Required && !valueGiven) {
      std::cerr << "Required value not given for option \"";
      display(std::cerr);
      std::cerr << "\"\n";
      return false;
    }
    return true;
  }
  bool required() const override { return Required; }
  void display(std::ostream &os) const override {
    if (!name.empty())
      os << "-" << name;
    if (!meta.empty())
      os << (name.empty() ? "<" : " <") << meta << ">";
  }
  std::string_view getDesc() const override { return desc; }

private:
  ValTy value{};
  std::string_view name = "";
  std::string_view meta = "";
  std::string_view desc = "";
  bool Required = false;
  bool valueGiven = false;

  void consume() {}
  template <typename... args_t>
  void consume(const CliName &name, args_t &&... args) {
    this->name = name.name;
    consume(std::forward<args_t>(args)...);
  }
  template <typename... args_t>
  void consume(const CliMetaName &meta, args_t &&... args) {
    this->meta = meta.name;
    consume(std::forward<args_t>(args)...);
  }
  template <typename... args_t>
  void consume(const CliDesc &desc, args_t &&... args) {
    this->desc = desc.desc;
    consume(std::forward<args_t>(args)...);
  }
  template <typename... args_t>
  void consume(const CliRequired &, args_t &&... args) {
    Required = true;
    consume(std::forward<args_t>(args)...);
  }
  template <typename T, typename... args_t>
  void consume(const CliInit<T> &init, args_t &&... args) {
    value = static_cast<ValTy>(init.getValue());
    consume(std::forward<args_t>(args)...);
  }
};

template <typename ValTy>
std::optional<size_t> CliOpt<ValTy>::parse(std::deque<std::string_view> &values,
                                           bool) {
  if (values.empty()) {
    std::cerr << "Missing value for option ";
    display(std::cerr);
    std::cerr << '\n';
    return std::nullopt;
  }
  auto parsed = CliParseValue<ValTy>(values.front());
  if (!parsed) {
    std::cerr << "Could not parse value for option ";
    display(std::cerr);
    std::cerr << ": " << values.front() << '\n';
    return std::nullopt;
  }
  value = std::move(*parsed);
  valueGiven = true;
  return 1;
}

/// Flags are set by their mere presence or by an inline value (-f=off).
template <>
inline std::optional<size_t>
CliOpt<bool>::parse(std::deque<std::string_view> &values, bool isInline) {
  if (!isInline) {
    value = true;
    valueGiven = true;
    return 0;
  }
  auto parsed = CliParseValue<bool>(values.front());
  if (!parsed) {
    std::cerr << "Could not parse boolean value for flag ";
    display(std::cerr);
    std::cerr << ": " << values.front() << '\n';
    return std::nullopt;
  }
  value = *parsed;
  valueGiven = true;
  return 1;
}

/// Convenience type aliases
using name = CliName;
using meta = CliMetaName;
using desc = CliDesc;
using required = CliRequired;
template <typename T> CliInit<std::decay_t<T>> init(T &&val) {
  return CliInit<std::decay_t<T>>(std::forward<T>(val));
}
template <typename T> using opt = CliOpt<T>;

inline ParseArgs::ParseArgs(const char *tool, const char *desc, int argc,
                            const char **argv)
    : tool(tool), desc(desc) {
  std::deque<std::string_view> positional;
  for (int argNum = 1; argNum < argc; ++argNum) {
    std::string_view arg = argv[argNum];
    if (arg.size() < 2 || arg.front() != '-') {
      positional.push_back(arg);
      continue;
    }
    std::string_view name = parseOptName(arg);
    if (name == "help" || name == "h") {
      printHelp(std::cout);
      std::exit(0);
    }
    auto It = options().find(name);
    if (It == options().end() || name.empty()) {
      std::cerr << "Encountered unknown option " << arg << '\n';
      bail();
    }
    CliOptConcept *opt = It->second;
    std::deque<std::string_view> values;
    // Is the argument just the name or also an '=' assignment?
    size_t prefixLen = &name.front() - &arg.front() + name.size();
    bool isInline = prefixLen < arg.size();
    if (isInline)
      values.push_back(arg.substr(prefixLen + 1 /* equals sign */));
    else if (argNum + 1 < argc)
      values.push_back(argv[argNum + 1]);
    auto res = opt->parse(values, isInline);
    if (!res)
      bail();
    if (!isInline)
      argNum += *res;
  }
  if (positional.size()) {
    auto It = options().find("");
    if (It == options().end() || positional.size() > 1) {
      std::cerr << "Too many positional arguments given:\n";
      for (const auto &arg : positional)
        std::cerr << arg << '\n';
      bail();
    }
    if (!It->second->parse(positional, true))
      bail();
  }
  // Check that all options are in a valid state
  bool allValid = true;
  for (const auto &KeyValuePair : options())
    if (!KeyValuePair.second->validate())
      allValid = false;
  if (!allValid)
    bail();
}

inline void ParseArgs::printHelp(std::ostream &os) const {
  os << "usage: " << tool << " [OPTION]...";
  auto eatAll = options().find("");
  if (eatAll != options().end()) {
    os << " ";
    eatAll->second->display(os);
  }
  os << "\n\n" << desc << "\n\nOptions:\n";
  for (const auto &KeyValuePair : options()) {
    if (KeyValuePair.first.empty())
      continue;
    os << "  ";
    KeyValuePair.second->display(os);
    os << "\n      " << KeyValuePair.second->getDesc() << '\n';
  }
}

} // namespace cl
} // namespace egraph
#endif // ENERGYGRAPH_CLI_ARGS_H
