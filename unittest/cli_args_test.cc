#include "energygraph/cli_args.h"
#include "gtest/gtest.h"
#include <array>

using namespace ::egraph;
namespace fs = ::std::filesystem;

static const char *TOOLNAME = "cli_args_test";
static const char *TOOLDESC = "Unittests for the cli_args library";

/// Ensure automatic unregistration of destructed cl::opt
TEST(CliArgsTest, AutoUnregister) {
  // Dual registration __should__ be an error if no unregistration happens
  { cl::opt<unsigned> Value(cl::name("u"), cl::init(0)); }
  cl::opt<unsigned> Value(cl::name("u"), cl::init(1));
  std::array args{"", "-u", "2"};
  cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data());
  EXPECT_EQ(Value, 2u);
}

TEST(CliArgsTest, Defaults) {
  cl::opt<double> Width(cl::name("W"), cl::init(840));
  cl::opt<fs::path> Outfile(cl::name("o"), cl::init("-"));
  std::array args{""};
  cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data());
  EXPECT_DOUBLE_EQ(Width, 840.);
  EXPECT_EQ(Outfile->string(), "-");
}

TEST(CliArgsTest, PositionalAndValues) {
  cl::opt<fs::path> Infile(cl::meta("input.csv"), cl::required());
  cl::opt<int64_t> Seconds(cl::name("division-seconds"), cl::init(0));
  cl::opt<double> Height(cl::name("H"), cl::init(630));
  std::array args{"", "samples.csv", "-division-seconds", "86400",
                  "--H=480.5"};
  cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data());
  EXPECT_EQ(Infile->string(), "samples.csv");
  EXPECT_EQ(*Seconds, 86400);
  EXPECT_DOUBLE_EQ(Height, 480.5);
}

TEST(CliArgsTest, Flags) {
  cl::opt<bool> Formatted(cl::name("formatted"), cl::init(false));
  cl::opt<bool> Strict(cl::name("strict"), cl::init(true));
  cl::opt<bool> Verbose(cl::name("v"), cl::init(false));
  std::array args{"", "-formatted", "-strict=off", "-v=yes"};
  cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data());
  EXPECT_TRUE(Formatted);
  EXPECT_FALSE(Strict);
  EXPECT_TRUE(Verbose);
}

TEST(CliArgsTest, ParseValues) {
  EXPECT_EQ(cl::CliParseValue<unsigned>("48"), 48u);
  EXPECT_FALSE(cl::CliParseValue<unsigned>("-1"));
  EXPECT_FALSE(cl::CliParseValue<unsigned>("4x"));
  EXPECT_EQ(cl::CliParseValue<int64_t>("-3600"), -3600);
  EXPECT_EQ(cl::CliParseValue<bool>("On"), true);
  EXPECT_FALSE(cl::CliParseValue<bool>("maybe"));
  EXPECT_FALSE(cl::CliParseValue<double>("1.5kW"));
}

TEST(CliArgsDeathTest, UnknownOption) {
  std::array args{"", "-nope"};
  EXPECT_EXIT(cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data()),
              ::testing::ExitedWithCode(1), "unknown option -nope");
}

TEST(CliArgsDeathTest, MissingRequired) {
  cl::opt<fs::path> Infile(cl::meta("input.csv"), cl::required());
  std::array args{""};
  EXPECT_EXIT(cl::ParseArgs(TOOLNAME, TOOLDESC, args.size(), args.data()),
              ::testing::ExitedWithCode(1), "Required value not given");
}
