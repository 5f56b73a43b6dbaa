#include <array>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "jobwatch/cli/ArgumentParser.hpp"

namespace jobwatch::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("test", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  ParseResult parse(std::vector<std::string> const& args) {
    return parser_->parse(std::span<std::string const>(args));
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagOption) {
  parser_->add_option("v", "verbose", "Enable verbose output");
  parser_->add_option("h", "help", "Show help");

  auto argv   = std::array<char const*, 3>{"test", "--verbose", "--help"};
  auto result = parser_->parse(static_cast<int>(argv.size()), argv.data());

  ASSERT_FALSE(result.has_error());
  EXPECT_TRUE(result.has("verbose"));
  EXPECT_TRUE(result.has("help"));
  EXPECT_EQ(result.get("verbose"), "true");
}

TEST_F(ArgumentParserTest, ShortOptionIsStoredUnderLongName) {
  parser_->add_option("C", "cwd", "Working directory", Option::Type::Value);

  auto result = parse({"-C", "/tmp", "ls"});

  ASSERT_FALSE(result.has_error());
  EXPECT_EQ(result.get("cwd"), "/tmp");
  EXPECT_FALSE(result.has("C"));
}

TEST_F(ArgumentParserTest, LongOnlyOption) {
  parser_->add_option("poll-ms", "Poll interval", Option::Type::Value);

  auto result = parse({"--poll-ms", "25", "true"});

  ASSERT_FALSE(result.has_error());
  EXPECT_EQ(result.get("poll-ms"), "25");
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"true"}));
}

TEST_F(ArgumentParserTest, OptionsStopAtFirstPositional) {
  parser_->add_option("v", "verbose", "Enable verbose output");

  auto result = parse({"-v", "ls", "-l", "--verbose", "dir"});

  ASSERT_FALSE(result.has_error());
  EXPECT_TRUE(result.has("verbose"));
  EXPECT_EQ(result.get_all("verbose").size(), 1u);
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"ls", "-l", "--verbose", "dir"}));
}

TEST_F(ArgumentParserTest, DoubleDashEndsOptions) {
  parser_->add_option("v", "verbose", "Enable verbose output");

  auto result = parse({"--", "-v", "x"});

  ASSERT_FALSE(result.has_error());
  EXPECT_FALSE(result.has("verbose"));
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"-v", "x"}));
}

TEST_F(ArgumentParserTest, MultiValueCollectsUntilNextOption) {
  parser_->add_option("e", "env", "Environment", Option::Type::MultiValue);
  parser_->add_option("v", "verbose", "Enable verbose output");

  auto result = parse({"-e", "A=1", "B=2", "-v", "--env", "C=3", "--", "cmd"});

  ASSERT_FALSE(result.has_error());
  EXPECT_EQ(result.get_all("env"), (std::vector<std::string>{"A=1", "B=2", "C=3"}));
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"cmd"}));
}

TEST_F(ArgumentParserTest, DefaultValueAppliesWhenAbsent) {
  parser_->add_option("s", "signal", "Signal", Option::Type::Value).default_value("term");

  EXPECT_EQ(parse({"cmd"}).get("signal"), "term");
  EXPECT_EQ(parse({"-s", "kill", "cmd"}).get("signal"), "kill");
}

TEST_F(ArgumentParserTest, UnknownOption) {
  parser_->add_option("v", "verbose", "Enable verbose output");

  auto result = parse({"--bogus"});

  ASSERT_TRUE(result.has_error());
  EXPECT_NE(result.error_message().find("Unknown option"), std::string_view::npos);
}

TEST_F(ArgumentParserTest, MissingValue) {
  parser_->add_option("t", "timeout-ms", "Timeout", Option::Type::Value);

  auto result = parse({"-t"});

  ASSERT_TRUE(result.has_error());
  EXPECT_NE(result.error_message().find("requires a value"), std::string_view::npos);
}

TEST_F(ArgumentParserTest, ValidatorRejectsValue) {
  parser_->add_option("t", "timeout-ms", "Timeout", Option::Type::Value).validator([](std::string const& v) {
    return !v.empty() && v.find_first_not_of("0123456789") == std::string::npos;
  });

  EXPECT_TRUE(parse({"-t", "soon"}).has_error());
  EXPECT_FALSE(parse({"-t", "100"}).has_error());
}

TEST_F(ArgumentParserTest, AbsentOptionHasNoValues) {
  parser_->add_option("e", "env", "Environment", Option::Type::MultiValue);

  auto result = parse({"cmd"});

  ASSERT_FALSE(result.has_error());
  EXPECT_FALSE(result.has("env"));
  EXPECT_FALSE(result.get("env").has_value());
  EXPECT_TRUE(result.get_all("env").empty());
  EXPECT_FALSE(result.has("no-such-option"));
}

TEST_F(ArgumentParserTest, HelpListsOptions) {
  parser_->positional_name("program [args...]");
  parser_->add_option("C", "cwd", "Working directory", Option::Type::Value);
  parser_->add_option("s", "signal", "Signal", Option::Type::Value).default_value("term");
  parser_->add_option("g", "group", "Group").help_text("Signals reach the whole group.");

  auto help = parser_->generate_help();

  EXPECT_NE(help.find("Test parser"), std::string::npos);
  EXPECT_NE(help.find("Usage: test [options] [--] program [args...]"), std::string::npos);
  EXPECT_NE(help.find("-C, --cwd <val>"), std::string::npos);
  EXPECT_NE(help.find("(default: term)"), std::string::npos);
  EXPECT_NE(help.find("Signals reach the whole group."), std::string::npos);
}

} // namespace jobwatch::cli::test
