#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hwplan/action/command_line.hpp"

namespace hwplan::action {
namespace {

TEST(CommandLineTest, RendersInInsertionOrder) {
  CommandLine command("tools/main");
  command.AddPositional("in.ir").AddFlag("top", "adder").AddPositional("x");

  EXPECT_EQ(
      command.Argv(),
      (std::vector<std::string>{"tools/main", "in.ir", "--top=adder", "x"}));
  EXPECT_EQ(command.ToString(), "tools/main in.ir --top=adder x");
}

TEST(CommandLineTest, AddFlagsUsesKeyOrder) {
  CommandLine command("tool");
  command.AddFlags({{"zeta", "1"}, {"alpha", "2"}, {"mid", "3"}});

  EXPECT_EQ(command.ToString(), "tool --alpha=2 --mid=3 --zeta=1");
}

TEST(CommandLineTest, EmptyFlagValueStillRendersEquals) {
  CommandLine command("tool");
  command.AddFlag("top", "");
  EXPECT_EQ(command.ToString(), "tool --top=");
}

TEST(CommandLineTest, FindFlagReturnsLastValue) {
  CommandLine command("tool");
  command.AddFlag("top", "a").AddPositional("top").AddFlag("top", "b");

  ASSERT_NE(command.FindFlag("top"), nullptr);
  EXPECT_EQ(*command.FindFlag("top"), "b");
  EXPECT_EQ(command.FindFlag("missing"), nullptr);
}

TEST(CommandLineTest, ExecutableOnly) {
  CommandLine command("tool");
  EXPECT_TRUE(command.Args().empty());
  EXPECT_EQ(command.ToString(), "tool");
  EXPECT_EQ(command.Argv(), std::vector<std::string>{"tool"});
}

TEST(CommandLineTest, EqualityComparesArguments) {
  CommandLine a("tool");
  CommandLine b("tool");
  a.AddFlag("x", "1");
  EXPECT_NE(a, b);
  b.AddFlag("x", "1");
  EXPECT_EQ(a, b);
}

TEST(CommandLineTest, ShellStringQuotesOnlyUnsafeWords) {
  CommandLine command("tools/bench");
  command.AddPositional("gen/a.sv")
      .AddFlag("top", "a b")
      .AddFlag("clock_period_ps", "1; rm -rf x")
      .AddFlag("module_name", "it's")
      .AddPositional("");

  EXPECT_EQ(
      command.ToShellString(),
      "tools/bench gen/a.sv '--top=a b' '--clock_period_ps=1; rm -rf x' "
      "'--module_name=it'\\''s' ''");
}

}  // namespace
}  // namespace hwplan::action
