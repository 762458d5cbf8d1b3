#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hcodec;

namespace {

CliParser parse(std::vector<std::string> args) {
    args.insert(args.begin(), "prog");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    CliParser cli;
    cli.parse(static_cast<int>(argv.size()), argv.data());
    return cli;
}

} // namespace

TEST(CliParser, KeyValuePairs) {
    CliParser cli = parse({"--in", "a.txt", "--out=b.bits", "--tree", "t.huft"});
    EXPECT_EQ(cli.get("in"), "a.txt");
    EXPECT_EQ(cli.get("out"), "b.bits");
    EXPECT_EQ(cli.get("tree"), "t.huft");
    EXPECT_FALSE(cli.has("verbose"));
    EXPECT_EQ(cli.get("missing", "dflt"), "dflt");
}

TEST(CliParser, BareFlagIsTrue) {
    CliParser cli = parse({"--verbose", "--in", "x"});
    EXPECT_TRUE(cli.flag("verbose"));
    EXPECT_EQ(cli.get("in"), "x");

    CliParser trailing = parse({"--in", "x", "--verbose"});
    EXPECT_TRUE(trailing.flag("verbose"));
    EXPECT_FALSE(trailing.flag("quiet"));

    CliParser off = parse({"--verbose=0"});
    EXPECT_FALSE(off.flag("verbose"));
}

TEST(CliParser, PositionalArgumentsAreKept) {
    CliParser cli = parse({"first", "--k", "v", "second"});
    ASSERT_EQ(cli.positional().size(), 2u);
    EXPECT_EQ(cli.positional()[0], "first");
    EXPECT_EQ(cli.positional()[1], "second");
    EXPECT_EQ(cli.get("k"), "v");
}

TEST(CliParser, ExtraValueAfterOptionIsPositional) {
    CliParser cli = parse({"--in", "a.bits", "b.bits", "--out", "c.txt"});
    EXPECT_EQ(cli.get("in"), "a.bits");
    EXPECT_EQ(cli.get("out"), "c.txt");
    ASSERT_EQ(cli.positional().size(), 1u);
    EXPECT_EQ(cli.positional()[0], "b.bits");
}
