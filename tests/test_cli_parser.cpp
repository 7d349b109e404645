#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

hufz::CliParser parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    hufz::CliParser p;
    p.parse(static_cast<int>(argv.size()), argv.data());
    return p;
}

} // namespace

TEST(CliParser, KeyValuePairs) {
    hufz::CliParser p = parse({"hufz_encode", "--in", "a.txt", "--out", "a.hufz"});
    EXPECT_TRUE(p.has("in"));
    EXPECT_EQ(p.get("in"), "a.txt");
    EXPECT_EQ(p.get("out"), "a.hufz");
    EXPECT_FALSE(p.has("quality"));
    EXPECT_EQ(p.get("quality", "none"), "none");
}

TEST(CliParser, FlagWithoutValueIsTrue) {
    hufz::CliParser p = parse({"prog", "--verbose", "--in", "x"});
    EXPECT_EQ(p.get("verbose"), "true");
    EXPECT_EQ(p.get("in"), "x");
}

TEST(CliParser, RepeatedKeysAccumulate) {
    hufz::CliParser p = parse({"prog", "--ref", "a", "--ref", "b", "--out", "m.csv"});
    EXPECT_EQ(p.get_all("ref"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(p.get("ref"), "b");
    EXPECT_TRUE(p.get_all("missing").empty());
}

TEST(CliParser, PositionalArgumentsIgnored) {
    hufz::CliParser p = parse({"prog", "stray", "--in", "x", "extra"});
    EXPECT_EQ(p.get("in"), "x");
    EXPECT_FALSE(p.has("stray"));
}
