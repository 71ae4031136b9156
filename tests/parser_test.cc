#include <gtest/gtest.h>

#include "parser.hpp"

TEST(OutputParserTest, GroupsItemsByNamespace) {
    const auto index = OutputParser::parse("//a/b:x\n//a/b:y\n# comment\n//c:z\n");
    const TargetIndex expected{{"//a/b", {"x", "y"}}, {"//c", {"z"}}};
    EXPECT_EQ(index, expected);
}

TEST(OutputParserTest, SortsNamespacesAndItems) {
    const auto index = OutputParser::parse("//z:b\n//a:d\n//z:a\n//a:c\n");
    ASSERT_EQ(index.size(), 2u);
    EXPECT_EQ(index.begin()->first, "//a");
    EXPECT_EQ(index.at("//a"), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(index.at("//z"), (std::vector<std::string>{"a", "b"}));
}

TEST(OutputParserTest, DropsDecorativeLines) {
    const std::string raw =
        "Loading: 0 packages loaded\n"
        "WARNING: something odd\n"
        "\n"
        "   \n"
        "@repo//a:b\n"
        "//no_separator\n"
        "//trailing:\n"
        "  //services/alerts:generate_client  \r\n";
    const auto index = OutputParser::parse(raw);
    const TargetIndex expected{{"//services/alerts", {"generate_client"}}};
    EXPECT_EQ(index, expected);
}

TEST(OutputParserTest, SplitsOnLastSeparator) {
    const auto index = OutputParser::parse("//weird:pkg:rule\n");
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.begin()->first, "//weird:pkg");
    EXPECT_EQ(index.begin()->second, (std::vector<std::string>{"rule"}));
}

TEST(OutputParserTest, NothingUsableYieldsEmptyIndex) {
    EXPECT_TRUE(OutputParser::parse("").empty());
    EXPECT_TRUE(OutputParser::parse("INFO: Elapsed time: 0.1s\n# nothing\n").empty());
}

TEST(OutputParserTest, ReparsingSerializedOutputIsStable) {
    const std::vector<std::string> inputs{
        "//a/b:x\n//a/b:y\n# comment\n//c:z\n",
        "//z:b\n//a:d\n//z:a\n//a:c\n//a:c\n",
        "junk\n//x:y:z\n  //p:q  \n",
        "",
    };
    for (const auto& raw : inputs) {
        const auto first = OutputParser::parse(raw);
        const auto second = OutputParser::parse(OutputParser::serialize(first));
        EXPECT_EQ(first, second) << raw;
    }
}

TEST(OutputParserTest, KindsComeFromFirstToken) {
    const std::string raw =
        "genrule rule //a:gen\n"
        "cc_binary rule //a:bin\n"
        "genrule rule //b:gen2\n"
        "source file //a:main.cc\n"
        "malformed\n"
        "\n";
    const std::vector<std::string> expected{"cc_binary", "genrule", "source"};
    EXPECT_EQ(OutputParser::parse_kinds(raw), expected);
}

TEST(OutputParserTest, KindsMayBeTabSeparated) {
    const std::vector<std::string> expected{"cc_test", "py_binary"};
    EXPECT_EQ(OutputParser::parse_kinds("py_binary\trule //a:bin\ncc_test rule //a:t\n\tindented\n"), expected);
}

TEST(OutputParserTest, CountsItems) {
    const TargetIndex index{{"//a", {"x", "y"}}, {"//b", {"z"}}};
    EXPECT_EQ(OutputParser::count_items(index), 3u);
    EXPECT_EQ(OutputParser::serialize(index), "//a:x\n//a:y\n//b:z\n");
}
