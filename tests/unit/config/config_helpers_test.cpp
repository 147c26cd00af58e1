#include <gtest/gtest.h>

#include <dlinkwm/config/config_helpers.h>

using namespace dlinkwm;
using namespace dlinkwm::config;

TEST(ConfigHelpersTest, StripCommentIgnoresHashInsideStrings) {
    EXPECT_EQ(strip_comment("key = 1 # note"), "key = 1 ");
    EXPECT_EQ(strip_comment("\"a#b\" = ['c#d'] # x"), "\"a#b\" = ['c#d'] ");
    EXPECT_EQ(strip_comment("\"esc\\\"#\" = 1"), "\"esc\\\"#\" = 1");
}

TEST(ConfigHelpersTest, ParsesBasicAndLiteralStrings) {
    std::size_t pos = 0;
    auto basic = parse_toml_string("\"a\\tb\\\"c\" rest", pos);
    ASSERT_TRUE(basic);
    EXPECT_EQ(basic.value(), "a\tb\"c");
    EXPECT_EQ(pos, 9u);

    pos = 0;
    auto literal = parse_toml_string("'C:\\path\\n'", pos);
    ASSERT_TRUE(literal);
    EXPECT_EQ(literal.value(), "C:\\path\\n");

    pos = 0;
    EXPECT_FALSE(parse_toml_string("\"open", pos));
    pos = 0;
    EXPECT_FALSE(parse_toml_string("\"bad\\q\"", pos));
}

TEST(ConfigHelpersTest, ParsesStringArrays) {
    auto arr = parse_string_array("[\"a\", 'b' ,\"c\",]");
    ASSERT_TRUE(arr);
    EXPECT_EQ(arr.value(), (std::vector<std::string>{"a", "b", "c"}));

    auto empty = parse_string_array("[ ]");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());

    EXPECT_FALSE(parse_string_array("\"a\""));
    EXPECT_FALSE(parse_string_array("[\"a\" \"b\"]"));
    EXPECT_FALSE(parse_string_array("[\"a\"] x"));
    EXPECT_FALSE(parse_string_array("[1, 2]"));
}

TEST(ConfigHelpersTest, BracketBalanceTracksOpenArrays) {
    EXPECT_EQ(bracket_balance("key = ["), 1);
    EXPECT_EQ(bracket_balance("key = [\"]\"]"), 0);
    EXPECT_EQ(bracket_balance("]"), -1);
}

TEST(ConfigHelpersTest, FormatsArraysAndQuotes) {
    EXPECT_EQ(format_string_array({"foo"}), "[\"foo\"]");
    EXPECT_EQ(format_string_array({"a", "b"}), "[\"a\", \"b\"]");
    EXPECT_EQ(format_string_array({}), "[]");
    EXPECT_EQ(quote_toml_string("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
}

TEST(ConfigHelpersTest, ParsesScalars) {
    EXPECT_TRUE(parse_bool("TRUE").value());
    EXPECT_FALSE(parse_bool("false").value());
    EXPECT_FALSE(parse_bool("yes"));

    EXPECT_EQ(parse_uint("1_048_576").value(), 1048576u);
    EXPECT_EQ(parse_uint("0x100000").value(), 0x100000u);
    EXPECT_FALSE(parse_uint("-1"));
    EXPECT_FALSE(parse_uint("12abc"));
    EXPECT_FALSE(parse_uint(""));
}

TEST(ConfigHelpersTest, TrimHelpers) {
    std::string s = "  padded \t";
    trim(s);
    EXPECT_EQ(s, "padded");
}
