#include "conf/line_matcher.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <stdexcept>
#include <string>

using trustconf::conf::LineMatcher;
using trustconf::conf::kMaxLineLength;

TEST(LineMatcherTest, MatchesPlainAssignment) {
    LineMatcher matcher("FOO", "=", "\\w+");
    auto value = matcher.match("FOO=bar");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "bar");
}

TEST(LineMatcherTest, AcceptsTrailingBlanksAndComment) {
    LineMatcher matcher("FOO", "=", "\\w+");
    EXPECT_EQ(matcher.match("FOO=bar   ").value_or(""), "bar");
    EXPECT_EQ(matcher.match("FOO=bar\t# inline note").value_or(""), "bar");
    EXPECT_EQ(matcher.match("FOO=bar#no space").value_or(""), "bar");
    EXPECT_EQ(matcher.match("FOO=bar # one # two").value_or(""), "bar");
}

TEST(LineMatcherTest, RejectsTrailingGarbage) {
    LineMatcher matcher("FOO", "=", "\\w+");
    EXPECT_FALSE(matcher.match("FOO=bar baz").has_value());
    EXPECT_FALSE(matcher.match("FOO=bar;rm -rf /").has_value());
    EXPECT_FALSE(matcher.match("FOO=bar$(id)").has_value());
    EXPECT_FALSE(matcher.match("FOO=bar baz # comment").has_value());
}

TEST(LineMatcherTest, AnchoredAtLineStart) {
    LineMatcher matcher("FOO", "=", "\\w+");
    EXPECT_FALSE(matcher.match(" FOO=bar").has_value());
    EXPECT_FALSE(matcher.match("XFOO=bar").has_value());
    EXPECT_FALSE(matcher.match("# FOO=bar").has_value());
}

TEST(LineMatcherTest, NameMustBeFollowedBySeparator) {
    LineMatcher matcher("FOO", "=", "\\w+");
    EXPECT_FALSE(matcher.match("FOOBAR=bar").has_value());
    EXPECT_FALSE(matcher.match("FOO").has_value());
    EXPECT_FALSE(matcher.match("").has_value());
}

TEST(LineMatcherTest, SeparatorIsLiteral) {
    LineMatcher equals("BAZ", "=", "\\w+");
    EXPECT_FALSE(equals.match("BAZ = qux").has_value());

    LineMatcher spaced("BAZ", " = ", "\\w+");
    EXPECT_EQ(spaced.match("BAZ = qux").value_or(""), "qux");

    LineMatcher dotted("BAZ", ".", "\\w+");
    EXPECT_EQ(dotted.match("BAZ.qux").value_or(""), "qux");
    EXPECT_FALSE(dotted.match("BAZxqux").has_value());
}

TEST(LineMatcherTest, NameMetacharactersAreLiteral) {
    LineMatcher matcher("A.B", "=", "\\w+");
    EXPECT_EQ(matcher.match("A.B=value").value_or(""), "value");
    EXPECT_FALSE(matcher.match("AxB=value").has_value());

    LineMatcher starred("X*", "=", "\\d+");
    EXPECT_EQ(starred.match("X*=12").value_or(""), "12");
    EXPECT_FALSE(starred.match("XXX=12").has_value());
    EXPECT_FALSE(starred.match("=12").has_value());
}

TEST(LineMatcherTest, ValueMustSatisfyPattern) {
    LineMatcher matcher("PORT", "=", "[0-9]{1,5}");
    EXPECT_EQ(matcher.match("PORT=8080").value_or(""), "8080");
    EXPECT_FALSE(matcher.match("PORT=80a").has_value());
    EXPECT_FALSE(matcher.match("PORT=123456").has_value());
    EXPECT_FALSE(matcher.match("PORT=").has_value());
}

TEST(LineMatcherTest, CapturesWholePatternDespiteInnerGroups) {
    LineMatcher matcher("MODE", "=", "(on|off)(_strict)?");
    EXPECT_EQ(matcher.match("MODE=on_strict").value_or(""), "on_strict");
    EXPECT_EQ(matcher.match("MODE=off # default").value_or(""), "off");
}

TEST(LineMatcherTest, BackreferencesKeepTheirNumbering) {
    LineMatcher matcher("PAIR", "=", "(a+)-\\1");
    EXPECT_EQ(matcher.match("PAIR=aa-aa").value_or(""), "aa-aa");
    EXPECT_FALSE(matcher.match("PAIR=aa-a").has_value());
}

TEST(LineMatcherTest, LongestValueWins) {
    LineMatcher any("FOO", "=", ".*");
    EXPECT_EQ(any.match("FOO=a # c").value_or("none"), "a # c");

    LineMatcher url("URL", "=", "[^ ]+");
    EXPECT_EQ(url.match("URL=http://host/#frag").value_or(""), "http://host/#frag");
    EXPECT_EQ(url.match("URL=http://host/ # note").value_or(""), "http://host/");
}

TEST(LineMatcherTest, EmptyValueCanMatch) {
    LineMatcher matcher("EMPTY", "=", "\\w*");
    auto value = matcher.match("EMPTY=");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "");
    EXPECT_EQ(matcher.match("EMPTY=  # nothing").value_or("none"), "");
}

TEST(LineMatcherTest, OverlongLinesNeverMatch) {
    LineMatcher matcher("FOO", "=", "\\w+");

    std::string longest = "FOO=" + std::string(kMaxLineLength - 4, 'a');
    EXPECT_TRUE(matcher.match(longest).has_value());

    const size_t big = 200000;
    EXPECT_FALSE(matcher.match("FOO=" + std::string(big, 'a')).has_value());
    EXPECT_FALSE(matcher.match("FOO=bar" + std::string(big, ' ')).has_value());
    EXPECT_FALSE(matcher.match("FOO=bar #" + std::string(big, 'x')).has_value());
}

TEST(LineMatcherTest, RejectsEmptyNameOrSeparator) {
    EXPECT_THROW(LineMatcher("", "=", "\\w+"), std::invalid_argument);
    EXPECT_THROW(LineMatcher("FOO", "", "\\w+"), std::invalid_argument);
}

TEST(LineMatcherTest, RejectsInvalidPattern) {
    EXPECT_THROW(LineMatcher("FOO", "=", "[a-"), std::regex_error);
    EXPECT_THROW(LineMatcher("FOO", "=", "a)|(.*"), std::regex_error);
}
