#include <gtest/gtest.h>

#include "url.hpp"

TEST(PercentDecodeTest, DecodesEscapes) {
    EXPECT_EQ(percent_decode("Chess%20Club"), "Chess Club");
    EXPECT_EQ(percent_decode("a%2fb%2Fc"), "a/b/c");
    EXPECT_EQ(percent_decode("plain"), "plain");
    EXPECT_EQ(percent_decode(""), "");
}

TEST(PercentDecodeTest, PlusHandling) {
    EXPECT_EQ(percent_decode("a+b"), "a+b");
    EXPECT_EQ(percent_decode("a+b", true), "a b");
    EXPECT_EQ(percent_decode("a%2Bb", true), "a+b");
}

TEST(PercentDecodeTest, BadEscapesKeptLiterally) {
    EXPECT_EQ(percent_decode("%"), "%");
    EXPECT_EQ(percent_decode("abc%2"), "abc%2");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
    EXPECT_EQ(percent_decode("%g0"), "%g0");
    EXPECT_EQ(percent_decode("100%off"), "100%off");
    // a bad escape does not stop later ones from decoding
    EXPECT_EQ(percent_decode("%%41"), "%A");
    EXPECT_EQ(percent_decode("50%+more", true), "50% more");
}

TEST(ParseTargetTest, RootHasNoSegments) {
    auto t = parse_target("/");
    EXPECT_TRUE(t.segments.empty());
    EXPECT_TRUE(t.query.empty());
}

TEST(ParseTargetTest, SplitsBeforeDecoding) {
    auto t = parse_target("/activities/AC%2FDC%20Fans/signup");
    ASSERT_EQ(t.segments.size(), 3u);
    EXPECT_EQ(t.segments[0], "activities");
    EXPECT_EQ(t.segments[1], "AC/DC Fans");
    EXPECT_EQ(t.segments[2], "signup");
}

TEST(ParseTargetTest, EmptySegmentsDropped) {
    auto t = parse_target("//activities///");
    ASSERT_EQ(t.segments.size(), 1u);
    EXPECT_EQ(t.segments[0], "activities");
}

TEST(ParseTargetTest, QueryParameters) {
    auto t = parse_target("/x?email=a%40b.edu&flag&name=John+Smith&email=last%40b.edu&&");
    EXPECT_EQ(t.query.at("email"), "last@b.edu");
    EXPECT_EQ(t.query.at("flag"), "");
    EXPECT_EQ(t.query.at("name"), "John Smith");
    EXPECT_EQ(t.query.size(), 3u);
}

TEST(ParseTargetTest, EmptyValueIsPresent) {
    auto t = parse_target("/x?email=");
    ASSERT_EQ(t.query.count("email"), 1u);
    EXPECT_EQ(t.query.at("email"), "");
}

TEST(ParseTargetTest, FragmentIgnored) {
    auto t = parse_target("/x?email=a#frag");
    EXPECT_EQ(t.query.at("email"), "a");
}

TEST(ParseTargetTest, BadEscapesSurviveInPathAndQuery) {
    auto t = parse_target("/activities/Chess%2/signup?email=100%off%4");
    ASSERT_EQ(t.segments.size(), 3u);
    EXPECT_EQ(t.segments[1], "Chess%2");
    EXPECT_EQ(t.query.at("email"), "100%off%4");
}
