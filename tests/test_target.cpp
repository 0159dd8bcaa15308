#include <gtest/gtest.h>
#include "api/Target.h"

using namespace cloudclip::api;

TEST(Target, SplitsPathIntoSegments) {
    auto t = parse_target("/session/482913/clipboard/latest");
    EXPECT_EQ(t.segments, (std::vector<std::string>{"session", "482913", "clipboard", "latest"}));
    EXPECT_TRUE(t.query.empty());
}

TEST(Target, RootHasNoSegments) {
    EXPECT_TRUE(parse_target("/").segments.empty());
    EXPECT_TRUE(parse_target("").segments.empty());
}

TEST(Target, IgnoresDuplicateAndTrailingSlashes) {
    auto t = parse_target("//sessions//active/");
    EXPECT_EQ(t.segments, (std::vector<std::string>{"sessions", "active"}));
}

TEST(Target, DecodesQueryParameters) {
    auto t = parse_target("/session/1/clipboard/history?hostname=my%20laptop&x=a+b&flag");
    EXPECT_EQ(t.query_param("hostname"), "my laptop");
    EXPECT_EQ(t.query_param("x"), "a b");
    EXPECT_EQ(t.query_param("flag"), "");
    EXPECT_EQ(t.query_param("missing"), "");
    EXPECT_EQ(t.segments.size(), 4u);
}

TEST(Target, FirstQueryOccurrenceWins) {
    auto t = parse_target("/?hostname=a&hostname=b");
    EXPECT_EQ(t.query_param("hostname"), "a");
}

TEST(Target, PathPlusIsLiteral) {
    auto t = parse_target("/session/a+b%2Fc/status");
    ASSERT_EQ(t.segments.size(), 3u);
    EXPECT_EQ(t.segments[1], "a+b/c");
}

TEST(Target, MalformedEscapesAreKept) {
    EXPECT_EQ(percent_decode("100%", false), "100%");
    EXPECT_EQ(percent_decode("%zz%4", false), "%zz%4");
    EXPECT_EQ(percent_decode("%41%62", false), "Ab");
}

TEST(Target, EncodeEscapesReservedBytes) {
    EXPECT_EQ(percent_encode("host-1.lan_x~"), "host-1.lan_x~");
    EXPECT_EQ(percent_encode("my laptop/2"), "my%20laptop%2F2");
    EXPECT_EQ(percent_decode(percent_encode("a&b=c d"), true), "a&b=c d");
}
