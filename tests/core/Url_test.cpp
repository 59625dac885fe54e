#include "core/Url.hpp"
#include <gtest/gtest.h>

using namespace mcp_gw;

TEST(UrlTest, EncodeKeepsUnreserved) {
    EXPECT_EQ(url_encode("abc-_.~XYZ09"), "abc-_.~XYZ09");
    EXPECT_EQ(url_encode("my server/1"), "my%20server%2F1");
    EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
}

TEST(UrlTest, DecodeHandlesPlusAndMalformedEscapes) {
    EXPECT_EQ(url_decode("a+b%20c"), "a b c");
    EXPECT_EQ(url_decode("%7B%22k%22%3A1%7D"), "{\"k\":1}");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
}

TEST(UrlTest, ParseQuery) {
    auto query = parse_query("transportType=stdio&command=npx&args=-y+pkg&flag&serverName=a&serverName=b");

    EXPECT_EQ(query.at("transportType"), "stdio");
    EXPECT_EQ(query.at("command"), "npx");
    EXPECT_EQ(query.at("args"), "-y pkg");
    EXPECT_EQ(query.at("flag"), "");
    EXPECT_EQ(query.at("serverName"), "a");
    EXPECT_TRUE(parse_query("").empty());
}

TEST(UrlTest, SplitTarget) {
    std::string path;
    std::string query;

    split_target("/sse?serverName=x", path, query);
    EXPECT_EQ(path, "/sse");
    EXPECT_EQ(query, "serverName=x");

    split_target("/api/health", path, query);
    EXPECT_EQ(path, "/api/health");
    EXPECT_TRUE(query.empty());
}
