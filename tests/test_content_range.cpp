#include <gtest/gtest.h>

#include <sdm/http.hpp>

using namespace sdm;

TEST(ContentRangeTest, ParsesFullForm) {
    auto const result = ContentRange::parse("bytes 0-1/10485760");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->start, 0);
    EXPECT_EQ(result->end, 1);
    EXPECT_EQ(result->total, 10485760);
}

TEST(ContentRangeTest, UnknownTotal) {
    auto const result = ContentRange::parse("bytes 100-199/*");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->start, 100);
    EXPECT_EQ(result->end, 199);
    EXPECT_FALSE(result->total);
}

TEST(ContentRangeTest, UnsatisfiedRange) {
    auto const result = ContentRange::parse("bytes */0");
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->start);
    EXPECT_FALSE(result->end);
    EXPECT_EQ(result->total, 0);
}

TEST(ContentRangeTest, ToleratesCaseAndWhitespace) {
    auto const result = ContentRange::parse("  Bytes 5-9/10 ");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->start, 5);
    EXPECT_EQ(result->end, 9);
    EXPECT_EQ(result->total, 10);
}

TEST(ContentRangeTest, RejectsMalformed) {
    EXPECT_FALSE(ContentRange::parse(""));
    EXPECT_FALSE(ContentRange::parse("bytes"));
    EXPECT_FALSE(ContentRange::parse("items 0-1/2"));
    EXPECT_FALSE(ContentRange::parse("bytes 0-1"));
    EXPECT_FALSE(ContentRange::parse("bytes a-b/10"));
    EXPECT_FALSE(ContentRange::parse("bytes 5-4/10"));
    EXPECT_FALSE(ContentRange::parse("bytes 0-10/10"));
    EXPECT_FALSE(ContentRange::parse("bytes 0-1/-5"));
}

TEST(ResponseTest, HeaderLookupIgnoresCase) {
    auto response = HTTP::Response{.status = 206};
    response.headers["Content-Range"] = "bytes 0-1/2";
    response.headers["accept-ranges"] = "bytes";
    EXPECT_EQ(response.header("content-range"), "bytes 0-1/2");
    EXPECT_EQ(response.header("ACCEPT-RANGES"), "bytes");
    EXPECT_FALSE(response.header("Content-Length"));
}
