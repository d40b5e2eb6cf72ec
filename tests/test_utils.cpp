#include "polyp/utils.h"

#include <gtest/gtest.h>

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesPaddedInput) {
    EXPECT_EQ(base64_decode("Zg=="), std::optional<std::string>("f"));
    EXPECT_EQ(base64_decode("Zm8="), std::optional<std::string>("fo"));
    EXPECT_EQ(base64_decode("Zm9vYmFy"), std::optional<std::string>("foobar"));
}

TEST(Base64Test, RejectsInvalidInput) {
    EXPECT_FALSE(base64_decode("not base64!").has_value());
    EXPECT_FALSE(base64_decode("abc").has_value());
    EXPECT_FALSE(base64_decode("a=bc").has_value());
    EXPECT_FALSE(base64_decode("ab=c").has_value());
}

TEST(Base64Test, KeepsBinaryAndControlBytes) {
    std::string raw("line1\nline2\r\n\t\"quoted\"\0nul\x1b[31m", 31);
    std::optional<std::string> decoded = base64_decode(base64_encode(raw));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, raw);
}

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  abc \n"), "abc");
    EXPECT_EQ(trim("\t\n "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringUtilsTest, SplitLinesDropsBlankLines) {
    std::vector<std::string> lines = split_lines("one\n\n  two  \nthree\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_TRUE(split_lines("").empty());
}

TEST(StringUtilsTest, ShortShaTakesPrefix) {
    EXPECT_EQ(short_sha("0123456789abcdef"), "01234567");
    EXPECT_EQ(short_sha("abc"), "abc");
}

TEST(TimestampTest, IsIso8601Utc) {
    std::string timestamp = get_current_timestamp_utc();
    ASSERT_EQ(timestamp.size(), 20u);
    EXPECT_EQ(timestamp[4], '-');
    EXPECT_EQ(timestamp[10], 'T');
    EXPECT_EQ(timestamp.back(), 'Z');
}
