#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "text.h"

TEST(Text, TruncateLeavesShortText)
{
    EXPECT_EQ(truncate("hello", 5), "hello");
    EXPECT_EQ(truncate("", 3), "");
}

TEST(Text, TruncateAppendsEllipsis)
{
    EXPECT_EQ(truncate("hello world", 5), "hello…");
}

TEST(Text, TruncateCountsCodePoints)
{
    std::string text = "héllo wörld";
    EXPECT_EQ(utf8_length(text), 11u);
    EXPECT_EQ(truncate(text, 2), "hé…");
}

TEST(Text, DisplayTime)
{
    EXPECT_EQ(display_time(std::chrono::seconds(0)), "00:00:00");
    EXPECT_EQ(display_time(std::chrono::seconds(59)), "00:00:59");
    EXPECT_EQ(display_time(std::chrono::seconds(3723)), "01:02:03");
    EXPECT_EQ(display_time(std::chrono::seconds(-4)), "00:00:00");
}

TEST(Text, TrimCopy)
{
    EXPECT_EQ(trim_copy("  a b \t\n"), "a b");
    EXPECT_EQ(trim_copy("   "), "");
}

TEST(Text, DecodeUtf8)
{
    EXPECT_EQ(decode_utf8("a▶é"), U"a▶é");
    EXPECT_EQ(decode_utf8(std::string("\xff", 1)), std::u32string(1, U'�'));
    EXPECT_EQ(decode_utf8(std::string("\xe2\x96", 2)).front(), U'�');
}

TEST(Text, EncodeUtf8)
{
    EXPECT_EQ(encode_utf8(U'a'), "a");
    EXPECT_EQ(encode_utf8(U'…'), "…");
    EXPECT_EQ(encode_utf8(U'█'), "█");
}
