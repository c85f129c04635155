#include <gtest/gtest.h>

#include <limits>
#include <string>

#include <Lumen/misc/format.hpp>

struct StringSink {
    void putc(const char c) { out.push_back(c); }
    void flush() { flushes += 1; }

    std::string out;
    size_t flushes = 0;
};

template<typename... Args>
static std::string Format(const char* fmt, Args&&... args) {
    StringSink sink;
    EXPECT_TRUE(format::format_to(sink, fmt, std::forward<Args>(args)...)) << fmt;
    return sink.out;
}

TEST(FormatTest, PlainText) {
    ASSERT_EQ(Format("hello"), "hello");
    ASSERT_EQ(Format(""), "");
}

TEST(FormatTest, Integers) {
    ASSERT_EQ(Format("{}", 42), "42");
    ASSERT_EQ(Format("{}", -42), "-42");
    ASSERT_EQ(Format("{}", 0u), "0");
    ASSERT_EQ(Format("{}", std::numeric_limits<uint64_t>::max()), "18446744073709551615");
    ASSERT_EQ(Format("{}", std::numeric_limits<int64_t>::min()), "-9223372036854775808");
    ASSERT_EQ(Format("{} {}", (uint8_t)200, (short)-7), "200 -7");
}

TEST(FormatTest, Bases) {
    ASSERT_EQ(Format("{:x}", 255), "ff");
    ASSERT_EQ(Format("{:#x}", 255), "0xff");
    ASSERT_EQ(Format("{:#X}", 255), "0XFF");
    ASSERT_EQ(Format("{:#b}", 5), "0b101");
    ASSERT_EQ(Format("{:o}", 8), "10");
    ASSERT_EQ(Format("{:#o}", 8), "010");
}

TEST(FormatTest, NegativeInBaseUsesTypeWidth) {
    ASSERT_EQ(Format("{:x}", (int8_t)-1), "ff");
    ASSERT_EQ(Format("{:x}", (int16_t)-1), "ffff");
    ASSERT_EQ(Format("{:x}", (int32_t)-1), "ffffffff");
    ASSERT_EQ(Format("{:x}", (int64_t)-1), "ffffffffffffffff");
    ASSERT_EQ(Format("{:#X}", (int16_t)-2), "0XFFFE");
    ASSERT_EQ(Format("{:b}", (int8_t)-128), "10000000");
    ASSERT_EQ(Format("{:o}", (int8_t)-1), "377");
}

TEST(FormatTest, NegativeDecimalKeepsSign) {
    ASSERT_EQ(Format("{}", (int8_t)-128), "-128");
    ASSERT_EQ(Format("{}", (int16_t)-1), "-1");
    ASSERT_EQ(Format("{:d}", (int32_t)-2147483647 - 1), "-2147483648");
}

TEST(FormatTest, CharsAndBools) {
    ASSERT_EQ(Format("{}", 'c'), "c");
    ASSERT_EQ(Format("{:d}", 'A'), "65");
    ASSERT_EQ(Format("{}", true), "true");
    ASSERT_EQ(Format("{:d}", false), "0");
}

TEST(FormatTest, Strings) {
    const char* name = "vga";
    char buffer[] = "text";

    ASSERT_EQ(Format("{}: {}", name, buffer), "vga: text");
    ASSERT_EQ(Format("[{}]", "literal"), "[literal]");
    ASSERT_EQ(Format("{}", (const char*)nullptr), "(null)");
}

TEST(FormatTest, Pointers) {
    ASSERT_EQ(Format("{}", (void*)0xB8000), "0xb8000");
}

TEST(FormatTest, EscapedBraces) {
    ASSERT_EQ(Format("{{}}"), "{}");
    ASSERT_EQ(Format("{{{}}}", 1), "{1}");
}

TEST(FormatTest, FlushesOnce) {
    StringSink sink;
    ASSERT_TRUE(format::format_to(sink, "{} {}", 1, 2));
    ASSERT_EQ(sink.flushes, 1);
}

TEST(FormatTest, MissingArgument) {
    StringSink sink;
    ASSERT_FALSE(format::format_to(sink, "ab{}cd"));
    ASSERT_EQ(sink.out, "ab");
    ASSERT_EQ(sink.flushes, 1);
}

TEST(FormatTest, LeftoverArgument) {
    StringSink sink;
    ASSERT_FALSE(format::format_to(sink, "{}", 1, 2));
    ASSERT_EQ(sink.out, "1");
}

TEST(FormatTest, UnterminatedPlaceholder) {
    StringSink sink;
    ASSERT_FALSE(format::format_to(sink, "value {", 1));
    ASSERT_FALSE(format::format_to(sink, "value {:x", 1));
}

TEST(FormatTest, StrayClosingBrace) {
    StringSink sink;
    ASSERT_FALSE(format::format_to(sink, "oops }"));
}
