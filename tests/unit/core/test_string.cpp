#include <gtest/gtest.h>
#include "weft/core/string.hpp"

using namespace weft;

// ============================================================================
// Unicode Tests
// ============================================================================

TEST(UnicodeTest, IsAscii) {
    EXPECT_TRUE(unicode::is_ascii('A'));
    EXPECT_TRUE(unicode::is_ascii(0));
    EXPECT_TRUE(unicode::is_ascii(127));
    EXPECT_FALSE(unicode::is_ascii(128));
    EXPECT_FALSE(unicode::is_ascii(0x4E2D));  // Chinese character
}

TEST(UnicodeTest, AsciiLowercase) {
    EXPECT_EQ(static_cast<u32>(unicode::to_ascii_lower('A')), static_cast<u32>('a'));
    EXPECT_EQ(static_cast<u32>(unicode::to_ascii_lower('Z')), static_cast<u32>('z'));
    EXPECT_EQ(static_cast<u32>(unicode::to_ascii_lower('a')), static_cast<u32>('a'));
    EXPECT_EQ(static_cast<u32>(unicode::to_ascii_lower('1')), static_cast<u32>('1'));
}

TEST(UnicodeTest, Utf8DecodeAscii) {
    const char* text = "Hello";
    auto result = unicode::utf8_decode(text, 5);

    EXPECT_EQ(static_cast<u32>(result.code_point), static_cast<u32>('H'));
    EXPECT_EQ(result.bytes_consumed, 1u);
}

TEST(UnicodeTest, Utf8DecodeTwoBytes) {
    const char* text = "\xC3\xA9";  // U+00E9
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(static_cast<u32>(result.code_point), 0x00E9u);
    EXPECT_EQ(result.bytes_consumed, 2u);
}

TEST(UnicodeTest, Utf8DecodeThreeBytes) {
    const char* text = "\xE4\xB8\xAD";  // U+4E2D
    auto result = unicode::utf8_decode(text, 3);

    EXPECT_EQ(static_cast<u32>(result.code_point), 0x4E2Du);
    EXPECT_EQ(result.bytes_consumed, 3u);
}

TEST(UnicodeTest, Utf8DecodeFourBytes) {
    const char* text = "\xF0\x9F\x98\x80";  // U+1F600
    auto result = unicode::utf8_decode(text, 4);

    EXPECT_EQ(static_cast<u32>(result.code_point), 0x1F600u);
    EXPECT_EQ(result.bytes_consumed, 4u);
}

TEST(UnicodeTest, Utf8Encode) {
    char buffer[4];

    EXPECT_EQ(unicode::utf8_encode('A', buffer), 1u);
    EXPECT_EQ(buffer[0], 'A');

    EXPECT_EQ(unicode::utf8_encode(0x00E9, buffer), 2u);
    EXPECT_EQ(static_cast<u8>(buffer[0]), 0xC3);
    EXPECT_EQ(static_cast<u8>(buffer[1]), 0xA9);

    EXPECT_EQ(unicode::utf8_encode(0x1F600, buffer), 4u);
    EXPECT_EQ(static_cast<u8>(buffer[0]), 0xF0);
    EXPECT_EQ(static_cast<u8>(buffer[3]), 0x80);
}

// ============================================================================
// String Tests
// ============================================================================

TEST(StringTest, DefaultConstruction) {
    String s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
}

TEST(StringTest, Literal) {
    auto s = "Hello"_s;
    EXPECT_EQ(s.size(), 5u);
    EXPECT_EQ(s, String("Hello"));
}

TEST(StringTest, Concatenation) {
    String a("Hello");
    String b(" World");
    String c = a + b;

    EXPECT_EQ(c, String("Hello World"));

    c += '!';
    EXPECT_EQ(c, String("Hello World!"));
}

TEST(StringTest, Contains) {
    String s("Hello World");

    EXPECT_TRUE(s.contains(String("World")));
    EXPECT_FALSE(s.contains(String("Foo")));
}

TEST(StringTest, StartsAndEndsWith) {
    String s("Hello World");

    EXPECT_TRUE(s.starts_with(String("Hello")));
    EXPECT_FALSE(s.starts_with(String("World")));
    EXPECT_TRUE(s.ends_with(String("World")));
    EXPECT_FALSE(s.ends_with(String("Hello")));
}

TEST(StringTest, ToLowercase) {
    String s("DocType HTML");
    EXPECT_EQ(s.to_lowercase(), String("doctype html"));
}

TEST(StringTest, Trim) {
    String s("  Hello World \n");
    EXPECT_EQ(s.trim(), String("Hello World"));
    EXPECT_EQ(String("   ").trim(), String(""));
}

TEST(StringTest, Split) {
    String s("a,b,,c");
    auto parts = s.split(',');

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], String("a"));
    EXPECT_EQ(parts[1], String("b"));
    EXPECT_TRUE(parts[2].empty());
    EXPECT_EQ(parts[3], String("c"));
}

TEST(StringTest, Find) {
    String s("Hello World");

    ASSERT_TRUE(s.find(String("World")).has_value());
    EXPECT_EQ(*s.find(String("World")), 6u);
    ASSERT_TRUE(s.find('o').has_value());
    EXPECT_EQ(*s.find('o'), 4u);
    EXPECT_FALSE(s.find(String("Foo")).has_value());
}

TEST(StringTest, Substring) {
    String s("Hello World");

    EXPECT_EQ(s.substring(0, 5), String("Hello"));
    EXPECT_EQ(s.substring(6), String("World"));
}

TEST(StringTest, EqualsIgnoreCase) {
    String a("DOCTYPE");

    EXPECT_TRUE(a.equals_ignore_case(String("doctype")));
    EXPECT_TRUE(a.equals_ignore_case(String("DocType")));
    EXPECT_FALSE(a.equals_ignore_case(String("doc")));
}

TEST(StringTest, Ordering) {
    EXPECT_TRUE(String("a") < String("b"));
    EXPECT_FALSE(String("b") < String("a"));
}

// ============================================================================
// StringBuilder Tests
// ============================================================================

TEST(StringBuilderTest, BasicUsage) {
    StringBuilder sb;
    sb.append("Hello");
    sb.append(' ');
    sb.append(String("World"));

    EXPECT_EQ(sb.build(), String("Hello World"));
}

TEST(StringBuilderTest, AppendNumber) {
    StringBuilder sb;
    sb.append(u64{42});
    sb.append(" ");
    sb.append(u64{100});

    EXPECT_EQ(sb.build(), String("42 100"));
}

TEST(StringBuilderTest, AppendCodePoint) {
    StringBuilder sb;
    sb.append(unicode::CodePoint('A'));
    sb.append(unicode::CodePoint(0x4E2D));

    EXPECT_EQ(sb.build(), String("A\xE4\xB8\xAD"));
}
