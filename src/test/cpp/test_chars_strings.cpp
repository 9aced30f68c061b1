#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "cslc/util/chars.hpp"
#include "cslc/util/strings.hpp"

namespace cslc {
namespace {

using namespace std::literals;

TEST(Chars, is_ascii_blank)
{
    for (const char8_t c : u8" \t\n\r\f\v"sv) {
        EXPECT_TRUE(is_ascii_blank(c));
    }
    EXPECT_FALSE(is_ascii_blank(u8'a'));
    EXPECT_FALSE(is_ascii_blank(u8'<'));
    EXPECT_FALSE(is_ascii_blank(u8'\0'));
}

TEST(Strings, is_ascii_blank)
{
    EXPECT_TRUE(is_ascii_blank(u8""sv));
    EXPECT_TRUE(is_ascii_blank(u8" \n\t"sv));
    EXPECT_FALSE(is_ascii_blank(u8"  x "sv));
}

TEST(Strings, length_blank_left)
{
    EXPECT_EQ(length_blank_left(u8""), 0);
    EXPECT_EQ(length_blank_left(u8"<style/>"), 0);
    EXPECT_EQ(length_blank_left(u8" \n\t<style/>"), 3);
    EXPECT_EQ(length_blank_left(u8"   "), 3);
    EXPECT_EQ(trim_ascii_blank_left(u8"  <a/> "), u8"<a/> ");
}

TEST(Strings, equals_ascii_ignore_case)
{
    EXPECT_TRUE(equals_ascii_ignore_case(u8"", u8""));
    EXPECT_TRUE(equals_ascii_ignore_case(u8"en-US", u8"EN-us"));
    EXPECT_FALSE(equals_ascii_ignore_case(u8"en-US", u8"en_US"));
    EXPECT_FALSE(equals_ascii_ignore_case(u8"en", u8"en-US"));
}

TEST(Strings, for_each_blank_separated)
{
    std::vector<std::u8string_view> parts;
    for_each_blank_separated(u8"  author \n editor\ttranslator ", [&](std::u8string_view part) {
        parts.push_back(part);
    });
    const std::vector<std::u8string_view> expected { u8"author", u8"editor", u8"translator" };
    EXPECT_EQ(parts, expected);

    parts.clear();
    for_each_blank_separated(u8"   ", [&](std::u8string_view part) { parts.push_back(part); });
    EXPECT_TRUE(parts.empty());
}

TEST(Strings, as_string_view)
{
    EXPECT_EQ(as_string_view(u8"abc"), "abc");
    EXPECT_EQ(as_u8string_view("abc"sv), u8"abc");
}

} // namespace
} // namespace cslc
