#include <cstddef>
#include <ostream>
#include <string_view>

#include <gtest/gtest.h>

#include "lamp/util/chars.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/parse_utils.hpp"

namespace lamp {

std::ostream& operator<<(std::ostream& out, Blank_Line blank) // NOLINT(misc-use-internal-linkage)
{
    return out << "Blank_Line{.begin = " << blank.begin << ", .length = " << blank.length << "}";
}

namespace {

using namespace std::literals;

TEST(Chars, is_ascii_blank)
{
    for (const char8_t c : all_ascii_blank8) {
        EXPECT_TRUE(is_ascii_blank(c));
    }
    EXPECT_FALSE(is_ascii_blank(u8'a'));
    EXPECT_FALSE(is_ascii_blank(u8'\0'));
}

TEST(Chars, names)
{
    EXPECT_TRUE(is_name_start(u8'a'));
    EXPECT_TRUE(is_name_start(u8'Z'));
    EXPECT_FALSE(is_name_start(u8'0'));
    EXPECT_FALSE(is_name_start(u8'-'));

    for (const char8_t c : u8"aZ0-_"sv) {
        EXPECT_TRUE(is_name_continuation(c));
    }
    EXPECT_FALSE(is_name_continuation(u8'.'));
    EXPECT_TRUE(is_reference_name_continuation(u8'.'));
    EXPECT_FALSE(is_reference_name_continuation(u8'}'));
}

TEST(Chars, is_unquoted_attribute_value)
{
    for (const char8_t c : u8"abc-123_/#"sv) {
        EXPECT_TRUE(is_unquoted_attribute_value(c));
    }
    for (const char8_t c : u8" \t\n.:"sv) {
        EXPECT_FALSE(is_unquoted_attribute_value(c));
    }
    for (const char8_t c : u8"größe"sv) {
        EXPECT_TRUE(is_unquoted_attribute_value(c));
    }
}

TEST(Strings, trim_ascii_blank_left)
{
    EXPECT_EQ(u8"lamp"sv, trim_ascii_blank_left(u8"lamp"));
    EXPECT_EQ(u8"lamp"sv, trim_ascii_blank_left(u8"\n\t\v\f\r lamp"));
    EXPECT_EQ(u8"lamp\n\t "sv, trim_ascii_blank_left(u8"\n\t lamp\n\t "));
}

TEST(Strings, trim_ascii_blank_right)
{
    EXPECT_EQ(u8"lamp"sv, trim_ascii_blank_right(u8"lamp\n\t\v\f\r "));
    EXPECT_EQ(u8"\n\t lamp"sv, trim_ascii_blank_right(u8"\n\t lamp\n\t "));
}

TEST(Strings, trim_ascii_blank)
{
    EXPECT_EQ(u8"lamp"sv, trim_ascii_blank(u8"\n\t lamp\n\t "));
    EXPECT_EQ(u8""sv, trim_ascii_blank(u8" \n "));
}

TEST(Strings, length_indentation)
{
    EXPECT_EQ(length_indentation(u8""), 0);
    EXPECT_EQ(length_indentation(u8"text"), 0);
    EXPECT_EQ(length_indentation(u8" \t text"), 3);
    EXPECT_EQ(length_indentation(u8"  \n text"), 2);
}

TEST(Strings, is_name)
{
    EXPECT_TRUE(is_name(u8"style"));
    EXPECT_TRUE(is_name(u8"my-box_2"));
    EXPECT_FALSE(is_name(u8""));
    EXPECT_FALSE(is_name(u8"2box"));
    EXPECT_FALSE(is_name(u8"config.title"));
}

TEST(Parse_Utils, find_blank_line_sequence)
{
    EXPECT_EQ(find_blank_line_sequence(u8""), (Blank_Line { 0, 0 }));
    EXPECT_EQ(find_blank_line_sequence(u8"lamp"), (Blank_Line { 0, 0 }));
    EXPECT_EQ(find_blank_line_sequence(u8"l\na\nm\np"), (Blank_Line { 0, 0 }));

    EXPECT_EQ(find_blank_line_sequence(u8"\nlamp"), (Blank_Line { 0, 1 }));
    EXPECT_EQ(find_blank_line_sequence(u8"lamp\n  \n"), (Blank_Line { 5, 3 }));
    EXPECT_EQ(find_blank_line_sequence(u8"la\n\nmp"), (Blank_Line { 3, 1 }));
    EXPECT_EQ(find_blank_line_sequence(u8"first\n\t\t\n\n second"), (Blank_Line { 6, 4 }));
}

TEST(Parse_Utils, length_leading_blank_lines)
{
    EXPECT_EQ(length_leading_blank_lines(u8""), 0);
    EXPECT_EQ(length_leading_blank_lines(u8"text"), 0);
    EXPECT_EQ(length_leading_blank_lines(u8"  text"), 0);
    EXPECT_EQ(length_leading_blank_lines(u8"\n \ntext"), 3);
    EXPECT_EQ(length_leading_blank_lines(u8"  \n  "), 5);
}

TEST(Parse_Utils, line_length)
{
    EXPECT_EQ(line_length(u8""), 0);
    EXPECT_EQ(line_length(u8"abc"), 3);
    EXPECT_EQ(line_length(u8"abc\ndef"), 3);
}

} // namespace
} // namespace lamp
