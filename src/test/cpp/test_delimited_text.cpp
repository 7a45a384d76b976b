#include <string_view>

#include <gtest/gtest.h>

#include "lamp/delimited_text.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {
namespace {

TEST(Delimited_Text, end_delimiter)
{
    const Parse_Input input { u8"abc}def" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter { .end = u8"}" }, Trigger_Set {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"abc");
    EXPECT_EQ(result->value.kind, Delimiter_Kind::end);
    EXPECT_EQ(result->next.pos.begin, 4);
}

TEST(Delimited_Text, keep_delimiter)
{
    const Parse_Input input { u8"abc}def" };
    const Parsed<Delimited_Text> result = scan_delimited_text(
        input, Text_Delimiter { .end = u8"}", .keep_delimiter = true }, Trigger_Set {}
    );
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"abc");
    EXPECT_EQ(result->next.pos.begin, 3);
}

TEST(Delimited_Text, trigger_interrupts)
{
    const Parse_Input input { u8"ab{c}" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter { .end = u8"}" }, Trigger_Set { u8"{" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"ab");
    EXPECT_EQ(result->value.kind, Delimiter_Kind::trigger);
    EXPECT_EQ(result->value.trigger, u8'{');
    EXPECT_EQ(result->next.pos.begin, 3);
}

TEST(Delimited_Text, end_wins_over_trigger)
{
    const Parse_Input input { u8"ab}}" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter { .end = u8"}}" }, Trigger_Set { u8"}" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"ab");
    EXPECT_EQ(result->value.kind, Delimiter_Kind::end);
    EXPECT_TRUE(result->next.eof());
}

TEST(Delimited_Text, empty_end_consumes_everything)
{
    const Parse_Input input { u8"all of it" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter {}, Trigger_Set {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"all of it");
    EXPECT_TRUE(result->next.eof());
}

TEST(Delimited_Text, missing_delimiter_fails)
{
    const Parse_Input input { u8"no end" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter { .end = u8"}" }, Trigger_Set {});
    EXPECT_FALSE(result);
}

TEST(Delimited_Text, accept_eof)
{
    const Parse_Input input { u8"no end" };
    const Parsed<Delimited_Text> result = scan_delimited_text(
        input, Text_Delimiter { .end = u8"}", .accept_eof = true }, Trigger_Set {}
    );
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"no end");
}

TEST(Delimited_Text, non_empty)
{
    const Parse_Input input { u8"}" };
    const Parsed<Delimited_Text> result = scan_delimited_text(
        input, Text_Delimiter { .end = u8"}", .non_empty = true }, Trigger_Set {}
    );
    EXPECT_FALSE(result);
}

TEST(Delimited_Text, fail_on)
{
    const Parse_Input input { u8"ab\ncd}" };
    const Parsed<Delimited_Text> result = scan_delimited_text(
        input, Text_Delimiter { .end = u8"}", .fail_on = u8"\n" }, Trigger_Set {}
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().pos.begin, 2);
}

TEST(Delimited_Text, non_ascii_text)
{
    const Parse_Input input { u8"äöü{" };
    const Parsed<Delimited_Text> result
        = scan_delimited_text(input, Text_Delimiter {}, Trigger_Set { u8"{" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value.text, u8"äöü");
    EXPECT_EQ(result->value.kind, Delimiter_Kind::trigger);
}

} // namespace
} // namespace lamp
