#include <gtest/gtest.h>

#include "exception.h"
#include "tokenizer.h"


TEST(SingleCharTokenizer, token_bounds_in_the_middle)
{
    SingleCharTokenizer t;
    UString text("highway;residential; unclassified");

    EXPECT_EQ(t.find_token_start(text, 12), 8);
    EXPECT_EQ(t.find_token_end(text, 12), 19);
    EXPECT_EQ(text.slice(8, 19), UString("residential"));
}

TEST(SingleCharTokenizer, start_skips_leading_spaces)
{
    SingleCharTokenizer t;
    UString text("highway;residential; unclassified");

    EXPECT_EQ(t.find_token_start(text, 33), 21);
    EXPECT_EQ(t.find_token_end(text, 21), 33);
}

TEST(SingleCharTokenizer, start_never_passes_cursor)
{
    SingleCharTokenizer t;
    UString text("a;   ");

    EXPECT_EQ(t.find_token_start(text, 3), 3);
    EXPECT_EQ(t.find_token_start(text, 5), 5);
}

TEST(SingleCharTokenizer, first_token)
{
    SingleCharTokenizer t;
    EXPECT_EQ(t.find_token_start("highway", 4), 0);
    EXPECT_EQ(t.find_token_end("highway", 4), 7);
    EXPECT_EQ(t.find_token_start("", 0), 0);
    EXPECT_EQ(t.find_token_end("", 0), 0);
}

TEST(SingleCharTokenizer, cursor_at_separator)
{
    SingleCharTokenizer t;
    UString text("ab;cd");
    EXPECT_EQ(t.find_token_start(text, 2), 0);
    EXPECT_EQ(t.find_token_end(text, 2), 2);
    EXPECT_EQ(t.find_token_start(text, 3), 3);
    EXPECT_EQ(t.find_token_end(text, 3), 5);
}

TEST(SingleCharTokenizer, cursor_is_clamped)
{
    SingleCharTokenizer t;
    UString text("ab;cd");
    EXPECT_EQ(t.find_token_start(text, -3), 0);
    EXPECT_EQ(t.find_token_end(text, 99), 5);
    EXPECT_EQ(t.find_token_start(text, 99), 3);
}

TEST(SingleCharTokenizer, bounds_enclose_cursor)
{
    SingleCharTokenizer t;
    for (UString text : {UString("a; b;;c  ;"), UString(";;"), UString("  x"),
                         UString("\U0001F600;\U0001F600 ;")})
    {
        TextPos n = static_cast<TextPos>(text.size());
        for (TextPos cursor = 0; cursor <= n; cursor++)
        {
            TextPos start = t.find_token_start(text, cursor);
            TextPos end = t.find_token_end(text, cursor);
            EXPECT_LE(0, start) << text << " " << cursor;
            EXPECT_LE(start, cursor) << text << " " << cursor;
            EXPECT_LE(cursor, end) << text << " " << cursor;
            EXPECT_LE(end, n) << text << " " << cursor;
        }
    }
}

TEST(SingleCharTokenizer, code_point_offsets)
{
    SingleCharTokenizer t;
    UString text("\U0001F600\U0001F600;ab");
    EXPECT_EQ(t.find_token_start(text, 5), 3);
    EXPECT_EQ(t.find_token_end(text, 0), 2);
}

TEST(SingleCharTokenizer, terminate_token)
{
    SingleCharTokenizer t;
    EXPECT_EQ(t.terminate_token(UString("residential")), UString("residential;"));
    EXPECT_EQ(t.terminate_token(UString("residential;")), UString("residential;"));
    EXPECT_EQ(t.terminate_token(UString("residential;  ")), UString("residential;  "));
    EXPECT_EQ(t.terminate_token(UString("residential  ")), UString("residential  ;"));
    EXPECT_EQ(t.terminate_token(UString("")), UString(";"));
}

TEST(SingleCharTokenizer, terminate_token_is_idempotent)
{
    SingleCharTokenizer t;
    for (UString s : {UString("a"), UString("a "), UString(";"), UString(""), UString("a; ")})
        EXPECT_EQ(t.terminate_token(t.terminate_token(s)), t.terminate_token(s)) << s;
}

TEST(SingleCharTokenizer, terminate_spanned_token)
{
    SingleCharTokenizer t;
    SpannedText s("road", {{0, 4, "bold"}});

    SpannedText terminated = t.terminate_token(s);
    EXPECT_EQ(terminated.get_text(), UString("road;"));
    EXPECT_EQ(terminated.get_spans(), FormatSpans({{0, 4, "bold"}}));

    EXPECT_EQ(t.terminate_token(terminated), terminated);
}

TEST(SingleCharTokenizer, other_separator)
{
    SingleCharTokenizer t(',');
    UString text("a,b; c");
    EXPECT_EQ(t.find_token_start(text, 6), 2);
    EXPECT_EQ(t.terminate_token(UString("c")), UString("c,"));
}

TEST(SingleCharTokenizer, invalid_separators)
{
    EXPECT_THROW(SingleCharTokenizer(' '), ValueException);
    EXPECT_THROW(SingleCharTokenizer::from_string(""), ValueException);
    EXPECT_THROW(SingleCharTokenizer::from_string(";;"), ValueException);
    EXPECT_THROW(SingleCharTokenizer::from_string(" "), ValueException);
    EXPECT_EQ(SingleCharTokenizer::from_string("|")->get_separator(), '|');
}
