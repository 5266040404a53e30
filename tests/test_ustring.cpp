#include <gtest/gtest.h>

#include "tools/string_helpers.h"
#include "tools/ustringmain.h"


TEST(UString, size_counts_code_points)
{
    EXPECT_EQ(UString("").size(), 0u);
    EXPECT_EQ(UString("abc").size(), 3u);
    EXPECT_EQ(UString("Straße").size(), 6u);
    EXPECT_EQ(UString("a\U0001F600b").size(), 3u);   // outside the BMP
}

TEST(UString, index_by_code_point)
{
    UString s("a\U0001F600b");
    EXPECT_EQ(s[0], 'a');
    EXPECT_EQ(s[1], 0x1F600);
    EXPECT_EQ(s[2], 'b');
}

TEST(UString, slice)
{
    UString s("highway;residential");
    EXPECT_EQ(s.slice(0, 7), UString("highway"));
    EXPECT_EQ(s.slice(8), UString("residential"));
    EXPECT_EQ(s.slice(-4), UString("tial"));
    EXPECT_EQ(s.slice(5, 5), UString(""));
    EXPECT_EQ(s.slice(7, 3), UString(""));
    EXPECT_EQ(s.slice(15, 100), UString("tial"));
    EXPECT_EQ(UString("a\U0001F600b").slice(1, 2), UString("\U0001F600"));
}

TEST(UString, strip)
{
    EXPECT_EQ(UString("  ab c ").strip(), UString("ab c"));
    EXPECT_EQ(UString("  ab").lstrip(), UString("ab"));
    EXPECT_EQ(UString("ab \t").rstrip(), UString("ab"));
    EXPECT_EQ(UString("   ").strip(), UString(""));
    EXPECT_EQ(UString("x\U0001F600 ").rstrip(), UString("x\U0001F600"));
}

TEST(UString, isspace)
{
    EXPECT_TRUE(UString("").isspace());
    EXPECT_TRUE(UString(" \t").isspace());
    EXPECT_FALSE(UString(" a ").isspace());
}

TEST(UString, code_points_round_trip)
{
    UString s("Ärger;\U0001F600");
    EXPECT_EQ(UString::from_code_points(s.get_code_points()), s);
    EXPECT_EQ(UString::from_code_point(';'), UString(";"));
}

TEST(UString, case_and_prefix)
{
    EXPECT_EQ(UString("ResiDential").lower(), UString("residential"));
    EXPECT_EQ(UString("straße").upper(), UString("STRASSE"));
    EXPECT_TRUE(UString("residential").startswith(UString("resi")));
    EXPECT_FALSE(UString("resi").startswith(UString("residential")));
}

TEST(UString, repr_shows_spaces_and_escapes)
{
    EXPECT_EQ(repr(UString(" b ")), "' b '");
    EXPECT_EQ(repr(UString("it's\n")), "'it\\'s\\n'");
    EXPECT_EQ(repr(std::string("a\tb")), "'a\\tb'");
}
