#include <gtest/gtest.h>

#include "Global/Misc/String_utils.hpp"

TEST(StringUtils, TrimRemovesSurroundingWhitespace)
{
	EXPECT_EQ(Trim("  abc \n\t"), "abc");
	EXPECT_EQ(Trim("   "), "");
	EXPECT_EQ(Trim("a b"), "a b");
}

TEST(StringUtils, NukeStringDropsControlCharacters)
{
	const std::string raw = std::string(" ab\x01" "c\0d ", 8);
	EXPECT_EQ(NukeString(raw), "abcd");
	EXPECT_EQ(NukeString("line1\nline2"), "line1\nline2");
}

TEST(StringUtils, TruncateKeepsAtMostLimit)
{
	EXPECT_EQ(Truncate("abcdef", 3), "abc");
	EXPECT_EQ(Truncate("ab", 3), "ab");
	EXPECT_EQ(Truncate(std::string(500, 'x'), 200).size(), 200u);
}

TEST(StringUtils, SplitLinesSkipsEmptyAndStripsCarriageReturn)
{
	const auto lines = SplitLines("one\r\n\ntwo\nthree");
	ASSERT_EQ(lines.size(), 3u);
	EXPECT_EQ(lines[0], "one");
	EXPECT_EQ(lines[1], "two");
	EXPECT_EQ(lines[2], "three");
	EXPECT_TRUE(SplitLines("").empty());
}

TEST(StringUtils, JoinAndCase)
{
	EXPECT_EQ(JoinStrings({"a", "b", "c"}, ", "), "a, b, c");
	EXPECT_EQ(JoinStrings({}, ","), "");
	EXPECT_EQ(ToLower("Pulling FS Layer"), "pulling fs layer");
	EXPECT_TRUE(StartsWith("OPENCLAW_PORT=1", "OPENCLAW_PORT="));
	EXPECT_FALSE(StartsWith("OPEN", "OPENCLAW"));
}
