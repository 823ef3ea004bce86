#include "chat_common.hpp"

#include <gtest/gtest.h>

using namespace lanchat;

TEST(Common,TrimStripsControlAndSpace) {
	EXPECT_EQ(trim("  a b \t\r\n"),"a b");
	EXPECT_EQ(trim(""),"");
	EXPECT_EQ(trim(" \t "),"");
}

TEST(Common,Utf8Validation) {
	EXPECT_TRUE(isValidUtf8("plain"));
	EXPECT_TRUE(isValidUtf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
	EXPECT_FALSE(isValidUtf8("\xC3"));
	EXPECT_FALSE(isValidUtf8("\xC0\xAF"));         // overlong
	EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));     // surrogate
	EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
	EXPECT_FALSE(isValidUtf8("\x80"));
}

TEST(Common,Utf8Slicing) {
	const std::string s="a\xC3\xA9" "b\xE2\x82\xAC";
	EXPECT_EQ(utf8Length(s),4u);
	EXPECT_EQ(utf8Prefix(s,2),"a\xC3\xA9");
	EXPECT_EQ(utf8Suffix(s,2),"b\xE2\x82\xAC");
	EXPECT_EQ(utf8Suffix(s,10),s);

	std::string t=s;
	utf8PopBack(t);
	EXPECT_EQ(t,"a\xC3\xA9" "b");
	utf8PopBack(t);
	utf8PopBack(t);
	EXPECT_EQ(t,"a");
}

TEST(Common,ClockTimeIsHhMmSs) {
	std::string t=clockTime(std::chrono::system_clock::now());
	ASSERT_EQ(t.size(),8u);
	EXPECT_EQ(t[2],':');
	EXPECT_EQ(t[5],':');
}

TEST(Common,DisplayWidthCountsColumns) {
	EXPECT_EQ(displayWidth("abc"),3u);
	EXPECT_EQ(displayWidth("\xE4\xBD\xA0\xE5\xA5\xBD"),4u);    // two CJK ideographs
	EXPECT_EQ(displayWidth("\xF0\x9F\x98\x80"),2u);            // emoji
	EXPECT_EQ(displayWidth("e\xCC\x81"),1u);                   // e + combining acute
	EXPECT_EQ(displayWidth("\xEA\xB0\x80" "a"),3u);            // hangul syllable
}

TEST(Common,FitWidthNeverSplitsAWideCharacter) {
	const std::string s="a\xE4\xBD\xA0" "b";
	EXPECT_EQ(fitWidth(s,2),"a");
	EXPECT_EQ(fitWidth(s,3),"a\xE4\xBD\xA0");
	EXPECT_EQ(fitWidth(s,10),s);
	EXPECT_EQ(fitWidthTail(s,2),"b");
	EXPECT_EQ(fitWidthTail(s,3),"\xE4\xBD\xA0" "b");
	EXPECT_EQ(fitWidthTail(s,0),"");
}

TEST(Common,SanitizeShowsControlsAsCaretNotation) {
	EXPECT_EQ(sanitizeForDisplay("plain text"),"plain text");
	EXPECT_EQ(sanitizeForDisplay("a\x1b[2Jb"),"a^[[2Jb");
	EXPECT_EQ(sanitizeForDisplay("bell\x07"),"bell^G");
	EXPECT_EQ(sanitizeForDisplay("x\ny\rz\t"),"x^Jy^Mz^I");
	EXPECT_EQ(sanitizeForDisplay(std::string("nul\0!",5)),"nul^@!");
	EXPECT_EQ(sanitizeForDisplay("del\x7f"),"del^?");
}

TEST(Common,SanitizeReplacesC1AndKeepsUnicode) {
	EXPECT_EQ(sanitizeForDisplay("\xC2\x9B" "31m"),"?31m");       // C1 CSI
	EXPECT_EQ(sanitizeForDisplay("\xC2\x85"),"?");
	EXPECT_EQ(sanitizeForDisplay("caf\xC3\xA9 \xE2\x82\xAC"),"caf\xC3\xA9 \xE2\x82\xAC");
	EXPECT_EQ(sanitizeForDisplay("bad\xFF"),"bad?");
}
