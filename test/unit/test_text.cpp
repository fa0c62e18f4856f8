#include <gtest/gtest.h>

#include "bookbinder_text.hpp"

using namespace bookbinder;

TEST(TextTest, RecognisesUnicodeWhitespace) {
	EXPECT_EQ(WhitespaceLength(" ", 0), 1u);
	EXPECT_EQ(WhitespaceLength("\x1f", 0), 1u);
	EXPECT_EQ(WhitespaceLength("\xC2\xA0", 0), 2u);     // no-break space
	EXPECT_EQ(WhitespaceLength("\xE2\x80\x83", 0), 3u); // em space
	EXPECT_EQ(WhitespaceLength("\xE3\x80\x80", 0), 3u); // ideographic space
	EXPECT_EQ(WhitespaceLength("\xE2\x80\x8B", 0), 0u); // zero width space is not whitespace
	EXPECT_EQ(WhitespaceLength("\xC3\xA9", 0), 0u);
	EXPECT_EQ(WhitespaceLength("a", 0), 0u);
	EXPECT_EQ(WhitespaceLength("\xE2\x80", 0), 0u);
	EXPECT_EQ(WhitespaceLength("ab", 5), 0u);
}

TEST(TextTest, TrimsUnicodeWhitespace) {
	string text = "\xC2\xA0 Caf\xC3\xA9\xE3\x80\x80\n";
	TrimWhitespace(text);
	EXPECT_EQ(text, "Caf\xC3\xA9");

	string blank = " \xE2\x80\x83\t";
	TrimWhitespace(blank);
	EXPECT_EQ(blank, "");

	// a trailing "é" must not be mistaken for a partial space
	string accented = "caf\xC3\xA9";
	TrimWhitespace(accented);
	EXPECT_EQ(accented, "caf\xC3\xA9");
}

TEST(TextTest, NormalizesLineEndings) {
	EXPECT_EQ(NormalizeLineEndings("one\r\ntwo\rthree\n"), "one\ntwo\nthree\n");
	EXPECT_EQ(NormalizeLineEndings("\r\r\n"), "\n\n");
	EXPECT_EQ(NormalizeLineEndings("plain"), "plain");
}
