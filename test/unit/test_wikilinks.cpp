#include <gtest/gtest.h>

#include "bookbinder_wikilinks.hpp"

using namespace bookbinder;

TEST(WikiLinkTest, ParsesPlainLink) {
	WikiLink link;
	ASSERT_TRUE(ParseWikiLink("[[Alice]]", link));
	EXPECT_EQ(link.target, "Alice");
	EXPECT_EQ(link.display_name, "");
}

TEST(WikiLinkTest, ParsesLinkWithDisplayName) {
	WikiLink link;
	ASSERT_TRUE(ParseWikiLink("[[Chapter One|The beginning]]", link));
	EXPECT_EQ(link.target, "Chapter One");
	EXPECT_EQ(link.display_name, "The beginning");
}

TEST(WikiLinkTest, TrimsSurroundingWhitespace) {
	WikiLink link;
	ASSERT_TRUE(ParseWikiLink("  [[Alice]] \t", link));
	EXPECT_EQ(link.target, "Alice");
}

TEST(WikiLinkTest, RejectsPartialMatches) {
	WikiLink link;
	EXPECT_FALSE(ParseWikiLink("see [[Alice]]", link));
	EXPECT_FALSE(ParseWikiLink("[[Alice]] and [[Bob]]", link));
	EXPECT_FALSE(ParseWikiLink("[[Alice]]!", link));
	EXPECT_FALSE(ParseWikiLink("[Alice]", link));
}

TEST(WikiLinkTest, RejectsEmptyParts) {
	WikiLink link;
	EXPECT_FALSE(ParseWikiLink("[[]]", link));
	EXPECT_FALSE(ParseWikiLink("[[|Display]]", link));
	EXPECT_FALSE(ParseWikiLink("[[Alice|]]", link));
	EXPECT_FALSE(ParseWikiLink("[[Alice", link));
}

TEST(WikiLinkTest, DisplayMayContainPipes) {
	WikiLink link;
	ASSERT_TRUE(ParseWikiLink("[[Alice|a|b]]", link));
	EXPECT_EQ(link.target, "Alice");
	EXPECT_EQ(link.display_name, "a|b");
}

TEST(WikiLinkTest, StripsEveryLinkSpan) {
	EXPECT_EQ(StripWikiLinks("see [[Alice]] and [[Bob|Robert]] now"), "see  and  now");
	// a target may contain '[', so the first "[[" swallows the second
	EXPECT_EQ(StripWikiLinks("[[unclosed and [[Done]]"), "");
	EXPECT_EQ(StripWikiLinks("keep [[a|]] this"), "keep [[a|]] this");
	EXPECT_EQ(StripWikiLinks("no links"), "no links");
}

TEST(WikiLinkTest, StripsCheckboxMarkers) {
	EXPECT_EQ(StripCheckbox("[ ] Buy milk"), "Buy milk");
	EXPECT_EQ(StripCheckbox("[x] Call Bob"), "Call Bob");
	EXPECT_EQ(StripCheckbox("[X] Call Bob"), "Call Bob");
	EXPECT_EQ(StripCheckbox("[-] Cancelled"), "[-] Cancelled");
	EXPECT_EQ(StripCheckbox("[x]no space"), "[x]no space");
}

TEST(WikiLinkTest, ClassifiesCheckedLink) {
	auto item = ClassifyItem("[x] [[Alice|Al]]");
	EXPECT_TRUE(item.is_wikilink);
	EXPECT_EQ(item.target, "Alice");
	EXPECT_EQ(item.text, "[[Alice|Al]]");
}

TEST(WikiLinkTest, ClassifiesPlainText) {
	auto item = ClassifyItem("[ ]  indented task");
	EXPECT_FALSE(item.is_wikilink);
	EXPECT_EQ(item.target, "");
	// only the four marker characters are removed
	EXPECT_EQ(item.text, " indented task");
}
