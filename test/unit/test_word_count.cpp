#include <gtest/gtest.h>

#include "bookbinder_word_count.hpp"

using namespace bookbinder;

TEST(WordCountTest, CountsPlainWords) {
	EXPECT_EQ(CountWords("Hello world"), 2u);
	EXPECT_EQ(CountWords("  spaced\tout\n\nwords  "), 3u);
	EXPECT_EQ(CountWords(""), 0u);
	EXPECT_EQ(CountWords(" \n\t "), 0u);
}

TEST(WordCountTest, SplitsOnUnicodeWhitespace) {
	EXPECT_EQ(CountWords("Hello\xC2\xA0world"), 2u);
	EXPECT_EQ(CountWords("one\xE2\x80\x83two\xE3\x80\x80three"), 3u);
	EXPECT_EQ(CountWords("\xC2\xA0\xC2\xA0"), 0u);
	EXPECT_EQ(StripMarkdownSyntax("#\xC2\xA0Title\n-\xC2\xA0item"), "Title\nitem");
}

TEST(WordCountTest, DropsWikiLinks) {
	EXPECT_EQ(CountWords("Meet [[Alice]] and [[Bob|Robert]] today"), 3u);
}

TEST(WordCountTest, KeepsFencedCodeButNotFences) {
	EXPECT_EQ(CountWords("```cpp\nint x = 1;\n```\n"), 4u);
	EXPECT_EQ(StripMarkdownSyntax("```\ncode\n```"), "\ncode\n");
}

TEST(WordCountTest, DropsBackticks) {
	EXPECT_EQ(StripMarkdownSyntax("use `grep` now"), "use grep now");
}

TEST(WordCountTest, DropsHtmlTags) {
	EXPECT_EQ(StripMarkdownSyntax("<b>bold</b> text<br/>"), "bold text");
	EXPECT_EQ(StripMarkdownSyntax("a <> b < c"), "a <> b < c");
}

TEST(WordCountTest, KeepsLinkText) {
	EXPECT_EQ(StripMarkdownSyntax("[the docs](https://example.com) say"), "the docs say");
	EXPECT_EQ(StripMarkdownSyntax("[](empty) [x]() [y] (z)"), "[](empty) [x]() [y] (z)");
}

TEST(WordCountTest, ImagesAfterLinkStage) {
	EXPECT_EQ(StripMarkdownSyntax("![](img.png) caption"), " caption");
	// a labelled image has already been rewritten by the link stage
	EXPECT_EQ(StripMarkdownSyntax("![alt text](img.png)"), "!alt text");
}

TEST(WordCountTest, StripsHeadingMarkers) {
	EXPECT_EQ(StripMarkdownSyntax("# Title\n###### Deep\n####### Seven\n#hashtag"),
	          "Title\nDeep\n####### Seven\n#hashtag");
	// the whitespace run may swallow the line break
	EXPECT_EQ(StripMarkdownSyntax("#\nword"), "word");
}

TEST(WordCountTest, StripsListMarkers) {
	EXPECT_EQ(StripMarkdownSyntax("- one\n* two\n+ three\n1. four\n12. five"), "one\ntwo\nthree\nfour\nfive");
	EXPECT_EQ(StripMarkdownSyntax("- 1. nested"), "nested");
	EXPECT_EQ(StripMarkdownSyntax("-dash\n1.5 km"), "-dash\n1.5 km");
}

TEST(WordCountTest, DropsEmphasisCharacters) {
	EXPECT_EQ(StripMarkdownSyntax("**bold** _it_ ~~gone~~ snake_case"), "bold it gone snakecase");
	EXPECT_EQ(CountWords("* * *"), 0u);
}

TEST(WordCountTest, CountsMixedDocument) {
	string note = "# Chapter 1\n"
	              "\n"
	              "It was a **dark** and _stormy_ night. See [[Weather]].\n"
	              "\n"
	              "- Rain\n"
	              "- [Thunder](https://example.com/thunder)\n"
	              "\n"
	              "<!-- draft -->\n";
	// Chapter 1 / It was a dark and stormy night. See . / Rain / Thunder
	EXPECT_EQ(CountWords(note), 13u);
}

TEST(WordCountTest, IdempotentOnPlainText) {
	string plain = "Plain words only, nothing else here.";
	EXPECT_EQ(CountWords(StripMarkdownSyntax(plain)), CountWords(plain));
	string cleaned = StripMarkdownSyntax("## Notes\n- **a** [b](c)\n");
	EXPECT_EQ(CountWords(cleaned), CountWords(StripMarkdownSyntax(cleaned)));
}
