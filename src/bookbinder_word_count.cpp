#include "bookbinder_word_count.hpp"
#include "bookbinder_text.hpp"
#include "bookbinder_wikilinks.hpp"

#include "duckdb/common/string_util.hpp"

#include <algorithm>
#include <cstring>

namespace bookbinder {

using duckdb::StringUtil;

static bool IsLineStart(const string &s, size_t i) {
	return i == 0 || s[i - 1] == '\n';
}

static bool IsSpaceAt(const string &s, size_t i) {
	return WhitespaceLength(s, i) > 0;
}

// Skip a run of whitespace starting at i, which may cross line breaks.
static size_t SkipSpace(const string &s, size_t i) {
	idx_t step;
	while ((step = WhitespaceLength(s, i)) > 0) {
		i += step;
	}
	return i;
}

// Blank lines opening or closing a ``` fence; the fenced lines themselves stay.
static string RemoveFenceLines(const string &s) {
	string result;
	result.reserve(s.size());
	size_t line_start = 0;
	while (true) {
		size_t line_end = s.find('\n', line_start);
		if (line_end == string::npos) {
			line_end = s.size();
		}
		if (s.compare(line_start, 3, "```") != 0) {
			result.append(s, line_start, line_end - line_start);
		}
		if (line_end == s.size()) {
			break;
		}
		result += '\n';
		line_start = line_end + 1;
	}
	return result;
}

static string RemoveChars(string s, const char *chars) {
	s.erase(std::remove_if(s.begin(), s.end(), [&](char c) { return c != '\0' && strchr(chars, c) != nullptr; }),
	        s.end());
	return s;
}

static string RemoveHtmlTags(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		if (s[i] == '<' && i + 1 < s.size() && s[i + 1] != '>') {
			size_t close = s.find('>', i + 1);
			if (close != string::npos) {
				i = close + 1;
				continue;
			}
		}
		result += s[i];
		i++;
	}
	return result;
}

// Match "[label](url)" with s[open] == '['; label may be empty only when allow_empty_label.
// Sets label_end to the ']' and end to one past the ')'.
static bool MatchInlineLink(const string &s, size_t open, bool allow_empty_label, size_t &label_end, size_t &end) {
	label_end = s.find(']', open + 1);
	if (label_end == string::npos || (!allow_empty_label && label_end == open + 1)) {
		return false;
	}
	if (label_end + 1 >= s.size() || s[label_end + 1] != '(') {
		return false;
	}
	size_t url_start = label_end + 2;
	size_t url_end = s.find(')', url_start);
	if (url_end == string::npos || url_end == url_start) {
		return false;
	}
	end = url_end + 1;
	return true;
}

// [text](url) -> text
static string ReplaceLinks(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		size_t label_end, end;
		if (s[i] == '[' && MatchInlineLink(s, i, false, label_end, end)) {
			result.append(s, i + 1, label_end - i - 1);
			i = end;
			continue;
		}
		result += s[i];
		i++;
	}
	return result;
}

static string RemoveImages(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		size_t label_end, end;
		if (s[i] == '!' && i + 1 < s.size() && s[i + 1] == '[' && MatchInlineLink(s, i + 1, true, label_end, end)) {
			i = end;
			continue;
		}
		result += s[i];
		i++;
	}
	return result;
}

// "#" to "######" followed by whitespace at the start of a line.
static string StripHeadingMarkers(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		if (IsLineStart(s, i) && s[i] == '#') {
			size_t j = i;
			while (j < s.size() && s[j] == '#') {
				j++;
			}
			size_t hashes = j - i;
			if (hashes <= 6 && IsSpaceAt(s, j)) {
				i = SkipSpace(s, j);
				continue;
			}
		}
		result += s[i];
		i++;
	}
	return result;
}

static string StripBulletMarkers(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		if (IsLineStart(s, i) && (s[i] == '-' || s[i] == '*' || s[i] == '+') && IsSpaceAt(s, i + 1)) {
			i = SkipSpace(s, i + 1);
			continue;
		}
		result += s[i];
		i++;
	}
	return result;
}

// "12. " at the start of a line.
static string StripOrderedMarkers(const string &s) {
	string result;
	result.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		if (IsLineStart(s, i) && StringUtil::CharacterIsDigit(s[i])) {
			size_t j = i;
			while (j < s.size() && StringUtil::CharacterIsDigit(s[j])) {
				j++;
			}
			if (j < s.size() && s[j] == '.' && IsSpaceAt(s, j + 1)) {
				i = SkipSpace(s, j + 1);
				continue;
			}
		}
		result += s[i];
		i++;
	}
	return result;
}

string StripMarkdownSyntax(const string &markdown) {
	string text = StripWikiLinks(markdown);
	text = RemoveFenceLines(text);
	text = RemoveChars(std::move(text), "`");
	text = RemoveHtmlTags(text);
	text = ReplaceLinks(text);
	text = RemoveImages(text);
	text = StripHeadingMarkers(text);
	text = StripBulletMarkers(text);
	text = StripOrderedMarkers(text);
	return RemoveChars(std::move(text), "*_~");
}

idx_t CountWords(const string &markdown) {
	string text = StripMarkdownSyntax(markdown);
	idx_t count = 0;
	size_t i = SkipSpace(text, 0);
	while (i < text.size()) {
		count++;
		while (i < text.size() && !IsSpaceAt(text, i)) {
			i++;
		}
		i = SkipSpace(text, i);
	}
	return count;
}

} // namespace bookbinder
