#include "bookbinder_wikilinks.hpp"
#include "bookbinder_text.hpp"

#include "duckdb/common/string_util.hpp"

namespace bookbinder {

using duckdb::StringUtil;

// Match a wikilink starting at s[i]. On success sets end to one past the closing "]]".
// The target runs up to the first ']' or '|' and must be non-empty; a display part runs up to
// the first ']' and must be non-empty too. Hand-rolled instead of std::regex so the scan is a
// single forward pass with no backtracking state.
static bool MatchWikiLinkAt(const char *s, size_t len, size_t i, size_t &end, WikiLink *link) {
	if (i + 1 >= len || s[i] != '[' || s[i + 1] != '[') {
		return false;
	}
	size_t target_start = i + 2;
	size_t j = target_start;
	while (j < len && s[j] != ']' && s[j] != '|') {
		j++;
	}
	if (j == target_start) {
		return false;
	}
	size_t target_end = j;
	size_t display_start = 0;
	size_t display_end = 0;

	if (j < len && s[j] == '|') {
		display_start = j + 1;
		j = display_start;
		while (j < len && s[j] != ']') {
			j++;
		}
		if (j == display_start) {
			return false;
		}
		display_end = j;
	}

	if (j + 1 >= len || s[j] != ']' || s[j + 1] != ']') {
		return false;
	}
	end = j + 2;
	if (link) {
		link->target.assign(s + target_start, target_end - target_start);
		link->display_name.assign(s + display_start, display_end - display_start);
	}
	return true;
}

bool ParseWikiLink(const string &text, WikiLink &link) {
	string trimmed = text;
	TrimWhitespace(trimmed);

	size_t end = 0;
	if (!MatchWikiLinkAt(trimmed.c_str(), trimmed.size(), 0, end, &link)) {
		return false;
	}
	return end == trimmed.size();
}

string StripWikiLinks(const string &text) {
	const char *s = text.c_str();
	const size_t len = text.size();
	string result;
	result.reserve(len);

	size_t i = 0;
	while (i < len) {
		size_t end = 0;
		if (s[i] == '[' && MatchWikiLinkAt(s, len, i, end, nullptr)) {
			i = end;
			continue;
		}
		result += s[i];
		i++;
	}
	return result;
}

string StripCheckbox(const string &item) {
	if (StringUtil::StartsWith(item, "[ ] ") || StringUtil::StartsWith(item, "[x] ") ||
	    StringUtil::StartsWith(item, "[X] ")) {
		return item.substr(4);
	}
	return item;
}

ClassifiedItem ClassifyItem(const string &item) {
	ClassifiedItem result;
	result.text = StripCheckbox(item);

	WikiLink link;
	if (ParseWikiLink(result.text, link)) {
		result.is_wikilink = true;
		result.target = std::move(link.target);
	}
	return result;
}

} // namespace bookbinder
