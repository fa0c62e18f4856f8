#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

struct WikiLink {
	string target;
	string display_name; // empty = absent
};

// A list item after checkbox removal, classified as plain text or a wikilink.
struct ClassifiedItem {
	string text;   // checkbox-stripped item text, verbatim
	bool is_wikilink = false;
	string target; // empty unless is_wikilink
};

// Parse text that is exactly one wikilink, [[target]] or [[target|display]], once surrounding
// whitespace is trimmed. Returns false for anything else, including text that merely contains one.
bool ParseWikiLink(const string &text, WikiLink &link);

// Remove every [[target]] / [[target|display]] span from text.
string StripWikiLinks(const string &text);

// Drop a leading "[ ] ", "[x] " or "[X] " task marker.
string StripCheckbox(const string &item);

ClassifiedItem ClassifyItem(const string &item);

} // namespace bookbinder
