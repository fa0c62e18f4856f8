#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

enum class ItemKind : uint8_t { PLAIN, RESOLVED_LINK, MISSING_LINK };

struct ResolvedItem {
	ItemKind kind = ItemKind::PLAIN;
	// PLAIN: the checkbox-stripped item; RESOLVED_LINK: the target's content (or a read error
	// placeholder); MISSING_LINK: empty
	string text;
	string target; // empty for PLAIN
	string path;   // located file, RESOLVED_LINK only
};

// Trimmed contents of a linked file. A file that cannot be read yields
// "[Error reading file: <reason>]" instead of throwing.
string ReadLinkedContent(FileSystem &fs, const string &path);

// Classify a list item and, when it is a wikilink, look its target up under root and read it.
// Links are followed one level only: the target's own wikilinks are left as text.
ResolvedItem ResolveItem(FileSystem &fs, const string &root, const string &item);

} // namespace bookbinder
