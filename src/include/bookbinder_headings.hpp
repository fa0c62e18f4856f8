#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

struct HeadingSection {
	string title; // may be empty for a bare "##"
	vector<string> items;
};

// Group "- " / "* " list items under their enclosing level-2 heading, in source order.
// Sections are kept even when they hold no items; items before the first heading are dropped.
// strict_headings only accepts "## title", rejecting a bare "##".
vector<HeadingSection> SegmentHeadings(const string &contents, bool strict_headings = false);

vector<HeadingSection> SegmentHeadingsFile(FileSystem &fs, const string &path, bool strict_headings = false);

} // namespace bookbinder
