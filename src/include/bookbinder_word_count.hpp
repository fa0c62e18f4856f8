#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

// Remove markdown syntax ahead of counting. Stages run in a fixed order, each on the output of
// the previous one: wikilinks, code fence lines, backticks, HTML tags, links (keeping their text),
// images, heading markers, list markers, then emphasis characters.
string StripMarkdownSyntax(const string &markdown);

// Number of whitespace-separated words left after StripMarkdownSyntax.
idx_t CountWords(const string &markdown);

} // namespace bookbinder
