#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

// Byte length of the whitespace character starting at pos, 0 when there is none. Whitespace is
// the Unicode White_Space set plus the ASCII information separators U+001C to U+001F.
idx_t WhitespaceLength(const string &text, idx_t pos);

// Strip leading and trailing whitespace (as above) in place.
void TrimWhitespace(string &text);

// "\r\n" and lone "\r" become "\n".
string NormalizeLineEndings(const string &text);

} // namespace bookbinder
