#include "bookbinder_text.hpp"

#include "utf8proc_wrapper.hpp"

namespace bookbinder {

using duckdb::Utf8Proc;

static bool IsWhitespaceCodepoint(int32_t cp) {
	switch (cp) {
	case 0x20:
	case 0x85:
	case 0xA0:
	case 0x1680:
	case 0x2028:
	case 0x2029:
	case 0x202F:
	case 0x205F:
	case 0x3000:
		return true;
	default:
		return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) || (cp >= 0x2000 && cp <= 0x200A);
	}
}

idx_t WhitespaceLength(const string &text, idx_t pos) {
	if (pos >= text.size()) {
		return 0;
	}
	auto lead = static_cast<unsigned char>(text[pos]);
	if (lead < 0x80) {
		return IsWhitespaceCodepoint(lead) ? 1 : 0;
	}
	// non-ASCII whitespace is always two or three bytes long
	if (lead < 0xC2 || lead > 0xEF) {
		return 0;
	}
	idx_t needed = lead < 0xE0 ? 2 : 3;
	if (pos + needed > text.size()) {
		return 0;
	}
	int sz = 0;
	int32_t cp = Utf8Proc::UTF8ToCodepoint(text.c_str() + pos, sz);
	if (sz != static_cast<int>(needed) || !IsWhitespaceCodepoint(cp)) {
		return 0;
	}
	return needed;
}

// Byte length of the whitespace character ending just before end, 0 when there is none.
static idx_t TrailingWhitespaceLength(const string &text, idx_t end) {
	for (idx_t len = 1; len <= 3 && len <= end; len++) {
		if (WhitespaceLength(text, end - len) == len) {
			return len;
		}
	}
	return 0;
}

void TrimWhitespace(string &text) {
	idx_t begin = 0;
	idx_t step;
	while ((step = WhitespaceLength(text, begin)) > 0) {
		begin += step;
	}
	idx_t end = text.size();
	while (end > begin && (step = TrailingWhitespaceLength(text, end)) > 0) {
		end -= step;
	}
	text = text.substr(begin, end - begin);
}

string NormalizeLineEndings(const string &text) {
	string result;
	result.reserve(text.size());
	for (idx_t i = 0; i < text.size(); i++) {
		if (text[i] == '\r') {
			result += '\n';
			if (i + 1 < text.size() && text[i + 1] == '\n') {
				i++;
			}
		} else {
			result += text[i];
		}
	}
	return result;
}

} // namespace bookbinder
