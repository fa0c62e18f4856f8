#include "bookbinder_resolver.hpp"
#include "bookbinder_files.hpp"
#include "bookbinder_text.hpp"
#include "bookbinder_wikilinks.hpp"

#include "duckdb/common/error_data.hpp"

namespace bookbinder {

using duckdb::ErrorData;

string ReadLinkedContent(FileSystem &fs, const string &path) {
	string contents;
	try {
		contents = ReadFileContents(fs, path);
	} catch (std::exception &ex) {
		ErrorData error(ex);
		return "[Error reading file: " + error.RawMessage() + "]";
	}
	contents = NormalizeLineEndings(contents);
	TrimWhitespace(contents);
	return contents;
}

ResolvedItem ResolveItem(FileSystem &fs, const string &root, const string &item) {
	auto classified = ClassifyItem(item);

	ResolvedItem result;
	if (!classified.is_wikilink) {
		result.text = std::move(classified.text);
		return result;
	}

	result.target = std::move(classified.target);
	result.path = LocateMarkdownFile(fs, root, result.target);
	if (result.path.empty()) {
		result.kind = ItemKind::MISSING_LINK;
		return result;
	}
	result.kind = ItemKind::RESOLVED_LINK;
	result.text = ReadLinkedContent(fs, result.path);
	return result;
}

} // namespace bookbinder
