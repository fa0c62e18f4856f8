#include "bookbinder_headings.hpp"
#include "bookbinder_files.hpp"
#include "bookbinder_text.hpp"

#include "duckdb/common/string_util.hpp"

namespace bookbinder {

using duckdb::StringUtil;

static bool IsLevelTwoHeading(const string &line, bool strict_headings) {
	if (line.size() < 2 || line[0] != '#' || line[1] != '#') {
		return false;
	}
	if (line.size() == 2) {
		return !strict_headings;
	}
	return line[2] == ' ';
}

vector<HeadingSection> SegmentHeadings(const string &contents, bool strict_headings) {
	vector<HeadingSection> result;
	HeadingSection current;
	bool open = false;

	const size_t len = contents.size();
	size_t line_start = 0;
	while (line_start < len) {
		size_t line_end = contents.find_first_of("\r\n", line_start);
		if (line_end == string::npos) {
			line_end = len;
		}
		string line = contents.substr(line_start, line_end - line_start);
		line_start = line_end + 1;
		TrimWhitespace(line);

		if (IsLevelTwoHeading(line, strict_headings)) {
			if (open) {
				result.push_back(std::move(current));
			}
			current = HeadingSection();
			current.title = line.size() > 2 ? line.substr(3) : string();
			TrimWhitespace(current.title);
			open = true;
		} else if (open && (StringUtil::StartsWith(line, "- ") || StringUtil::StartsWith(line, "* "))) {
			string item = line.substr(2);
			TrimWhitespace(item);
			current.items.push_back(std::move(item));
		}
	}

	if (open) {
		result.push_back(std::move(current));
	}
	return result;
}

vector<HeadingSection> SegmentHeadingsFile(FileSystem &fs, const string &path, bool strict_headings) {
	return SegmentHeadings(ReadFileContents(fs, path), strict_headings);
}

} // namespace bookbinder
