#include "bookbinder_files.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "utf8proc_wrapper.hpp"

#include <algorithm>
#include <utility>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace bookbinder {

using duckdb::FileFlags;
using duckdb::IOException;
using duckdb::StringUtil;
using duckdb::Utf8Proc;

bool IsMarkdownFileName(const string &name) {
	return name.size() > 3 && name.compare(name.size() - 3, 3, ".md") == 0;
}

static string JoinVaultPath(FileSystem &fs, const string &root, const string &name) {
	if (fs.IsPathAbsolute(name)) {
		return name;
	}
	return fs.JoinPath(root, name);
}

// A name with a directory part ("sub/Page.md") matches any path ending in it.
static bool MatchesName(const string &full_path, const string &entry, const string &name) {
	if (name.find('/') == string::npos) {
		return entry == name;
	}
	return StringUtil::EndsWith(full_path, "/" + name);
}

// ListFiles reports a linked directory as a directory. The search never descends into one, so a
// link back up the tree cannot loop.
static bool IsSymbolicLink(const string &path) {
#ifndef _WIN32
	struct stat info;
	if (lstat(path.c_str(), &info) != 0) {
		return false;
	}
	return S_ISLNK(info.st_mode);
#else
	return false;
#endif
}

static string SearchMarkdownFile(FileSystem &fs, const string &dir, const string &name) {
	vector<std::pair<string, bool>> entries;
	if (!fs.ListFiles(dir, [&](const string &entry, bool is_dir) { entries.emplace_back(entry, is_dir); })) {
		// unreadable directories are skipped
		return string();
	}
	std::sort(entries.begin(), entries.end());

	for (const auto &entry : entries) {
		if (entry.second) {
			continue;
		}
		string full_path = fs.JoinPath(dir, entry.first);
		if (MatchesName(full_path, entry.first, name)) {
			return full_path;
		}
	}
	for (const auto &entry : entries) {
		if (!entry.second) {
			continue;
		}
		string subdir = fs.JoinPath(dir, entry.first);
		if (IsSymbolicLink(subdir)) {
			continue;
		}
		string found = SearchMarkdownFile(fs, subdir, name);
		if (!found.empty()) {
			return found;
		}
	}
	return string();
}

string LocateMarkdownFile(FileSystem &fs, const string &root, const string &name) {
	string filename = name;
	if (!StringUtil::EndsWith(filename, ".md")) {
		filename += ".md";
	}

	string direct = JoinVaultPath(fs, root, filename);
	if (fs.FileExists(direct)) {
		return direct;
	}
	if (fs.IsPathAbsolute(filename) || !fs.DirectoryExists(root)) {
		return string();
	}
	return SearchMarkdownFile(fs, root, filename);
}

vector<string> ListMarkdownFiles(FileSystem &fs, const string &dir) {
	vector<std::pair<string, string>> keyed;
	bool listed = fs.ListFiles(dir, [&](const string &name, bool is_dir) {
		if (!is_dir && IsMarkdownFileName(name)) {
			keyed.emplace_back(StringUtil::Lower(name), name);
		}
	});
	if (!listed) {
		throw IOException("Could not list folder \"%s\"", dir);
	}
	// ties between names differing only in case fall back to byte order
	std::sort(keyed.begin(), keyed.end());

	vector<string> files;
	files.reserve(keyed.size());
	for (const auto &entry : keyed) {
		files.push_back(fs.JoinPath(dir, entry.second));
	}
	return files;
}

string ReadFileContents(FileSystem &fs, const string &path) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	auto file_size = fs.GetFileSize(*handle);
	string contents(static_cast<size_t>(file_size), '\0');
	if (file_size > 0) {
		fs.Read(*handle, &contents[0], file_size, 0);
	}
	if (!Utf8Proc::IsValid(contents.c_str(), contents.size())) {
		throw IOException("File \"%s\" is not valid UTF-8", path);
	}
	return contents;
}

} // namespace bookbinder
