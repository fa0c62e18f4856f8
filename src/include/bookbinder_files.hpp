#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

// True for "<something>.md".
bool IsMarkdownFileName(const string &name);

// Find <name>.md (the suffix is added when missing) under root. root/<name> wins; otherwise the
// tree is searched depth first, each directory's files before its subdirectories, entries in
// byte order. Returns an empty string when no regular file matches.
string LocateMarkdownFile(FileSystem &fs, const string &root, const string &name);

// Markdown files directly inside dir (no recursion), ordered case-insensitively by file name.
vector<string> ListMarkdownFiles(FileSystem &fs, const string &dir);

// Read a whole file. Throws IOException if it cannot be read or is not valid UTF-8.
string ReadFileContents(FileSystem &fs, const string &path);

} // namespace bookbinder
