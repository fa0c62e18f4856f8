#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

enum class OutputMode : uint8_t {
	//! separators and a [[target]] back-reference around each resolved link
	NORMAL,
	//! resolved content only, one newline after each entry
	FINAL
};

struct BindOptions {
	OutputMode mode = OutputMode::NORMAL;
	//! accept a folder as target and bind every markdown file directly inside it
	bool batch_folders = true;
	bool count_words = true;
	//! only "## title" opens a section; a bare "##" does not
	bool strict_headings = false;
};

struct BindResult {
	string output;
	idx_t word_count = 0;
	vector<string> files;
	//! level-2 sections seen across all files, including empty ones
	idx_t section_count = 0;
};

// Receives progress messages while a book is bound. The base class discards them.
class BindLogger {
public:
	virtual ~BindLogger() {
	}
	virtual void Log(const string &message) {
	}
};

// Collects display text and the text that counts towards the word count.
class BindAccumulator {
public:
	explicit BindAccumulator(OutputMode mode);

	void AddResolvedLink(const string &target, const string &content);
	void AddMissingLink(const string &target);
	void AddPlainItem(const string &text);

	const string &Display() const {
		return display;
	}
	const string &Counted() const {
		return counted;
	}

private:
	OutputMode mode;
	string display;
	string counted;
};

// The ordered source files for target. A folder (under root, or target itself as a path) yields
// its markdown files when batch_folders is set; otherwise target is located as a single note.
// Throws IOException when nothing matches or the folder holds no markdown files.
vector<string> ResolveSourceFiles(FileSystem &fs, const string &root, const string &target, bool batch_folders);

// Append one source file's items to accumulator. Returns the number of level-2 sections found.
idx_t BindSourceFile(FileSystem &fs, const string &root, const string &path, const BindOptions &options,
                     BindAccumulator &accumulator, BindLogger &logger);

BindResult BindBook(FileSystem &fs, const string &root, const string &target, const BindOptions &options,
                    BindLogger &logger);
BindResult BindBook(FileSystem &fs, const string &root, const string &target, const BindOptions &options);

// "Word Count: <n>\n" followed by the display text.
string FormatBoundBook(const BindResult &result);

} // namespace bookbinder
