#include "bookbinder_assembler.hpp"
#include "bookbinder_files.hpp"
#include "bookbinder_headings.hpp"
#include "bookbinder_resolver.hpp"
#include "bookbinder_word_count.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace bookbinder {

using duckdb::IOException;
using duckdb::StringUtil;

BindAccumulator::BindAccumulator(OutputMode mode_p) : mode(mode_p) {
}

void BindAccumulator::AddResolvedLink(const string &target, const string &content) {
	if (mode == OutputMode::FINAL) {
		display += content + "\n";
	} else {
		display += "---\n\n";
		display += "[[" + target + "]]\n\n";
		display += content + "\n\n";
	}
	counted += content + "\n";
}

void BindAccumulator::AddMissingLink(const string &target) {
	display += "[Link not found: " + target + "]\n";
}

void BindAccumulator::AddPlainItem(const string &text) {
	display += text + "\n";
	if (mode != OutputMode::FINAL) {
		display += "\n";
	}
}

static vector<string> BatchFolder(FileSystem &fs, const string &folder, const string &target) {
	auto files = ListMarkdownFiles(fs, folder);
	if (files.empty()) {
		throw IOException("No markdown files found in folder '%s'", target);
	}
	return files;
}

vector<string> ResolveSourceFiles(FileSystem &fs, const string &root, const string &target, bool batch_folders) {
	if (batch_folders) {
		string folder = fs.IsPathAbsolute(target) ? target : fs.JoinPath(root, target);
		if (fs.DirectoryExists(folder)) {
			return BatchFolder(fs, folder, target);
		}
	}

	string path = LocateMarkdownFile(fs, root, target);
	if (!path.empty()) {
		return vector<string> {path};
	}

	if (batch_folders) {
		if (fs.DirectoryExists(target)) {
			return BatchFolder(fs, target, target);
		}
		throw IOException("File or folder '%s' not found", target);
	}
	string filename = StringUtil::EndsWith(target, ".md") ? target : target + ".md";
	throw IOException("File '%s' not found in '%s'", filename, root);
}

idx_t BindSourceFile(FileSystem &fs, const string &root, const string &path, const BindOptions &options,
                     BindAccumulator &accumulator, BindLogger &logger) {
	auto sections = SegmentHeadingsFile(fs, path, options.strict_headings);
	logger.Log(StringUtil::Format("%s: %d level-2 sections", path, sections.size()));

	for (const auto &section : sections) {
		for (const auto &item : section.items) {
			auto resolved = ResolveItem(fs, root, item);
			switch (resolved.kind) {
			case ItemKind::RESOLVED_LINK:
				logger.Log("resolved [[" + resolved.target + "]] -> " + resolved.path);
				accumulator.AddResolvedLink(resolved.target, resolved.text);
				break;
			case ItemKind::MISSING_LINK:
				logger.Log("link not found: [[" + resolved.target + "]]");
				accumulator.AddMissingLink(resolved.target);
				break;
			default:
				accumulator.AddPlainItem(resolved.text);
				break;
			}
		}
	}
	return sections.size();
}

BindResult BindBook(FileSystem &fs, const string &root, const string &target, const BindOptions &options,
                    BindLogger &logger) {
	BindResult result;
	result.files = ResolveSourceFiles(fs, root, target, options.batch_folders);

	BindAccumulator accumulator(options.mode);
	for (const auto &path : result.files) {
		result.section_count += BindSourceFile(fs, root, path, options, accumulator, logger);
	}

	result.output = accumulator.Display();
	if (options.count_words) {
		result.word_count = CountWords(accumulator.Counted());
		logger.Log(StringUtil::Format("%d files bound, %d words", result.files.size(), result.word_count));
	}
	return result;
}

BindResult BindBook(FileSystem &fs, const string &root, const string &target, const BindOptions &options) {
	BindLogger logger;
	return BindBook(fs, root, target, options, logger);
}

string FormatBoundBook(const BindResult &result) {
	return "Word Count: " + std::to_string(result.word_count) + "\n" + result.output;
}

} // namespace bookbinder
