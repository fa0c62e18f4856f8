#include "bookbinder_cli.hpp"
#include "bookbinder_settings.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/common/string_util.hpp"

namespace bookbinder {

using duckdb::ErrorData;
using duckdb::InvalidInputException;
using duckdb::OutputStream;
using duckdb::Printer;
using duckdb::StringUtil;

static const char *BOOKBINDER_USAGE = "Usage: bookbinder <filename_or_folder> [root_folder] [--final] [--verbose]\n"
                                      "       bookbinder --bind [root_folder] [folder] [--final] [--verbose]\n"
                                      "--bind writes <root>/<folder>.md and never overwrites a source note\n"
                                      "Example: bookbinder 'kanban 1'\n"
                                      "Example: bookbinder 'my_folder'\n"
                                      "Example: bookbinder 'my_folder' . --final";

static const char *HEADINGS_USAGE = "Usage: bookbinder-headings <filename> [root_folder]\n"
                                    "Example: bookbinder-headings 'kanban 1'";

class PrinterBindLogger : public BindLogger {
public:
	void Log(const string &message) override {
		Printer::Print(OutputStream::STREAM_STDERR, "[bookbinder] " + message);
	}
};

static void PrintError(const std::exception &ex) {
	ErrorData error(ex);
	Printer::Print(OutputStream::STREAM_STDERR, "Error: " + error.RawMessage());
}

CliArguments ParseArguments(const vector<string> &args) {
	CliArguments result;
	for (const auto &arg : args) {
		if (arg == "--final") {
			result.final_mode = true;
		} else if (arg == "--verbose") {
			result.verbose = true;
		} else if (arg == "--bind") {
			result.bind = true;
		} else {
			result.positional.push_back(arg);
		}
	}
	return result;
}

string BindIntoVault(FileSystem &fs, const CliArguments &arguments, BindLogger &logger, BindResult &result) {
	string root = arguments.positional.empty() ? "." : arguments.positional[0];
	auto settings = LoadSettings(fs, root);
	string folder = arguments.positional.size() > 1 ? arguments.positional[1] : settings.folder_to_examine;

	BindOptions options;
	options.mode = (arguments.final_mode || settings.final_mode) ? OutputMode::FINAL : OutputMode::NORMAL;
	result = BindBook(fs, root, folder, options, logger);

	string output_path = fs.JoinPath(root, folder + ".md");
	for (const auto &source : result.files) {
		if (source == output_path) {
			throw InvalidInputException("Refusing to bind \"%s\" into itself: pass a folder to --bind", output_path);
		}
	}
	WriteTextFile(fs, output_path, FormatBoundBook(result));
	return output_path;
}

int RunBookbinder(const vector<string> &args) {
	auto arguments = ParseArguments(args);
	if (arguments.positional.empty() && !arguments.bind) {
		Printer::Print(OutputStream::STREAM_STDERR, BOOKBINDER_USAGE);
		return 1;
	}

	auto fs = FileSystem::CreateLocal();
	PrinterBindLogger verbose_logger;
	BindLogger quiet_logger;
	BindLogger &logger = arguments.verbose ? verbose_logger : quiet_logger;

	try {
		BindResult result;
		if (arguments.bind) {
			string path = BindIntoVault(*fs, arguments, logger, result);
			Printer::RawPrint(OutputStream::STREAM_STDOUT,
			                  StringUtil::Format("Bound %s into %s (%d words)\n", FileSystem::ExtractBaseName(path),
			                                     path, result.word_count));
		} else {
			string root = arguments.positional.size() > 1 ? arguments.positional[1] : ".";
			BindOptions options;
			options.mode = arguments.final_mode ? OutputMode::FINAL : OutputMode::NORMAL;
			result = BindBook(*fs, root, arguments.positional[0], options, logger);
			Printer::RawPrint(OutputStream::STREAM_STDOUT, FormatBoundBook(result));
		}
	} catch (std::exception &ex) {
		PrintError(ex);
		return 1;
	}
	Printer::Flush(OutputStream::STREAM_STDOUT);
	return 0;
}

int RunBookbinderHeadings(const vector<string> &args) {
	if (args.empty()) {
		Printer::Print(OutputStream::STREAM_STDERR, HEADINGS_USAGE);
		return 1;
	}
	string root = args.size() > 1 ? args[1] : ".";

	BindOptions options;
	options.batch_folders = false;
	options.count_words = false;
	options.strict_headings = true;

	auto fs = FileSystem::CreateLocal();
	try {
		auto result = BindBook(*fs, root, args[0], options);
		if (result.section_count == 0) {
			Printer::RawPrint(OutputStream::STREAM_STDOUT, "No list items found in the file.\n");
		} else {
			Printer::RawPrint(OutputStream::STREAM_STDOUT, result.output);
		}
	} catch (std::exception &ex) {
		PrintError(ex);
		return 1;
	}
	Printer::Flush(OutputStream::STREAM_STDOUT);
	return 0;
}

} // namespace bookbinder
