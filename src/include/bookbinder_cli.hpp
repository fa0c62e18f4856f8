#pragma once

#include "bookbinder_assembler.hpp"

namespace bookbinder {

struct CliArguments {
	vector<string> positional;
	bool final_mode = false;
	bool verbose = false;
	bool bind = false;
};

// Flags are recognised anywhere and removed; every other argument is positional, in order.
CliArguments ParseArguments(const vector<string> &args);

// positional is [root, folder]. Binds folder (default: the plugin's configured folder) under root
// and writes "Word Count: <n>" plus the text to "<root>/<folder>.md". Returns the path written.
// Throws InvalidInputException instead of overwriting one of the notes being bound.
string BindIntoVault(FileSystem &fs, const CliArguments &arguments, BindLogger &logger, BindResult &result);

// Entry points; args exclude the program name. Both return the process exit code.
int RunBookbinder(const vector<string> &args);
int RunBookbinderHeadings(const vector<string> &args);

} // namespace bookbinder
