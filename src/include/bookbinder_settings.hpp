#pragma once

#include "bookbinder_common.hpp"

namespace bookbinder {

// Settings of the Obsidian plugin, stored as JSON in the vault.
struct BookbinderSettings {
	string folder_to_examine = "Sample book";
	bool final_mode = false;
};

// <root>/.obsidian/plugins/bookbinder/data.json
string SettingsPath(FileSystem &fs, const string &root);

// Parse the plugin's data.json. Missing keys keep their defaults; malformed input or a value of
// the wrong type throws InvalidInputException.
BookbinderSettings ParseSettings(const string &text);

// Defaults when the settings file does not exist.
BookbinderSettings LoadSettings(FileSystem &fs, const string &root);

// Replace path with contents.
void WriteTextFile(FileSystem &fs, const string &path, const string &contents);

} // namespace bookbinder
