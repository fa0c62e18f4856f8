#include "bookbinder_settings.hpp"
#include "bookbinder_files.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <ryml/ryml.hpp>
#include <ryml/ryml_std.hpp>
#include <stdexcept>

namespace bookbinder {

using duckdb::FileFlags;
using duckdb::InvalidInputException;
using duckdb::StringUtil;

// ryml calls this instead of abort() when it encounters a parse error.
static void RymlErrorCallback(const char *msg, size_t msg_len, ryml::Location /*loc*/, void * /*userdata*/) {
	throw std::runtime_error(std::string(msg, msg_len));
}

string SettingsPath(FileSystem &fs, const string &root) {
	return fs.JoinPath(fs.JoinPath(fs.JoinPath(fs.JoinPath(root, ".obsidian"), "plugins"), "bookbinder"), "data.json");
}

static string ScalarValue(ryml::ConstNodeRef node, const char *key) {
	if (!node.has_val()) {
		throw InvalidInputException("bookbinder setting \"%s\" must be a scalar", key);
	}
	ryml::csubstr val = node.val();
	return string(val.str, val.len);
}

BookbinderSettings ParseSettings(const string &text) {
	BookbinderSettings settings;

	// the tree points into this buffer, it must outlive every node access below
	string buffer = text;
	StringUtil::Trim(buffer);
	if (buffer.empty()) {
		return settings;
	}

	ryml::Callbacks callbacks = ryml::get_callbacks();
	callbacks.m_error = RymlErrorCallback;
	ryml::Tree tree(callbacks);
	try {
		ryml::EventHandlerTree evth(callbacks);
		ryml::Parser parser(&evth);
		ryml::parse_in_place(&parser, ryml::to_substr(buffer), &tree);
	} catch (std::exception &ex) {
		throw InvalidInputException("Could not parse bookbinder settings: %s", ex.what());
	}

	ryml::ConstNodeRef root = tree.rootref();
	if (!root.is_map()) {
		throw InvalidInputException("bookbinder settings must be a JSON object");
	}

	if (root.has_child("folderToExamine")) {
		string folder = ScalarValue(root["folderToExamine"], "folderToExamine");
		// the plugin falls back to its default for an empty folder
		if (!folder.empty()) {
			settings.folder_to_examine = folder;
		}
	}
	if (root.has_child("finalMode")) {
		string final_mode = ScalarValue(root["finalMode"], "finalMode");
		if (final_mode == "true") {
			settings.final_mode = true;
		} else if (final_mode == "false") {
			settings.final_mode = false;
		} else {
			throw InvalidInputException("bookbinder setting \"finalMode\" must be true or false, got \"%s\"",
			                            final_mode);
		}
	}
	return settings;
}

BookbinderSettings LoadSettings(FileSystem &fs, const string &root) {
	string path = SettingsPath(fs, root);
	if (!fs.FileExists(path)) {
		return BookbinderSettings();
	}
	return ParseSettings(ReadFileContents(fs, path));
}

void WriteTextFile(FileSystem &fs, const string &path, const string &contents) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
	fs.Write(*handle, const_cast<char *>(contents.data()), static_cast<int64_t>(contents.size()), 0);
	handle->Sync();
	handle->Close();
}

} // namespace bookbinder
