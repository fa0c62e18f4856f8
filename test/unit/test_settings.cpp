#include "vault_fixture.hpp"

#include "bookbinder_settings.hpp"

#include "duckdb/common/exception.hpp"

using namespace bookbinder;

TEST(SettingsTest, ParsesPluginData) {
	auto settings = ParseSettings("{\"folderToExamine\": \"Draft\", \"finalMode\": true}");
	EXPECT_EQ(settings.folder_to_examine, "Draft");
	EXPECT_TRUE(settings.final_mode);
}

TEST(SettingsTest, MissingKeysKeepDefaults) {
	auto settings = ParseSettings("{}");
	EXPECT_EQ(settings.folder_to_examine, "Sample book");
	EXPECT_FALSE(settings.final_mode);

	auto blank = ParseSettings("  \n");
	EXPECT_EQ(blank.folder_to_examine, "Sample book");

	auto partial = ParseSettings("{\"finalMode\": false, \"unrelated\": [1, 2]}");
	EXPECT_EQ(partial.folder_to_examine, "Sample book");
	EXPECT_FALSE(partial.final_mode);
}

TEST(SettingsTest, EmptyFolderFallsBackToDefault) {
	auto settings = ParseSettings("{\"folderToExamine\": \"\"}");
	EXPECT_EQ(settings.folder_to_examine, "Sample book");
}

TEST(SettingsTest, RejectsBadValues) {
	EXPECT_THROW(ParseSettings("[1, 2]"), duckdb::InvalidInputException);
	EXPECT_THROW(ParseSettings("{\"finalMode\": \"yes\"}"), duckdb::InvalidInputException);
	EXPECT_THROW(ParseSettings("{\"folderToExamine\": {\"nested\": 1}}"), duckdb::InvalidInputException);
}

class SettingsFileTest : public VaultTest {};

TEST_F(SettingsFileTest, MissingFileMeansDefaults) {
	auto settings = LoadSettings(*fs, root);
	EXPECT_EQ(settings.folder_to_examine, "Sample book");
	EXPECT_FALSE(settings.final_mode);
}

TEST_F(SettingsFileTest, LoadsFromPluginFolder) {
	WriteNote(".obsidian/plugins/bookbinder/data.json", "{\n  \"folderToExamine\": \"My Novel\",\n  \"finalMode\": false\n}");
	EXPECT_EQ(SettingsPath(*fs, root), fs->JoinPath(root, ".obsidian/plugins/bookbinder/data.json"));
	auto settings = LoadSettings(*fs, root);
	EXPECT_EQ(settings.folder_to_examine, "My Novel");
	EXPECT_FALSE(settings.final_mode);
}

TEST_F(SettingsFileTest, WriteTextFileReplacesContents) {
	string path = WriteNote("Out.md", "a much longer first version");
	WriteTextFile(*fs, path, "short");
	auto handle = fs->OpenFile(path, duckdb::FileFlags::FILE_FLAGS_READ);
	EXPECT_EQ(fs->GetFileSize(*handle), 5);
}
