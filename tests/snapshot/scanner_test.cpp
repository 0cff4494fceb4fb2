#include "dirsync/snapshot/scanner.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using dirsync::snapshot::DirectoryScanner;
using dirsync::snapshot::FileStatus;
using dirsync::test_support::create_temp_dir;
using dirsync::test_support::write_file;

class DirectoryScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("dirsync_scanner_test_");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(DirectoryScannerTest, RecordsFilesAndDirectoriesWithNormalizedPaths) {
    write_file(root_ / "top.txt", "hello");
    write_file(root_ / "docs" / "nested" / "deep.md", "deep content");
    fs::create_directories(root_ / "empty");

    DirectoryScanner scanner(root_);
    auto result = scanner.scan();
    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& files = result.value().files;

    ASSERT_EQ(files.size(), 5u);
    EXPECT_TRUE(files.count("top.txt"));
    EXPECT_TRUE(files.count("docs"));
    EXPECT_TRUE(files.count("docs/nested"));
    EXPECT_TRUE(files.count("docs/nested/deep.md"));
    EXPECT_TRUE(files.count("empty"));

    const auto& top = files.at("top.txt");
    EXPECT_EQ(top.status, FileStatus::Present);
    EXPECT_FALSE(top.is_directory);
    EXPECT_EQ(top.size, 5u);
    EXPECT_EQ(top.hash.size(), 16u);
    EXPECT_GT(top.modified_time, 0);

    const auto& dir = files.at("docs");
    EXPECT_TRUE(dir.is_directory);
    EXPECT_TRUE(dir.hash.empty());
    EXPECT_EQ(dir.size, 0u);
}

TEST_F(DirectoryScannerTest, HashChangesWithContent) {
    write_file(root_ / "note.txt", "first");
    DirectoryScanner scanner(root_);
    auto before = scanner.scan();
    ASSERT_TRUE(before.is_ok());

    write_file(root_ / "note.txt", "second");
    auto after = scanner.scan();
    ASSERT_TRUE(after.is_ok());

    EXPECT_NE(before.value().files.at("note.txt").hash, after.value().files.at("note.txt").hash);
}

TEST_F(DirectoryScannerTest, HashOfEmptyFileIsFnvOffsetBasis) {
    write_file(root_ / "empty.bin", "");
    auto hash = DirectoryScanner::hash_file(root_ / "empty.bin");
    ASSERT_TRUE(hash.is_ok());
    EXPECT_EQ(hash.value(), "cbf29ce484222325");
}

TEST_F(DirectoryScannerTest, SkipsExcludedMetadataDirectory) {
    write_file(root_ / "kept.txt", "x");
    write_file(root_ / ".dirsync" / "snapshot.json", "{}");
    write_file(root_ / ".dirsync" / "staging" / "partial.bin", "y");

    DirectoryScanner scanner(root_, {root_ / ".dirsync"});
    auto result = scanner.scan();
    ASSERT_TRUE(result.is_ok());

    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_TRUE(result.value().contains("kept.txt"));
}

TEST_F(DirectoryScannerTest, MissingRootIsAnError) {
    DirectoryScanner scanner(root_ / "does-not-exist");
    EXPECT_TRUE(scanner.scan().is_error());
}

TEST_F(DirectoryScannerTest, KeepsUtf8NamesAndSkipsInvalidOnes) {
    const std::string utf8_name = "caf\xc3\xa9.txt";
    write_file(root_ / utf8_name, "latte");
    write_file(root_ / std::string("bad\xff name.txt"), "x");

    DirectoryScanner scanner(root_);
    auto result = scanner.scan();
    ASSERT_TRUE(result.is_ok()) << result.error();

    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_TRUE(result.value().contains(utf8_name));
}
