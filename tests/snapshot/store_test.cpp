#include "dirsync/snapshot/store.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using dirsync::snapshot::FileSnapshotStore;
using dirsync::test_support::create_temp_dir;
using dirsync::test_support::write_file;

class FileSnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("dirsync_store_test_");
        snapshot_path_ = root_ / ".dirsync" / "snapshot.json";
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
    fs::path snapshot_path_;
};

TEST_F(FileSnapshotStoreTest, FirstRunHasNoLastSnapshot) {
    FileSnapshotStore store(root_, snapshot_path_);
    auto last = store.load_last();
    ASSERT_TRUE(last.is_ok()) << last.error();
    EXPECT_FALSE(last.value().has_value());
}

TEST_F(FileSnapshotStoreTest, CommitPersistsLiveDirectoryAsBaseline) {
    write_file(root_ / "a.txt", "alpha");
    write_file(root_ / "sub" / "b.txt", "beta");

    FileSnapshotStore store(root_, snapshot_path_);
    auto committed = store.commit();
    ASSERT_TRUE(committed.is_ok()) << committed.error();
    EXPECT_TRUE(fs::exists(snapshot_path_));
    EXPECT_FALSE(fs::exists(fs::path(snapshot_path_).concat(".tmp")));

    auto last = store.load_last();
    ASSERT_TRUE(last.is_ok()) << last.error();
    ASSERT_TRUE(last.value().has_value());
    EXPECT_EQ(*last.value(), committed.value());
    EXPECT_TRUE(last.value()->contains("sub/b.txt"));
    EXPECT_FALSE(last.value()->contains(".dirsync"));
    EXPECT_FALSE(last.value()->contains(".dirsync/snapshot.json"));
}

TEST_F(FileSnapshotStoreTest, SnapshotFileOutsideRootIsHonoured) {
    const auto elsewhere = create_temp_dir("dirsync_store_external_");
    write_file(root_ / "a.txt", "alpha");

    FileSnapshotStore store(root_, elsewhere / "baseline.json");
    ASSERT_TRUE(store.commit().is_ok());
    EXPECT_TRUE(fs::exists(elsewhere / "baseline.json"));

    fs::remove_all(elsewhere);
}

TEST_F(FileSnapshotStoreTest, CorruptBaselineIsReportedAsError) {
    write_file(snapshot_path_, "{not json");
    FileSnapshotStore store(root_, snapshot_path_);
    EXPECT_TRUE(store.load_last().is_error());
}

TEST_F(FileSnapshotStoreTest, CaptureDoesNotTouchBaseline) {
    write_file(root_ / "a.txt", "alpha");
    FileSnapshotStore store(root_, snapshot_path_);

    auto current = store.capture_current();
    ASSERT_TRUE(current.is_ok());
    EXPECT_TRUE(current.value().contains("a.txt"));
    EXPECT_FALSE(fs::exists(snapshot_path_));
}

TEST_F(FileSnapshotStoreTest, SaveReportsUnencodablePathAsError) {
    FileSnapshotStore store(root_, snapshot_path_);
    dirsync::snapshot::DirectorySnapshot snapshot;
    snapshot.put(dirsync::test_support::make_record("bad\xff name.txt"));

    dirsync::Result<void> saved;
    EXPECT_NO_THROW(saved = store.save(snapshot));
    EXPECT_TRUE(saved.is_error());
    EXPECT_FALSE(fs::exists(snapshot_path_));
}

TEST_F(FileSnapshotStoreTest, CommitSkipsNamesThatAreNotUtf8) {
    write_file(root_ / "good.txt", "ok");
    write_file(root_ / std::string("bad\xff name.txt"), "x");
    write_file(root_ / std::string("bad\xfe dir") / "inner.txt", "y");

    FileSnapshotStore store(root_, snapshot_path_);
    auto committed = store.commit();
    ASSERT_TRUE(committed.is_ok()) << committed.error();
    EXPECT_EQ(committed.value().size(), 1u);
    EXPECT_TRUE(committed.value().contains("good.txt"));

    auto last = store.load_last();
    ASSERT_TRUE(last.is_ok()) << last.error();
    ASSERT_TRUE(last.value().has_value());
    EXPECT_EQ(*last.value(), committed.value());
}
