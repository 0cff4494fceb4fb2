#include "dirsync/snapshot/diff.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using dirsync::snapshot::DirectorySnapshot;
using dirsync::snapshot::FileStatus;
using dirsync::snapshot::reconcile;
using dirsync::snapshot::tombstone_count;
using dirsync::test_support::make_record;

namespace {

DirectorySnapshot snapshot_of(std::initializer_list<dirsync::snapshot::FileRecord> records) {
    DirectorySnapshot snapshot;
    for (const auto& record : records) {
        snapshot.put(record);
    }
    return snapshot;
}

std::set<std::string> keys(const DirectorySnapshot& snapshot) {
    std::set<std::string> out;
    for (const auto& [path, _] : snapshot.files) {
        out.insert(path);
    }
    return out;
}

} // namespace

TEST(ReconcileTest, MarksRemovedPathsAndKeepsCurrentMetadata) {
    const auto last = snapshot_of({make_record("a.txt", "aaaa"), make_record("b.txt", "bbbb")});
    const auto modified_b = make_record("b.txt", "b2b2", 7, 1700000500);
    const auto current = snapshot_of({modified_b, make_record("c.txt", "cccc")});

    const auto merged = reconcile(last, current);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged.files.at("a.txt").status, FileStatus::Deleted);
    EXPECT_EQ(merged.files.at("a.txt").hash, "aaaa");
    EXPECT_EQ(merged.files.at("b.txt"), modified_b);
    EXPECT_EQ(merged.files.at("c.txt").status, FileStatus::Present);
    EXPECT_EQ(tombstone_count(merged), 1u);
}

TEST(ReconcileTest, TombstoneOnlyForPathsMissingFromCurrent) {
    const auto last = snapshot_of({make_record("keep.txt"), make_record("docs"), make_record("docs/old.md")});
    const auto current = snapshot_of({make_record("keep.txt"), make_record("docs"), make_record("new.txt")});

    const auto merged = reconcile(last, current);

    for (const auto& [path, record] : merged.files) {
        const bool expected_deleted = last.contains(path) && !current.contains(path);
        EXPECT_EQ(record.is_tombstone(), expected_deleted) << path;
    }
}

TEST(ReconcileTest, PathSetIsUnionOfInputs) {
    const auto last = snapshot_of({make_record("x"), make_record("y"), make_record("z/1")});
    const auto current = snapshot_of({make_record("y"), make_record("z/2")});

    const auto merged = reconcile(last, current);

    std::set<std::string> expected = keys(last);
    const auto current_keys = keys(current);
    expected.insert(current_keys.begin(), current_keys.end());
    EXPECT_EQ(keys(merged), expected);
}

TEST(ReconcileTest, CurrentOverridesLastForSharedPaths) {
    auto stale = make_record("report.pdf", "1111", 10, 100);
    auto fresh = make_record("report.pdf", "2222", 20, 200);

    const auto merged = reconcile(snapshot_of({stale}), snapshot_of({fresh}));

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged.files.at("report.pdf"), fresh);
}

TEST(ReconcileTest, RecreatedPathIsPresentNotTombstoned) {
    auto before = make_record("notes.txt", "aaaa");
    auto recreated = make_record("notes.txt", "bbbb");

    const auto merged = reconcile(snapshot_of({before}), snapshot_of({recreated}));

    EXPECT_EQ(merged.files.at("notes.txt").status, FileStatus::Present);
    EXPECT_EQ(tombstone_count(merged), 0u);
}

TEST(ReconcileTest, EmptyInputs) {
    const auto only_last = reconcile(snapshot_of({make_record("gone")}), DirectorySnapshot{});
    EXPECT_EQ(tombstone_count(only_last), 1u);

    const auto current = snapshot_of({make_record("fresh")});
    EXPECT_EQ(reconcile(DirectorySnapshot{}, current), current);
}
