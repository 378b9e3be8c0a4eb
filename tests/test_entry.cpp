#include <gtest/gtest.h>
#include "dutree_core.h"

#include <type_traits>

TEST(EntryTest, FileEntryKeepsPathAndSize) {
    Entry file = FileEntry("a/f1", 100);
    EXPECT_EQ(file.kind(), EntryKind::File);
    EXPECT_EQ(file.path(), fs::path("a/f1"));
    EXPECT_EQ(file.size(), 100u);
    EXPECT_EQ(file.as_directory(), nullptr);
}

TEST(EntryTest, DirectorySizeIsSumOfChildren) {
    Entry dir = DirectoryEntry("A", {
        FileEntry("A/f1", 100),
        FileEntry("A/f2", 50),
        DirectoryEntry("A/B", {FileEntry("A/B/f3", 10)}),
    });

    ASSERT_NE(dir.as_directory(), nullptr);
    EXPECT_EQ(dir.kind(), EntryKind::Directory);
    EXPECT_EQ(dir.size(), 160u);
    EXPECT_EQ(dir.as_directory()->children().size(), 3u);
}

TEST(EntryTest, EmptyDirectoryHasZeroSize) {
    Entry dir = DirectoryEntry("empty", {});
    EXPECT_EQ(dir.size(), 0u);
    EXPECT_TRUE(dir.as_directory()->children().empty());
}

TEST(EntryTest, VisitDispatchesOnKind) {
    Entry file = FileEntry("f", 1);
    Entry dir = DirectoryEntry("d", {});

    auto children_of = [](const auto& node) -> size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(node)>, DirectoryEntry>) {
            return node.children().size() + 1;
        } else {
            return 0;
        }
    };

    EXPECT_EQ(file.visit(children_of), 0u);
    EXPECT_EQ(dir.visit(children_of), 1u);
}

TEST(SorterTest, DirectoriesBeforeFilesThenSizeDescending) {
    Entry dir = DirectoryEntry("A", {
        FileEntry("A/f2", 50),
        FileEntry("A/f1", 100),
        DirectoryEntry("A/B", {FileEntry("A/B/f3", 10)}),
    });

    const auto& children = dir.as_directory()->children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[0].path(), fs::path("A/B"));
    EXPECT_EQ(children[1].path(), fs::path("A/f1"));
    EXPECT_EQ(children[2].path(), fs::path("A/f2"));
}

TEST(SorterTest, SmallDirectoryStillPrecedesLargeFile) {
    Entry dir = DirectoryEntry("root", {
        FileEntry("root/big", 1 << 20),
        DirectoryEntry("root/empty", {}),
    });

    const auto& children = dir.as_directory()->children();
    EXPECT_EQ(children[0].kind(), EntryKind::Directory);
    EXPECT_EQ(children[1].kind(), EntryKind::File);
}

TEST(SorterTest, EqualSizesAreOrderedByPath) {
    std::vector<Entry> entries;
    entries.emplace_back(FileEntry("d/c", 7));
    entries.emplace_back(FileEntry("d/a", 7));
    entries.emplace_back(FileEntry("d/b", 7));

    sort_entries(entries);

    EXPECT_EQ(entries[0].path(), fs::path("d/a"));
    EXPECT_EQ(entries[1].path(), fs::path("d/b"));
    EXPECT_EQ(entries[2].path(), fs::path("d/c"));
}

TEST(SorterTest, OrderIsStrict) {
    Entry a = FileEntry("x", 5);
    Entry b = DirectoryEntry("y", {});

    EXPECT_FALSE(entry_order(a, a));
    EXPECT_TRUE(entry_order(b, a));
    EXPECT_FALSE(entry_order(a, b));
}
