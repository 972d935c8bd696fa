#include "protocols/local_file_system.hpp"

#include "core/errors.hpp"
#include "fakes.hpp"

#include <algorithm>

#include <gtest/gtest.h>

TEST(LocalFileSystemTest, StatReportsSizeAndKind) {
    TempDir dir;
    writeFile(dir / "a.txt", "hello");
    LocalFileSystem fs;

    auto file = fs.stat(dir / "a.txt");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->name, "a.txt");
    EXPECT_EQ(file->size, 5u);
    EXPECT_FALSE(file->isDirectory);

    auto directory = fs.stat(dir.str());
    ASSERT_TRUE(directory.has_value());
    EXPECT_TRUE(directory->isDirectory);

    EXPECT_FALSE(fs.stat(dir / "missing").has_value());
}

TEST(LocalFileSystemTest, ListsRegularFilesOnly) {
    TempDir dir;
    writeFile(dir / "one.gcode", "1");
    writeFile(dir / "two.gcode", "22");
    writeFile(dir / "nested/three.gcode", "333");
    LocalFileSystem fs;

    auto entries = fs.listDirectory(dir.str());
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());

    EXPECT_EQ(names, (std::vector<std::string>{"one.gcode", "two.gcode"}));
}

TEST(LocalFileSystemTest, ListingMissingDirectoryThrows) {
    TempDir dir;
    LocalFileSystem fs;

    EXPECT_THROW(fs.listDirectory(dir / "absent"), FileNotFoundError);
}

TEST(LocalFileSystemTest, WriteRenameRemove) {
    TempDir dir;
    LocalFileSystem fs;

    auto writer = fs.openWrite(dir / "tmp");
    writer->write("abc", 3);
    writer->sync();
    writer->close();

    fs.rename(dir / "tmp", dir / "final");
    EXPECT_EQ(readFile(dir / "final"), "abc");
    EXPECT_TRUE(fs.remove(dir / "final"));
    EXPECT_FALSE(fs.remove(dir / "final"));
}

TEST(LocalFileSystemTest, AvailableSpaceUsesExistingAncestor) {
    TempDir dir;
    LocalFileSystem fs;

    auto space = fs.availableSpace(dir / "not/yet/created");
    ASSERT_TRUE(space.has_value());
    EXPECT_GT(*space, 0u);
}

TEST(LocalFileSystemTest, CopyMetadataAppliesModeAndTime) {
    TempDir dir;
    writeFile(dir / "f", "x");
    LocalFileSystem fs;

    FileInfo from;
    from.permissions = 0600;
    from.modifiedTime = 1700000000;
    EXPECT_TRUE(fs.copyMetadata(dir / "f", from));

    auto info = fs.stat(dir / "f");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->permissions, 0600u);
    EXPECT_EQ(info->modifiedTime, 1700000000);
}

TEST(RemotePathTest, SplitsAndJoins) {
    EXPECT_EQ(remote_path::parent("/a/b/c.db"), "/a/b");
    EXPECT_EQ(remote_path::parent("/c.db"), "/");
    EXPECT_EQ(remote_path::parent("c.db"), "");
    EXPECT_EQ(remote_path::fileName("/a/b/c.db"), "c.db");
    EXPECT_EQ(remote_path::join("/a/", "b"), "/a/b");
    EXPECT_EQ(remote_path::join("/a", "b"), "/a/b");
    EXPECT_EQ(remote_path::join("", "b"), "b");
}
