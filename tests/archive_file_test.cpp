#include <gtest/gtest.h>

#include "icepack/archive_file.hpp"
#include "icepack/errors.hpp"
#include "icepack/tree_hash.hpp"
#include "test_support.hpp"

#include <cerrno>

using namespace icepack;

TEST(ArchiveFileTest, OpenMissingFileReportsPath) {
    test::TempDir dir;
    std::string path = dir.file("nonexistent");
    try {
        ArchiveFile::open_for_reading(path);
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(std::string(e.what()), "open " + path + ": No such file or directory");
        EXPECT_EQ(e.code().value(), ENOENT);
    }
}

TEST(ArchiveFileTest, OpenDirectoryIsUnsupported) {
    test::TempDir dir;
    try {
        ArchiveFile::open_for_reading(dir.path().string());
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(std::string(e.what()), "directories are not supported: " + dir.path().string());
        EXPECT_EQ(e.code(), errc::unsupported_file);
    }
}

TEST(ArchiveFileTest, ReadsRanges) {
    test::TempDir dir;
    test::write_file(dir.file("a"), "0123456789");

    ArchiveFile file = ArchiveFile::open_for_reading(dir.file("a"));
    EXPECT_EQ(file.size(), 10);
    EXPECT_EQ(file.read(ByteRange(2, 3)), "234");
    // Short at end of file
    EXPECT_EQ(file.read(ByteRange(8, 5)), "89");
}

TEST(ArchiveFileTest, CreateExclusiveRefusesExistingPath) {
    test::TempDir dir;
    test::write_file(dir.file("taken"), "x");
    try {
        ArchiveFile::create_exclusive(dir.file("taken"));
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code().value(), EEXIST);
    }
    EXPECT_EQ(test::read_file(dir.file("taken")), "x");
}

TEST(ArchiveFileTest, PositionedWritesIntoResizedFile) {
    test::TempDir dir;
    {
        ArchiveFile file = ArchiveFile::create_exclusive(dir.file("out"));
        file.resize(8);
        EXPECT_EQ(file.write_at("EFGH", 4), 4u);
        EXPECT_EQ(file.write_at("ABCD", 0), 4u);
        EXPECT_EQ(file.size(), 8);
    }
    EXPECT_EQ(test::read_file(dir.file("out")), "ABCDEFGH");
}

TEST(ArchiveFileTest, TreeHashOfRegionMatchesBuffer) {
    test::TempDir dir;
    std::string data = test::random_bytes(3 * TREE_HASH_CHUNK_SIZE + 17);
    test::write_file(dir.file("big"), data);

    ArchiveFile file = ArchiveFile::open_for_reading(dir.file("big"));
    EXPECT_EQ(file.tree_hash(), compute_tree_hash(data));

    int64_t offset = TREE_HASH_CHUNK_SIZE + 5;
    int64_t length = TREE_HASH_CHUNK_SIZE * 2;
    EXPECT_EQ(file.tree_hash(offset, length),
              compute_tree_hash(data.substr(static_cast<size_t>(offset),
                                            static_cast<size_t>(length))));
}

TEST(ArchiveFileTest, TreeHashPastEndOfFileIsEmpty) {
    test::TempDir dir;
    test::write_file(dir.file("a"), "test");

    ArchiveFile file = ArchiveFile::open_for_reading(dir.file("a"));
    EXPECT_FALSE(file.tree_hash(4, 10).has_value());
    EXPECT_EQ(file.tree_hash(0, 100), compute_tree_hash("test"));
}
