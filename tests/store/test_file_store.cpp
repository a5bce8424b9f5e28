// DIRGATE - File Store Tests
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include <gtest/gtest.h>

#include "dirgate/security/path_guard.h"
#include "dirgate/store/file_store.h"
#include "dirgate/util/fs.h"

#include <cerrno>
#include <memory>
#include <string>
#include <vector>

namespace dirgate {
namespace store {
namespace {

namespace fs = util::fs;

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp_.IsValid());
        root_ = tmp_.GetPath();

        security::PathGuard::Config config;
        config.root = root_.String();
        guard_.reset(new security::PathGuard(config));
    }

    security::ResolvedPath Resolve(const std::string& relative) const {
        return guard_->Validate(relative).Value();
    }

    std::string ReadText(const std::string& relative) const {
        std::vector<uint8_t> data;
        EXPECT_TRUE(fs::ReadFileBytes(root_ / relative, data)) << relative;
        return std::string(data.begin(), data.end());
    }

    fs::TempDirectory tmp_{"dirgate_store_test"};
    fs::Path root_;
    std::unique_ptr<security::PathGuard> guard_;
    FileStore store_;
};

// ============================================================================
// Listing
// ============================================================================

TEST_F(FileStoreTest, ListSortsDirectoriesFirstThenByName) {
    ASSERT_TRUE(fs::WriteFile(root_ / "beta.txt", "12345"));
    ASSERT_TRUE(fs::WriteFile(root_ / "Alpha.txt", "1"));
    ASSERT_TRUE(fs::CreateDirectories(root_ / "zeta"));
    ASSERT_TRUE(fs::CreateDirectories(root_ / "Docs"));

    std::vector<FileEntry> entries = store_.List(guard_->Root());
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].name, "Docs");
    EXPECT_TRUE(entries[0].isDirectory);
    EXPECT_EQ(entries[0].sizeBytes, 0u);
    EXPECT_EQ(entries[1].name, "zeta");
    EXPECT_EQ(entries[2].name, "Alpha.txt");
    EXPECT_EQ(entries[3].name, "beta.txt");
    EXPECT_EQ(entries[3].sizeBytes, 5u);
    EXPECT_EQ(entries[3].absolutePath, (root_ / "beta.txt").String());
}

TEST_F(FileStoreTest, ListEmptyDirectory) {
    EXPECT_TRUE(store_.List(guard_->Root()).empty());
}

TEST_F(FileStoreTest, ListMissingDirectory) {
    try {
        store_.List(Resolve("missing"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
    }
}

TEST_F(FileStoreTest, ListFileIsNotFound) {
    ASSERT_TRUE(fs::WriteFile(root_ / "plain.txt", "x"));
    try {
        store_.List(Resolve("plain.txt"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
    }
}

// ============================================================================
// Reading and Writing
// ============================================================================

TEST_F(FileStoreTest, WriteThenRead) {
    fs::Path written = store_.Write(guard_->Root(), "hello.txt", Bytes("hello world"));
    EXPECT_EQ(written, root_ / "hello.txt");

    EXPECT_EQ(store_.Read(Resolve("hello.txt")), Bytes("hello world"));
}

TEST_F(FileStoreTest, WriteReplacesExistingFile) {
    store_.Write(guard_->Root(), "a.txt", Bytes("first version"));
    store_.Write(guard_->Root(), "a.txt", Bytes("second"));
    EXPECT_EQ(ReadText("a.txt"), "second");
}

TEST_F(FileStoreTest, WriteRejectsBadNames) {
    for (const char* name : {"", ".", "..", "a/b.txt"}) {
        try {
            store_.Write(guard_->Root(), name, Bytes("x"));
            FAIL() << "expected StoreError for '" << name << "'";
        } catch (const StoreError& e) {
            EXPECT_EQ(e.Kind(), ErrorKind::InvalidInput);
        }
    }
}

TEST_F(FileStoreTest, WriteIntoMissingDirectory) {
    try {
        store_.Write(Resolve("nowhere"), "a.txt", Bytes("x"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
    }
}

TEST_F(FileStoreTest, ReadMissingOrDirectory) {
    ASSERT_TRUE(fs::CreateDirectories(root_ / "dir"));
    EXPECT_THROW(store_.Read(Resolve("missing.txt")), StoreError);
    EXPECT_THROW(store_.Read(Resolve("dir")), StoreError);
}

// ============================================================================
// Copy and Move
// ============================================================================

TEST_F(FileStoreTest, CopyCreatesParentsAndKeepsSource) {
    ASSERT_TRUE(fs::WriteFile(root_ / "src.txt", "payload"));

    store_.Copy(Resolve("src.txt"), Resolve("new/dir/copy.txt"));

    EXPECT_EQ(ReadText("new/dir/copy.txt"), "payload");
    EXPECT_EQ(ReadText("src.txt"), "payload");
}

TEST_F(FileStoreTest, CopyOverwritesDestination) {
    ASSERT_TRUE(fs::WriteFile(root_ / "src.txt", "new"));
    ASSERT_TRUE(fs::WriteFile(root_ / "dst.txt", "old contents"));

    store_.Copy(Resolve("src.txt"), Resolve("dst.txt"));
    EXPECT_EQ(ReadText("dst.txt"), "new");
}

TEST_F(FileStoreTest, CopyRejections) {
    ASSERT_TRUE(fs::WriteFile(root_ / "src.txt", "data"));
    ASSERT_TRUE(fs::CreateDirectories(root_ / "dir"));

    try {
        store_.Copy(Resolve("missing.txt"), Resolve("x.txt"));
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
    }

    try {
        store_.Copy(Resolve("src.txt"), Resolve("dir"));
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidInput);
    }

    try {
        store_.Copy(Resolve("src.txt"), Resolve("src.txt"));
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidInput);
    }
    EXPECT_EQ(ReadText("src.txt"), "data");
}

TEST_F(FileStoreTest, MoveRenamesFile) {
    ASSERT_TRUE(fs::WriteFile(root_ / "a.txt", "moving"));

    fs::Path moved = store_.Move(Resolve("a.txt"), Resolve("archive/b.txt"));

    EXPECT_EQ(moved, root_ / "archive/b.txt");
    EXPECT_FALSE(fs::Exists(root_ / "a.txt"));
    EXPECT_EQ(ReadText("archive/b.txt"), "moving");
}

TEST_F(FileStoreTest, MoveIntoExistingDirectoryKeepsName) {
    ASSERT_TRUE(fs::WriteFile(root_ / "a.txt", "x"));
    ASSERT_TRUE(fs::CreateDirectories(root_ / "inbox"));

    fs::Path moved = store_.Move(Resolve("a.txt"), Resolve("inbox"));

    EXPECT_EQ(moved, root_ / "inbox/a.txt");
    EXPECT_TRUE(fs::IsFile(root_ / "inbox/a.txt"));
}

TEST_F(FileStoreTest, MoveIntoDirectoryChecksComposedLength) {
    ASSERT_TRUE(fs::WriteFile(root_ / "long_name.txt", "x"));
    ASSERT_TRUE(fs::CreateDirectories(root_ / "inbox"));

    // Room for root/inbox but not root/inbox/long_name.txt
    size_t limit = root_.String().size() + 12;
    FileStore store(limit);
    try {
        store.Move(Resolve("long_name.txt"), Resolve("inbox"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidInput);
        EXPECT_EQ(std::string(e.what()),
                  "Path too long (max " + std::to_string(limit) + " characters)");
    }
    EXPECT_TRUE(fs::IsFile(root_ / "long_name.txt"));
    EXPECT_FALSE(fs::Exists(root_ / "inbox/long_name.txt"));
}

TEST_F(FileStoreTest, MoveOntoItselfIsNoOp) {
    ASSERT_TRUE(fs::WriteFile(root_ / "a.txt", "same"));

    fs::Path moved = store_.Move(Resolve("a.txt"), Resolve("a.txt"));
    EXPECT_EQ(moved, root_ / "a.txt");
    EXPECT_EQ(ReadText("a.txt"), "same");
}

TEST_F(FileStoreTest, MoveMissingSource) {
    EXPECT_THROW(store_.Move(Resolve("missing.txt"), Resolve("b.txt")), StoreError);
}

// ============================================================================
// Error Mapping
// ============================================================================

TEST(StoreErrorTest, FromErrno) {
    EXPECT_EQ(StoreError::FromErrno(ENOENT, "x").Kind(), ErrorKind::NotFound);
    EXPECT_EQ(StoreError::FromErrno(ENOTDIR, "x").Kind(), ErrorKind::NotFound);
    EXPECT_EQ(StoreError::FromErrno(EACCES, "x").Kind(), ErrorKind::AccessDenied);
    EXPECT_EQ(StoreError::FromErrno(EPERM, "x").Kind(), ErrorKind::AccessDenied);
    EXPECT_EQ(StoreError::FromErrno(EISDIR, "x").Kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(StoreError::FromErrno(EIO, "x").Kind(), ErrorKind::Internal);

    StoreError error = StoreError::FromErrno(ENOENT, "Cannot open 'a'");
    EXPECT_EQ(std::string(error.what()).rfind("Cannot open 'a': ", 0), 0u);
}

} // namespace
} // namespace store
} // namespace dirgate
