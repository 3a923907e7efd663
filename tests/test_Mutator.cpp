#include "SandboxTest.h"
#include "fs/Mutator.h"
#include "security/PathGuard.h"

class MutatorTest : public SandboxTest {
protected:
    void SetUp() override {
        SandboxTest::SetUp();
        guard = std::make_unique<PathGuard>(config);
        mutator = std::make_unique<Mutator>(*guard);
    }

    std::unique_ptr<PathGuard> guard;
    std::unique_ptr<Mutator> mutator;
};

TEST_F(MutatorTest, WriteCreatesThenOverwrites) {
    fs::path target = root / "new.txt";
    WriteResult first = mutator->writeFile(target.u8string(), "hello");
    EXPECT_TRUE(first.created);
    EXPECT_EQ(first.bytesWritten, 5u);
    EXPECT_EQ(readAll(target), "hello");

    WriteResult second = mutator->writeFile(target.u8string(), "hi");
    EXPECT_FALSE(second.created);
    EXPECT_EQ(readAll(target), "hi");
}

TEST_F(MutatorTest, WriteRejections) {
    EXPECT_FS_ERROR(mutator->writeFile(root.u8string(), "x"), ErrorKind::NotAFile);
    EXPECT_FS_ERROR(mutator->writeFile((base / "escape.txt").u8string(), "x"), ErrorKind::AccessDenied);
    EXPECT_FS_ERROR(mutator->writeFile((root / "missing/x.txt").u8string(), "x"), ErrorKind::NotFound);
    EXPECT_FS_ERROR(mutator->writeFile(root.u8string() + "/../escape.txt", "x"), ErrorKind::InvalidParams);
    EXPECT_FALSE(fs::exists(base / "escape.txt"));
}

TEST_F(MutatorTest, WriteThroughDanglingSymlinkOutsideIsDenied) {
    fs::create_symlink(base / "planted.txt", root / "trap");
    EXPECT_FS_ERROR(mutator->writeFile((root / "trap").u8string(), "x"), ErrorKind::AccessDenied);
    EXPECT_FALSE(fs::exists(base / "planted.txt"));
}

TEST_F(MutatorTest, CreateDirectoryIsRecursiveAndIdempotent) {
    fs::path nested = root / "a/b/c";
    CreateDirectoryResult first = mutator->createDirectory(nested.u8string());
    EXPECT_TRUE(first.created);
    EXPECT_TRUE(fs::is_directory(nested));

    CreateDirectoryResult again = mutator->createDirectory(nested.u8string());
    EXPECT_FALSE(again.created);

    writeFile("file", "x");
    EXPECT_FS_ERROR(mutator->createDirectory((root / "file").u8string()), ErrorKind::NotADirectory);
    EXPECT_FS_ERROR(mutator->createDirectory((base / "outside/x").u8string()), ErrorKind::AccessDenied);
    EXPECT_FALSE(fs::exists(base / "outside"));
}

TEST_F(MutatorTest, DeleteFile) {
    fs::path file = writeFile("gone.txt", "x");
    EXPECT_EQ(mutator->deleteFile(file.u8string()), file);
    EXPECT_FALSE(fs::exists(file));

    EXPECT_FS_ERROR(mutator->deleteFile(file.u8string()), ErrorKind::NotFound);
    fs::create_directories(root / "dir");
    EXPECT_FS_ERROR(mutator->deleteFile((root / "dir").u8string()), ErrorKind::NotAFile);
}

TEST_F(MutatorTest, DeleteDirectoryOnlyWhenEmpty) {
    writeFile("full/keep.txt", "x");
    EXPECT_FS_ERROR(mutator->deleteDirectory((root / "full").u8string()), ErrorKind::NotEmpty);
    EXPECT_TRUE(fs::exists(root / "full/keep.txt"));

    fs::create_directories(root / "empty");
    mutator->deleteDirectory((root / "empty").u8string());
    EXPECT_FALSE(fs::exists(root / "empty"));
}

TEST_F(MutatorTest, AllowedRootCannotBeDeletedOrMoved) {
    EXPECT_FS_ERROR(mutator->deleteDirectory(root.u8string()), ErrorKind::AccessDenied);
    EXPECT_FS_ERROR(mutator->moveFile(root.u8string(), (root / "x").u8string()), ErrorKind::AccessDenied);
    EXPECT_TRUE(fs::is_directory(root));
}

TEST_F(MutatorTest, MoveRenamesFilesAndDirectories) {
    fs::path src = writeFile("src.txt", "data");
    MoveResult moved = mutator->moveFile(src.u8string(), (root / "dst.txt").u8string());
    EXPECT_EQ(moved.destination, root / "dst.txt");
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(readAll(root / "dst.txt"), "data");

    writeFile("olddir/inner.txt", "i");
    mutator->moveFile((root / "olddir").u8string(), (root / "newdir").u8string());
    EXPECT_EQ(readAll(root / "newdir/inner.txt"), "i");
}

TEST_F(MutatorTest, MoveNeverOverwrites) {
    fs::path a = writeFile("a.txt", "a");
    fs::path b = writeFile("b.txt", "b");
    EXPECT_FS_ERROR(mutator->moveFile(a.u8string(), b.u8string()), ErrorKind::AlreadyExists);
    EXPECT_EQ(readAll(b), "b");

    fs::create_symlink(root / "nowhere", root / "dangling");
    EXPECT_FS_ERROR(mutator->moveFile(a.u8string(), (root / "dangling").u8string()), ErrorKind::AlreadyExists);
    EXPECT_TRUE(fs::exists(a));
}

TEST_F(MutatorTest, MoveAcrossSandboxBoundaryIsDenied) {
    fs::path a = writeFile("a.txt", "a");
    EXPECT_FS_ERROR(mutator->moveFile(a.u8string(), (base / "stolen.txt").u8string()), ErrorKind::AccessDenied);
    fs::path outside = writeFile(base / "o.txt", "o");
    EXPECT_FS_ERROR(mutator->moveFile(outside.u8string(), (root / "in.txt").u8string()), ErrorKind::AccessDenied);
    EXPECT_TRUE(fs::exists(a));
}
