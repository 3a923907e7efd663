#include "SandboxTest.h"
#include "fs/Reader.h"
#include "security/PathGuard.h"
#include <limits>

class ReaderTest : public SandboxTest {
protected:
    void SetUp() override {
        SandboxTest::SetUp();
        guard = std::make_unique<PathGuard>(config);
        reader = std::make_unique<Reader>(*guard, config);
    }

    std::unique_ptr<PathGuard> guard;
    std::unique_ptr<Reader> reader;
};

TEST_F(ReaderTest, ListDirectoryOrdersDirectoriesFirst) {
    writeFile("b.txt", "bb");
    writeFile("A.txt", "a");
    fs::create_directories(root / "zeta");
    fs::create_directories(root / "alpha");

    DirListing listing = reader->listDirectory(root.u8string());
    ASSERT_EQ(listing.entries.size(), 4u);
    EXPECT_EQ(listing.entries[0].name, "alpha");
    EXPECT_EQ(listing.entries[1].name, "zeta");
    // 字节序: 大写字母排在小写之前
    EXPECT_EQ(listing.entries[2].name, "A.txt");
    EXPECT_EQ(listing.entries[3].name, "b.txt");
    EXPECT_EQ(listing.entries[3].size, 2u);
    EXPECT_TRUE(listing.entries[3].modified.has_value());
    EXPECT_FALSE(listing.truncated);
}

TEST_F(ReaderTest, ListDirectoryReportsSymlinksAfterFiles) {
    writeFile("file.txt", "x");
    fs::create_symlink(root / "file.txt", root / "aaa-link");
    DirListing listing = reader->listDirectory(root.u8string());
    ASSERT_EQ(listing.entries.size(), 2u);
    EXPECT_EQ(listing.entries[0].kind, EntryKind::File);
    EXPECT_EQ(listing.entries[1].kind, EntryKind::Symlink);
}

TEST_F(ReaderTest, ListDirectoryTruncatesAtCap) {
    for (size_t i = 0; i < Reader::kMaxDirEntries + 5; ++i) {
        std::ofstream(root / ("f" + std::to_string(i))) << "";
    }
    DirListing listing = reader->listDirectory(root.u8string());
    EXPECT_EQ(listing.entries.size(), Reader::kMaxDirEntries);
    EXPECT_EQ(listing.total, Reader::kMaxDirEntries + 5);
    EXPECT_TRUE(listing.truncated);
}

TEST_F(ReaderTest, ListDirectoryOnFileFails) {
    fs::path file = writeFile("f.txt", "x");
    EXPECT_FS_ERROR(reader->listDirectory(file.u8string()), ErrorKind::NotADirectory);
}

TEST_F(ReaderTest, ReadWholeFile) {
    fs::path file = writeFile("test.txt", "line one\nline two\nline three");
    FileContent content = reader->readFile(file.u8string());
    EXPECT_EQ(content.text, "line one\nline two\nline three");
    EXPECT_EQ(content.firstLine, 1u);
    EXPECT_EQ(content.lastLine, 3u);
    EXPECT_EQ(content.totalLines, 3u);
    EXPECT_EQ(content.size, 28u);
    EXPECT_FALSE(content.empty);
}

TEST_F(ReaderTest, ReadLineWindow) {
    fs::path file = writeFile("test.txt", "line0\nline1\nline2\nline3\nline4\n");
    FileContent content = reader->readFile(file.u8string(), 1, 2);
    EXPECT_EQ(content.text, "line1\nline2");
    EXPECT_EQ(content.firstLine, 2u);
    EXPECT_EQ(content.lastLine, 3u);
    EXPECT_EQ(content.totalLines, 5u);

    FileContent limitOnly = reader->readFile(file.u8string(), std::nullopt, 2);
    EXPECT_EQ(limitOnly.text, "line0\nline1");

    FileContent pastEnd = reader->readFile(file.u8string(), 3, 100);
    EXPECT_EQ(pastEnd.text, "line3\nline4");
}

TEST_F(ReaderTest, HugeLimitReadsToEnd) {
    fs::path file = writeFile("four.txt", "l0\nl1\nl2\nl3\n");
    FileContent content = reader->readFile(file.u8string(), 1, std::numeric_limits<size_t>::max());
    EXPECT_EQ(content.text, "l1\nl2\nl3");
    EXPECT_EQ(content.firstLine, 2u);
    EXPECT_EQ(content.lastLine, 4u);

    FileContent noOffset = reader->readFile(file.u8string(), std::nullopt, std::numeric_limits<size_t>::max());
    EXPECT_EQ(noOffset.text, "l0\nl1\nl2\nl3");
}

TEST_F(ReaderTest, ZeroLimitIsAnEmptyWindow) {
    fs::path file = writeFile("four.txt", "l0\nl1\nl2\nl3\n");
    FileContent content = reader->readFile(file.u8string(), 1, 0);
    EXPECT_TRUE(content.text.empty());
    EXPECT_FALSE(content.empty);
    EXPECT_EQ(content.firstLine, 2u);
    EXPECT_EQ(content.lastLine, 1u);
    EXPECT_EQ(content.totalLines, 4u);
}

TEST_F(ReaderTest, CrlfLineEndingsAreStripped) {
    fs::path file = writeFile("dos.txt", "a\r\nb\r\n");
    FileContent content = reader->readFile(file.u8string());
    EXPECT_EQ(content.text, "a\nb");
    EXPECT_EQ(content.totalLines, 2u);
}

TEST_F(ReaderTest, OffsetBeyondEndIsInvalid) {
    fs::path file = writeFile("test.txt", "one\ntwo");
    EXPECT_FS_ERROR(reader->readFile(file.u8string(), 10), ErrorKind::InvalidParams);
    EXPECT_FS_ERROR(reader->readFile(file.u8string(), 2), ErrorKind::InvalidParams);
}

TEST_F(ReaderTest, EmptyFile) {
    fs::path file = writeFile("empty.txt", "");
    FileContent content = reader->readFile(file.u8string());
    EXPECT_TRUE(content.empty);
    EXPECT_EQ(content.totalLines, 0u);
    EXPECT_EQ(content.size, 0u);
    // 空文件上的 offset 不报错
    EXPECT_TRUE(reader->readFile(file.u8string(), 5).empty);
}

TEST_F(ReaderTest, SizeCeilingAppliesOnlyToFullReads) {
    config.maxReadSize = 10;
    fs::path file = writeFile("big.txt", "line1\nline2\nline3\n");
    EXPECT_FS_ERROR(reader->readFile(file.u8string()), ErrorKind::TooLarge);

    FileContent window = reader->readFile(file.u8string(), 0, 1);
    EXPECT_EQ(window.text, "line1");
}

TEST_F(ReaderTest, BinaryDetection) {
    fs::path file = writeFile("binary.bin", std::string("hello\0world", 11));
    EXPECT_FS_ERROR(reader->readFile(file.u8string()), ErrorKind::BinaryFile);

    // NUL 出现在前 8 KiB 之后不算二进制
    std::string late(Reader::kBinaryCheckSize + 10, 'a');
    late[Reader::kBinaryCheckSize + 5] = '\0';
    fs::path lateFile = writeFile("late.txt", late);
    EXPECT_NO_THROW(reader->readFile(lateFile.u8string()));
}

TEST_F(ReaderTest, ReadOutsideSandboxIsDenied) {
    fs::path secret = writeFile(base / "secret.txt", "secret");
    EXPECT_FS_ERROR(reader->readFile(secret.u8string()), ErrorKind::AccessDenied);
    EXPECT_FS_ERROR(reader->readFile((root / "missing.txt").u8string()), ErrorKind::NotFound);
    EXPECT_FS_ERROR(reader->readFile(root.u8string()), ErrorKind::NotAFile);
}

TEST_F(ReaderTest, FileInfoForFile) {
    fs::path file = writeFile("data.json", "{\"k\": 1}");
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                          fs::perms::others_read);
    FileInfo info = reader->fileInfo(file.u8string());
    EXPECT_EQ(info.path, file);
    EXPECT_EQ(info.kind, EntryKind::File);
    EXPECT_EQ(info.size, 8u);
    EXPECT_EQ(info.mimeType, "application/json");
    EXPECT_EQ(info.permissions, "644");
    EXPECT_TRUE(info.modified.has_value());
    EXPECT_TRUE(info.accessed.has_value());
}

TEST_F(ReaderTest, FileInfoForDirectoryAndUnknownExtension) {
    fs::create_directories(root / "sub");
    FileInfo dir = reader->fileInfo((root / "sub").u8string());
    EXPECT_EQ(dir.kind, EntryKind::Directory);
    EXPECT_TRUE(dir.mimeType.empty());

    fs::path blob = writeFile("blob.qqq", "x");
    EXPECT_EQ(reader->fileInfo(blob.u8string()).mimeType, "application/octet-stream");
}

TEST_F(ReaderTest, ReadMultipleCapturesFailuresInline) {
    fs::path a = writeFile("a.txt", "alpha");
    fs::path secret = writeFile(base / "secret.txt", "nope");
    fs::path b = writeFile("b.txt", "beta");

    auto items = reader->readMultiple({a.u8string(), secret.u8string(), (root / "missing").u8string(), b.u8string()});
    ASSERT_EQ(items.size(), 4u);
    ASSERT_TRUE(items[0].content.has_value());
    EXPECT_EQ(items[0].content->text, "alpha");
    ASSERT_TRUE(items[1].error.has_value());
    EXPECT_EQ(items[1].error->kind(), ErrorKind::AccessDenied);
    EXPECT_EQ(items[1].requestedPath, secret.u8string());
    ASSERT_TRUE(items[2].error.has_value());
    EXPECT_EQ(items[2].error->kind(), ErrorKind::NotFound);
    ASSERT_TRUE(items[3].content.has_value());
    EXPECT_EQ(items[3].content->text, "beta");
}

TEST_F(ReaderTest, ListAllowedDirectories) {
    ASSERT_EQ(reader->listAllowedDirectories().size(), 1u);
    EXPECT_EQ(reader->listAllowedDirectories()[0], root);
}
