#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "core/FsError.h"
#include "fs/EntryKind.h"
#include "security/PathGuard.h"

struct DirEntry {
    std::string name;
    EntryKind kind = EntryKind::Other;
    std::uintmax_t size = 0;
    std::optional<std::chrono::system_clock::time_point> modified;
};

struct DirListing {
    fs::path path;
    std::vector<DirEntry> entries;
    size_t total = 0;
    bool truncated = false;
};

/**
 * @brief read_file 的结果
 * firstLine / lastLine 为 1-based 闭区间,empty 文件时二者均为 0
 */
struct FileContent {
    fs::path path;
    std::string text;
    size_t firstLine = 0;
    size_t lastLine = 0;
    size_t totalLines = 0;
    std::uintmax_t size = 0;
    bool empty = false;
};

struct FileInfo {
    fs::path path;
    EntryKind kind = EntryKind::Other;
    std::uintmax_t size = 0;
    std::string mimeType;  // 仅普通文件
    std::optional<std::chrono::system_clock::time_point> created;
    std::optional<std::chrono::system_clock::time_point> modified;
    std::optional<std::chrono::system_clock::time_point> accessed;
    std::string permissions;
};

/** read_multiple_files 中的单项; 失败时 content 为空,error 记录原因 */
struct BatchReadItem {
    std::string requestedPath;
    std::optional<FileContent> content;
    std::optional<FsError> error;
};

/**
 * @brief 只读操作: 列目录、读文件、查询元数据
 */
class Reader {
public:
    static constexpr size_t kMaxDirEntries = 1000;
    static constexpr size_t kBinaryCheckSize = 8192;

    Reader(const PathGuard& guard, const Config& config);

    DirListing listDirectory(const std::string& path) const;

    /**
     * @brief 读取文件内容,可选 0-based 的行窗口
     *
     * 不带 offset/limit 时文件大小不得超过 maxReadSize (TooLarge);
     * 带行窗口时不受该限制。前 8 KiB 含 NUL 字节视为二进制文件 (BinaryFile)。
     * limit 为 0 时返回空窗口: text 为空, lastLine == firstLine - 1。
     */
    FileContent readFile(const std::string& path,
                         std::optional<size_t> offset = std::nullopt,
                         std::optional<size_t> limit = std::nullopt) const;

    FileInfo fileInfo(const std::string& path) const;

    /** 逐个全文读取,单项失败记录在结果中,不会中断整批 */
    std::vector<BatchReadItem> readMultiple(const std::vector<std::string>& paths) const;

    const std::vector<fs::path>& listAllowedDirectories() const { return guard.allowedRoots(); }

    // 供 Editor 复用
    static std::string readBytes(const fs::path& path, const std::string& displayPath);
    static bool isBinary(const std::string& content);

private:
    const PathGuard& guard;
    const Config& config;
};
