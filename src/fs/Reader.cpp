#include "fs/Reader.h"
#include "utils/Format.h"
#include "utils/MimeTypes.h"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>

namespace {
    std::chrono::system_clock::time_point fromTimespec(const struct timespec& ts) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
    }

    // 目录在前,其次普通文件,最后是符号链接和其他类型; 同组内按字节序
    int groupOrder(EntryKind kind) {
        switch (kind) {
            case EntryKind::Directory: return 0;
            case EntryKind::File: return 1;
            case EntryKind::Symlink: return 2;
            case EntryKind::Other: return 3;
        }
        return 3;
    }

    // 按 '\n' 切行,去掉行尾 '\r'; 末尾换行不产生额外的空行
    std::vector<std::string> splitTextLines(const std::string& text) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start < text.size()) {
            size_t nl = text.find('\n', start);
            size_t end = nl == std::string::npos ? text.size() : nl;
            std::string line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
        return lines;
    }
}

Reader::Reader(const PathGuard& guard, const Config& config) : guard(guard), config(config) {}

std::string Reader::readBytes(const fs::path& path, const std::string& displayPath) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FsError::fromErrorCode(std::error_code(errno, std::generic_category()), displayPath);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FsError(ErrorKind::Internal, "Failed to read file: " + displayPath);
    }
    return content;
}

bool Reader::isBinary(const std::string& content) {
    size_t checkLen = std::min(content.size(), kBinaryCheckSize);
    return content.find('\0') < checkLen;
}

DirListing Reader::listDirectory(const std::string& path) const {
    DirListing listing;
    listing.path = guard.requireDirectory(path);

    std::error_code ec;
    fs::directory_iterator it(listing.path, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }

    std::vector<DirEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        DirEntry entry;
        entry.name = it->path().filename().u8string();

        std::error_code entryEc;
        entry.kind = entryKindOf(it->symlink_status(entryEc));
        if (entryEc) continue;

        if (entry.kind == EntryKind::File) {
            entry.size = it->file_size(entryEc);
            if (entryEc) entry.size = 0;
            auto mtime = it->last_write_time(entryEc);
            if (!entryEc) {
                entry.modified = FormatUtils::toSystemClock(mtime);
            }
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) {
        int ga = groupOrder(a.kind);
        int gb = groupOrder(b.kind);
        if (ga != gb) return ga < gb;
        return a.name < b.name;
    });

    listing.total = entries.size();
    if (entries.size() > kMaxDirEntries) {
        entries.resize(kMaxDirEntries);
        listing.truncated = true;
    }
    listing.entries = std::move(entries);
    return listing;
}

FileContent Reader::readFile(const std::string& path,
                             std::optional<size_t> offset,
                             std::optional<size_t> limit) const {
    FileContent result;
    result.path = guard.requireFile(path);

    std::error_code ec;
    result.size = fs::file_size(result.path, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }

    const bool hasRange = offset.has_value() || limit.has_value();
    if (!hasRange && result.size > config.maxReadSize) {
        throw FsError::tooLarge(path, result.size, config.maxReadSize);
    }

    std::string content = readBytes(result.path, path);
    if (isBinary(content)) {
        throw FsError::binaryFile(path);
    }

    std::vector<std::string> lines = splitTextLines(content);
    result.totalLines = lines.size();
    if (lines.empty()) {
        result.empty = true;
        return result;
    }

    size_t start = offset.value_or(0);
    if (start >= lines.size()) {
        throw FsError::invalidParams("Offset " + std::to_string(start) +
                                     " is beyond end of file (" + std::to_string(lines.size()) + " lines)");
    }
    size_t end = lines.size();
    // limit 可能接近 SIZE_MAX,与剩余行数比较,不做 start + limit
    if (limit && *limit < lines.size() - start) {
        end = start + *limit;
    }

    for (size_t i = start; i < end; ++i) {
        if (i > start) result.text += '\n';
        result.text += lines[i];
    }
    result.firstLine = start + 1;
    result.lastLine = end;
    return result;
}

FileInfo Reader::fileInfo(const std::string& path) const {
    FileInfo info;
    info.path = guard.resolve(path, ResolveMode::MustExist).path;

    std::error_code ec;
    fs::file_status status = fs::symlink_status(info.path, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }
    info.kind = entryKindOf(status);
    info.permissions = FormatUtils::formatPermissions(status.permissions());

    struct stat st {};
    if (::lstat(info.path.c_str(), &st) != 0) {
        throw FsError::fromErrorCode(std::error_code(errno, std::generic_category()), path);
    }
    info.size = static_cast<std::uintmax_t>(st.st_size);
    info.modified = fromTimespec(st.st_mtim);
    info.accessed = fromTimespec(st.st_atim);

#if defined(__linux__) && defined(STATX_BTIME)
    struct statx stx {};
    if (::statx(AT_FDCWD, info.path.c_str(), AT_SYMLINK_NOFOLLOW, STATX_BTIME, &stx) == 0 &&
        (stx.stx_mask & STATX_BTIME)) {
        struct timespec birth {};
        birth.tv_sec = stx.stx_btime.tv_sec;
        birth.tv_nsec = stx.stx_btime.tv_nsec;
        info.created = fromTimespec(birth);
    }
#endif

    if (info.kind == EntryKind::File) {
        info.mimeType = MimeTypes::guess(info.path);
    }
    return info;
}

std::vector<BatchReadItem> Reader::readMultiple(const std::vector<std::string>& paths) const {
    std::vector<BatchReadItem> items;
    items.reserve(paths.size());
    for (const auto& path : paths) {
        BatchReadItem item;
        item.requestedPath = path;
        try {
            item.content = readFile(path);
        } catch (const FsError& e) {
            item.error = e;
        } catch (const fs::filesystem_error& e) {
            item.error = FsError::fromErrorCode(e.code(), path);
        }
        items.push_back(std::move(item));
    }
    return items;
}
