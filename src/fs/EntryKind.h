#pragma once
#include <filesystem>

/**
 * @brief 目录条目类型 (基于 symlink_status,不跟随链接)
 */
enum class EntryKind {
    File,
    Directory,
    Symlink,
    Other
};

inline EntryKind entryKindOf(const std::filesystem::file_status& status) {
    if (std::filesystem::is_symlink(status)) return EntryKind::Symlink;
    if (std::filesystem::is_directory(status)) return EntryKind::Directory;
    if (std::filesystem::is_regular_file(status)) return EntryKind::File;
    return EntryKind::Other;
}

inline const char* toString(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Other: return "other";
    }
    return "other";
}
