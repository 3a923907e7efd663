#pragma once
#include <cstdint>
#include <string>
#include "core/ConfigManager.h"
#include "security/PathGuard.h"

struct WriteResult {
    fs::path path;
    std::uintmax_t bytesWritten = 0;
    bool created = false;  // 写入前文件不存在
};

struct CreateDirectoryResult {
    fs::path path;
    bool created = false;  // false: 目录已存在
};

struct MoveResult {
    fs::path source;
    fs::path destination;
};

/**
 * @brief 写入类与破坏性操作
 *
 * 工具是否可用由 ToolRegistry 按权限等级决定,这里只负责路径校验和执行。
 * 删除永远不递归; 允许的根目录本身不能被删除或移动。
 */
class Mutator {
public:
    explicit Mutator(const PathGuard& guard);

    WriteResult writeFile(const std::string& path, const std::string& content) const;
    CreateDirectoryResult createDirectory(const std::string& path) const;
    fs::path deleteFile(const std::string& path) const;
    fs::path deleteDirectory(const std::string& path) const;
    MoveResult moveFile(const std::string& source, const std::string& destination) const;

private:
    const PathGuard& guard;
};
