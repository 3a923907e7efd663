#pragma once
#include "ITool.h"
#include "ToolRegistry.h"
#include "core/ConfigManager.h"
#include "fs/Editor.h"
#include "fs/Mutator.h"
#include "fs/Reader.h"
#include "fs/Searcher.h"
#include "fs/TreeWalker.h"
#include "security/PathGuard.h"

/**
 * @brief 所有工具共享的文件系统组件
 *
 * 持有 Config 的引用,Config 必须比 FilesystemContext 活得更久。
 */
struct FilesystemContext {
    explicit FilesystemContext(const Config& config)
        : config(config), guard(config), reader(guard, config), walker(guard),
          searcher(guard, config), editor(guard, config), mutator(guard) {}

    FilesystemContext(const FilesystemContext&) = delete;
    FilesystemContext& operator=(const FilesystemContext&) = delete;

    const Config& config;
    PathGuard guard;
    Reader reader;
    TreeWalker walker;
    Searcher searcher;
    Editor editor;
    Mutator mutator;
};

/**
 * @brief 创建全部 13 个文件系统工具并交给 registry
 *
 * registry 按自身的权限等级过滤,返回实际注册的数量。
 */
size_t registerFilesystemTools(ToolRegistry& registry, FilesystemContext& context);

// ---------------------------------------------------------------------------
// 只读工具
// ---------------------------------------------------------------------------

class ListAllowedDirectoriesTool : public ITool {
public:
    explicit ListAllowedDirectoriesTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "list_allowed_directories"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class ListDirectoryTool : public ITool {
public:
    explicit ListDirectoryTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "list_directory"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

/**
 * @brief 读取文件
 *
 * - 无 offset/limit → 全文 (受 maxReadSize 限制)
 * - 指定 offset/limit → 返回 0-based 行窗口,不受大小限制
 */
class ReadFileTool : public ITool {
public:
    explicit ReadFileTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "read_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class ReadMultipleFilesTool : public ITool {
public:
    explicit ReadMultipleFilesTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "read_multiple_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class GetFileInfoTool : public ITool {
public:
    explicit GetFileInfoTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "get_file_info"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class DirectoryTreeTool : public ITool {
public:
    explicit DirectoryTreeTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "directory_tree"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class SearchFilesTool : public ITool {
public:
    explicit SearchFilesTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "search_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::ReadOnly; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

// ---------------------------------------------------------------------------
// 写入工具
// ---------------------------------------------------------------------------

class WriteFileTool : public ITool {
public:
    explicit WriteFileTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "write_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Write; }
    // 覆盖已有文件
    bool isDestructive() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

/**
 * @brief 精确文本替换,返回 unified diff
 *
 * 每个 edit 接受 oldText/newText 或 old_text/new_text 两种写法。
 * dry_run 为 true 时只返回 diff,不写文件。
 */
class EditFileTool : public ITool {
public:
    explicit EditFileTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "edit_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Write; }
    nlohmann::json execute(const nlohmann::json& args) override;

    static std::vector<TextEdit> parseEdits(const nlohmann::json& edits);

private:
    FilesystemContext& ctx;
};

class CreateDirectoryTool : public ITool {
public:
    explicit CreateDirectoryTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "create_directory"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Write; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

// ---------------------------------------------------------------------------
// 破坏性工具
// ---------------------------------------------------------------------------

class DeleteFileTool : public ITool {
public:
    explicit DeleteFileTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "delete_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Destructive; }
    bool isDestructive() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class DeleteDirectoryTool : public ITool {
public:
    explicit DeleteDirectoryTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "delete_directory"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Destructive; }
    bool isDestructive() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};

class MoveFileTool : public ITool {
public:
    explicit MoveFileTool(FilesystemContext& ctx) : ctx(ctx) {}

    std::string getName() const override { return "move_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    PermissionTier requiredTier() const override { return PermissionTier::Destructive; }
    bool isDestructive() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    FilesystemContext& ctx;
};
