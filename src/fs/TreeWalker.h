#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "fs/EntryKind.h"
#include "security/PathGuard.h"

struct TreeNode {
    std::string name;
    EntryKind kind = EntryKind::Other;
    std::uintmax_t size = 0;
    std::vector<TreeNode> children;  // 仅目录,且未超出深度上限
};

struct TreeResult {
    fs::path rootPath;
    TreeNode root;
    size_t count = 0;        // 根节点以外的条目数
    bool truncated = false;  // 达到 kMaxTreeEntries 后提前停止
};

/** visit() 回调收到的条目; depth 从 0 开始 (根目录的直接子项) */
struct VisitEntry {
    fs::path path;
    std::string name;
    std::string relativePath;  // 相对遍历根目录,使用 '/' 分隔
    EntryKind kind = EntryKind::Other;
    std::uintmax_t size = 0;
    int depth = 0;
};

/**
 * @brief 深度优先目录遍历
 *
 * 条目用 symlink_status 检查,符号链接只报告不跟随。
 * 子项排序: 目录在前,然后按名字字节序。
 * 深度为 0 时目录只报告自身,不展开子项。
 */
class TreeWalker {
public:
    static constexpr size_t kMaxTreeEntries = 1000;

    /** 返回 false 终止遍历 */
    using Visitor = std::function<bool(const VisitEntry&)>;

    explicit TreeWalker(const PathGuard& guard);

    TreeResult walk(const std::string& path, int maxDepth, bool includeHidden = false) const;

    /**
     * @brief 遍历已校验的目录 root
     * root 本身无法读取时抛出 FsError; 更深层不可读的目录被静默跳过。
     */
    void visit(const fs::path& root, int maxDepth, bool includeHidden, const Visitor& visitor) const;

    /** 画出带 ├── └── │ 连接线的文本树 */
    static std::string render(const TreeResult& result);

private:
    const PathGuard& guard;
};
