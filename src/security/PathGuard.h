#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "core/FsError.h"

namespace fs = std::filesystem;

enum class ResolveMode {
    MustExist,
    MayNotExist
};

/**
 * @brief PathGuard 的解析结果
 * path 一定是 canonical 的绝对路径,且位于某个允许的根目录之内。
 */
struct ResolvedPath {
    fs::path path;
    bool exists = false;
};

/**
 * @brief 沙箱路径校验
 *
 * 所有触碰文件系统的操作都必须先经过 PathGuard:
 * 1. MayNotExist 模式下拒绝任何 . / .. 段 (在访问文件系统之前)
 * 2. 使用操作系统的 canonicalize (realpath) 解析全部符号链接
 * 3. 按路径组件 (而不是字符串前缀) 判断是否位于允许的根目录内
 *
 * 先解析符号链接再检查包含关系,才能阻止沙箱内指向沙箱外的链接;
 * 按组件比较才能避免 /allowed-evil 被误判为 /allowed 的子路径。
 */
class PathGuard {
public:
    explicit PathGuard(const Config& config);

    ResolvedPath resolve(const std::string& input, ResolveMode mode) const;

    /** MustExist + 必须是普通文件 (NotAFile) */
    fs::path requireFile(const std::string& input) const;

    /** MustExist + 必须是目录 (NotADirectory) */
    fs::path requireDirectory(const std::string& input) const;

    /**
     * @brief 为递归创建目录 (mkdir -p) 解析路径
     *
     * 向上找到最近的已存在祖先,canonicalize 并校验它,
     * 再把尚不存在的尾部逐段拼接回去。尾部不允许出现 . 或 ..
     */
    fs::path resolveCreatable(const std::string& input) const;

    /** @return canonical 路径是否等于或位于某个允许的根目录之下 */
    bool isAllowed(const fs::path& canonical) const;

    /** @return canonical 路径是否恰好是某个允许的根目录 */
    bool isRoot(const fs::path& canonical) const;

    const std::vector<fs::path>& allowedRoots() const { return config.allowedDirectories; }

    /** @return path 是否等于 root 或是 root 的严格后代 (按组件比较) */
    static bool isWithin(const fs::path& path, const fs::path& root);

private:
    static constexpr int kMaxSymlinkHops = 40;

    const Config& config;

    static bool hasDotSegments(const fs::path& path);
    static fs::path stripTrailingSeparators(const fs::path& path);
    fs::path checkContained(const fs::path& canonical, const std::string& input) const;
};
