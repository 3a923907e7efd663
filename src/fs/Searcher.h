#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "fs/TreeWalker.h"
#include "security/PathGuard.h"

struct SearchMatch {
    fs::path path;
    std::string relativePath;
    EntryKind kind = EntryKind::Other;
    std::uintmax_t size = 0;
};

struct SearchResult {
    fs::path root;
    std::string pattern;
    std::vector<SearchMatch> matches;
    bool truncated = false;
};

/**
 * @brief 按 glob 模式搜索目录树
 *
 * 遍历深度受配置的 maxDepth 限制,隐藏条目也参与匹配,符号链接不跟随。
 * 结果按遍历顺序输出,达到上限后停止并标记 truncated。
 */
class Searcher {
public:
    static constexpr size_t kDefaultMaxResults = 50;
    static constexpr size_t kMaxSearchResults = 200;

    Searcher(const PathGuard& guard, const Config& config);

    SearchResult search(const std::string& path, const std::string& pattern,
                        std::optional<size_t> maxResults = std::nullopt) const;

    static std::string render(const SearchResult& result);

private:
    const PathGuard& guard;
    const Config& config;
    TreeWalker walker;
};
