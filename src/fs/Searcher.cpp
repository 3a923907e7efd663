#include "fs/Searcher.h"
#include "utils/Format.h"
#include "utils/GlobMatcher.h"
#include <algorithm>

Searcher::Searcher(const PathGuard& guard, const Config& config)
    : guard(guard), config(config), walker(guard) {}

SearchResult Searcher::search(const std::string& path, const std::string& pattern,
                              std::optional<size_t> maxResults) const {
    SearchResult result;
    result.pattern = pattern;

    // 先编译模式: 非法模式不需要触碰文件系统
    GlobMatcher matcher(pattern);
    result.root = guard.requireDirectory(path);

    const size_t cap = std::clamp<size_t>(maxResults.value_or(kDefaultMaxResults), 1, kMaxSearchResults);

    walker.visit(result.root, config.maxDepth, true, [&](const VisitEntry& entry) {
        if (!matcher.matches(entry.name, entry.relativePath)) {
            return true;
        }
        result.matches.push_back(SearchMatch{entry.path, entry.relativePath, entry.kind, entry.size});
        if (result.matches.size() >= cap) {
            result.truncated = true;
            return false;
        }
        return true;
    });
    return result;
}

std::string Searcher::render(const SearchResult& result) {
    const std::string root = result.root.u8string();
    if (result.matches.empty()) {
        return "No matches found for pattern \"" + result.pattern + "\" in " + root;
    }

    std::string out = "Found " + std::to_string(result.matches.size()) +
                      (result.matches.size() == 1 ? " match" : " matches") +
                      " for pattern \"" + result.pattern + "\" in " + root +
                      (result.truncated ? " (results truncated)" : "") + ":\n\n";
    for (const auto& match : result.matches) {
        out += match.path.u8string();
        switch (match.kind) {
            case EntryKind::File: out += " (" + FormatUtils::formatSize(match.size) + ")"; break;
            case EntryKind::Directory: out += "/"; break;
            case EntryKind::Symlink: out += " (symlink)"; break;
            case EntryKind::Other: break;
        }
        out += "\n";
    }
    return out;
}
