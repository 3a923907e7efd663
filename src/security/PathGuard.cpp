#include "security/PathGuard.h"
#include <algorithm>

PathGuard::PathGuard(const Config& config) : config(config) {}

bool PathGuard::isWithin(const fs::path& path, const fs::path& root) {
    auto pathIt = path.begin();
    for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt) {
        // 尾部分隔符会产生空组件
        if (rootIt->empty()) continue;
        if (pathIt == path.end() || *pathIt != *rootIt) {
            return false;
        }
        ++pathIt;
    }
    return true;
}

bool PathGuard::isAllowed(const fs::path& canonical) const {
    return std::any_of(config.allowedDirectories.begin(), config.allowedDirectories.end(),
                       [&](const fs::path& root) { return isWithin(canonical, root); });
}

bool PathGuard::isRoot(const fs::path& canonical) const {
    return std::any_of(config.allowedDirectories.begin(), config.allowedDirectories.end(),
                       [&](const fs::path& root) { return canonical == root; });
}

bool PathGuard::hasDotSegments(const fs::path& path) {
    for (const auto& part : path) {
        if (part == "." || part == "..") return true;
    }
    return false;
}

fs::path PathGuard::stripTrailingSeparators(const fs::path& path) {
    std::string s = path.u8string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == fs::path::preferred_separator)) {
        s.pop_back();
    }
    return fs::u8path(s);
}

fs::path PathGuard::checkContained(const fs::path& canonical, const std::string& input) const {
    if (!isAllowed(canonical)) {
        throw FsError::accessDenied(input);
    }
    return canonical;
}

ResolvedPath PathGuard::resolve(const std::string& input, ResolveMode mode) const {
    if (input.empty()) {
        throw FsError::invalidParams("path must be a non-empty string");
    }
    fs::path raw = fs::u8path(input);

    // 创建类操作: 在任何文件系统访问之前拒绝遍历段
    if (mode == ResolveMode::MayNotExist && hasDotSegments(raw)) {
        throw FsError::invalidParams("path must not contain '.' or '..' segments: " + input);
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(raw, ec);
    if (!ec) {
        return {checkContained(canonical, input), true};
    }
    bool missing = ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
    if (!missing) {
        throw FsError::fromErrorCode(ec, input);
    }
    if (mode == ResolveMode::MustExist) {
        throw FsError::notFound(input);
    }

    // 目标尚不存在: canonicalize 父目录,再拼接叶子名
    fs::path trimmed = stripTrailingSeparators(raw);
    fs::path leaf = trimmed.filename();
    if (leaf.empty()) {
        throw FsError::invalidParams("path has no file name component: " + input);
    }
    fs::path parent = trimmed.parent_path();
    if (parent.empty()) {
        parent = fs::current_path();
    }

    fs::path canonicalParent = fs::canonical(parent, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            throw FsError::notFound(parent.u8string());
        }
        throw FsError::fromErrorCode(ec, parent.u8string());
    }
    checkContained(canonicalParent, input);

    fs::path composed = canonicalParent / leaf;

    // 悬空的符号链接: 写入时会跟随它,所以沿链接逐跳解析,按最终目标做包含检查
    fs::path current = composed;
    for (int hops = 0; hops < kMaxSymlinkHops; ++hops) {
        fs::file_status linkStatus = fs::symlink_status(current, ec);
        if (ec || !fs::is_symlink(linkStatus)) {
            return {checkContained(current, input), false};
        }
        fs::path target = fs::read_symlink(current, ec);
        if (ec) {
            throw FsError::fromErrorCode(ec, input);
        }
        if (target.is_relative()) {
            target = current.parent_path() / target;
        }
        current = fs::weakly_canonical(target, ec);
        if (ec) {
            throw FsError::fromErrorCode(ec, input);
        }
    }
    throw FsError(ErrorKind::Internal, "Too many levels of symbolic links: " + input);
}

fs::path PathGuard::requireFile(const std::string& input) const {
    ResolvedPath resolved = resolve(input, ResolveMode::MustExist);
    std::error_code ec;
    if (!fs::is_regular_file(resolved.path, ec)) {
        throw FsError::notAFile(input);
    }
    return resolved.path;
}

fs::path PathGuard::requireDirectory(const std::string& input) const {
    ResolvedPath resolved = resolve(input, ResolveMode::MustExist);
    std::error_code ec;
    if (!fs::is_directory(resolved.path, ec)) {
        throw FsError::notADirectory(input);
    }
    return resolved.path;
}

fs::path PathGuard::resolveCreatable(const std::string& input) const {
    if (input.empty()) {
        throw FsError::invalidParams("path must be a non-empty string");
    }
    fs::path raw = fs::u8path(input);
    if (hasDotSegments(raw)) {
        throw FsError::invalidParams("path must not contain '.' or '..' segments: " + input);
    }

    fs::path existing = stripTrailingSeparators(raw);
    std::vector<fs::path> tail;
    std::error_code ec;
    while (!fs::exists(existing, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw FsError::fromErrorCode(ec, input);
        }
        fs::path name = existing.filename();
        fs::path parent = existing.parent_path();
        if (name.empty()) {
            throw FsError::notFound(input);
        }
        tail.push_back(name);
        if (parent.empty()) {
            existing = fs::current_path();
            break;
        }
        existing = parent;
    }

    fs::path base = fs::canonical(existing, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, existing.u8string());
    }
    checkContained(base, input);

    for (auto it = tail.rbegin(); it != tail.rend(); ++it) {
        base /= *it;
    }
    return base;
}
