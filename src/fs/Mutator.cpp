#include "fs/Mutator.h"
#include <cerrno>
#include <fstream>

Mutator::Mutator(const PathGuard& guard) : guard(guard) {}

WriteResult Mutator::writeFile(const std::string& path, const std::string& content) const {
    ResolvedPath resolved = guard.resolve(path, ResolveMode::MayNotExist);

    std::error_code ec;
    if (resolved.exists && fs::is_directory(resolved.path, ec)) {
        throw FsError::notAFile(path);
    }

    std::ofstream out(resolved.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw FsError::fromErrorCode(std::error_code(errno, std::generic_category()), path);
    }
    out << content;
    out.close();
    if (out.fail()) {
        throw FsError(ErrorKind::Internal, "Failed to write file: " + path);
    }

    WriteResult result;
    result.path = resolved.path;
    result.bytesWritten = content.size();
    result.created = !resolved.exists;
    return result;
}

CreateDirectoryResult Mutator::createDirectory(const std::string& path) const {
    CreateDirectoryResult result;
    result.path = guard.resolveCreatable(path);

    std::error_code ec;
    fs::file_status status = fs::status(result.path, ec);
    if (fs::exists(status)) {
        if (!fs::is_directory(status)) {
            throw FsError::notADirectory(path);
        }
        return result;
    }

    fs::create_directories(result.path, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }
    result.created = true;
    return result;
}

fs::path Mutator::deleteFile(const std::string& path) const {
    fs::path target = guard.requireFile(path);

    std::error_code ec;
    if (!fs::remove(target, ec) || ec) {
        throw FsError::fromErrorCode(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory), path);
    }
    return target;
}

fs::path Mutator::deleteDirectory(const std::string& path) const {
    fs::path target = guard.requireDirectory(path);
    if (guard.isRoot(target)) {
        throw FsError(ErrorKind::AccessDenied, "Refusing to delete an allowed root directory: " + path);
    }

    std::error_code ec;
    if (!fs::is_empty(target, ec)) {
        if (ec) throw FsError::fromErrorCode(ec, path);
        throw FsError::notEmpty(path);
    }

    // remove() 对非空目录返回 ENOTEMPTY,不会递归
    if (!fs::remove(target, ec) || ec) {
        throw FsError::fromErrorCode(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory), path);
    }
    return target;
}

MoveResult Mutator::moveFile(const std::string& source, const std::string& destination) const {
    MoveResult result;
    result.source = guard.resolve(source, ResolveMode::MustExist).path;
    if (guard.isRoot(result.source)) {
        throw FsError(ErrorKind::AccessDenied, "Refusing to move an allowed root directory: " + source);
    }

    ResolvedPath dest = guard.resolve(destination, ResolveMode::MayNotExist);
    std::error_code ec;
    // 悬空符号链接也算已存在 (dest.path 是沿链接解析后的目标)
    bool occupied = dest.exists || fs::exists(fs::symlink_status(dest.path, ec)) ||
                    fs::exists(fs::symlink_status(fs::u8path(destination), ec));
    if (occupied) {
        throw FsError::alreadyExists(destination);
    }
    result.destination = dest.path;

    fs::rename(result.source, result.destination, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, source);
    }
    return result;
}
