#include "core/FsError.h"

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidParams: return "InvalidParams";
        case ErrorKind::AccessDenied: return "AccessDenied";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::NotAFile: return "NotAFile";
        case ErrorKind::NotADirectory: return "NotADirectory";
        case ErrorKind::BinaryFile: return "BinaryFile";
        case ErrorKind::TooLarge: return "TooLarge";
        case ErrorKind::NoMatch: return "NoMatch";
        case ErrorKind::AmbiguousMatch: return "AmbiguousMatch";
        case ErrorKind::NotEmpty: return "NotEmpty";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

int jsonRpcCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return -32002;
        case ErrorKind::Internal: return -32603;
        default: return -32602;
    }
}

FsError FsError::invalidParams(const std::string& message) {
    return FsError(ErrorKind::InvalidParams, "Invalid parameters: " + message);
}

FsError FsError::accessDenied(const std::string& path) {
    return FsError(ErrorKind::AccessDenied, "Access denied: " + path);
}

FsError FsError::notFound(const std::string& path) {
    return FsError(ErrorKind::NotFound, "Not found: " + path);
}

FsError FsError::notAFile(const std::string& path) {
    return FsError(ErrorKind::NotAFile, "Not a file: " + path);
}

FsError FsError::notADirectory(const std::string& path) {
    return FsError(ErrorKind::NotADirectory, "Not a directory: " + path);
}

FsError FsError::binaryFile(const std::string& path) {
    return FsError(ErrorKind::BinaryFile,
                   "Binary file detected: " + path + ". Use get_file_info to inspect its metadata.");
}

FsError FsError::tooLarge(const std::string& path, std::uintmax_t size, std::uintmax_t max) {
    return FsError(ErrorKind::TooLarge,
                   "File too large: " + path + " (" + std::to_string(size) + " bytes, max " +
                   std::to_string(max) + " bytes). Use offset/limit to read a line range.");
}

FsError FsError::notEmpty(const std::string& path) {
    return FsError(ErrorKind::NotEmpty, "Directory not empty: " + path);
}

FsError FsError::alreadyExists(const std::string& path) {
    return FsError(ErrorKind::AlreadyExists, "Already exists: " + path);
}

FsError FsError::fromErrorCode(const std::error_code& ec, const std::string& path) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return FsError(ErrorKind::Internal, "Permission denied by operating system: " + path);
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return notFound(path);
    }
    if (ec == std::errc::directory_not_empty) {
        return notEmpty(path);
    }
    if (ec == std::errc::not_a_directory) {
        return notADirectory(path);
    }
    return FsError(ErrorKind::Internal, ec.message() + ": " + path);
}
