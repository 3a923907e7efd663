#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

/**
 * @brief 文件系统操作的错误分类
 *
 * 所有组件(PathGuard / Reader / Editor / ...)都通过抛出 FsError 报告失败,
 * 由 ToolRegistry 在工具边界统一转换为 isError 结果。
 */
enum class ErrorKind {
    InvalidParams,   // 参数非法,或 MayNotExist 路径包含 . / ..
    AccessDenied,    // 解析后的路径不在允许的根目录内
    NotFound,
    NotAFile,
    NotADirectory,
    BinaryFile,      // 前 8 KiB 中出现 NUL 字节
    TooLarge,        // 全文读取超过 maxReadSize
    NoMatch,         // edit: oldText 未出现
    AmbiguousMatch,  // edit: oldText 出现多次
    NotEmpty,
    AlreadyExists,
    Internal         // 操作系统层面的意外 I/O 错误
};

const char* toString(ErrorKind kind);

/**
 * @brief JSON-RPC 错误码映射
 * NotFound -> -32002, Internal -> -32603, 其他 -> -32602
 */
int jsonRpcCode(ErrorKind kind);

class FsError : public std::runtime_error {
public:
    FsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    static FsError invalidParams(const std::string& message);
    static FsError accessDenied(const std::string& path);
    static FsError notFound(const std::string& path);
    static FsError notAFile(const std::string& path);
    static FsError notADirectory(const std::string& path);
    static FsError binaryFile(const std::string& path);
    static FsError tooLarge(const std::string& path, std::uintmax_t size, std::uintmax_t max);
    static FsError notEmpty(const std::string& path);
    static FsError alreadyExists(const std::string& path);

    /**
     * @brief 将操作系统错误转换为 FsError
     *
     * permission_denied 映射为 Internal("Permission denied by operating system"),
     * 与沙箱的 AccessDenied 区分开。
     */
    static FsError fromErrorCode(const std::error_code& ec, const std::string& path);

private:
    ErrorKind kind_;
};
