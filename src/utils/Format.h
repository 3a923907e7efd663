#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * 输出格式化辅助函数 (文件大小、日期、权限)。
 * 所有日期均按 UTC 输出,不依赖本地时区。
 */
namespace FormatUtils {
    /** "512 B" / "1.5 KB" / "1.0 MB" / "2.0 GB" */
    std::string formatSize(std::uintmax_t bytes);

    /** YYYY-MM-DD */
    std::string formatDate(std::chrono::system_clock::time_point tp);

    /** YYYY-MM-DD HH:MM:SS */
    std::string formatTimestamp(std::chrono::system_clock::time_point tp);

    /** POSIX 权限位的八进制表示,如 "644" */
    std::string formatPermissions(std::filesystem::perms p);

    /** 把 filesystem 时钟的时间点转换为 system_clock */
    std::chrono::system_clock::time_point toSystemClock(std::filesystem::file_time_type ft);
}
