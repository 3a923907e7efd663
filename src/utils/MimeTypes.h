#pragma once
#include <filesystem>
#include <string>

namespace MimeTypes {
    /**
     * @brief 按扩展名 (大小写不敏感) 猜测内容类型
     * @return 未知扩展名返回 "application/octet-stream"
     */
    std::string guess(const std::filesystem::path& path);
}
