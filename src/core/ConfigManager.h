#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief 权限等级 (单调格: Destructive ⊇ Write ⊇ ReadOnly)
 * 启动时确定,进程生命周期内不变。
 */
enum class PermissionTier {
    ReadOnly,
    Write,
    Destructive
};

PermissionTier permissionTierFromFlags(bool allowWrite, bool allowDestructive);
const char* toString(PermissionTier tier);

/** @return tier 是否包含 required 所需的权限 */
inline bool tierAllows(PermissionTier tier, PermissionTier required) {
    return static_cast<int>(tier) >= static_cast<int>(required);
}

struct Config {
    static constexpr std::uintmax_t kDefaultMaxReadSize = 10485760;  // 10 MiB
    static constexpr int kDefaultMaxDepth = 10;

    /** 允许访问的根目录; validate() 之后均为 canonical 的已存在目录 */
    std::vector<std::filesystem::path> allowedDirectories;
    bool allowWrite = false;
    bool allowDestructive = false;
    std::uintmax_t maxReadSize = kDefaultMaxReadSize;
    int maxDepth = kDefaultMaxDepth;

    std::string logFile;
    std::string logLevel = "info";

    PermissionTier tier() const { return permissionTierFromFlags(allowWrite, allowDestructive); }

    /**
     * @brief 规范化并校验配置
     *
     * - allow_destructive 隐含 allow_write
     * - 每个根目录都 canonicalize,且必须是目录
     * 失败时抛出 std::runtime_error,信息中包含出错的目录。
     */
    Config validate() const;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }
        Config cfg;
        try {
            if (j.contains("allowed_directories")) {
                for (const auto& dir : j.at("allowed_directories").get<std::vector<std::string>>()) {
                    cfg.allowedDirectories.push_back(std::filesystem::u8path(dir));
                }
            }
            cfg.allowWrite = j.value("allow_write", false);
            cfg.allowDestructive = j.value("allow_destructive", false);
            cfg.maxReadSize = j.value("max_read_size", kDefaultMaxReadSize);
            cfg.maxDepth = j.value("max_depth", kDefaultMaxDepth);
            cfg.logFile = j.value("log_file", "");
            cfg.logLevel = j.value("log_level", "info");
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }
        return cfg;
    }
};
