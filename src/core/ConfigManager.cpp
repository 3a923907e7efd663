#include "core/ConfigManager.h"

namespace fs = std::filesystem;

PermissionTier permissionTierFromFlags(bool allowWrite, bool allowDestructive) {
    if (allowDestructive) return PermissionTier::Destructive;
    if (allowWrite) return PermissionTier::Write;
    return PermissionTier::ReadOnly;
}

const char* toString(PermissionTier tier) {
    switch (tier) {
        case PermissionTier::ReadOnly: return "read-only";
        case PermissionTier::Write: return "write";
        case PermissionTier::Destructive: return "destructive";
    }
    return "read-only";
}

Config Config::validate() const {
    Config out = *this;
    if (out.allowDestructive) {
        out.allowWrite = true;
    }
    if (out.allowedDirectories.empty()) {
        throw std::runtime_error("At least one allowed directory is required");
    }
    if (out.maxReadSize == 0) {
        throw std::runtime_error("max_read_size must be greater than zero");
    }
    if (out.maxDepth < 0) {
        throw std::runtime_error("max_depth must not be negative");
    }

    std::vector<fs::path> canonicalized;
    canonicalized.reserve(out.allowedDirectories.size());
    for (const auto& dir : out.allowedDirectories) {
        std::error_code ec;
        fs::path canon = fs::canonical(dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to resolve directory '" + dir.u8string() + "': " + ec.message());
        }
        if (!fs::is_directory(canon, ec)) {
            throw std::runtime_error("'" + dir.u8string() + "' is not a directory");
        }
        canonicalized.push_back(canon);
    }
    out.allowedDirectories = std::move(canonicalized);
    return out;
}
