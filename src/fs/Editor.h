#pragma once
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "security/PathGuard.h"

struct TextEdit {
    std::string oldText;
    std::string newText;
};

struct EditResult {
    fs::path path;
    std::string diff;
    size_t applied = 0;
    bool dryRun = false;
};

/**
 * @brief 精确文本替换
 *
 * 编辑按顺序作用在不断累积的内容上,每一步的 oldText 必须在当前内容中恰好出现一次。
 * 全部成功后才写回文件; 任何一步失败都不会修改文件。
 */
class Editor {
public:
    Editor(const PathGuard& guard, const Config& config);

    EditResult edit(const std::string& path, const std::vector<TextEdit>& edits, bool dryRun = false) const;

    /**
     * @brief 纯函数: 依次应用编辑
     * @throws FsError NoMatch / AmbiguousMatch / InvalidParams
     */
    static std::string applyEdits(const std::string& content, const std::vector<TextEdit>& edits);

    /** oldText 在 content 中不重叠出现的次数 */
    static size_t countOccurrences(const std::string& content, const std::string& needle);

private:
    const PathGuard& guard;
    const Config& config;
};
