#pragma once
#include <string>
#include <vector>

/**
 * @brief 行级 unified diff 生成
 *
 * 使用 Myers 差分算法 (先去掉公共前后缀),输出 GNU diff 风格:
 *   --- oldLabel
 *   +++ newLabel
 *   @@ -a,b +c,d @@
 * 缺少结尾换行的行后附加 "\ No newline at end of file"。
 */
namespace UnifiedDiff {

    struct DiffOp {
        enum class Kind { Equal, Delete, Insert };
        Kind kind;
        size_t oldIndex;  // Delete / Equal 有效
        size_t newIndex;  // Insert / Equal 有效
    };

    /** 按行切分,每行保留自身的 '\n' (最后一行可能没有) */
    std::vector<std::string> splitLines(const std::string& text);

    std::vector<DiffOp> diffLines(const std::vector<std::string>& a, const std::vector<std::string>& b);

    /**
     * @return 内容相同时返回空串
     */
    std::string generate(const std::string& oldText, const std::string& newText,
                         const std::string& oldLabel, const std::string& newLabel,
                         size_t context = 3);
}
