#pragma once
#include <regex>
#include <string>

/**
 * @brief glob 匹配 (编译为 ECMAScript 正则)
 *
 * 方言:
 * - 始终区分大小写,按字节比较
 * - `*`  匹配不含 `/` 的任意串; `**` 匹配包含 `/` 的任意串; `**` + `/` 也可匹配零层目录
 * - `?`  匹配一个非 `/` 字符
 * - `[abc]` `[a-z]` `[!abc]` 字符类 (不会匹配 `/`)
 * - `{a,b}` 多选,可嵌套
 * - `\x` 转义
 *
 * 模式不含 `/` 时只匹配条目名; 否则匹配相对于搜索根目录的路径 (统一用 `/` 分隔)。
 */
class GlobMatcher {
public:
    /** @throws FsError(InvalidParams) 模式非法 (未闭合的 [ 或 {) */
    explicit GlobMatcher(const std::string& pattern);

    bool matches(const std::string& name, const std::string& relativePath) const;

    bool isPathPattern() const { return pathMode; }
    const std::string& getPattern() const { return source; }

    static std::string toRegex(const std::string& glob);

private:
    std::string source;
    std::regex compiled;
    bool pathMode;
};
