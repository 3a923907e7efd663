#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"

/**
 * @brief 工具接口定义
 *
 * 每个工具对应一个 MCP tool,是单一的文件系统操作。
 * 路径校验和错误分类在 fs/ 层完成,工具只负责参数解析和结果格式化。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具的唯一标识名称 (tools/call 中的 name)
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取参数的 JSON Schema (MCP inputSchema)
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 注册该工具所需的最低权限等级
     */
    virtual PermissionTier requiredTier() const = 0;

    /** MCP annotations.destructiveHint */
    virtual bool isDestructive() const { return false; }

    /** MCP annotations.readOnlyHint */
    bool isReadOnly() const { return requiredTier() == PermissionTier::ReadOnly; }

    /**
     * @brief 执行工具操作
     * @param args 工具参数 (JSON 对象)
     * @return MCP CallToolResult:
     * {
     *   "content": [
     *     {"type": "text", "text": "结果内容"}
     *   ],
     *   ...结构化字段
     * }
     * @throws FsError 失败时抛出,由 ToolRegistry 转换为 isError 结果
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
