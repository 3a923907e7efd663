#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"
#include "core/ConfigManager.h"
#include "core/FsError.h"

/**
 * @brief 工具注册中心
 *
 * 按启动时确定的权限等级登记工具: 超出等级的工具不会被注册,
 * 既不会出现在 tools/list 中,调用时也与未知工具的处理完全相同。
 */
class ToolRegistry {
public:
    explicit ToolRegistry(PermissionTier tier);
    ~ToolRegistry() = default;

    /**
     * @brief 某个权限等级下允许的全部工具名 (按注册顺序)
     */
    static std::vector<std::string> toolsForTier(PermissionTier tier);

    /**
     * @brief 注册一个工具
     * @param tool 工具实例 (unique_ptr 转移所有权)
     * @return 工具所需权限超出当前等级时返回 false,工具被丢弃
     */
    bool registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief 列出所有工具的定义 (MCP tools/list 格式)
     *
     * 格式:
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema },
     *     "annotations": {"readOnlyHint": true, "destructiveHint": false}
     *   }
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief 执行工具
     *
     * 工具抛出的 FsError 被转换为:
     * {"content":[{"type":"text","text":msg}], "isError":true, "errorKind":"...", "errorCode":-32602}
     * 未知工具返回 "Unknown tool: xxx"。
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

    PermissionTier getTier() const { return tier; }

    static nlohmann::json textResult(const std::string& text);
    static nlohmann::json errorResult(const FsError& error);

private:
    PermissionTier tier;
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
};
