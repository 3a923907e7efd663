#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "tools/ToolRegistry.h"

/**
 * @brief MCP 服务端 (JSON-RPC 2.0, 每行一条消息)
 *
 * 生产环境读写 stdin/stdout,测试中使用字符串流。
 * 一次只处理一条请求; 通知 (没有 id 的消息) 永远不回复。
 */
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "palisade";

    // JSON-RPC 协议错误码
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;

    McpServer(ToolRegistry& registry, std::string version);

    /**
     * @brief 读取直到 EOF
     * @return 处理的消息行数
     */
    size_t run(std::istream& in, std::ostream& out);

    /**
     * @brief 处理一行原始输入
     * @return 需要写回的响应; 通知和空行返回 std::nullopt
     */
    std::optional<nlohmann::json> handleLine(const std::string& line);

    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

    bool isInitialized() const { return initialized; }

private:
    ToolRegistry& registry;
    std::string version;
    bool initialized = false;

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
};
