#include "mcp/McpServer.h"
#include "utils/Logger.h"
#include <istream>
#include <ostream>

McpServer::McpServer(ToolRegistry& registry, std::string version)
    : registry(registry), version(std::move(version)) {}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

size_t McpServer::run(std::istream& in, std::ostream& out) {
    size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto response = handleLine(line);
        if (line.find_first_not_of(" \t") != std::string::npos) ++handled;
        if (!response) continue;

        // 工具可能返回非 UTF-8 的文件内容,序列化时替换非法字节
        out << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        out.flush();
    }
    Logger::getInstance().info("Input closed, shutting down after " + std::to_string(handled) + " message(s)");
    return handled;
}

std::optional<nlohmann::json> McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Malformed JSON-RPC message: ") + e.what());
        return makeError(nullptr, kParseError, "Parse error");
    }

    // 批量请求: 逐条处理,只收集需要回复的部分
    if (message.is_array()) {
        if (message.empty()) {
            return makeError(nullptr, kInvalidRequest, "Invalid Request: empty batch");
        }
        nlohmann::json responses = nlohmann::json::array();
        for (const auto& item : message) {
            auto response = handleMessage(item);
            if (response) responses.push_back(*response);
        }
        if (responses.empty()) return std::nullopt;
        return responses;
    }
    return handleMessage(message);
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    const bool hasId = message.contains("id");
    nlohmann::json id = hasId ? message["id"] : nlohmann::json(nullptr);
    if (hasId && !(id.is_string() || id.is_number_integer() || id.is_null())) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request: id must be a string or integer");
    }

    if (!message.contains("method")) {
        // 客户端发来的响应 (result / error),本服务端从不发出请求,直接忽略
        if (message.contains("result") || message.contains("error")) {
            return std::nullopt;
        }
        return makeError(id, kInvalidRequest, "Invalid Request: missing method");
    }
    if (!message["method"].is_string() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (!hasId) return std::nullopt;
        return makeError(id, kInvalidRequest, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (!hasId) {
        if (method == "notifications/initialized") {
            initialized = true;
            Logger::getInstance().success("Client initialized");
        } else {
            Logger::getInstance().debug("Ignoring notification: " + method);
        }
        return std::nullopt;
    }

    if (method == "initialize") {
        return makeResult(id, handleInitialize(params));
    }
    if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return makeResult(id, handleToolsList());
    }
    if (method == "tools/call") {
        return handleToolsCall(id, params);
    }

    Logger::getInstance().warn("Method not found: " + method);
    return makeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::handleInitialize(const nlohmann::json& params) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        std::string name = client.contains("name") && client["name"].is_string()
            ? client["name"].get<std::string>() : "unknown";
        Logger::getInstance().info("Client connected: " + name);
    }

    std::string instructions =
        "This server provides sandboxed access to the local filesystem. "
        "Call list_allowed_directories first; every path must be absolute and inside one of those directories. "
        "Permission tier: " + std::string(toString(registry.getTier())) + ".";

    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", version}}},
        {"instructions", instructions}
    };
}

nlohmann::json McpServer::handleToolsList() {
    return {{"tools", registry.listToolSchemas()}};
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return makeError(id, kInvalidParams, "Invalid params: tools/call requires a string 'name'");
    }
    const std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();

    return makeResult(id, registry.executeTool(name, arguments));
}
