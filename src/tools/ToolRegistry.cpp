#include "ToolRegistry.h"
#include "utils/Logger.h"
#include <algorithm>
#include <filesystem>

namespace {
    struct TierTools {
        PermissionTier tier;
        std::vector<std::string> names;
    };

    const std::vector<TierTools>& tierTable() {
        static const std::vector<TierTools> table = {
            {PermissionTier::ReadOnly, {"list_allowed_directories", "list_directory", "read_file",
                                        "read_multiple_files", "get_file_info", "directory_tree",
                                        "search_files"}},
            {PermissionTier::Write, {"write_file", "edit_file", "create_directory"}},
            {PermissionTier::Destructive, {"delete_file", "delete_directory", "move_file"}}
        };
        return table;
    }

    std::string summarizeArgs(const nlohmann::json& args) {
        std::string dumped = args.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (dumped.size() > 200) {
            dumped = dumped.substr(0, 200) + "...";
        }
        return dumped;
    }
}

ToolRegistry::ToolRegistry(PermissionTier tier) : tier(tier) {}

std::vector<std::string> ToolRegistry::toolsForTier(PermissionTier tier) {
    std::vector<std::string> names;
    for (const auto& group : tierTable()) {
        if (tierAllows(tier, group.tier)) {
            names.insert(names.end(), group.names.begin(), group.names.end());
        }
    }
    return names;
}

bool ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return false;

    std::string name = tool->getName();
    if (!tierAllows(tier, tool->requiredTier())) {
        Logger::getInstance().debug("Tool '" + name + "' requires " + toString(tool->requiredTier()) +
                                    " permission, not registered");
        return false;
    }

    if (tools.count(name)) {
        Logger::getInstance().warn("Tool '" + name + "' registered twice, replacing");
    } else {
        order.push_back(name);
    }
    tools[name] = std::move(tool);
    return true;
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;
    schemas.reserve(order.size());

    for (const auto& name : order) {
        const ITool& tool = *tools.at(name);
        nlohmann::json schema;
        schema["name"] = tool.getName();
        schema["description"] = tool.getDescription();
        schema["inputSchema"] = tool.getSchema();
        schema["annotations"] = {
            {"readOnlyHint", tool.isReadOnly()},
            {"destructiveHint", tool.isDestructive()}
        };
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::textResult(const std::string& text) {
    nlohmann::json contentItem;
    contentItem["type"] = "text";
    contentItem["text"] = text;

    nlohmann::json result;
    result["content"] = nlohmann::json::array({contentItem});
    return result;
}

nlohmann::json ToolRegistry::errorResult(const FsError& error) {
    nlohmann::json result = textResult(error.what());
    result["isError"] = true;
    result["errorKind"] = toString(error.kind());
    result["errorCode"] = jsonRpcCode(error.kind());
    return result;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    Logger& logger = Logger::getInstance();

    ITool* tool = getTool(name);
    if (!tool) {
        logger.warn("Unknown tool requested: " + name);
        return errorResult(FsError(ErrorKind::InvalidParams, "Unknown tool: " + name));
    }

    logger.action(name + " " + summarizeArgs(args));
    try {
        return tool->execute(args);
    } catch (const FsError& e) {
        logger.warn(name + " failed [" + toString(e.kind()) + "]: " + e.what());
        return errorResult(e);
    } catch (const nlohmann::json::exception& e) {
        FsError error = FsError::invalidParams(e.what());
        logger.warn(name + " failed [" + toString(error.kind()) + "]: " + error.what());
        return errorResult(error);
    } catch (const std::filesystem::filesystem_error& e) {
        FsError error = FsError::fromErrorCode(e.code(), e.path1().u8string());
        logger.error(name + " failed [" + toString(error.kind()) + "]: " + error.what());
        return errorResult(error);
    } catch (const std::exception& e) {
        FsError error(ErrorKind::Internal, std::string("Tool execution failed: ") + e.what());
        logger.error(name + " failed: " + e.what());
        return errorResult(error);
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
