#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "mcp/McpServer.h"
#include "tools/FsTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Format.h"
#include "utils/Logger.h"
#include <iostream>

#ifndef PALISADE_VERSION
#define PALISADE_VERSION "0.1.0"
#endif

namespace {
    void logStartup(const Config& cfg, size_t toolCount) {
        Logger& logger = Logger::getInstance();
        logger.info(std::string("palisade ") + PALISADE_VERSION + " starting (MCP " +
                    McpServer::kProtocolVersion + ", stdio)");
        for (const auto& dir : cfg.allowedDirectories) {
            logger.info("Allowed directory: " + dir.u8string());
        }
        logger.info(std::string("Permission tier: ") + toString(cfg.tier()) + ", " +
                    std::to_string(toolCount) + " tool(s) registered");
        logger.info("Max read size: " + FormatUtils::formatSize(cfg.maxReadSize) +
                    ", max depth: " + std::to_string(cfg.maxDepth));
    }
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? fs::u8path(argv[0]).filename().u8string() : "palisade";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLineOptions options;
    try {
        options = parseCommandLine(args);
    } catch (const UsageError& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << usageText(program);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << std::endl;
        return 1;
    }

    if (options.action == CommandLineOptions::Action::Help) {
        std::cout << usageText(program);
        return 0;
    }
    if (options.action == CommandLineOptions::Action::Version) {
        std::cout << "palisade " << PALISADE_VERSION << std::endl;
        return 0;
    }

    Logger& logger = Logger::getInstance();
    auto level = parseLogLevel(options.config.logLevel);
    if (!level) {
        std::cerr << program << ": unknown log level '" << options.config.logLevel << "'" << std::endl;
        return 2;
    }
    logger.setMinLevel(*level);
    if (!options.config.logFile.empty() && !logger.setLogFile(options.config.logFile)) {
        std::cerr << program << ": cannot open log file '" << options.config.logFile << "'" << std::endl;
        return 1;
    }

    Config cfg;
    try {
        cfg = options.config.validate();
    } catch (const std::exception& e) {
        logger.error(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    FilesystemContext context(cfg);
    ToolRegistry registry(cfg.tier());
    size_t toolCount = registerFilesystemTools(registry, context);
    logStartup(cfg, toolCount);

    McpServer server(registry, PALISADE_VERSION);
    try {
        server.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
    return 0;
}
