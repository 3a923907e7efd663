#include "core/CommandLine.h"
#include "utils/Logger.h"
#include <cctype>

namespace fs = std::filesystem;

namespace {
    bool isAllDigits(const std::string& s) {
        if (s.empty()) return false;
        for (unsigned char c : s) {
            if (!std::isdigit(c)) return false;
        }
        return true;
    }

    std::uintmax_t parseSize(const std::string& option, const std::string& value) {
        if (!isAllDigits(value)) {
            throw UsageError(option + " expects a positive integer, got '" + value + "'");
        }
        try {
            return std::stoull(value);
        } catch (const std::out_of_range&) {
            throw UsageError(option + " value out of range: " + value);
        }
    }

    int parseDepth(const std::string& option, const std::string& value) {
        if (!isAllDigits(value)) {
            throw UsageError(option + " expects a non-negative integer, got '" + value + "'");
        }
        try {
            return std::stoi(value);
        } catch (const std::out_of_range&) {
            throw UsageError(option + " value out of range: " + value);
        }
    }

    // 拆分 --name=value
    void splitOption(const std::string& arg, std::string& name, std::string& inlineValue, bool& hasInline) {
        size_t eq = arg.find('=');
        hasInline = arg.rfind("--", 0) == 0 && eq != std::string::npos;
        name = hasInline ? arg.substr(0, eq) : arg;
        inlineValue = hasInline ? arg.substr(eq + 1) : "";
    }
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options] <dir>...\n"
           "\n"
           "Serve the given directories to an MCP client over stdin/stdout.\n"
           "\n"
           "Options:\n"
           "  --allow-write          enable write_file, edit_file, create_directory\n"
           "  --allow-destructive    also enable delete_file, delete_directory, move_file (implies --allow-write)\n"
           "  --max-read-size N      maximum bytes for a full read_file (default 10485760)\n"
           "  --max-depth N          maximum traversal depth for directory_tree/search_files (default 10)\n"
           "  --config FILE          load settings from a JSON file; flags and directories extend it\n"
           "  --log-file FILE        append log output to FILE\n"
           "  --log-level LEVEL      debug, info, warn or error (default info)\n"
           "  --version              print version and exit\n"
           "  -h, --help             print this help and exit\n";
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    // 先找 --config,命令行上的其余设置覆盖配置文件
    for (size_t i = 0; i < args.size(); ++i) {
        std::string name, value;
        bool hasInline = false;
        splitOption(args[i], name, value, hasInline);
        if (name != "--config") continue;
        if (!hasInline) {
            if (i + 1 >= args.size()) throw UsageError("--config requires a value");
            value = args[++i];
        }
        options.config = Config::load(value);
    }

    Config& config = options.config;
    bool optionsEnded = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-") {
            config.allowedDirectories.push_back(fs::u8path(arg));
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        std::string name, inlineValue;
        bool hasInline = false;
        splitOption(arg, name, inlineValue, hasInline);

        auto takeValue = [&]() -> std::string {
            if (hasInline) return inlineValue;
            if (i + 1 >= args.size()) throw UsageError(name + " requires a value");
            return args[++i];
        };
        auto noValue = [&]() {
            if (hasInline) throw UsageError(name + " does not take a value");
        };

        if (name == "-h" || name == "--help") {
            options.action = CommandLineOptions::Action::Help;
            return options;
        } else if (name == "--version") {
            options.action = CommandLineOptions::Action::Version;
            return options;
        } else if (name == "--allow-write") {
            noValue();
            config.allowWrite = true;
        } else if (name == "--allow-destructive") {
            noValue();
            config.allowWrite = true;
            config.allowDestructive = true;
        } else if (name == "--max-read-size") {
            config.maxReadSize = parseSize(name, takeValue());
            if (config.maxReadSize == 0) throw UsageError("--max-read-size must be greater than zero");
        } else if (name == "--max-depth") {
            config.maxDepth = parseDepth(name, takeValue());
        } else if (name == "--config") {
            takeValue();  // 已在第一遍处理
        } else if (name == "--log-file") {
            config.logFile = takeValue();
        } else if (name == "--log-level") {
            std::string level = takeValue();
            if (!parseLogLevel(level)) {
                throw UsageError("Unknown log level: " + level);
            }
            config.logLevel = level;
        } else {
            throw UsageError("Unknown option: " + arg);
        }
    }

    if (config.allowedDirectories.empty()) {
        throw UsageError("At least one allowed directory is required");
    }
    return options;
}
