#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string stripTrailingNewlines(const std::string& message) {
        std::string trimmed = message;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }
        return trimmed;
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "action") return LogLevel::ACTION;
    if (lower == "success") return LogLevel::SUCCESS;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::ACTION: return "ACTION";
        case LogLevel::SUCCESS: return "SUCCESS";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger::Logger() : useColor(::isatty(STDERR_FILENO) != 0) {}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) {
        logFile.close();
    }
    if (path.empty()) {
        return true;
    }
    logFile.open(path, std::ios::app);
    return logFile.is_open();
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    logFile << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ")
            << "[" << toString(level) << "] "
            << stripTrailingNewlines(message) << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    std::string color;
    switch (level) {
        case LogLevel::DEBUG:
            color = GRAY;
            prefix = "[Debug] ";
            break;
        case LogLevel::INFO:
            color = CYAN;
            prefix = "[Info] ";
            break;
        case LogLevel::ACTION:
            color = YELLOW + BOLD;
            prefix = "[Action] ";
            break;
        case LogLevel::SUCCESS:
            color = GREEN;
            prefix = "[OK] ";
            break;
        case LogLevel::WARNING:
            color = YELLOW;
            prefix = "[Warn] ";
            break;
        case LogLevel::ERROR:
            color = RED + BOLD;
            prefix = "[Error] ";
            break;
    }
    if (useColor) {
        prefix = color + prefix + RESET;
    }

    // 多行消息每行都带前缀
    std::stringstream ss(stripTrailingNewlines(message));
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << "\n";
    }
    std::cerr.flush();
}
