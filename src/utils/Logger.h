#pragma once
#include <string>
#include <functional>
#include <fstream>
#include <mutex>
#include <optional>

// 声明顺序即严重程度,低于最小级别的消息被丢弃
enum class LogLevel {
    DEBUG,
    INFO,
    ACTION,
    SUCCESS,
    WARNING,
    ERROR
};

/** "debug" / "info" / "action" / "success" / "warn" / "warning" / "error" (大小写不敏感) */
std::optional<LogLevel> parseLogLevel(const std::string& name);
const char* toString(LogLevel level);

/**
 * @brief 进程级日志
 *
 * 控制台输出走 stderr (stdout 专用于 JSON-RPC 协议),
 * 只有 stderr 是终端时才带 ANSI 颜色。可选追加写入日志文件。
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    LogLevel getMinLevel() {
        std::lock_guard<std::mutex> lock(mtx);
        return minLevel;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    /**
     * @brief 打开 (追加模式) 日志文件; 传空串关闭文件输出
     * @return 文件是否成功打开
     */
    bool setLogFile(const std::string& path);

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;

        writeToFile(level, message);
        if (consoleEnabled) {
            printToConsole(level, message);
        }

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void action(const std::string& m) { log(LogLevel::ACTION, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

private:
    Logger();
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    bool consoleEnabled = true;
    bool useColor = false;
    std::ofstream logFile;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
