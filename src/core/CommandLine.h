#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "core/ConfigManager.h"

/** 命令行用法错误 (进程以退出码 2 结束) */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLineOptions {
    enum class Action {
        Run,
        Help,
        Version
    };

    Action action = Action::Run;
    Config config;
};

/**
 * @brief 解析命令行参数 (不含 argv[0])
 *
 * palisade [options] <dir>...
 * --config FILE 先加载 JSON 配置,其余选项和位置参数在其之上覆盖 / 追加。
 * 返回的 config 尚未 validate()。
 *
 * @throws UsageError 未知选项、缺少参数值、数值非法、没有任何目录
 * @throws std::runtime_error 配置文件无法读取或解析
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

std::string usageText(const std::string& program);
