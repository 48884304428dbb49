#pragma once

#include "promptcalc/core/ErrorTypes.h"

#include <functional>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace promptcalc::core {

/**
 * @brief 错误构造 + 结构化日志
 *
 * 核心层没有 I/O，也没有可重试的失败；这里只负责把前置条件/配置类错误
 * 组装成 ErrorInfo，并以统一格式输出到 stderr（或测试注入的 sink）。
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Warning};
        bool enabled{true};
    };

    // 每条日志一行（已带换行）
    using LogSink = std::function<void(const std::string& line)>;

    ErrorHandler();
    explicit ErrorHandler(LoggerConfig cfg);

    void setLoggerConfig(LoggerConfig cfg);
    const LoggerConfig& getLoggerConfig() const;

    // 为空时恢复默认 stderr 输出
    void setSink(LogSink sink);

    // 从配置节点（形如 {"min_level": "INFO", "enabled": true}）更新日志配置；
    // 未识别的级别保持原值并返回 false
    bool applyLoggingConfig(const nlohmann::json& loggingNode);

    // ========== 错误构造 ==========
    static ErrorInfo makeError(ErrorType type,
                               const std::string& message,
                               const std::optional<nlohmann::json>& details = std::nullopt);

    // err 非空时填充，便于 `ErrorInfo* err` 出参风格的调用方直接使用
    static void fill(ErrorInfo* err,
                     ErrorType type,
                     const std::string& message,
                     const std::optional<nlohmann::json>& details = std::nullopt);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);
    static std::optional<LogLevel> logLevelFromString(const std::string& value);

private:
    LoggerConfig m_loggerCfg;
    LogSink m_sink;
};

} // namespace promptcalc::core
