#include "promptcalc/core/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

namespace promptcalc::core {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string trimUpperCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

ErrorHandler::ErrorHandler()
    : m_loggerCfg(LoggerConfig{})
{}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    m_loggerCfg = cfg;
}

const ErrorHandler::LoggerConfig& ErrorHandler::getLoggerConfig() const {
    return m_loggerCfg;
}

void ErrorHandler::setSink(LogSink sink) {
    m_sink = std::move(sink);
}

bool ErrorHandler::applyLoggingConfig(const nlohmann::json& loggingNode) {
    if (!loggingNode.is_object()) return false;

    bool ok = true;
    if (loggingNode.contains("enabled") && loggingNode["enabled"].is_boolean()) {
        m_loggerCfg.enabled = loggingNode["enabled"].get<bool>();
    }
    if (loggingNode.contains("min_level")) {
        const auto& v = loggingNode["min_level"];
        std::optional<LogLevel> lv;
        if (v.is_string()) lv = logLevelFromString(v.get<std::string>());
        if (lv.has_value()) {
            m_loggerCfg.minLevel = *lv;
        } else {
            ok = false;
        }
    }
    return ok;
}

ErrorInfo ErrorHandler::makeError(ErrorType type,
                                  const std::string& message,
                                  const std::optional<nlohmann::json>& details) {
    ErrorInfo info;
    info.errorType = type;
    info.errorCode = 0;
    info.message = message;
    info.details = details;
    return info;
}

void ErrorHandler::fill(ErrorInfo* err,
                        ErrorType type,
                        const std::string& message,
                        const std::optional<nlohmann::json>& details) {
    if (!err) return;
    *err = makeError(type, message, details);
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::logLevelFromString(const std::string& value) {
    const auto v = trimUpperCopy(value);
    if (v == "ERROR") return LogLevel::Error;
    if (v == "WARNING" || v == "WARN") return LogLevel::Warning;
    if (v == "INFO") return LogLevel::Info;
    if (v == "DEBUG") return LogLevel::Debug;
    return std::nullopt;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled) return;

    auto levelRank = [](LogLevel lv) {
        switch (lv) {
            case LogLevel::Error: return 0;
            case LogLevel::Warning: return 1;
            case LogLevel::Info: return 2;
            default: return 3;
        }
    };
    if (levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;

    // 结构化输出：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";

    const auto line = oss.str();
    if (m_sink) {
        m_sink(line);
        return;
    }
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace promptcalc::core
