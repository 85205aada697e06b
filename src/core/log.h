#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace layerfall::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] std::optional<LogLevel> tryParseLogLevel(std::string_view text);
[[nodiscard]] LogLevel parseLogLevel(std::string_view text, LogLevel fallback);
[[nodiscard]] const char* logLevelName(LogLevel level);

// Replaces the console writer. An empty sink restores it.
void setLogSink(LogSink sink);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace layerfall::core

#define LF_LOG_STREAM(level, category) \
    if (!::layerfall::core::shouldLog(level)) {} else ::layerfall::core::LogLine((level), (category)).stream()

#define LF_LOGE(category) LF_LOG_STREAM(::layerfall::core::LogLevel::Error, (category))
#define LF_LOGW(category) LF_LOG_STREAM(::layerfall::core::LogLevel::Warn, (category))
#define LF_LOGI(category) LF_LOG_STREAM(::layerfall::core::LogLevel::Info, (category))
#define LF_LOGD(category) LF_LOG_STREAM(::layerfall::core::LogLevel::Debug, (category))
#define LF_LOGT(category) LF_LOG_STREAM(::layerfall::core::LogLevel::Trace, (category))
