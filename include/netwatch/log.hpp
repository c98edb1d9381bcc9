#ifndef NETWATCH_LOG_HPP
#define NETWATCH_LOG_HPP

#include <sstream>
#include <string>

namespace netwatch {

enum class LogLevel { Debug = 0, Info, Warning, Error, Off };

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool logEnabled(LogLevel level);

// Parses "debug", "info", "warning"/"warn", "error" or "off".
bool parseLogLevel(const std::string& text, LogLevel& level);

// Writes one line to stderr: "<time> [LEVEL] component: message".
void logMessage(LogLevel level, const char* component, const std::string& message);

} // namespace netwatch

#define NETWATCH_LOG(level, component, expr)                          \
    do {                                                              \
        if (::netwatch::logEnabled(level)) {                          \
            std::ostringstream netwatch_log_stream_;                  \
            netwatch_log_stream_ << expr;                             \
            ::netwatch::logMessage(level, component,                  \
                                   netwatch_log_stream_.str());       \
        }                                                             \
    } while (0)

#define NETWATCH_LOG_DEBUG(component, expr) NETWATCH_LOG(::netwatch::LogLevel::Debug, component, expr)
#define NETWATCH_LOG_INFO(component, expr) NETWATCH_LOG(::netwatch::LogLevel::Info, component, expr)
#define NETWATCH_LOG_WARN(component, expr) NETWATCH_LOG(::netwatch::LogLevel::Warning, component, expr)
#define NETWATCH_LOG_ERROR(component, expr) NETWATCH_LOG(::netwatch::LogLevel::Error, component, expr)

#endif
