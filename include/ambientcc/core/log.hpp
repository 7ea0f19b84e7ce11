#pragma once

#include <cstdint>
#include <string>

namespace ambientcc {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

/**
 * Logger - Process-wide leveled logging to stderr
 *
 * The initial level comes from AMBIENTCC_LOG_LEVEL (error, warn, info,
 * debug, trace) and defaults to info. Lines carry the process id so the
 * output of concurrent workers can be told apart.
 */
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    static bool parseLevel(const std::string& name, LogLevel& level) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

} // namespace ambientcc

#define LOG_ERROR(msg) ::ambientcc::Logger::error(msg)
#define LOG_WARN(msg)  ::ambientcc::Logger::warn(msg)
#define LOG_INFO(msg)  ::ambientcc::Logger::info(msg)
#define LOG_DEBUG(msg) \
    do { if (::ambientcc::Logger::enabled(::ambientcc::LogLevel::DEBUG)) \
        ::ambientcc::Logger::debug(msg); } while (0)
#define LOG_TRACE(msg) \
    do { if (::ambientcc::Logger::enabled(::ambientcc::LogLevel::TRACE)) \
        ::ambientcc::Logger::trace(msg); } while (0)
