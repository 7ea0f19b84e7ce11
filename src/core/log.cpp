#include "ambientcc/core/log.hpp"
#include <iostream>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <unistd.h>

namespace ambientcc {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel lvl) noexcept {
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level());
}

void Logger::log(LogLevel lvl, const std::string& message) noexcept {
    try {
        if (!enabled(lvl)) return;

        auto now = std::chrono::system_clock::now();
        auto tt = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm = {};
        localtime_r(&tt, &tm);

        std::ostringstream ss;
        ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(lvl) << "]";
        ss << " [" << getpid() << "]";
        ss << " " << message;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << ss.str() << std::endl;
    } catch (const std::exception&) {
        // Logging must never throw
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& lvl) noexcept {
    std::string s = name;
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "error") { lvl = LogLevel::ERROR; return true; }
    if (s == "warn" || s == "warning") { lvl = LogLevel::WARN; return true; }
    if (s == "info") { lvl = LogLevel::INFO; return true; }
    if (s == "debug") { lvl = LogLevel::DEBUG; return true; }
    if (s == "trace") { lvl = LogLevel::TRACE; return true; }
    return false;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("AMBIENTCC_LOG_LEVEL");
    LogLevel lvl = LogLevel::INFO;
    if (env_val) parseLevel(env_val, lvl);
    return lvl;
}

const char* Logger::levelToString(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

} // namespace ambientcc
