#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

#include "common/macros.h"

namespace Common {

/// Front end of the process-wide async logger.
/// Formatting happens on the caller's stack; the record is handed to a
/// bounded MPMC queue drained by a single writer thread (see logging.cpp).
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    static constexpr size_t MAX_MSG_SIZE = 240;  // Matches the queue record payload

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t messages_dropped = 0;
        uint64_t messages_filtered = 0;
        uint64_t bytes_written = 0;
    };

    // Delete copy/move constructors
    Logger() = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    static void log(Level level, const char* format, Args&&... args) noexcept {
        if (!isEnabled(level)) {
            return;
        }
        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (UNLIKELY(len <= 0)) {
            return;
        }
        // Oversized messages are truncated, not dropped
        size_t n = static_cast<size_t>(len);
        if (n >= sizeof(buffer)) {
            n = sizeof(buffer) - 1;
        }
        write(level, buffer, n);
    }

    [[nodiscard]] static bool isEnabled(Level level) noexcept;
    [[nodiscard]] static Stats getStats() noexcept;
    [[nodiscard]] static const char* levelToString(Level level) noexcept;

private:
    static void write(Level level, const char* msg, size_t len) noexcept;
};

// ========== Global logger lifecycle ==========

/// Starts the writer thread logging into log_file (parent dirs are created).
/// A second call replaces the running logger.
void initLogging(const char* log_file);

/// Drains the queue, flushes and stops the writer thread.
void shutdownLogging();

/// Messages below this level are discarded at the call site.
void setLogLevel(Logger::Level level) noexcept;
[[nodiscard]] Logger::Level getLogLevel() noexcept;

/// Builds <dir>/<prefix>_<YYYYmmdd_HHMMSS>.log where dir comes from
/// MARKGATE_LOGS_DIR (default "logs").
bool defaultLogPath(const char* prefix, char* out, size_t out_size) noexcept;

} // namespace Common

#define LOG_DEBUG(...) ::Common::Logger::log(::Common::Logger::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  ::Common::Logger::log(::Common::Logger::INFO, __VA_ARGS__)
#define LOG_WARN(...)  ::Common::Logger::log(::Common::Logger::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ::Common::Logger::log(::Common::Logger::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) ::Common::Logger::log(::Common::Logger::FATAL, __VA_ARGS__)
