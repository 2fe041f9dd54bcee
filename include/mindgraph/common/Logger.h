#pragma once

#include "mindgraph/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace mindgraph {

/// Logging section of EngineConfig
struct LoggingOptions {
    /// Minimum level; unset keeps the backend's own default
    /// (info, or LOG_LEVEL / SPDLOG_LEVEL from the environment)
    std::optional<LogLevel> level;

    /// Directory for mindgraph.log; console only when empty
    std::string logDir;

    bool logToFile = false;
};

/**
 * @brief Process-wide logging facade for the engine
 *
 * Every line is prefixed with the calling function, e.g.
 * "BoardSession::persistNow() - Saving board 'b1' failed: disk full".
 *
 * The backend is an spdlog console logger created on first use unless the
 * host injects its own ILoggerBackend or calls configure() first. Lines can
 * also be captured in memory so tests can assert on fail-soft paths that
 * only log.
 *
 * The facade is thread-safe; the engine itself logs from the session thread.
 *
 * @code
 * mindgraph::Logger::configure(config.logging);
 * LOG_INFO("Loaded board '{}': {} nodes", boardId, count);
 * @endcode
 */
class Logger {
public:
    /// Inject a host backend (ownership transferred). nullptr resets to the default.
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the default console backend if none is installed
    static void initialize();

    /// Install the spdlog backend described by `options` (file sink when
    /// requested) unless a backend already exists, then apply the level
    static void configure(const LoggingOptions& options);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    /// While enabled, every line is also kept in memory regardless of the
    /// backend level, formatted "[<level>] <function>() - <message>"
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured lines with optional filtering
     * @param pattern Substring filter (empty = all lines)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     * @return Matching lines, oldest first
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& line);
};

/// Captures log lines for the lifetime of the object, starting from an
/// empty buffer and clearing it again on destruction.
class ScopedLogCapture {
public:
    ScopedLogCapture();
    ~ScopedLogCapture();

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    std::vector<std::string> lines(const std::string& pattern = "") const {
        return Logger::getCapturedLogs(pattern);
    }

    bool contains(const std::string& pattern) const { return !lines(pattern).empty(); }
};

}  // namespace mindgraph

// Logging macros with std::format support
#define LOG_TRACE(...) mindgraph::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) mindgraph::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  mindgraph::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  mindgraph::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) mindgraph::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
