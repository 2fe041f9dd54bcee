#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mindgraph {

/// Severity of an engine log line. The engine never logs above Error.
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Lower-case name ("trace" ... "off"), also used as the capture tag
const char* logLevelName(LogLevel level);

/// Case-insensitive inverse of logLevelName(); accepts "warning" and "err".
/// nullopt for anything else.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Destination of engine log lines
 *
 * A host that already has a logging system implements this to receive
 * layout, history and persistence diagnostics through it instead of the
 * default spdlog console logger.
 *
 * @code
 * class HostLogger : public mindgraph::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host->setMinLevel(level); }
 *     void flush() override { host->flush(); }
 * };
 *
 * mindgraph::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace mindgraph
