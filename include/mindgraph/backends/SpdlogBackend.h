#pragma once

#include "mindgraph/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace mindgraph {

/// Default backend: the "mindgraph" spdlog logger.
///
/// Console sink always; `<logDir>/mindgraph.log` is added when `logToFile`
/// is set and `logDir` is not empty. Starts at info, overridable through the
/// LOG_LEVEL or SPDLOG_LEVEL environment variable.
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Level of the underlying spdlog logger
    LogLevel level() const;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mindgraph
