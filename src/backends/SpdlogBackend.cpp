#include "mindgraph/backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mindgraph {

namespace {

constexpr const char* LOGGER_NAME = "mindgraph";
constexpr const char* LOG_FILE_NAME = "mindgraph.log";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [mindgraph] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel fromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info: return LogLevel::Info;
        case spdlog::level::warn: return LogLevel::Warn;
        case spdlog::level::off: return LogLevel::Off;
        default: return LogLevel::Error;
    }
}

std::optional<LogLevel> levelFromEnvironment() {
    const char* value = std::getenv("LOG_LEVEL");
    if (!value) {
        value = std::getenv("SPDLOG_LEVEL");
    }
    if (!value) {
        return std::nullopt;
    }
    return parseLogLevel(value);
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    if (logDir.empty() || !logToFile) {
        // Reuse the registered logger when the backend is recreated
        logger_ = spdlog::get(LOGGER_NAME);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(LOGGER_NAME);
        }
        logger_->set_pattern(CONSOLE_PATTERN);
    } else {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);

        std::filesystem::create_directories(logDir);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / LOG_FILE_NAME).string(), true);
        fileSink->set_pattern(FILE_PATTERN);

        spdlog::drop(LOGGER_NAME);
        logger_ = std::make_shared<spdlog::logger>(
            LOGGER_NAME, spdlog::sinks_init_list{consoleSink, fileSink});
        spdlog::register_logger(logger_);
    }

    logger_->set_level(toSpdlog(levelFromEnvironment().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(toSpdlog(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

LogLevel SpdlogBackend::level() const {
    return fromSpdlog(logger_->level());
}

}  // namespace mindgraph
