#ifndef FILEWARDEN_COMMON_LOGGING_HPP
#define FILEWARDEN_COMMON_LOGGING_HPP

#include <argparse/argparse.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace filewarden {
namespace common {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Enum that mirrors spdlog::level::level_enum but is part of our API
 */
enum class LogLevel {
    TRACE = spdlog::level::trace,
    DEBUG = spdlog::level::debug,
    INFO = spdlog::level::info,
    WARN = spdlog::level::warn,
    ERROR = spdlog::level::err,
    CRITICAL = spdlog::level::critical,
    OFF = spdlog::level::off
};

/**
 * Logging configuration for the application
 *
 * The console and the log file are separate sinks with separate levels, so
 * the terminal can stay quiet while the file keeps the debug trail.
 */
struct LoggingConfig {
    LogLevel level = LogLevel::DEBUG;         // Level of the file sink
    LogLevel console_level = LogLevel::INFO;  // Level of the console sink
    bool console_logging = true;              // Whether to log to console
    bool file_logging = true;                 // Whether to log to file
    std::string log_file_path = "filewarden.log";
    size_t max_file_size = 1048576; // Maximum size of log file in bytes (1 MB)
    size_t max_files = 3;           // Maximum number of log files to keep
};

/**
 * Line layout shared by every sink: timestamp - component - level - message
 */
inline constexpr const char *LOG_PATTERN = "%Y-%m-%d %H:%M:%S - %n - %l - %v";

/**
 * Initialize the logging system
 *
 * Creates a logger with the configured sinks and registers it with spdlog.
 * The "filewarden" logger also becomes the default logger, so component
 * loggers that were never initialized fall back to it.
 *
 * @param config Logging configuration
 * @param logger_name Name of the logger
 * @return Whether initialization succeeded
 */
bool initialize_logging(const LoggingConfig &config,
                        const std::string &logger_name = "filewarden");

/**
 * Configure and initialize logging based on command line arguments
 *
 * Reads --log-level, --console-log-level, --log-file, --no-file-log and
 * --no-console-log.
 *
 * @param program Argument parser with command line arguments
 * @param log_name Name of the logger to create
 * @return Whether configuration succeeded
 */
bool configure_logging(const argparse::ArgumentParser &program,
                       const std::string &log_name = "filewarden");

/**
 * Get the logger instance
 *
 * @param logger_name Name of the logger to get
 * @return Logger instance
 */
Logger get_logger(const std::string &logger_name = "filewarden");

/**
 * Convert a LogLevel to string representation
 *
 * @param level Log level to convert
 * @return String representation of the log level
 */
std::string log_level_to_string(LogLevel level);

/**
 * Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off")
 *
 * @param name Level name, case-insensitive
 * @return The level, or std::nullopt for an unknown name
 */
std::optional<LogLevel> log_level_from_string(const std::string &name);

} // namespace common
} // namespace filewarden

#endif // FILEWARDEN_COMMON_LOGGING_HPP
