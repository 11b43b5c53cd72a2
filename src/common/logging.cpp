#include "common/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>
#include <vector>

namespace filewarden {
namespace common {

namespace {
// Static map for logger instances
std::unordered_map<std::string, Logger> loggers;

// Static map for level to string conversion
const std::unordered_map<LogLevel, std::string> level_to_string_map = {
    {LogLevel::TRACE, "trace"},
    {LogLevel::DEBUG, "debug"},
    {LogLevel::INFO, "info"},
    {LogLevel::WARN, "warn"},
    {LogLevel::ERROR, "error"},
    {LogLevel::CRITICAL, "critical"},
    {LogLevel::OFF, "off"}};

spdlog::level::level_enum to_spdlog(LogLevel level)
{
    return static_cast<spdlog::level::level_enum>(level);
}
} // namespace

bool initialize_logging(const LoggingConfig &config,
                        const std::string &logger_name)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_logging) {
            auto console_sink =
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog(config.console_level));
            sinks.push_back(console_sink);
        }

        if (config.file_logging) {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file_path,
                    config.max_file_size,
                    config.max_files);
            file_sink->set_level(to_spdlog(config.level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(logger_name,
                                                       sinks.begin(),
                                                       sinks.end());

        // The logger passes everything either sink wants; sinks filter
        LogLevel logger_level = config.level;
        if (config.console_logging && config.file_logging) {
            logger_level = std::min(config.level, config.console_level);
        } else if (config.console_logging) {
            logger_level = config.console_level;
        }
        logger->set_level(to_spdlog(logger_level));
        logger->set_pattern(LOG_PATTERN);
        logger->flush_on(spdlog::level::warn);

        // Re-initialization replaces the previous logger of the same name
        spdlog::drop(logger_name);
        spdlog::register_logger(logger);
        loggers[logger_name] = logger;

        if (logger_name == "filewarden") {
            // Component loggers cloned from the previous default go stale
            for (auto it = loggers.begin(); it != loggers.end();) {
                if (it->first != logger_name) {
                    it = loggers.erase(it);
                } else {
                    ++it;
                }
            }
            spdlog::set_default_logger(logger);
        }

        return true;
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Logging initialization failed: " << ex.what()
                  << std::endl;
        return false;
    }
}

bool configure_logging(const argparse::ArgumentParser &program,
                       const std::string &log_name)
{
    LoggingConfig logging_config;

    auto file_level = log_level_from_string(program.get("--log-level"));
    if (!file_level) {
        std::cerr << "Invalid log level: " << program.get("--log-level")
                  << std::endl;
        return false;
    }

    auto console_level =
        log_level_from_string(program.get("--console-log-level"));
    if (!console_level) {
        std::cerr << "Invalid console log level: "
                  << program.get("--console-log-level") << std::endl;
        return false;
    }

    logging_config.level = *file_level;
    logging_config.console_level = *console_level;
    logging_config.console_logging = !program.get<bool>("--no-console-log");
    logging_config.file_logging = !program.get<bool>("--no-file-log");
    logging_config.log_file_path = program.get("--log-file");

    if (!initialize_logging(logging_config, log_name)) {
        return false;
    }

    get_logger(log_name)->debug(
        "logging initialized (file: {} at {}, console: {} at {})",
        logging_config.file_logging ? logging_config.log_file_path : "off",
        log_level_to_string(logging_config.level),
        logging_config.console_logging ? "on" : "off",
        log_level_to_string(logging_config.console_level));
    return true;
}

Logger get_logger(const std::string &logger_name)
{
    auto it = loggers.find(logger_name);
    if (it != loggers.end()) {
        return it->second;
    }

    // Unknown components share the default logger's sinks under their own
    // name, so the component column stays meaningful
    auto default_logger = spdlog::default_logger();
    if (!default_logger) {
        return default_logger;
    }
    auto component_logger = default_logger->clone(logger_name);
    loggers[logger_name] = component_logger;
    return component_logger;
}

std::string log_level_to_string(LogLevel level)
{
    auto it = level_to_string_map.find(level);
    if (it != level_to_string_map.end()) {
        return it->second;
    }
    return "info"; // Default
}

std::optional<LogLevel> log_level_from_string(const std::string &name)
{
    std::string lowered = name;
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto &[level, level_name] : level_to_string_map) {
        if (level_name == lowered) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace common
} // namespace filewarden
