#pragma once

#include <string>

#include <spdlog/logger.h>

using Logger = spdlog::logger;

// Sets the default root log level, and for any logger subsequently created by logger_for.
// Probably only worthwhile calling before any Loggers are created (e.g. in main()).
void set_log_level(spdlog::level::level_enum level);
// All loggers share a single colour sink on stderr, leaving stdout for program output.
Logger logger_for(std::string name);

// Logs each message of a list on its own line.
template <typename Messages>
void log_each(Logger &logger, spdlog::level::level_enum level, const Messages &messages) {
    for (const auto &message : messages)
        logger.log(level, "{}", message);
}
