/*
 * setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Installs the process-wide spdlog logger

**************************************************/

#ifndef EMUFLOW_LOGGING_SETUP_HPP
#define EMUFLOW_LOGGING_SETUP_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "config/logging_config.hpp"

namespace emuflow::logging {

/**
 * @brief Converts a level name ("trace", "warning", "err", ...) to an
 * spdlog level. Unknown names map to info.
 */
[[nodiscard]] spdlog::level::level_enum levelFromString(
    const std::string& level);

/**
 * @brief Creates the console and file sinks described by @p config and
 * makes a logger over them the spdlog default.
 *
 * Falls back to console only when the log file cannot be created.
 */
void initLogging(const config::LoggingConfig& config);

/**
 * @brief Console-only logging at info level, used before the run
 * configuration is read.
 */
void initDefaultLogging();

/**
 * @brief Changes the level of the default logger and all of its sinks.
 */
void setLevel(const std::string& level);

}  // namespace emuflow::logging

#endif  // EMUFLOW_LOGGING_SETUP_HPP
