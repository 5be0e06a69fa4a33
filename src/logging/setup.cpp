/*
 * setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "setup.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace emuflow::logging {

namespace {

constexpr const char* LOGGER_NAME = "emuflow";

auto createConsoleSink(const config::LoggingConfig& config)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (config.consoleColor) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(levelFromString(config.consoleLevel));
    sink->set_pattern(config.pattern);
    return sink;
}

auto createFileSink(const config::LoggingConfig& config) -> spdlog::sink_ptr {
    std::filesystem::path path =
        std::filesystem::path(config.logDir) / (config.logFilename + ".log");
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        path.string(), config.truncate);
    sink->set_level(levelFromString(config.fileLevel));
    sink->set_pattern(config.pattern);
    return sink;
}

void install(std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                   sinks.end());
    auto level = spdlog::level::off;
    for (const auto& sink : sinks) {
        level = std::min(level, sink->level());
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

}  // namespace

spdlog::level::level_enum levelFromString(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical" || level == "fatal") return spdlog::level::critical;
    if (level == "off" || level == "none") return spdlog::level::off;
    return spdlog::level::info;
}

void initLogging(const config::LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(createConsoleSink(config));
    }

    std::string fileError;
    if (config.enableFile) {
        try {
            sinks.push_back(createFileSink(config));
        } catch (const std::exception& e) {
            fileError = e.what();
            if (!config.enableConsole) {
                sinks.push_back(createConsoleSink(config));
            }
        }
    }

    install(std::move(sinks));
    if (!fileError.empty()) {
        spdlog::warn("Cannot create log file in '{}': {}", config.logDir,
                     fileError);
    }
}

void initDefaultLogging() {
    config::LoggingConfig config;
    config.enableFile = false;
    initLogging(config);
}

void setLevel(const std::string& level) {
    auto value = levelFromString(level);
    auto logger = spdlog::default_logger();
    for (const auto& sink : logger->sinks()) {
        sink->set_level(value);
    }
    logger->set_level(value);
}

}  // namespace emuflow::logging
