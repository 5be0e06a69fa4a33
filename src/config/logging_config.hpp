/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Logging section of the run configuration

**************************************************/

#ifndef EMUFLOW_CONFIG_LOGGING_CONFIG_HPP
#define EMUFLOW_CONFIG_LOGGING_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

namespace emuflow::config {

using json = nlohmann::json;

/**
 * @brief Logging configuration
 *
 * @example
 * ```yaml
 * logging:
 *   consoleLevel: info
 *   consoleColor: true
 *   enableFile: true
 *   logDir: logs
 *   logFilename: emuflow
 *   fileLevel: trace
 * ```
 */
struct LoggingConfig {
    // Console
    bool enableConsole{true};
    std::string consoleLevel{"info"};
    bool consoleColor{true};

    // File
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"emuflow"};
    std::string fileLevel{"trace"};
    bool truncate{true};  ///< Start a fresh log file for every run

    /// Placeholders: %Y %m %d %H %M %S %e (milliseconds), %l (level),
    /// %t (thread id), %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json toJson() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"truncate", truncate},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.truncate = j.value("truncate", cfg.truncate);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

}  // namespace emuflow::config

#endif  // EMUFLOW_CONFIG_LOGGING_CONFIG_HPP
