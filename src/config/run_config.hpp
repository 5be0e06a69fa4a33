/*
 * run_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Description of one emulated run

**************************************************/

#ifndef EMUFLOW_CONFIG_RUN_CONFIG_HPP
#define EMUFLOW_CONFIG_RUN_CONFIG_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging_config.hpp"
#include "task/fields.hpp"

namespace emuflow::config {

using json = nlohmann::json;

/**
 * @brief Everything needed to prepare a dispatcher for one run.
 *
 * @example
 * ```yaml
 * arch: riscv64
 * board: default
 * task-dirs: [tasks]
 * task-files: |
 *   user/mount.yml
 * devices:
 *   vivid: "vivid"
 * network: false
 * test-commands: |
 *   uname -a
 *   pytest
 * ```
 */
struct RunConfig {
    std::string arch{"riscv64"};
    std::string board{"default"};
    std::string resc{"default"};
    std::string repl{"default"};
    std::string kernel;

    std::vector<std::string> taskDirs;
    std::vector<std::string> taskFiles;

    task::VariableMap vars;
    task::VariableMap devices;
    task::VariableMap packages;

    bool network{true};

    std::string testCommands;
    std::string testYaml;
    std::string testShell{"target"};
    std::vector<std::string> testRequires{"chroot", "python"};

    LoggingConfig logging;

    /**
     * @brief Rewrites every top-level key to its hyphenated spelling
     * (`taskDirs` and `task_dirs` become `task-dirs`).
     * @throws InvalidRunConfig If @p j is not an object.
     */
    [[nodiscard]] static json normalize(const json& j);

    /**
     * @throws InvalidRunConfig On wrong value types or an invalid board.
     */
    [[nodiscard]] static RunConfig fromJson(const json& j);

    /**
     * @throws InvalidRunConfig If the text is not a YAML mapping.
     */
    [[nodiscard]] static RunConfig fromYaml(std::string_view yaml);

    /**
     * @brief Reads the raw, normalized description from a `.json`, `.yml`
     * or `.yaml` file.
     * @throws InvalidRunConfig If the file cannot be read or parsed.
     */
    [[nodiscard]] static json readFile(const std::filesystem::path& path);

    [[nodiscard]] json toJson() const;

    /**
     * @brief The board actually used: the architecture's default board when
     * `board` is "default".
     * @throws InvalidRunConfig For an unsupported architecture, or a custom
     * board without resc, repl and kernel.
     */
    [[nodiscard]] std::string resolveBoard() const;

    /**
     * @brief Device variables merged with package variables; packages win.
     */
    [[nodiscard]] task::VariableMap overrideVars() const;
};

}  // namespace emuflow::config

#endif  // EMUFLOW_CONFIG_RUN_CONFIG_HPP
