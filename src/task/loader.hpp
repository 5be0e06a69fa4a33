/*
 * loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Loads task definitions from YAML and JSON files

**************************************************/

#ifndef EMUFLOW_TASK_LOADER_HPP
#define EMUFLOW_TASK_LOADER_HPP

#include <filesystem>
#include <vector>

#include "task.hpp"

namespace emuflow::task {

namespace fs = std::filesystem;

/**
 * @class TaskLoader
 * @brief Reads task definition files (`.yml`, `.yaml`, `.json`).
 */
class TaskLoader {
public:
    /**
     * @brief Loads one task definition file.
     *
     * @param path File to load.
     * @param overrides Fields merged over the file's mapping.
     * @throws InvalidTaskDefinition If the file cannot be read or parsed, or
     * its content is not a valid task.
     */
    [[nodiscard]] static Task loadFile(const fs::path& path,
                                       const json& overrides = json::object());

    /**
     * @brief Loads every task file of a directory, sorted by file name.
     * Files with other extensions are ignored.
     *
     * @throws InvalidTaskDefinition If the directory does not exist or a file
     * is invalid.
     */
    [[nodiscard]] static std::vector<Task> loadDirectory(const fs::path& dir);

    [[nodiscard]] static bool isTaskFile(const fs::path& path);
};

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_LOADER_HPP
