/*
 * loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "loader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "exception.hpp"
#include "spdlog/spdlog.h"

namespace emuflow::task {

bool TaskLoader::isTaskFile(const fs::path& path) {
    auto ext = path.extension().string();
    return ext == ".yml" || ext == ".yaml" || ext == ".json";
}

Task TaskLoader::loadFile(const fs::path& path, const json& overrides) {
    spdlog::info("Loading task definition: {}", path.string());

    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open task file: {}", path.string());
        THROW_INVALID_TASK_DEFINITION("Cannot open task file: " +
                                      path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    try {
        if (path.extension() == ".json") {
            return Task::fromJson(json::parse(buffer.str()), overrides);
        }
        return Task::fromYaml(buffer.str(), overrides);
    } catch (const json::exception& e) {
        spdlog::error("Invalid JSON in {}: {}", path.string(), e.what());
        THROW_INVALID_TASK_DEFINITION("Invalid JSON in " + path.string() +
                                      ": " + e.what());
    } catch (const InvalidTaskDefinition& e) {
        spdlog::error("Invalid task definition in {}: {}", path.string(),
                      e.what());
        throw;
    }
}

std::vector<Task> TaskLoader::loadDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::error("Task directory not found: {}", dir.string());
        THROW_INVALID_TASK_DEFINITION("Task directory not found: " +
                                      dir.string());
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && isTaskFile(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.filename() < b.filename();
              });

    std::vector<Task> tasks;
    tasks.reserve(files.size());
    for (const auto& file : files) {
        tasks.push_back(loadFile(file));
    }
    spdlog::info("Loaded {} tasks from {}", tasks.size(), dir.string());
    return tasks;
}

}  // namespace emuflow::task
