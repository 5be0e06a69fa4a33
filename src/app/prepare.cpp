/*
 * prepare.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "prepare.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "atom/utils/string.hpp"
#include "spdlog/spdlog.h"
#include "task/loader.hpp"

namespace emuflow::app {

namespace {

constexpr std::array<const char*, 3> NETWORK_TASKS = {
    "host_network", "renode_network", "target_network"};

void registerTask(dispatch::Dispatcher& dispatcher, task::Task task) {
    spdlog::debug("Adding task '{}' ({} commands)", task.getName(),
                  task.getCommands().size());
    dispatcher.addTask(std::move(task));
}

}  // namespace

std::string formatLocalTime(const std::chrono::system_clock::time_point& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::unique_ptr<dispatch::Dispatcher> prepareDispatcher(
    const config::RunConfig& config, shell::SessionFactory sessionFactory) {
    auto board = config.resolveBoard();
    spdlog::info("Preparing run for {} on board {}", config.arch, board);

    dispatch::DispatcherContext context;
    context.globalVars = {
        {"NOW", formatLocalTime(std::chrono::system_clock::now())},
        {"BOARD", board},
        {"ARCH", config.arch}};
    for (const auto& [name, value] : config.vars) {
        context.globalVars[name] = value;
    }
    context.overrideVars = config.overrideVars();

    auto dispatcher = std::make_unique<dispatch::Dispatcher>(
        std::move(context), std::move(sessionFactory));

    for (const auto& dir : config.taskDirs) {
        for (auto& task : task::TaskLoader::loadDirectory(dir)) {
            registerTask(*dispatcher, std::move(task));
        }
    }
    for (const auto& file : config.taskFiles) {
        registerTask(*dispatcher, task::TaskLoader::loadFile(file));
    }

    nlohmann::json testFields = {{"name", TEST_TASK_NAME},
                                 {"shell", config.testShell},
                                 {"requires", config.testRequires}};
    if (!atom::utils::trim(config.testYaml).empty()) {
        registerTask(*dispatcher,
                     task::Task::fromYaml(config.testYaml, testFields));
    } else if (!atom::utils::trim(config.testCommands).empty()) {
        testFields.erase("name");
        testFields["echo"] = true;
        registerTask(*dispatcher,
                     task::Task::fromMultilineString(
                         TEST_TASK_NAME, config.testCommands, testFields));
    }

    for (const auto& [name, value] : dispatcher->getContext().overrideVars) {
        if (dispatcher->hasTask(name)) {
            spdlog::info("Enabling task '{}'", name);
            dispatcher->enableTask(name, true);
        } else {
            spdlog::debug("Override variable '{}' names no task", name);
        }
    }

    if (!config.network) {
        for (const auto* name : NETWORK_TASKS) {
            if (dispatcher->hasTask(name)) {
                spdlog::info("Network disabled, disabling task '{}'", name);
                dispatcher->enableTask(name, false);
            }
        }
    }

    spdlog::info("Prepared {} tasks", dispatcher->getTaskNames().size());
    return dispatcher;
}

}  // namespace emuflow::app
