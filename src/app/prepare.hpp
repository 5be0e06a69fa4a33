/*
 * prepare.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Builds a ready-to-evaluate dispatcher from a run config

**************************************************/

#ifndef EMUFLOW_APP_PREPARE_HPP
#define EMUFLOW_APP_PREPARE_HPP

#include <chrono>
#include <memory>
#include <string>

#include "config/run_config.hpp"
#include "dispatcher/dispatcher.hpp"
#include "shell/session.hpp"

namespace emuflow::app {

/// Name of the task built from the run's test commands
inline constexpr const char* TEST_TASK_NAME = "action_test";

/**
 * @brief Formats @p tp as local time `%Y-%m-%d %H:%M:%S`.
 */
[[nodiscard]] std::string formatLocalTime(
    const std::chrono::system_clock::time_point& tp);

/**
 * @brief Creates the dispatcher for one run.
 *
 * Global variables are `NOW`, `BOARD` and `ARCH` plus `config.vars`;
 * override variables are the device and package variables. Tasks from
 * `taskDirs` are registered first, then `taskFiles`, then the test task.
 * Tasks named by override keys are enabled and network tasks are disabled
 * when the network is off.
 *
 * @throws InvalidRunConfig, InvalidTaskDefinition, DuplicateTask On
 * configuration errors.
 */
[[nodiscard]] std::unique_ptr<dispatch::Dispatcher> prepareDispatcher(
    const config::RunConfig& config, shell::SessionFactory sessionFactory);

}  // namespace emuflow::app

#endif  // EMUFLOW_APP_PREPARE_HPP
