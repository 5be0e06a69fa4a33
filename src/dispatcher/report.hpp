/*
 * report.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Task states and the evaluation report

**************************************************/

#ifndef EMUFLOW_DISPATCHER_REPORT_HPP
#define EMUFLOW_DISPATCHER_REPORT_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace emuflow::dispatch {

using json = nlohmann::json;

/**
 * @enum TaskStatus
 * @brief Lifecycle of a task during evaluation.
 */
enum class TaskStatus {
    Pending,    ///< Waiting for its dependencies
    Ready,      ///< Dependencies satisfied, not started yet
    Running,    ///< Commands are being executed
    Succeeded,  ///< Every command succeeded
    Failed,     ///< At least one command failed
    Skipped     ///< Not executed
};

/**
 * @enum SkipReason
 * @brief Why a task was skipped.
 */
enum class SkipReason {
    None,
    Disabled,          ///< Disabled before evaluation; satisfies dependents
    DependencyFailed,  ///< A dependency failed with fail-fast or was skipped
    ShellUnavailable   ///< The shell's session could not be used
};

[[nodiscard]] std::string toString(TaskStatus status);
[[nodiscard]] std::string toString(SkipReason reason);

[[nodiscard]] inline bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Succeeded || status == TaskStatus::Failed ||
           status == TaskStatus::Skipped;
}

/**
 * @brief Result of one executed command.
 */
struct CommandResult {
    std::string command;          ///< Command text after variable resolution
    bool success{};               ///< Whether the command met its policy
    bool timedOut{};              ///< Completion or expected output not seen
    std::optional<int> exitCode;  ///< Set when the exit status was checked
    std::string output;           ///< Raw session output
    std::string reason;           ///< Failure description
    std::chrono::milliseconds executionTime{};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Terminal state of one task.
 */
struct TaskOutcome {
    std::string name;
    std::string shell;
    TaskStatus status{TaskStatus::Pending};
    SkipReason skipReason{SkipReason::None};
    std::vector<CommandResult> commands;  ///< Commands actually executed
    std::optional<std::string> failedCommand;
    std::string reason;
    bool transportFailed{false};  ///< The session dropped during the task
    std::chrono::milliseconds executionTime{};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Execution order computed without running anything.
 */
struct ExecutionPlan {
    std::vector<std::string> order;  ///< Global topological order
    std::map<std::string, std::vector<std::string>> shells;  ///< Enabled tasks
    std::vector<std::string> disabled;

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Result of Dispatcher::evaluate().
 */
struct EvaluationReport {
    bool success{};
    std::vector<std::string> order;
    std::vector<TaskOutcome> tasks;  ///< In registration order

    /**
     * @brief Outcome of a task by name, or nullptr.
     */
    [[nodiscard]] const TaskOutcome* find(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> failedTasks() const;
    [[nodiscard]] std::vector<std::string> skippedTasks() const;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Multi-line human readable summary, one line per task.
     */
    [[nodiscard]] std::string summary() const;
};

}  // namespace emuflow::dispatch

#endif  // EMUFLOW_DISPATCHER_REPORT_HPP
