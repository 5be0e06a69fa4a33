/**
 * @file dispatcher.hpp
 * @brief Registers tasks and evaluates them across their shells.
 *
 * Every shell gets one session and one worker thread. Each worker runs the
 * tasks of its shell in global topological order and waits until all
 * dependencies of the next task are terminal, so tasks on different shells
 * run concurrently while tasks on the same shell never interleave.
 *
 * @par Usage Example:
 * @code
 * #include "dispatcher/dispatcher.hpp"
 * #include "shell/dry_run_session.hpp"
 *
 * using namespace emuflow;
 *
 * dispatch::Dispatcher dispatcher({{{"BOARD", "hifive_unleashed"}}, {}},
 *                                 shell::DryRunSession::factory());
 * dispatcher.addTask(task::Task::fromYaml("name: boot\nshell: renode\n"
 *                                         "commands: [start]\n"));
 * auto report = dispatcher.evaluate();
 * @endcode
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef EMUFLOW_DISPATCHER_DISPATCHER_HPP
#define EMUFLOW_DISPATCHER_DISPATCHER_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "context.hpp"
#include "report.hpp"
#include "shell/session.hpp"
#include "task/dependency.hpp"
#include "task/task.hpp"

namespace emuflow::dispatch {

/**
 * @class Dispatcher
 * @brief Owns the task set of one run and evaluates it once.
 */
class Dispatcher {
public:
    /**
     * @param context Global and override variables.
     * @param sessionFactory Creates the session of each shell when
     * evaluation starts.
     */
    Dispatcher(DispatcherContext context, shell::SessionFactory sessionFactory);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Registers a task.
     * @throws DuplicateTask If the name is already registered.
     * @throws InvalidDispatcherState If evaluation has started.
     */
    void addTask(task::Task task);

    /**
     * @brief Enables or disables a registered task.
     * @throws TaskNotFound If no task has that name.
     * @throws InvalidDispatcherState If evaluation has started.
     */
    void enableTask(const std::string& name, bool enabled = true);

    [[nodiscard]] bool hasTask(const std::string& name) const;

    /**
     * @throws TaskNotFound If no task has that name.
     */
    [[nodiscard]] auto getTask(const std::string& name) const
        -> const task::Task&;

    /**
     * @brief Names of all tasks in registration order.
     */
    [[nodiscard]] auto getTaskNames() const -> std::vector<std::string>;

    [[nodiscard]] auto getContext() const -> const DispatcherContext&;

    /**
     * @brief Computes the execution order without opening any session.
     * @throws TaskNotFound If a requires/before entry names no task.
     * @throws CircularDependency If the ordering constraints contain a cycle.
     */
    [[nodiscard]] ExecutionPlan plan() const;

    /**
     * @brief Runs every enabled task and reports the outcome of each.
     *
     * The graph is validated and all placeholders of enabled tasks are
     * resolved before the first session is opened. Command and transport
     * failures are recorded in the report instead of being thrown.
     *
     * @throws TaskNotFound, CircularDependency, UnresolvedVariable On
     * configuration errors.
     * @throws InvalidDispatcherState If called more than once.
     */
    [[nodiscard]] EvaluationReport evaluate();

    [[nodiscard]] bool isEvaluated() const;

private:
    void runShell(const std::string& shell, const std::vector<size_t>& queue);

    /**
     * @brief Blocks until all dependencies of the task are terminal.
     * @return True if the task may run; otherwise it has been marked skipped.
     */
    bool waitForDependencies(size_t index);

    void runTask(size_t index, shell::ShellSession& session);

    [[nodiscard]] CommandResult runCommand(const task::Task& task,
                                           const task::Command& command,
                                           shell::ShellSession& session);

    void setStatus(size_t index, TaskStatus status);
    void recordCommand(size_t index, CommandResult result);
    void failOnTransport(size_t index, std::string reason);
    void skipRemaining(const std::vector<size_t>& queue, size_t from,
                       const std::string& reason);

    // Requires mutex_ to be held.
    [[nodiscard]] bool satisfiesDependents(size_t index) const;

    [[nodiscard]] auto findTask(const std::string& name) const -> size_t;

    DispatcherContext context_;
    shell::SessionFactory sessionFactory_;

    std::vector<std::unique_ptr<task::Task>> tasks_;
    std::unordered_map<std::string, size_t> taskIndex_;
    bool started_{false};

    // Evaluation state
    std::vector<std::vector<size_t>> dependencies_;
    std::vector<TaskOutcome> outcomes_;
    mutable std::mutex mutex_;
    std::condition_variable stateChanged_;
};

}  // namespace emuflow::dispatch

#endif  // EMUFLOW_DISPATCHER_DISPATCHER_HPP
