/*
 * dispatcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "dispatcher.hpp"

#include <map>
#include <sstream>
#include <system_error>
#include <thread>

#include "spdlog/spdlog.h"
#include "task/exception.hpp"

namespace emuflow::dispatch {

namespace {

auto elapsedSince(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

auto describeTimeout(const std::optional<std::chrono::seconds>& timeout)
    -> std::string {
    return timeout ? std::to_string(timeout->count()) + "s" : "unbounded wait";
}

void echoOutput(const std::string& shell, const std::string& output,
                bool echo) {
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (echo) {
            spdlog::info("[{}] {}", shell, line);
        } else {
            spdlog::debug("[{}] {}", shell, line);
        }
    }
}

}  // namespace

Dispatcher::Dispatcher(DispatcherContext context,
                       shell::SessionFactory sessionFactory)
    : context_(std::move(context)),
      sessionFactory_(std::move(sessionFactory)) {}

void Dispatcher::addTask(task::Task task) {
    std::lock_guard lock(mutex_);
    if (started_) {
        THROW_INVALID_DISPATCHER_STATE(
            "Cannot add task '" + task.getName() +
            "': the dispatcher has already been evaluated");
    }
    if (taskIndex_.contains(task.getName())) {
        THROW_DUPLICATE_TASK("Task '" + task.getName() +
                             "' is already registered");
    }
    spdlog::debug("Registering task '{}' on shell '{}'", task.getName(),
                  task.getShell());
    taskIndex_.emplace(task.getName(), tasks_.size());
    tasks_.push_back(std::make_unique<task::Task>(std::move(task)));
}

void Dispatcher::enableTask(const std::string& name, bool enabled) {
    std::lock_guard lock(mutex_);
    if (started_) {
        THROW_INVALID_DISPATCHER_STATE(
            "Cannot change task '" + name +
            "': the dispatcher has already been evaluated");
    }
    tasks_[findTask(name)]->enable(enabled);
    spdlog::debug("Task '{}' {}", name, enabled ? "enabled" : "disabled");
}

bool Dispatcher::hasTask(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return taskIndex_.contains(name);
}

auto Dispatcher::getTask(const std::string& name) const -> const task::Task& {
    std::lock_guard lock(mutex_);
    return *tasks_[findTask(name)];
}

auto Dispatcher::getTaskNames() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        names.push_back(task->getName());
    }
    return names;
}

auto Dispatcher::getContext() const -> const DispatcherContext& {
    return context_;
}

bool Dispatcher::isEvaluated() const {
    std::lock_guard lock(mutex_);
    return started_;
}

auto Dispatcher::findTask(const std::string& name) const -> size_t {
    auto it = taskIndex_.find(name);
    if (it == taskIndex_.end()) {
        THROW_TASK_NOT_FOUND("Task '" + name + "' is not registered");
    }
    return it->second;
}

ExecutionPlan Dispatcher::plan() const {
    std::lock_guard lock(mutex_);
    auto graph = task::TaskGraph::build(tasks_);

    ExecutionPlan plan;
    plan.order = graph.validate();
    for (const auto& name : plan.order) {
        const auto& task = *tasks_[taskIndex_.at(name)];
        if (task.isEnabled()) {
            plan.shells[task.getShell()].push_back(name);
        } else {
            plan.disabled.push_back(name);
        }
    }
    return plan;
}

EvaluationReport Dispatcher::evaluate() {
    {
        std::lock_guard lock(mutex_);
        if (started_) {
            THROW_INVALID_DISPATCHER_STATE(
                "The dispatcher can only be evaluated once");
        }
        started_ = true;
    }

    spdlog::info("Evaluating {} tasks", tasks_.size());
    auto graph = task::TaskGraph::build(tasks_);
    auto order = graph.validate();

    // Every placeholder must resolve before the first session opens.
    for (auto& task : tasks_) {
        if (task->isEnabled()) {
            task->applyVars(context_.globalVars, context_.overrideVars);
        }
    }

    outcomes_.clear();
    dependencies_.assign(tasks_.size(), {});
    for (size_t i = 0; i < tasks_.size(); ++i) {
        const auto& task = *tasks_[i];
        TaskOutcome outcome;
        outcome.name = task.getName();
        outcome.shell = task.getShell();
        if (!task.isEnabled()) {
            outcome.status = TaskStatus::Skipped;
            outcome.skipReason = SkipReason::Disabled;
            outcome.reason = "task is disabled";
            spdlog::info("[{}] Skipping disabled task '{}'", outcome.shell,
                         outcome.name);
        }
        outcomes_.push_back(std::move(outcome));
        for (const auto& dep : graph.getDependencies(task.getName())) {
            dependencies_[i].push_back(taskIndex_.at(dep));
        }
    }

    std::map<std::string, std::vector<size_t>> queues;
    for (const auto& name : order) {
        auto index = taskIndex_.at(name);
        if (tasks_[index]->isEnabled()) {
            queues[tasks_[index]->getShell()].push_back(index);
        }
    }

    std::vector<std::thread> workers;
    workers.reserve(queues.size());
    try {
        for (const auto& [shell, queue] : queues) {
            spdlog::debug("Starting worker for shell '{}' with {} tasks",
                          shell, queue.size());
            workers.emplace_back(
                [this, &shell, &queue] { runShell(shell, queue); });
        }
    } catch (const std::system_error& e) {
        spdlog::critical("Failed to start shell worker: {}", e.what());
        // Unblock running workers waiting on shells that never started.
        size_t started = 0;
        for (const auto& [shell, queue] : queues) {
            if (started++ >= workers.size()) {
                skipRemaining(queue, 0, e.what());
            }
        }
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EvaluationReport report;
    report.order = std::move(order);
    {
        std::lock_guard lock(mutex_);
        report.tasks = outcomes_;
    }
    report.success = true;
    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (tasks_[i]->isEnabled() &&
            report.tasks[i].status != TaskStatus::Succeeded) {
            report.success = false;
        }
    }

    if (report.success) {
        spdlog::info("Evaluation finished: all tasks succeeded");
    } else {
        spdlog::error("Evaluation finished with failures");
        for (const auto& name : report.failedTasks()) {
            const auto* outcome = report.find(name);
            spdlog::error("  task '{}' failed at '{}': {}", name,
                          outcome->failedCommand.value_or(""),
                          outcome->reason);
        }
    }
    return report;
}

void Dispatcher::runShell(const std::string& shell,
                          const std::vector<size_t>& queue) {
    std::unique_ptr<shell::ShellSession> session;
    try {
        session = sessionFactory_ ? sessionFactory_(shell) : nullptr;
        if (!session) {
            THROW_SESSION_ERROR("No transport available for shell '" + shell +
                                "'");
        }
        session->open();
    } catch (const std::exception& e) {
        spdlog::error("[{}] Cannot open session: {}", shell, e.what());
        skipRemaining(queue, 0, e.what());
        return;
    }

    for (size_t i = 0; i < queue.size(); ++i) {
        auto index = queue[i];
        if (!waitForDependencies(index)) {
            continue;
        }
        try {
            runTask(index, *session);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Session failure during task '{}': {}", shell,
                          tasks_[index]->getName(), e.what());
            failOnTransport(index,
                            std::string("session failure: ") + e.what());
            skipRemaining(queue, i + 1, e.what());
            break;
        }
    }
    session->close();
}

bool Dispatcher::satisfiesDependents(size_t index) const {
    const auto& outcome = outcomes_[index];
    switch (outcome.status) {
        case TaskStatus::Succeeded:
            return true;
        case TaskStatus::Skipped:
            return outcome.skipReason == SkipReason::Disabled;
        case TaskStatus::Failed:
            // A dropped session leaves the task incomplete
            return !outcome.transportFailed &&
                   !tasks_[index]->getPolicy().failFast;
        default:
            return false;
    }
}

bool Dispatcher::waitForDependencies(size_t index) {
    std::unique_lock lock(mutex_);
    const auto& deps = dependencies_[index];
    stateChanged_.wait(lock, [&] {
        for (auto dep : deps) {
            if (!isTerminal(outcomes_[dep].status)) {
                return false;
            }
        }
        return true;
    });

    for (auto dep : deps) {
        if (!satisfiesDependents(dep)) {
            auto& outcome = outcomes_[index];
            outcome.status = TaskStatus::Skipped;
            outcome.skipReason = SkipReason::DependencyFailed;
            outcome.reason = "dependency '" + outcomes_[dep].name + "' " +
                             toString(outcomes_[dep].status);
            spdlog::warn("[{}] Skipping task '{}': {}", outcome.shell,
                         outcome.name, outcome.reason);
            lock.unlock();
            stateChanged_.notify_all();
            return false;
        }
    }
    outcomes_[index].status = TaskStatus::Ready;
    return true;
}

void Dispatcher::runTask(size_t index, shell::ShellSession& session) {
    const auto& task = *tasks_[index];
    setStatus(index, TaskStatus::Running);
    spdlog::info("[{}] Running task '{}'", task.getShell(), task.getName());
    auto start = std::chrono::steady_clock::now();

    if (task.getSleep().count() > 0) {
        spdlog::debug("[{}] Sleeping {}s before '{}'", task.getShell(),
                      task.getSleep().count(), task.getName());
        std::this_thread::sleep_for(task.getSleep());
    }

    std::optional<CommandResult> failure;
    const auto& commands = task.getCommands();
    for (size_t i = 0; i < commands.size(); ++i) {
        CommandResult result;
        try {
            result = runCommand(task, commands[i], session);
        } catch (const std::exception&) {
            std::lock_guard lock(mutex_);
            outcomes_[index].failedCommand = commands[i].command;
            throw;
        }
        bool success = result.success;
        if (!success && !failure) {
            failure = result;
        }
        recordCommand(index, std::move(result));
        if (!success && task.getPolicy().failFast) {
            if (i + 1 < commands.size()) {
                spdlog::warn("[{}] Task '{}' stops, {} commands not run",
                             task.getShell(), task.getName(),
                             commands.size() - i - 1);
            }
            break;
        }
    }

    {
        std::lock_guard lock(mutex_);
        auto& outcome = outcomes_[index];
        outcome.executionTime = elapsedSince(start);
        if (failure) {
            outcome.status = TaskStatus::Failed;
            outcome.failedCommand = failure->command;
            outcome.reason = failure->reason;
            spdlog::error("[{}] Task '{}' failed: {}", outcome.shell,
                          outcome.name, outcome.reason);
        } else {
            outcome.status = TaskStatus::Succeeded;
            spdlog::info("[{}] Task '{}' succeeded in {}ms", outcome.shell,
                         outcome.name, outcome.executionTime.count());
        }
    }
    stateChanged_.notify_all();
}

CommandResult Dispatcher::runCommand(const task::Task& task,
                                     const task::Command& command,
                                     shell::ShellSession& session) {
    const auto policy = task.policyFor(command);
    const auto& shell = task.getShell();

    CommandResult result;
    result.command = command.command;
    auto start = std::chrono::steady_clock::now();

    spdlog::debug("[{}] Sending '{}'", shell, command.command);
    session.send(command.command);
    auto reply = policy.expect
                     ? session.expect(*policy.expect, policy.timeout)
                     : session.waitForPrompt(policy.timeout);
    result.output = reply.output;
    echoOutput(shell, reply.output, policy.echo);

    if (!reply.matched) {
        result.timedOut = true;
        result.reason =
            policy.expect
                ? "expected output '" + *policy.expect + "' not seen within " +
                      describeTimeout(policy.timeout)
                : "command did not complete within " +
                      describeTimeout(policy.timeout);
    } else if (policy.checkExitCode) {
        int status = session.exitStatus();
        result.exitCode = status;
        if (policy.shouldFail && status == 0) {
            result.reason = "command succeeded but was expected to fail";
        } else if (!policy.shouldFail && status != 0) {
            result.reason = "command exited with status " +
                            std::to_string(status);
        } else {
            result.success = true;
        }
    } else {
        result.success = true;
    }

    result.executionTime = elapsedSince(start);
    if (!result.success) {
        spdlog::error("[{}] '{}' failed: {}", shell, command.command,
                      result.reason);
    }
    return result;
}

void Dispatcher::setStatus(size_t index, TaskStatus status) {
    {
        std::lock_guard lock(mutex_);
        outcomes_[index].status = status;
    }
    stateChanged_.notify_all();
}

void Dispatcher::recordCommand(size_t index, CommandResult result) {
    std::lock_guard lock(mutex_);
    outcomes_[index].commands.push_back(std::move(result));
}

void Dispatcher::failOnTransport(size_t index, std::string reason) {
    {
        std::lock_guard lock(mutex_);
        auto& outcome = outcomes_[index];
        outcome.status = TaskStatus::Failed;
        outcome.transportFailed = true;
        outcome.reason = std::move(reason);
    }
    stateChanged_.notify_all();
}

void Dispatcher::skipRemaining(const std::vector<size_t>& queue, size_t from,
                               const std::string& reason) {
    {
        std::lock_guard lock(mutex_);
        for (size_t i = from; i < queue.size(); ++i) {
            auto& outcome = outcomes_[queue[i]];
            outcome.status = TaskStatus::Skipped;
            outcome.skipReason = SkipReason::ShellUnavailable;
            outcome.reason = "shell unavailable: " + reason;
            spdlog::warn("[{}] Skipping task '{}': shell unavailable",
                         outcome.shell, outcome.name);
        }
    }
    stateChanged_.notify_all();
}

}  // namespace emuflow::dispatch
