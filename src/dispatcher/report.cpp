/*
 * report.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "report.hpp"

#include <algorithm>
#include <sstream>

namespace emuflow::dispatch {

std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Ready: return "ready";
        case TaskStatus::Running: return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Skipped: return "skipped";
    }
    return "unknown";
}

std::string toString(SkipReason reason) {
    switch (reason) {
        case SkipReason::None: return "none";
        case SkipReason::Disabled: return "disabled";
        case SkipReason::DependencyFailed: return "dependency failed";
        case SkipReason::ShellUnavailable: return "shell unavailable";
    }
    return "unknown";
}

json CommandResult::toJson() const {
    return {
        {"command", command},
        {"success", success},
        {"timedOut", timedOut},
        {"exitCode", exitCode ? json(*exitCode) : json(nullptr)},
        {"output", output},
        {"reason", reason},
        {"executionTime", executionTime.count()},
    };
}

json TaskOutcome::toJson() const {
    json results = json::array();
    for (const auto& result : commands) {
        results.push_back(result.toJson());
    }
    return {
        {"name", name},
        {"shell", shell},
        {"status", toString(status)},
        {"skipReason", toString(skipReason)},
        {"failedCommand",
         failedCommand ? json(*failedCommand) : json(nullptr)},
        {"reason", reason},
        {"transportFailed", transportFailed},
        {"executionTime", executionTime.count()},
        {"commands", results},
    };
}

json ExecutionPlan::toJson() const {
    return {{"order", order}, {"shells", shells}, {"disabled", disabled}};
}

const TaskOutcome* EvaluationReport::find(const std::string& name) const {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const TaskOutcome& t) { return t.name == name; });
    return it == tasks.end() ? nullptr : &*it;
}

std::vector<std::string> EvaluationReport::failedTasks() const {
    std::vector<std::string> names;
    for (const auto& task : tasks) {
        if (task.status == TaskStatus::Failed) {
            names.push_back(task.name);
        }
    }
    return names;
}

std::vector<std::string> EvaluationReport::skippedTasks() const {
    std::vector<std::string> names;
    for (const auto& task : tasks) {
        if (task.status == TaskStatus::Skipped) {
            names.push_back(task.name);
        }
    }
    return names;
}

json EvaluationReport::toJson() const {
    json outcomes = json::array();
    for (const auto& task : tasks) {
        outcomes.push_back(task.toJson());
    }
    return {{"success", success}, {"order", order}, {"tasks", outcomes}};
}

std::string EvaluationReport::summary() const {
    std::ostringstream out;
    for (const auto& task : tasks) {
        out << "[" << task.shell << "] " << task.name << ": "
            << toString(task.status);
        if (task.status == TaskStatus::Skipped) {
            out << " (" << toString(task.skipReason) << ")";
        }
        if (task.status == TaskStatus::Failed && task.failedCommand) {
            out << " at '" << *task.failedCommand << "'";
        }
        if (!task.reason.empty() && task.status != TaskStatus::Succeeded) {
            out << ": " << task.reason;
        }
        out << "\n";
    }
    out << (success ? "All tasks succeeded" : "Evaluation failed");
    return out.str();
}

}  // namespace emuflow::dispatch
