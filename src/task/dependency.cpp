#include "dependency.hpp"

#include <algorithm>
#include <functional>
#include <queue>

#include "exception.hpp"
#include "spdlog/spdlog.h"
#include "task.hpp"

namespace emuflow::task {

namespace {

void insertSorted(std::vector<size_t>& list, size_t value) {
    auto it = std::lower_bound(list.begin(), list.end(), value);
    if (it == list.end() || *it != value) {
        list.insert(it, value);
    }
}

std::string joinPath(const std::vector<std::string>& names) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) {
            result += " -> ";
        }
        result += name;
    }
    return result;
}

}  // namespace

TaskGraph TaskGraph::build(const std::vector<std::unique_ptr<Task>>& tasks) {
    TaskGraph graph;
    for (const auto& task : tasks) {
        graph.addNode(task->getName());
    }

    for (const auto& task : tasks) {
        for (const auto& dep : task->getRequires()) {
            if (!graph.nodeExists(dep)) {
                spdlog::error("Task {} requires unknown task {}",
                              task->getName(), dep);
                THROW_TASK_NOT_FOUND("Task '" + task->getName() +
                                     "' requires unknown task '" + dep + "'");
            }
            graph.addDependency(task->getName(), dep);
        }
        for (const auto& later : task->getBefore()) {
            if (!graph.nodeExists(later)) {
                spdlog::error("Task {} must run before unknown task {}",
                              task->getName(), later);
                THROW_TASK_NOT_FOUND("Task '" + task->getName() +
                                     "' must run before unknown task '" +
                                     later + "'");
            }
            graph.addDependency(later, task->getName());
        }
    }

    spdlog::debug("Task graph built with {} nodes", graph.size());
    return graph;
}

void TaskGraph::addNode(const Node& node) {
    if (node.empty()) {
        spdlog::error("Cannot add node with empty name.");
        THROW_INVALID_TASK_DEFINITION("Node name cannot be empty");
    }
    if (index_.contains(node)) {
        THROW_DUPLICATE_TASK("Task '" + node + "' is already registered");
    }

    index_.emplace(node, nodes_.size());
    nodes_.push_back(node);
    adjList_.emplace_back();
    incomingEdges_.emplace_back();
}

void TaskGraph::addDependency(const Node& from, const Node& to) {
    if (from == to) {
        spdlog::error("Self-dependency detected: {}", from);
        THROW_CIRCULAR_DEPENDENCY("Circular dependency detected: " + from +
                                  " -> " + to);
    }

    auto fromIndex = indexOf(from);
    auto toIndex = indexOf(to);
    insertSorted(adjList_[fromIndex], toIndex);
    insertSorted(incomingEdges_[toIndex], fromIndex);
    spdlog::trace("Dependency {} -> {} added", from, to);
}

bool TaskGraph::nodeExists(const Node& node) const noexcept {
    return index_.contains(node);
}

auto TaskGraph::size() const noexcept -> size_t { return nodes_.size(); }

auto TaskGraph::indexOf(const Node& node) const -> size_t {
    auto it = index_.find(node);
    if (it == index_.end()) {
        THROW_TASK_NOT_FOUND("Task '" + node + "' is not registered");
    }
    return it->second;
}

auto TaskGraph::nodeAt(size_t index) const -> const Node& {
    return nodes_.at(index);
}

auto TaskGraph::getDependencies(const Node& node) const -> std::vector<Node> {
    return namesOf(adjList_[indexOf(node)]);
}

auto TaskGraph::getDependents(const Node& node) const -> std::vector<Node> {
    return namesOf(incomingEdges_[indexOf(node)]);
}

auto TaskGraph::getAllDependents(const Node& node) const
    -> std::unordered_set<Node> {
    std::unordered_set<Node> result;
    std::vector<size_t> pending{indexOf(node)};
    while (!pending.empty()) {
        auto current = pending.back();
        pending.pop_back();
        for (auto dependent : incomingEdges_[current]) {
            if (result.insert(nodes_[dependent]).second) {
                pending.push_back(dependent);
            }
        }
    }
    return result;
}

auto TaskGraph::hasCycle() const -> bool { return findCycle().has_value(); }

auto TaskGraph::findCycle() const -> std::optional<std::vector<Node>> {
    std::vector<int> state(nodes_.size(), 0);
    std::vector<size_t> path;

    for (size_t node = 0; node < nodes_.size(); ++node) {
        if (state[node] == 0) {
            if (auto cycle = findCycleUtil(node, state, path)) {
                return cycle;
            }
        }
    }
    return std::nullopt;
}

auto TaskGraph::findCycleUtil(size_t node, std::vector<int>& state,
                              std::vector<size_t>& path) const
    -> std::optional<std::vector<Node>> {
    state[node] = 1;
    path.push_back(node);

    for (auto dep : adjList_[node]) {
        if (state[dep] == 1) {
            auto start = std::find(path.begin(), path.end(), dep);
            std::vector<size_t> cycle(start, path.end());
            cycle.push_back(dep);
            return namesOf(cycle);
        }
        if (state[dep] == 0) {
            if (auto cycle = findCycleUtil(dep, state, path)) {
                return cycle;
            }
        }
    }

    path.pop_back();
    state[node] = 2;
    return std::nullopt;
}

auto TaskGraph::topologicalSort() const -> std::optional<std::vector<Node>> {
    std::vector<size_t> remaining(nodes_.size());
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t node = 0; node < nodes_.size(); ++node) {
        remaining[node] = adjList_[node].size();
        if (remaining[node] == 0) {
            ready.push(node);
        }
    }

    std::vector<Node> sorted;
    sorted.reserve(nodes_.size());
    while (!ready.empty()) {
        auto node = ready.top();
        ready.pop();
        sorted.push_back(nodes_[node]);
        for (auto dependent : incomingEdges_[node]) {
            if (--remaining[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (sorted.size() != nodes_.size()) {
        spdlog::error("Cycle detected during topological sort.");
        return std::nullopt;
    }
    return sorted;
}

auto TaskGraph::validate() const -> std::vector<Node> {
    if (auto cycle = findCycle()) {
        auto description = joinPath(*cycle);
        spdlog::error("Circular dependency detected: {}", description);
        THROW_CIRCULAR_DEPENDENCY("Circular dependency detected: " +
                                  description);
    }

    auto sorted = topologicalSort();
    if (!sorted) {
        THROW_CIRCULAR_DEPENDENCY("Failed to order tasks");
    }
    spdlog::debug("Task order: {}", joinPath(*sorted));
    return *sorted;
}

auto TaskGraph::namesOf(const std::vector<size_t>& indices) const
    -> std::vector<Node> {
    std::vector<Node> names;
    names.reserve(indices.size());
    for (auto index : indices) {
        names.push_back(nodes_[index]);
    }
    return names;
}

}  // namespace emuflow::task
