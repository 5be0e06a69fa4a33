// DEPENDENCY.hpp
#ifndef EMUFLOW_TASK_DEPENDENCY_HPP
#define EMUFLOW_TASK_DEPENDENCY_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace emuflow::task {

class Task;

/**
 * @brief A directed dependency graph over task names.
 *
 * Nodes keep their registration order, which breaks ties between
 * independent nodes during topological sorting so that identical input
 * always yields the same order.
 */
class TaskGraph {
public:
    using Node = std::string;

    TaskGraph() = default;

    /**
     * @brief Builds the graph for a task set.
     *
     * `requires: B` on A adds the edge A -> B (A depends on B);
     * `before: C` on A adds C -> A.
     *
     * @throws TaskNotFound If a requires/before entry names no task.
     */
    [[nodiscard]] static TaskGraph build(
        const std::vector<std::unique_ptr<Task>>& tasks);

    /**
     * @brief Adds a node to the dependency graph.
     *
     * @param node The name of the node to be added.
     * @throws InvalidTaskDefinition If the name is empty.
     * @throws DuplicateTask If the node already exists.
     */
    void addNode(const Node& node);

    /**
     * @brief Adds a directed dependency where @p from depends on @p to.
     *
     * @throws TaskNotFound If either node does not exist.
     * @throws CircularDependency If @p from equals @p to.
     */
    void addDependency(const Node& from, const Node& to);

    [[nodiscard]] bool nodeExists(const Node& node) const noexcept;

    [[nodiscard]] auto size() const noexcept -> size_t;

    /**
     * @brief Registration index of @p node.
     * @throws TaskNotFound If the node does not exist.
     */
    [[nodiscard]] auto indexOf(const Node& node) const -> size_t;

    [[nodiscard]] auto nodeAt(size_t index) const -> const Node&;

    /**
     * @brief Direct dependencies of a node, in registration order.
     */
    [[nodiscard]] auto getDependencies(const Node& node) const
        -> std::vector<Node>;

    /**
     * @brief Direct dependents of a node, in registration order.
     */
    [[nodiscard]] auto getDependents(const Node& node) const
        -> std::vector<Node>;

    /**
     * @brief All nodes depending on @p node directly or transitively.
     */
    [[nodiscard]] auto getAllDependents(const Node& node) const
        -> std::unordered_set<Node>;

    [[nodiscard]] auto hasCycle() const -> bool;

    /**
     * @brief Finds one cycle.
     * @return The nodes of the cycle in edge order, first node repeated at
     * the end, or nullopt if the graph is acyclic.
     */
    [[nodiscard]] auto findCycle() const -> std::optional<std::vector<Node>>;

    /**
     * @brief Orders nodes so that every node comes after its dependencies.
     * Ties are broken by registration order.
     *
     * @return The order, or nullopt if a cycle is detected.
     */
    [[nodiscard]] auto topologicalSort() const
        -> std::optional<std::vector<Node>>;

    /**
     * @brief Checks acyclicity and returns the topological order.
     * @throws CircularDependency Naming the tasks of the offending cycle.
     */
    [[nodiscard]] auto validate() const -> std::vector<Node>;

private:
    std::vector<Node> nodes_;
    std::unordered_map<Node, size_t> index_;
    // Per node index, sorted indices
    std::vector<std::vector<size_t>> adjList_;
    std::vector<std::vector<size_t>> incomingEdges_;

    /**
     * @brief Utility function to check for cycles in the graph.
     * @param node The current node being visited
     * @param state 0 unvisited, 1 on the recursion stack, 2 finished
     * @param path The current recursion stack
     * @return The cycle if one is reachable from @p node
     */
    [[nodiscard]] auto findCycleUtil(size_t node, std::vector<int>& state,
                                     std::vector<size_t>& path) const
        -> std::optional<std::vector<Node>>;

    [[nodiscard]] auto namesOf(const std::vector<size_t>& indices) const
        -> std::vector<Node>;
};

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_DEPENDENCY_HPP
