/**
 * @file DependencyGraph.hpp
 * @brief Directed "task depends on task" edges of one project
 *
 * Edges point from a task to the tasks it depends on. The graph itself does
 * not enforce acyclicity or fan-in; TaskAggregate checks both before calling
 * addEdge() and re-checks them through findCycle() in its invariants.
 */

#pragma once

#include <json/json.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace taskcore::taskmanagement::domain::model {

struct CriticalPath {
    std::vector<std::string> taskIds;  ///< Dependencies first
    double totalWeight = 0.0;
};

class DependencyGraph {
public:
    using Edges = std::map<std::string, std::set<std::string>>;

    [[nodiscard]] bool hasEdge(const std::string& task, const std::string& dependsOn) const;

    void addEdge(const std::string& task, const std::string& dependsOn);

    /**
     * @return false if the edge did not exist
     */
    bool removeEdge(const std::string& task, const std::string& dependsOn);

    /**
     * @brief Remove every edge into or out of a task
     * @return Number of edges removed
     */
    std::size_t removeNode(const std::string& task);

    [[nodiscard]] const std::set<std::string>& dependenciesOf(const std::string& task) const;
    [[nodiscard]] std::set<std::string> dependentsOf(const std::string& task) const;
    [[nodiscard]] std::size_t directDependencyCount(const std::string& task) const;

    /**
     * @brief True if `target` can be reached from `start` by following
     *        dependency edges (a node reaches itself)
     *
     * Iterative DFS with a visited set, O(V+E).
     */
    [[nodiscard]] bool reaches(const std::string& start, const std::string& target) const;

    /**
     * @return One cycle (first node repeated at the end), if any
     */
    [[nodiscard]] std::optional<std::vector<std::string>> findCycle() const;

    /**
     * @brief Order `nodes` so every task comes after its dependencies
     *
     * Ties keep the order of `nodes`.
     * @throws shared::exception::CircularDependencyException if the graph has a cycle
     */
    [[nodiscard]] std::vector<std::string> topologicalOrder(const std::vector<std::string>& nodes) const;

    /**
     * @brief Heaviest dependency chain, weighting each task with `weight`
     */
    [[nodiscard]] CriticalPath criticalPath(const std::vector<std::string>& nodes,
                                            const std::function<double(const std::string&)>& weight) const;

    [[nodiscard]] std::size_t edgeCount() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return edges_.empty(); }
    [[nodiscard]] const Edges& edges() const noexcept { return edges_; }

    /**
     * @brief Array of {"task", "dependsOn"} objects
     */
    [[nodiscard]] Json::Value toJson() const;
    static DependencyGraph fromJson(const Json::Value& json);

    bool operator==(const DependencyGraph& other) const {
        return edges_ == other.edges_;
    }

private:
    Edges edges_;
};

} // namespace taskcore::taskmanagement::domain::model
