#include "taskcore/taskmanagement/domain/model/DependencyGraph.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace taskcore::taskmanagement::domain::model {

namespace {

enum class Mark { UNVISITED, ON_PATH, DONE };

bool visitForCycle(const DependencyGraph::Edges& edges,
                   const std::string& node,
                   std::unordered_map<std::string, Mark>& marks,
                   std::vector<std::string>& path) {
    marks[node] = Mark::ON_PATH;
    path.push_back(node);

    auto it = edges.find(node);
    if (it != edges.end()) {
        for (const auto& next : it->second) {
            const Mark mark = marks.count(next) ? marks[next] : Mark::UNVISITED;
            if (mark == Mark::ON_PATH) {
                auto start = std::find(path.begin(), path.end(), next);
                std::vector<std::string> cycle(start, path.end());
                cycle.push_back(next);
                path = std::move(cycle);
                return true;
            }
            if (mark == Mark::UNVISITED && visitForCycle(edges, next, marks, path)) {
                return true;
            }
        }
    }

    path.pop_back();
    marks[node] = Mark::DONE;
    return false;
}

} // namespace

bool DependencyGraph::hasEdge(const std::string& task, const std::string& dependsOn) const {
    auto it = edges_.find(task);
    return it != edges_.end() && it->second.count(dependsOn) > 0;
}

void DependencyGraph::addEdge(const std::string& task, const std::string& dependsOn) {
    edges_[task].insert(dependsOn);
}

bool DependencyGraph::removeEdge(const std::string& task, const std::string& dependsOn) {
    auto it = edges_.find(task);
    if (it == edges_.end() || it->second.erase(dependsOn) == 0) {
        return false;
    }
    if (it->second.empty()) {
        edges_.erase(it);
    }
    return true;
}

std::size_t DependencyGraph::removeNode(const std::string& task) {
    std::size_t removed = 0;

    auto own = edges_.find(task);
    if (own != edges_.end()) {
        removed += own->second.size();
        edges_.erase(own);
    }

    for (auto it = edges_.begin(); it != edges_.end();) {
        removed += it->second.erase(task);
        if (it->second.empty()) {
            it = edges_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

const std::set<std::string>& DependencyGraph::dependenciesOf(const std::string& task) const {
    static const std::set<std::string> kNone;
    auto it = edges_.find(task);
    return it == edges_.end() ? kNone : it->second;
}

std::set<std::string> DependencyGraph::dependentsOf(const std::string& task) const {
    std::set<std::string> dependents;
    for (const auto& [from, targets] : edges_) {
        if (targets.count(task) > 0) {
            dependents.insert(from);
        }
    }
    return dependents;
}

std::size_t DependencyGraph::directDependencyCount(const std::string& task) const {
    return dependenciesOf(task).size();
}

bool DependencyGraph::reaches(const std::string& start, const std::string& target) const {
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack{start};

    while (!stack.empty()) {
        std::string current = std::move(stack.back());
        stack.pop_back();

        if (current == target) {
            return true;
        }
        if (!visited.insert(current).second) {
            continue;
        }
        for (const auto& next : dependenciesOf(current)) {
            if (visited.count(next) == 0) {
                stack.push_back(next);
            }
        }
    }
    return false;
}

std::optional<std::vector<std::string>> DependencyGraph::findCycle() const {
    std::unordered_map<std::string, Mark> marks;
    for (const auto& entry : edges_) {
        if (marks.count(entry.first) && marks[entry.first] != Mark::UNVISITED) {
            continue;
        }
        std::vector<std::string> path;
        if (visitForCycle(edges_, entry.first, marks, path)) {
            return path;
        }
    }
    return std::nullopt;
}

std::vector<std::string> DependencyGraph::topologicalOrder(const std::vector<std::string>& nodes) const {
    // Kahn's algorithm restricted to `nodes`
    const std::set<std::string> members(nodes.begin(), nodes.end());
    std::unordered_map<std::string, std::size_t> pending;
    std::unordered_map<std::string, std::vector<std::string>> dependents;

    for (const auto& node : nodes) {
        std::size_t count = 0;
        for (const auto& dependency : dependenciesOf(node)) {
            if (members.count(dependency) > 0) {
                ++count;
                dependents[dependency].push_back(node);
            }
        }
        pending[node] = count;
    }

    std::deque<std::string> ready;
    for (const auto& node : nodes) {
        if (pending[node] == 0) {
            ready.push_back(node);
        }
    }

    std::vector<std::string> order;
    order.reserve(nodes.size());
    while (!ready.empty()) {
        std::string current = ready.front();
        ready.pop_front();
        order.push_back(current);
        for (const auto& dependent : dependents[current]) {
            if (--pending[dependent] == 0) {
                ready.push_back(dependent);
            }
        }
    }

    if (order.size() != members.size()) {
        std::string involved;
        for (const auto& node : nodes) {
            if (pending[node] > 0) {
                if (!involved.empty()) involved += ", ";
                involved += node;
            }
        }
        throw shared::exception::CircularDependencyException(
            "Dependency cycle detected involving tasks: " + involved);
    }
    return order;
}

CriticalPath DependencyGraph::criticalPath(const std::vector<std::string>& nodes,
                                           const std::function<double(const std::string&)>& weight) const {
    const auto order = topologicalOrder(nodes);
    const std::set<std::string> members(nodes.begin(), nodes.end());

    std::unordered_map<std::string, double> best;
    std::unordered_map<std::string, std::string> previous;
    CriticalPath result;
    std::string tail;

    for (const auto& node : order) {
        double heaviestDependency = 0.0;
        for (const auto& dependency : dependenciesOf(node)) {
            if (members.count(dependency) > 0 && best[dependency] > heaviestDependency) {
                heaviestDependency = best[dependency];
                previous[node] = dependency;
            }
        }
        best[node] = heaviestDependency + weight(node);
        if (tail.empty() || best[node] > result.totalWeight) {
            result.totalWeight = best[node];
            tail = node;
        }
    }

    for (std::string node = tail; !node.empty();) {
        result.taskIds.push_back(node);
        auto it = previous.find(node);
        node = it == previous.end() ? std::string() : it->second;
    }
    std::reverse(result.taskIds.begin(), result.taskIds.end());
    return result;
}

std::size_t DependencyGraph::edgeCount() const noexcept {
    std::size_t count = 0;
    for (const auto& entry : edges_) {
        count += entry.second.size();
    }
    return count;
}

Json::Value DependencyGraph::toJson() const {
    Json::Value json(Json::arrayValue);
    for (const auto& [task, targets] : edges_) {
        for (const auto& dependsOn : targets) {
            Json::Value edge(Json::objectValue);
            edge["task"] = task;
            edge["dependsOn"] = dependsOn;
            json.append(edge);
        }
    }
    return json;
}

DependencyGraph DependencyGraph::fromJson(const Json::Value& json) {
    if (!json.isNull() && !json.isArray()) {
        throw shared::exception::DomainException("INVALID_DEPENDENCY_GRAPH", "Dependency list must be an array");
    }
    DependencyGraph graph;
    for (const auto& edge : json) {
        if (!edge.isMember("task") || !edge.isMember("dependsOn")) {
            throw shared::exception::DomainException("INVALID_DEPENDENCY_GRAPH", "Dependency edge is incomplete");
        }
        graph.addEdge(edge["task"].asString(), edge["dependsOn"].asString());
    }
    return graph;
}

} // namespace taskcore::taskmanagement::domain::model
