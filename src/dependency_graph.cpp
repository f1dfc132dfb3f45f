#include "forecast/dependency_graph.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <functional>
#include <queue>

namespace forecast {

DependencyGraph::DependencyGraph(const Project& project) {
    const auto& items = project.workItems();
    ids_.reserve(items.size());
    for (const auto& item : items) {
        if (index_.count(item.id) == 0) {
            index_[item.id] = ids_.size();
            ids_.push_back(item.id);
        }
    }

    dependents_.assign(ids_.size(), std::vector<size_t>());
    dependencies_.assign(ids_.size(), std::vector<size_t>());

    for (const auto& item : items) {
        size_t item_index = index_.at(item.id);
        for (const auto& dependency : item.dependencies) {
            auto it = index_.find(dependency);
            if (it == index_.end()) {
                throw UnknownDependencyError(item.id, dependency);
            }
            // duplicated declarations collapse into one edge
            auto& deps = dependencies_[item_index];
            if (std::find(deps.begin(), deps.end(), it->second) != deps.end()) {
                continue;
            }
            deps.push_back(it->second);
            dependents_[it->second].push_back(item_index);
        }
    }
}

size_t DependencyGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& deps : dependencies_) {
        count += deps.size();
    }
    return count;
}

std::vector<std::string> DependencyGraph::topologicalOrder() const {
    std::vector<size_t> in_degree(ids_.size(), 0);
    for (size_t i = 0; i < ids_.size(); ++i) {
        in_degree[i] = dependencies_[i].size();
    }

    // min-heap on node index keeps project order among ready nodes
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (in_degree[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<std::string> order;
    order.reserve(ids_.size());

    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(ids_[current]);

        for (size_t dependent : dependents_[current]) {
            if (--in_degree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (order.size() != ids_.size()) {
        throw CyclicDependencyError();
    }
    return order;
}

} // namespace forecast
