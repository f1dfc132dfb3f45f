#ifndef FORECAST_DEPENDENCY_GRAPH_HPP
#define FORECAST_DEPENDENCY_GRAPH_HPP

#include "forecast/project.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace forecast {

// Directed acyclic graph over work item ids with edges dependency -> dependent.
// Nodes are indexed in project order.
class DependencyGraph {
public:
    // Throws UnknownDependencyError when a dependency id is not in the project.
    explicit DependencyGraph(const Project& project);

    // Kahn's algorithm; ties are broken by project order so the result is
    // deterministic. Throws CyclicDependencyError instead of returning a partial order.
    std::vector<std::string> topologicalOrder() const;

    size_t size() const { return ids_.size(); }
    size_t edgeCount() const;

private:
    std::vector<std::string> ids_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<size_t>> dependents_;
    std::vector<std::vector<size_t>> dependencies_;
};

} // namespace forecast

#endif // FORECAST_DEPENDENCY_GRAPH_HPP
