/// @file topsort.cpp
/// @brief Kahn's algorithm, one frontier at a time

#include "state/topsort.hpp"

#include <stdexcept>
#include <utility>

namespace tachy {

TopologicalGroups topological_groups(const std::vector<std::set<size_t>>& successors) {
    const size_t num_nodes = successors.size();

    std::vector<size_t> in_degree(num_nodes, 0);
    for (const auto& succ : successors) {
        for (size_t next : succ) {
            if (next >= num_nodes) {
                throw std::out_of_range("Edge points at a node that does not exist");
            }
            in_degree[next]++;
        }
    }

    TopologicalGroups result;
    std::vector<size_t> frontier;
    for (size_t node = 0; node < num_nodes; ++node) {
        if (in_degree[node] == 0) {
            frontier.push_back(node);
        }
    }

    std::vector<bool> placed(num_nodes, false);
    while (!frontier.empty()) {
        std::set<size_t> next_frontier;
        for (size_t node : frontier) {
            placed[node] = true;
            for (size_t next : successors[node]) {
                if (--in_degree[next] == 0) {
                    next_frontier.insert(next);
                }
            }
        }
        result.groups.push_back(std::move(frontier));
        frontier.assign(next_frontier.begin(), next_frontier.end());
    }

    for (size_t node = 0; node < num_nodes; ++node) {
        if (!placed[node]) {
            result.leftover.push_back(node);
        }
    }
    return result;
}

} // namespace tachy
