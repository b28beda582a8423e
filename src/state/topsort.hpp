#pragma once

/// @file topsort.hpp
/// @brief Kahn's algorithm producing parallel groups

#include <cstddef>
#include <set>
#include <vector>

namespace tachy {

struct TopologicalGroups {
    /// Nodes whose predecessors all appear in earlier groups; ascending
    /// within each group
    std::vector<std::vector<size_t>> groups;
    /// Nodes on or downstream of a cycle, ascending
    std::vector<size_t> leftover;
};

/// Sorts nodes 0..successors.size()-1 into groups. Duplicate edges are
/// counted once.
[[nodiscard]] TopologicalGroups topological_groups(const std::vector<std::set<size_t>>& successors);

} // namespace tachy
