#pragma once

/// @file check.hpp
/// @brief Net grouping, net diagnostics, and wire width inference

#include "state/change.hpp"
#include "state/errors.hpp"
#include "state/port.hpp"
#include "state/wire_size.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace tachy {

/// A maximal connected set of wire fragments plus the ports touching them
struct Net {
    /// Half-edges carrying a wire fragment, ascending
    std::vector<WireLoc> fragments;
    /// Indices into NetGraph::ports
    std::vector<size_t> ports;
    /// Smallest location in the net (fragment or port)
    WireLoc representative;
    /// Color every incident port agrees on; unset for nets without ports
    /// or with conflicting ports
    std::optional<PortColor> color;
};

/// Nets of a board, numbered in order of their smallest location
struct NetGraph {
    std::vector<PortSpec> ports;
    std::vector<Net> nets;
    /// Net of every fragment and port location
    std::map<WireLoc, size_t> net_index;

    [[nodiscard]] std::optional<size_t> net_at(const WireLoc& loc) const;
};

/// Groups fragments and ports into nets. Fragments facing each other across
/// a cell edge are joined, as are the sides a shape connects within a cell.
/// A port joins the fragment at its own location, or forms a net by itself.
[[nodiscard]] NetGraph group_nets(const WireMap& fragments, std::vector<PortSpec> ports);

/// Assigns each net's color and reports color conflicts, missing sources,
/// and competing sources
[[nodiscard]] std::vector<BuildError> check_nets(NetGraph& graph);

/// Final wire sizes, one per net; unset for nets whose constraints conflict
struct SizeSolution {
    std::vector<std::optional<WireSize>> sizes;
    std::vector<BuildError> errors;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/// Narrows every net's size interval until no constraint changes anything,
/// then picks the smallest size left
[[nodiscard]] SizeSolution solve_wire_sizes(const NetGraph& graph,
                                            const std::vector<PortConstraint>& constraints);

} // namespace tachy
