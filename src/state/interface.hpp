#pragma once

/// @file interface.hpp
/// @brief Edge-of-board puzzle ports and their placement along a side

#include "geom/coords.hpp"
#include "geom/direction.hpp"
#include "state/port.hpp"
#include "state/wire_size.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tachy {

/// Where an interface sits along its side of the board
struct InterfacePosition {
    enum class Anchor { LEFT, CENTER, RIGHT };

    Anchor anchor = Anchor::CENTER;
    /// Distance from the anchored end; ignored for CENTER
    int32_t offset = 0;

    [[nodiscard]] static InterfacePosition left(int32_t offset) { return {Anchor::LEFT, offset}; }
    [[nodiscard]] static InterfacePosition center() { return {Anchor::CENTER, 0}; }
    [[nodiscard]] static InterfacePosition right(int32_t offset) { return {Anchor::RIGHT, offset}; }
};

struct InterfacePort {
    std::string name;
    PortFlow flow = PortFlow::SOURCE;
    PortColor color = PortColor::BEHAVIOR;
    WireSize size = WireSize::ONE;
};

/// A named row of ports one cell outside the board, facing into it.
///
/// "Left" and "Right" are as seen from outside the board looking in
/// through the side.
struct Interface {
    std::string name;
    Direction side = Direction::WEST;
    InterfacePosition position;
    std::vector<InterfacePort> ports;

    /// Top-left cell of the interface for the given board bounds
    [[nodiscard]] Coords top_left(const CoordsRect& bounds) const;

    /// Footprint: a column for East/West sides, a row for North/South
    [[nodiscard]] CoordsSize size() const;

    /// Placed ports for the given board bounds, in declaration order
    [[nodiscard]] std::vector<PortSpec> placed_ports(const CoordsRect& bounds) const;
    [[nodiscard]] std::vector<PortSpec> placed_ports_at(Coords top_left) const;

    /// One Exact constraint per port
    [[nodiscard]] std::vector<PortConstraint> constraints(const CoordsRect& bounds) const;
};

/// Smallest board every interface in the list fits along its side
[[nodiscard]] CoordsSize min_bounds_size(const std::vector<Interface>& interfaces);

} // namespace tachy
