/// @file interface.cpp
/// @brief Interface placement along the board edge

#include "state/interface.hpp"

#include <algorithm>

namespace tachy {

Coords Interface::top_left(const CoordsRect& bounds) const {
    const int32_t span = is_horizontal(side) ? bounds.height : bounds.width;
    const auto len = static_cast<int32_t>(ports.size());
    int32_t dist = 0;
    switch (position.anchor) {
    case InterfacePosition::Anchor::LEFT:
        dist = position.offset;
        break;
    case InterfacePosition::Anchor::CENTER:
        dist = (span - len) / 2;
        break;
    case InterfacePosition::Anchor::RIGHT:
        dist = span - len - position.offset;
        break;
    }

    CoordsDelta delta;
    switch (side) {
    case Direction::EAST:
        delta = {bounds.width, span - len - dist};
        break;
    case Direction::SOUTH:
        delta = {dist, bounds.height};
        break;
    case Direction::WEST:
        delta = {-1, dist};
        break;
    case Direction::NORTH:
        delta = {span - len - dist, -1};
        break;
    }
    return bounds.top_left() + delta;
}

CoordsSize Interface::size() const {
    const auto len = static_cast<int32_t>(ports.size());
    return is_horizontal(side) ? CoordsSize{1, len} : CoordsSize{len, 1};
}

std::vector<PortSpec> Interface::placed_ports(const CoordsRect& bounds) const {
    return placed_ports_at(top_left(bounds));
}

std::vector<PortSpec> Interface::placed_ports_at(Coords top_left) const {
    const CoordsDelta step = direction_delta(rotate_ccw(side));
    const auto len = static_cast<int32_t>(ports.size());
    Coords start = top_left;
    if (side == Direction::EAST || side == Direction::NORTH) {
        start = top_left - step * (len - 1);
    }
    const Direction port_dir = -side;

    std::vector<PortSpec> placed;
    placed.reserve(ports.size());
    for (int32_t index = 0; index < len; ++index) {
        const auto& port = ports[static_cast<size_t>(index)];
        placed.push_back({port.flow, port.color, {start + step * index, port_dir}});
    }
    return placed;
}

std::vector<PortConstraint> Interface::constraints(const CoordsRect& bounds) const {
    const auto placed = placed_ports(bounds);
    std::vector<PortConstraint> constraints;
    constraints.reserve(placed.size());
    for (size_t index = 0; index < placed.size(); ++index) {
        constraints.push_back(
            {ConstraintKind::EXACT, placed[index].loc, placed[index].loc, ports[index].size});
    }
    return constraints;
}

CoordsSize min_bounds_size(const std::vector<Interface>& interfaces) {
    // Interfaces sharing a side must fit side by side
    int32_t east = 0;
    int32_t west = 0;
    int32_t north = 0;
    int32_t south = 0;
    for (const auto& iface : interfaces) {
        int32_t needed = static_cast<int32_t>(iface.ports.size());
        if (iface.position.anchor != InterfacePosition::Anchor::CENTER) {
            needed += iface.position.offset;
        }
        switch (iface.side) {
        case Direction::EAST:
            east += needed;
            break;
        case Direction::WEST:
            west += needed;
            break;
        case Direction::NORTH:
            north += needed;
            break;
        case Direction::SOUTH:
            south += needed;
            break;
        }
    }
    return {std::max({north, south, 1}), std::max({east, west, 1})};
}

} // namespace tachy
