#pragma once

/// @file chip_data.hpp
/// @brief Static port, constraint, and dependency tables for every chip kind

#include "geom/coords.hpp"
#include "geom/direction.hpp"
#include "geom/orientation.hpp"
#include "save/chip_type.hpp"
#include "state/port.hpp"
#include "state/wire_size.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace tachy {

/// A port in the chip's own frame: local cell offset plus the side it faces
struct ChipPort {
    PortFlow flow;
    PortColor color;
    CoordsDelta delta;
    Direction dir;
};

/// A width constraint over local port indices. Exact/AtLeast/AtMost use
/// `a` and `size`; Equal and Double use `a` and `b`, where Double(a, b)
/// means size(b) == 2 * size(a).
struct AbstractConstraint {
    ConstraintKind kind;
    size_t a = 0;
    size_t b = 0;
    WireSize size = WireSize::ZERO;

    [[nodiscard]] static AbstractConstraint exact(size_t port, WireSize size) {
        return {ConstraintKind::EXACT, port, port, size};
    }
    [[nodiscard]] static AbstractConstraint at_least(size_t port, WireSize size) {
        return {ConstraintKind::AT_LEAST, port, port, size};
    }
    [[nodiscard]] static AbstractConstraint at_most(size_t port, WireSize size) {
        return {ConstraintKind::AT_MOST, port, port, size};
    }
    [[nodiscard]] static AbstractConstraint equal(size_t a, size_t b) {
        return {ConstraintKind::EQUAL, a, b, WireSize::ZERO};
    }
    [[nodiscard]] static AbstractConstraint doubled(size_t a, size_t b) {
        return {ConstraintKind::DOUBLE, a, b, WireSize::ZERO};
    }
};

/// Everything the checker needs to know about a chip kind
struct ChipData {
    std::vector<ChipPort> ports;
    std::vector<AbstractConstraint> constraints;
    /// (sink index, source index): the source's value is computed from the
    /// sink's value within the same subcycle
    std::vector<std::pair<size_t, size_t>> dependencies;
};

/// Port table for a chip type. Only Const depends on the type's value.
[[nodiscard]] ChipData chip_data(ChipType type);

/// Largest size port `index` can take given its Exact/AtMost constraints
[[nodiscard]] WireSize port_max_size(const ChipData& data, size_t index);

/// Ports of a chip placed with its top-left cell at `coords`
[[nodiscard]] std::vector<PortSpec> chip_ports(ChipType type, Coords coords, Orientation orient);

/// Constraints of a placed chip, expressed over its port locations
[[nodiscard]] std::vector<PortConstraint> chip_constraints(ChipType type, Coords coords,
                                                           Orientation orient);

/// Dependencies of a placed chip, expressed over its port locations
[[nodiscard]] std::vector<PortDependency> chip_dependencies(ChipType type, Coords coords,
                                                            Orientation orient);

} // namespace tachy
