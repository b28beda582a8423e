#pragma once

/// @file port.hpp
/// @brief Port flow/color, half-edge locations, and placed port constraints

#include "geom/coords.hpp"
#include "geom/direction.hpp"
#include "state/wire_size.hpp"

#include <string_view>
#include <tuple>

namespace tachy {

/// Whether a port drives its wire or reads from it
enum class PortFlow { SOURCE, SINK };

/// Signal discipline carried by a port
enum class PortColor { BEHAVIOR, EVENT, ANALOG };

[[nodiscard]] std::string_view port_flow_name(PortFlow flow);
[[nodiscard]] std::string_view port_color_name(PortColor color);

/// A half-edge: one side of one cell. Wire fragments and ports both live at
/// a WireLoc; a port at (c, d) connects to the fragment at (c, d).
struct WireLoc {
    Coords coords;
    Direction dir = Direction::EAST;

    /// The half-edge on the other side of the same cell boundary
    [[nodiscard]] WireLoc across() const { return {coords + dir, -dir}; }

    bool operator==(const WireLoc& other) const {
        return coords == other.coords && dir == other.dir;
    }
    bool operator!=(const WireLoc& other) const { return !(*this == other); }
    bool operator<(const WireLoc& other) const {
        return std::tie(coords.x, coords.y, dir) <
               std::tie(other.coords.x, other.coords.y, other.dir);
    }
};

/// A port placed on the board
struct PortSpec {
    PortFlow flow = PortFlow::SINK;
    PortColor color = PortColor::BEHAVIOR;
    WireLoc loc;
};

/// Kinds of width constraint a chip or interface places on its ports
enum class ConstraintKind { EXACT, AT_LEAST, AT_MOST, EQUAL, DOUBLE };

/// A width constraint between placed ports. For Exact/AtLeast/AtMost only
/// `a` and `size` are meaningful. Equal(a, b) ties two ports together;
/// Double(a, b) requires size(b) == 2 * size(a).
struct PortConstraint {
    ConstraintKind kind = ConstraintKind::EXACT;
    WireLoc a;
    WireLoc b;
    WireSize size = WireSize::ZERO;
};

/// Within one chip, the value at `source` depends on the value at `sink`
/// during the same subcycle.
struct PortDependency {
    WireLoc sink;
    WireLoc source;
};

} // namespace tachy
