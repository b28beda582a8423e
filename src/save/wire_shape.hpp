#pragma once

/// @file wire_shape.hpp
/// @brief Wire fragment shapes and the in-cell connections each one makes

#include "geom/direction.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace tachy {

/// Shape of the wire fragment on one side (half-edge) of a cell.
///
/// Each shape names the other sides of the same cell it is joined to; every
/// side it joins carries the matching partner shape.
enum class WireShape {
    STUB,        ///< Stops immediately inside the cell
    STRAIGHT,    ///< Joins the opposite side
    TURN_LEFT,   ///< Joins the side counterclockwise from this one
    TURN_RIGHT,  ///< Joins the side clockwise from this one
    SPLIT_TEE,   ///< Joins both perpendicular sides
    SPLIT_LEFT,  ///< Joins the opposite side and the counterclockwise side
    SPLIT_RIGHT, ///< Joins the opposite side and the clockwise side
    CROSS        ///< Joins all four sides
};

/// The set of sides joined by `shape` sitting on side `dir`, including `dir`
[[nodiscard]] std::vector<Direction> connected_directions(WireShape shape, Direction dir);

/// The shape side `dir` must carry when it belongs to the connected group of
/// sides `group` (which must contain `dir`).
/// @throws std::invalid_argument if `group` does not contain `dir`
[[nodiscard]] WireShape shape_for_group(Direction dir, const std::vector<Direction>& group);

[[nodiscard]] std::string_view wire_shape_name(WireShape shape);
[[nodiscard]] std::optional<WireShape> parse_wire_shape(std::string_view name);

} // namespace tachy
