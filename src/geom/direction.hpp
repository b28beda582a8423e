#pragma once

/// @file direction.hpp
/// @brief The four grid directions and their rotations

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tachy {

struct CoordsDelta;

/// A grid direction. Screen convention: +x is East, +y is South.
enum class Direction : uint8_t { EAST, SOUTH, WEST, NORTH };

/// All four directions in clockwise order starting from East
[[nodiscard]] const std::array<Direction, 4>& all_directions();

/// Unit step for a direction (North is (0, -1))
[[nodiscard]] CoordsDelta direction_delta(Direction dir);

[[nodiscard]] constexpr Direction rotate_cw(Direction dir) {
    return static_cast<Direction>((static_cast<uint8_t>(dir) + 1) % 4);
}

[[nodiscard]] constexpr Direction rotate_ccw(Direction dir) {
    return static_cast<Direction>((static_cast<uint8_t>(dir) + 3) % 4);
}

/// The opposite direction
[[nodiscard]] constexpr Direction operator-(Direction dir) {
    return static_cast<Direction>((static_cast<uint8_t>(dir) + 2) % 4);
}

/// Mirrors across the vertical axis (swaps East and West)
[[nodiscard]] constexpr Direction flip_horz(Direction dir) {
    switch (dir) {
    case Direction::EAST:
        return Direction::WEST;
    case Direction::WEST:
        return Direction::EAST;
    default:
        return dir;
    }
}

/// Mirrors across the horizontal axis (swaps North and South)
[[nodiscard]] constexpr Direction flip_vert(Direction dir) {
    switch (dir) {
    case Direction::NORTH:
        return Direction::SOUTH;
    case Direction::SOUTH:
        return Direction::NORTH;
    default:
        return dir;
    }
}

/// True for East and West
[[nodiscard]] constexpr bool is_horizontal(Direction dir) {
    return dir == Direction::EAST || dir == Direction::WEST;
}

/// One-letter code used in wire keys ('e', 's', 'w', 'n')
[[nodiscard]] char direction_char(Direction dir);

/// Parses a one-letter direction code
[[nodiscard]] std::optional<Direction> direction_from_char(char c);

[[nodiscard]] std::string_view direction_name(Direction dir);

} // namespace tachy
