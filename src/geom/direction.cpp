/// @file direction.cpp
/// @brief Direction deltas and text codes

#include "geom/direction.hpp"

#include "geom/coords.hpp"

namespace tachy {

const std::array<Direction, 4>& all_directions() {
    static const std::array<Direction, 4> dirs = {Direction::EAST, Direction::SOUTH,
                                                  Direction::WEST, Direction::NORTH};
    return dirs;
}

CoordsDelta direction_delta(Direction dir) {
    switch (dir) {
    case Direction::EAST:
        return {1, 0};
    case Direction::SOUTH:
        return {0, 1};
    case Direction::WEST:
        return {-1, 0};
    case Direction::NORTH:
        return {0, -1};
    }
    return {0, 0};
}

char direction_char(Direction dir) {
    switch (dir) {
    case Direction::EAST:
        return 'e';
    case Direction::SOUTH:
        return 's';
    case Direction::WEST:
        return 'w';
    case Direction::NORTH:
        return 'n';
    }
    return '?';
}

std::optional<Direction> direction_from_char(char c) {
    switch (c) {
    case 'e':
        return Direction::EAST;
    case 's':
        return Direction::SOUTH;
    case 'w':
        return Direction::WEST;
    case 'n':
        return Direction::NORTH;
    default:
        return std::nullopt;
    }
}

std::string_view direction_name(Direction dir) {
    switch (dir) {
    case Direction::EAST:
        return "East";
    case Direction::SOUTH:
        return "South";
    case Direction::WEST:
        return "West";
    case Direction::NORTH:
        return "North";
    }
    return "Unknown";
}

} // namespace tachy
