#pragma once

/// @file coords.hpp
/// @brief Integer grid coordinates, deltas, sizes, and rectangles

#include "geom/direction.hpp"

#include <cstdint>
#include <tuple>

namespace tachy {

/// Offset between two grid cells
struct CoordsDelta {
    int32_t x = 0;
    int32_t y = 0;

    [[nodiscard]] CoordsDelta operator-() const { return {-x, -y}; }
    [[nodiscard]] CoordsDelta operator+(CoordsDelta other) const { return {x + other.x, y + other.y}; }
    [[nodiscard]] CoordsDelta operator*(int32_t k) const { return {x * k, y * k}; }
    bool operator==(const CoordsDelta& other) const { return x == other.x && y == other.y; }
    bool operator!=(const CoordsDelta& other) const { return !(*this == other); }
};

/// Width and height of a rectangular footprint
struct CoordsSize {
    int32_t width = 0;
    int32_t height = 0;

    [[nodiscard]] CoordsSize transposed() const { return {height, width}; }
    [[nodiscard]] int32_t area() const { return width * height; }
    [[nodiscard]] bool contains(CoordsDelta delta) const {
        return delta.x >= 0 && delta.y >= 0 && delta.x < width && delta.y < height;
    }
    bool operator==(const CoordsSize& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const CoordsSize& other) const { return !(*this == other); }
};

/// A grid cell
struct Coords {
    int32_t x = 0;
    int32_t y = 0;

    [[nodiscard]] Coords operator+(CoordsDelta d) const { return {x + d.x, y + d.y}; }
    [[nodiscard]] Coords operator-(CoordsDelta d) const { return {x - d.x, y - d.y}; }
    [[nodiscard]] CoordsDelta operator-(Coords other) const { return {x - other.x, y - other.y}; }
    /// The neighboring cell in the given direction
    [[nodiscard]] Coords operator+(Direction dir) const { return *this + direction_delta(dir); }

    bool operator==(const Coords& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Coords& other) const { return !(*this == other); }
    bool operator<(const Coords& other) const {
        return std::tie(x, y) < std::tie(other.x, other.y);
    }
};

/// Axis-aligned rectangle of cells: [x, x + width) x [y, y + height)
struct CoordsRect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    CoordsRect() = default;
    CoordsRect(int32_t x, int32_t y, int32_t width, int32_t height)
        : x(x), y(y), width(width), height(height) {}
    CoordsRect(Coords top_left, CoordsSize size)
        : x(top_left.x), y(top_left.y), width(size.width), height(size.height) {}

    [[nodiscard]] Coords top_left() const { return {x, y}; }
    [[nodiscard]] CoordsSize size() const { return {width, height}; }
    [[nodiscard]] bool is_empty() const { return width <= 0 || height <= 0; }

    [[nodiscard]] bool contains(Coords c) const {
        return c.x >= x && c.y >= y && c.x < x + width && c.y < y + height;
    }
    [[nodiscard]] bool contains_rect(const CoordsRect& other) const {
        return other.x >= x && other.y >= y && other.x + other.width <= x + width &&
               other.y + other.height <= y + height;
    }

    bool operator==(const CoordsRect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const CoordsRect& other) const { return !(*this == other); }
};

} // namespace tachy
