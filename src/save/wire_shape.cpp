/// @file wire_shape.cpp
/// @brief Shape/connection-set mapping and shape names

#include "save/wire_shape.hpp"

#include <algorithm>
#include <stdexcept>

namespace tachy {

std::vector<Direction> connected_directions(WireShape shape, Direction dir) {
    switch (shape) {
    case WireShape::STUB:
        return {dir};
    case WireShape::STRAIGHT:
        return {dir, -dir};
    case WireShape::TURN_LEFT:
        return {dir, rotate_ccw(dir)};
    case WireShape::TURN_RIGHT:
        return {dir, rotate_cw(dir)};
    case WireShape::SPLIT_TEE:
        return {dir, rotate_cw(dir), rotate_ccw(dir)};
    case WireShape::SPLIT_LEFT:
        return {dir, -dir, rotate_ccw(dir)};
    case WireShape::SPLIT_RIGHT:
        return {dir, -dir, rotate_cw(dir)};
    case WireShape::CROSS:
        return {dir, rotate_cw(dir), -dir, rotate_ccw(dir)};
    }
    return {dir};
}

WireShape shape_for_group(Direction dir, const std::vector<Direction>& group) {
    auto has = [&group](Direction d) {
        return std::find(group.begin(), group.end(), d) != group.end();
    };
    if (!has(dir)) {
        throw std::invalid_argument("shape_for_group() requires the group to contain the side");
    }
    bool opposite = has(-dir);
    bool left = has(rotate_ccw(dir));
    bool right = has(rotate_cw(dir));
    if (opposite && left && right) {
        return WireShape::CROSS;
    }
    if (opposite) {
        if (left) {
            return WireShape::SPLIT_LEFT;
        }
        return right ? WireShape::SPLIT_RIGHT : WireShape::STRAIGHT;
    }
    if (left && right) {
        return WireShape::SPLIT_TEE;
    }
    if (left) {
        return WireShape::TURN_LEFT;
    }
    return right ? WireShape::TURN_RIGHT : WireShape::STUB;
}

std::string_view wire_shape_name(WireShape shape) {
    switch (shape) {
    case WireShape::STUB:
        return "Stub";
    case WireShape::STRAIGHT:
        return "Straight";
    case WireShape::TURN_LEFT:
        return "TurnLeft";
    case WireShape::TURN_RIGHT:
        return "TurnRight";
    case WireShape::SPLIT_TEE:
        return "SplitTee";
    case WireShape::SPLIT_LEFT:
        return "SplitLeft";
    case WireShape::SPLIT_RIGHT:
        return "SplitRight";
    case WireShape::CROSS:
        return "Cross";
    }
    return "Unknown";
}

std::optional<WireShape> parse_wire_shape(std::string_view name) {
    for (WireShape shape :
         {WireShape::STUB, WireShape::STRAIGHT, WireShape::TURN_LEFT, WireShape::TURN_RIGHT,
          WireShape::SPLIT_TEE, WireShape::SPLIT_LEFT, WireShape::SPLIT_RIGHT, WireShape::CROSS}) {
        if (wire_shape_name(shape) == name) {
            return shape;
        }
    }
    return std::nullopt;
}

} // namespace tachy
