/// @file test_wire.cpp
/// @brief Tests for wire shapes and wire sizes

#include <catch2/catch.hpp>

#include "save/wire_shape.hpp"
#include "state/wire_size.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace tachy;

namespace {

std::vector<Direction> sorted(std::vector<Direction> dirs) {
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

} // namespace

TEST_CASE("Shapes connect the expected sides", "[wire][shape]") {
    CHECK(connected_directions(WireShape::STUB, Direction::NORTH) ==
          std::vector<Direction>{Direction::NORTH});
    CHECK(sorted(connected_directions(WireShape::STRAIGHT, Direction::EAST)) ==
          sorted({Direction::EAST, Direction::WEST}));
    CHECK(sorted(connected_directions(WireShape::TURN_LEFT, Direction::EAST)) ==
          sorted({Direction::EAST, Direction::NORTH}));
    CHECK(sorted(connected_directions(WireShape::TURN_RIGHT, Direction::EAST)) ==
          sorted({Direction::EAST, Direction::SOUTH}));
    CHECK(sorted(connected_directions(WireShape::SPLIT_TEE, Direction::SOUTH)) ==
          sorted({Direction::SOUTH, Direction::EAST, Direction::WEST}));
    CHECK(sorted(connected_directions(WireShape::SPLIT_LEFT, Direction::WEST)) ==
          sorted({Direction::WEST, Direction::EAST, Direction::SOUTH}));
    CHECK(connected_directions(WireShape::CROSS, Direction::NORTH).size() == 4);
}

TEST_CASE("Every side of a group agrees on the group", "[wire][shape]") {
    const WireShape shape =
        GENERATE(WireShape::STUB, WireShape::STRAIGHT, WireShape::TURN_LEFT, WireShape::TURN_RIGHT,
                 WireShape::SPLIT_TEE, WireShape::SPLIT_LEFT, WireShape::SPLIT_RIGHT,
                 WireShape::CROSS);
    for (Direction dir : all_directions()) {
        const auto group = connected_directions(shape, dir);
        CHECK(shape_for_group(dir, group) == shape);
        for (Direction side : group) {
            CHECK(sorted(connected_directions(shape_for_group(side, group), side)) == sorted(group));
        }
    }
}

TEST_CASE("Shape for a group without its own side is rejected", "[wire][shape]") {
    CHECK_THROWS_AS(shape_for_group(Direction::EAST, {Direction::WEST}), std::invalid_argument);
}

TEST_CASE("Shape names", "[wire][shape]") {
    CHECK(wire_shape_name(WireShape::SPLIT_TEE) == "SplitTee");
    CHECK(parse_wire_shape("TurnRight") == WireShape::TURN_RIGHT);
    CHECK_FALSE(parse_wire_shape("turnright").has_value());
    CHECK_FALSE(parse_wire_shape("").has_value());
}

TEST_CASE("Wire size bits and masks", "[wire][size]") {
    CHECK(num_bits(WireSize::ZERO) == 0);
    CHECK(num_bits(WireSize::SIXTEEN) == 16);
    CHECK(mask(WireSize::ONE) == 0x1u);
    CHECK(mask(WireSize::EIGHT) == 0xffu);
    CHECK(mask(WireSize::ANALOG) == 0u);

    CHECK(min_for_value(0) == WireSize::ZERO);
    CHECK(min_for_value(1) == WireSize::ONE);
    CHECK(min_for_value(3) == WireSize::TWO);
    CHECK(min_for_value(4) == WireSize::FOUR);
    CHECK(min_for_value(255) == WireSize::EIGHT);
    CHECK(min_for_value(256) == WireSize::SIXTEEN);

    CHECK(half(WireSize::FOUR) == WireSize::TWO);
    CHECK_FALSE(half(WireSize::ANALOG).has_value());
    CHECK(double_size(WireSize::EIGHT) == WireSize::SIXTEEN);
    CHECK_FALSE(double_size(WireSize::SIXTEEN).has_value());

    CHECK(parse_wire_size("8") == WireSize::EIGHT);
    CHECK(parse_wire_size("Four") == WireSize::FOUR);
    CHECK_FALSE(parse_wire_size("3").has_value());
}

TEST_CASE("Wire size intervals", "[wire][size]") {
    SECTION("Narrowing") {
        auto interval = WireSizeInterval::full();
        CHECK(interval.is_ambiguous());
        CHECK(interval.make_at_least(WireSize::TWO));
        CHECK_FALSE(interval.make_at_least(WireSize::ONE));
        CHECK(interval.make_at_most(WireSize::EIGHT));
        CHECK(interval == WireSizeInterval(WireSize::TWO, WireSize::EIGHT));
        CHECK(interval.lower_bound() == WireSize::TWO);
        CHECK(interval.make_at_most(WireSize::ONE));
        CHECK(interval.is_empty());
        CHECK_FALSE(interval.lower_bound().has_value());
        CHECK(interval == WireSizeInterval::empty());
    }

    SECTION("Intersection") {
        const WireSizeInterval a(WireSize::ONE, WireSize::EIGHT);
        const WireSizeInterval b(WireSize::FOUR, WireSize::SIXTEEN);
        CHECK(a.intersection(b) == WireSizeInterval(WireSize::FOUR, WireSize::EIGHT));
        CHECK(a.intersection(WireSizeInterval::exactly(WireSize::SIXTEEN)).is_empty());
    }

    SECTION("Halving and doubling") {
        CHECK(WireSizeInterval(WireSize::ONE, WireSize::SIXTEEN).half() ==
              WireSizeInterval(WireSize::ONE, WireSize::EIGHT));
        CHECK(WireSizeInterval(WireSize::ONE, WireSize::FOUR).doubled() ==
              WireSizeInterval(WireSize::TWO, WireSize::EIGHT));
        CHECK(WireSizeInterval(WireSize::EIGHT, WireSize::SIXTEEN).doubled() ==
              WireSizeInterval::exactly(WireSize::SIXTEEN));
        CHECK(WireSizeInterval::exactly(WireSize::SIXTEEN).doubled().is_empty());
        CHECK(WireSizeInterval::empty().half().is_empty());
    }

    SECTION("Zero-width intervals halve and double to zero") {
        const auto zero = WireSizeInterval::exactly(WireSize::ZERO);
        CHECK(zero.half() == zero);
        CHECK(zero.doubled() == zero);
        CHECK(WireSizeInterval(WireSize::ZERO, WireSize::FOUR).half() ==
              WireSizeInterval(WireSize::ONE, WireSize::TWO));
    }
}
