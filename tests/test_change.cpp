/// @file test_change.cpp
/// @brief Tests for change inversion, collapsing, and descriptions

#include <catch2/catch.hpp>

#include "state/change.hpp"

#include <vector>

using namespace tachy;

namespace {

const WireLoc LOC_A{{1, 1}, Direction::EAST};
const WireLoc LOC_B{{2, 1}, Direction::WEST};

ReplaceWires add_stub(const WireLoc& loc) {
    return {{}, {{loc, WireShape::STUB}}};
}

ReplaceWires remove_stub(const WireLoc& loc) {
    return {{{loc, WireShape::STUB}}, {}};
}

} // namespace

TEST_CASE("Every change has an exact inverse", "[change]") {
    const AddChip add{{2, 3}, ChipKind::MUX, Orientation(1, false)};
    CHECK(invert_change(add) == GridChange(RemoveChip{{2, 3}, ChipKind::MUX, Orientation(1, false)}));

    const SetBounds bounds{CoordsRect(0, 0, 4, 4), CoordsRect(-1, 0, 5, 4)};
    CHECK(invert_change(bounds) ==
          GridChange(SetBounds{CoordsRect(-1, 0, 5, 4), CoordsRect(0, 0, 4, 4)}));

    const ReplaceWires replace{{{LOC_A, WireShape::STUB}}, {{LOC_A, WireShape::STRAIGHT}}};
    CHECK(invert_change(replace) ==
          GridChange(ReplaceWires{{{LOC_A, WireShape::STRAIGHT}}, {{LOC_A, WireShape::STUB}}}));

    const MassAddWires mass{CoordsRect(0, 0, 3, 3), {{LOC_A, WireShape::STUB}}};
    CHECK(invert_change(mass) ==
          GridChange(MassRemoveWires{CoordsRect(0, 0, 3, 3), {{LOC_A, WireShape::STUB}}}));

    CHECK(invert_change(AddStubWire{{0, 0}, Direction::SOUTH}) ==
          GridChange(RemoveStubWire{{0, 0}, Direction::SOUTH}));

    for (const GridChange& change : std::vector<GridChange>{add, bounds, replace, mass}) {
        CHECK(invert_change(invert_change(change)) == change);
    }
}

TEST_CASE("Inverting a group reverses its order", "[change]") {
    const std::vector<GridChange> group = {
        AddChip{{0, 0}, ChipKind::NOT, {}},
        add_stub(LOC_A),
    };
    const std::vector<GridChange> inverted = invert_group(group);
    REQUIRE(inverted.size() == 2);
    CHECK(inverted[0] == GridChange(remove_stub(LOC_A)));
    CHECK(inverted[1] == GridChange(RemoveChip{{0, 0}, ChipKind::NOT, {}}));
}

TEST_CASE("Collapsing fuses and cancels neighbours", "[change]") {
    SECTION("A chip added then removed leaves nothing") {
        const std::vector<GridChange> group = {
            AddChip{{1, 1}, ChipKind::AND, {}},
            RemoveChip{{1, 1}, ChipKind::AND, {}},
        };
        CHECK(invert_and_collapse_group(group).empty());
    }

    SECTION("Different chips are kept apart") {
        const std::vector<GridChange> group = {
            AddChip{{1, 1}, ChipKind::AND, {}},
            RemoveChip{{1, 1}, ChipKind::OR, {}},
        };
        CHECK(invert_and_collapse_group(group).size() == 2);
    }

    SECTION("Consecutive wire replacements fuse into one") {
        const std::vector<GridChange> group = {add_stub(LOC_A), add_stub(LOC_B)};
        const auto collapsed = invert_and_collapse_group(group);
        REQUIRE(collapsed.size() == 1);
        const WireMap both = {{LOC_A, WireShape::STUB}, {LOC_B, WireShape::STUB}};
        CHECK(collapsed[0] == GridChange(ReplaceWires{both, {}}));
    }

    SECTION("A wire added then removed leaves nothing") {
        const std::vector<GridChange> group = {add_stub(LOC_A), remove_stub(LOC_A)};
        CHECK(invert_and_collapse_group(group).empty());
    }

    SECTION("Unchanged fragments are dropped") {
        const ReplaceWires replace{{{LOC_A, WireShape::STUB}, {LOC_B, WireShape::STUB}},
                                   {{LOC_A, WireShape::STUB}, {LOC_B, WireShape::STRAIGHT}}};
        const auto collapsed = invert_and_collapse_group({replace});
        REQUIRE(collapsed.size() == 1);
        CHECK(collapsed[0] == GridChange(ReplaceWires{{{LOC_B, WireShape::STRAIGHT}},
                                                      {{LOC_B, WireShape::STUB}}}));
    }

    SECTION("Bounds changes chain and cancel") {
        const CoordsRect a(0, 0, 4, 4);
        const CoordsRect b(0, 0, 5, 4);
        const CoordsRect c(0, 0, 5, 6);
        CHECK(collapse_group({SetBounds{a, b}, SetBounds{b, c}}) ==
              std::vector<GridChange>{SetBounds{a, c}});
        CHECK(collapse_group({SetBounds{a, b}, SetBounds{b, a}}).empty());
        CHECK(collapse_group({SetBounds{a, a}}).empty());
    }

    SECTION("Stub edits cancel") {
        const std::vector<GridChange> group = {
            RemoveStubWire{{3, 3}, Direction::NORTH},
            AddStubWire{{3, 3}, Direction::NORTH},
        };
        CHECK(collapse_group(group).empty());
    }
}

TEST_CASE("Change descriptions", "[change]") {
    CHECK(describe_change(AddChip{{3, 1}, ChipKind::AND, {}}) == "AddChip(And at (3, 1))");
    CHECK(describe_change(RemoveChip{{0, -2}, ChipType::constant(7), {}}) ==
          "RemoveChip(Const(7) at (0, -2))");
    CHECK(describe_change(add_stub(LOC_A)) == "ReplaceWires(0 -> 1 fragments)");
    CHECK(describe_change(SetBounds{CoordsRect(0, 0, 4, 4), CoordsRect(-1, 0, 5, 4)}) ==
          "SetBounds([0, 0 4x4] -> [-1, 0 5x4])");
    CHECK(describe_change(AddStubWire{{1, 2}, Direction::WEST}) == "AddStubWire((1, 2) West)");
}
