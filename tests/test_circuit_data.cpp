/// @file test_circuit_data.cpp
/// @brief Tests for the saved board format and loading boards from it

#include <catch2/catch.hpp>

#include "save/circuit_data.hpp"
#include "state/edit_grid.hpp"
#include "state/puzzle.hpp"
#include "test_helpers.hpp"

using namespace tachy;
using namespace tachy::test;

TEST_CASE("Delta keys", "[circuit_data]") {
    CHECK(encode_delta_key({2, -3}) == "p2m3");
    CHECK(encode_delta_key({0, 0}) == "p0p0");
    CHECK(encode_delta_key({-10, 7}) == "m10p7");
    CHECK(decode_delta_key("m10p7") == CoordsDelta{-10, 7});
    CHECK(decode_delta_key("p999999999m1") == CoordsDelta{999999999, -1});

    SECTION("Malformed keys") {
        CHECK_FALSE(decode_delta_key("").has_value());
        CHECK_FALSE(decode_delta_key("p2").has_value());
        CHECK_FALSE(decode_delta_key("p2m").has_value());
        CHECK_FALSE(decode_delta_key("x2p3").has_value());
        CHECK_FALSE(decode_delta_key("p2p3p4").has_value());
        CHECK_FALSE(decode_delta_key("p1000000000p0").has_value());
        CHECK_FALSE(decode_delta_key("p-2p3").has_value());
    }
}

TEST_CASE("Wire keys and chip values", "[circuit_data]") {
    CHECK(encode_wire_key({1, -1}, Direction::NORTH) == "p1m1n");
    const auto wire = decode_wire_key("m4p0w");
    REQUIRE(wire.has_value());
    CHECK(wire->first == CoordsDelta{-4, 0});
    CHECK(wire->second == Direction::WEST);
    CHECK_FALSE(decode_wire_key("p0p0").has_value());
    CHECK_FALSE(decode_wire_key("p0p0q").has_value());
    CHECK_FALSE(decode_wire_key("").has_value());

    CHECK(encode_chip_value(Orientation(1, true), ChipType::constant(5)) == "t1-Const(5)");
    const auto chip = decode_chip_value("f2-Mux");
    REQUIRE(chip.has_value());
    CHECK(chip->first == Orientation(2, false));
    CHECK(chip->second == ChipType(ChipKind::MUX));
    CHECK_FALSE(decode_chip_value("f2Mux").has_value());
    CHECK_FALSE(decode_chip_value("f9-Mux").has_value());
    CHECK_FALSE(decode_chip_value("f0-Widget").has_value());
}

TEST_CASE("Each connected group is written once", "[circuit_data]") {
    SECTION("A straight run between two stubs keeps only the straight") {
        const WireMap fragments = {
            {{{0, 0}, Direction::EAST}, WireShape::STUB},
            {{{1, 0}, Direction::WEST}, WireShape::STRAIGHT},
            {{{1, 0}, Direction::EAST}, WireShape::STRAIGHT},
            {{{2, 0}, Direction::WEST}, WireShape::STUB},
        };
        const auto wires = encode_wires(fragments, {0, 0});
        CHECK(wires == std::map<std::string, std::string>{{"p1p0e", "Straight"}});
        CHECK(decode_wires(wires, {0, 0}) == fragments);
    }

    SECTION("A lone stub pair keeps the east side") {
        const WireMap fragments = {
            {{{0, 0}, Direction::EAST}, WireShape::STUB},
            {{{1, 0}, Direction::WEST}, WireShape::STUB},
        };
        const auto wires = encode_wires(fragments, {0, 0});
        CHECK(wires == std::map<std::string, std::string>{{"p0p0e", "Stub"}});
        CHECK(decode_wires(wires, {0, 0}) == fragments);
    }

    SECTION("Turns and tees") {
        const WireMap fragments = {
            {{{1, 1}, Direction::EAST}, WireShape::TURN_LEFT},
            {{{1, 1}, Direction::NORTH}, WireShape::TURN_RIGHT},
            {{{2, 1}, Direction::WEST}, WireShape::SPLIT_TEE},
            {{{2, 1}, Direction::NORTH}, WireShape::SPLIT_LEFT},
            {{{2, 1}, Direction::SOUTH}, WireShape::SPLIT_RIGHT},
            {{{1, 0}, Direction::SOUTH}, WireShape::STUB},
            {{{2, 0}, Direction::SOUTH}, WireShape::STUB},
            {{{2, 2}, Direction::NORTH}, WireShape::STUB},
        };
        const auto wires = encode_wires(fragments, {1, 0});
        CHECK(wires == std::map<std::string, std::string>{{"p0p1e", "TurnLeft"},
                                                          {"p1p1w", "SplitTee"}});
        CHECK(decode_wires(wires, {1, 0}) == fragments);
    }

    SECTION("Overlapping and malformed entries are skipped") {
        const std::map<std::string, std::string> wires = {
            {"p0p0e", "Straight"},
            {"p0p0w", "TurnLeft"},
            {"p5p5e", "Sideways"},
            {"nonsense", "Stub"},
        };
        const WireMap fragments = decode_wires(wires, {0, 0});
        CHECK(fragments.size() == 4);
        CHECK(fragments.at({{0, 0}, Direction::WEST}) == WireShape::STRAIGHT);
        CHECK(fragments.count({{0, 0}, Direction::SOUTH}) == 0);
    }
}

TEST_CASE("A board survives saving and loading", "[circuit_data][edit_grid]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = puzzle_grid(puzzle, 3, 3);
    place(grid, {1, 1}, ChipKind::XOR);
    draw(grid, {{-1, 1}, {0, 1}, {1, 1}});
    draw(grid, {{1, 3}, {1, 2}, {1, 1}});
    draw(grid, {{1, 1}, {2, 1}, {3, 1}});

    const CircuitData data = grid.to_circuit_data();
    CHECK(data.size == CoordsSize{3, 3});
    CHECK(data.chips == std::map<std::string, std::string>{{"p1p1", "f0-Xor"}});
    CHECK(data.wires == std::map<std::string, std::string>{{"p0p1e", "Straight"},
                                                           {"p1p2s", "Straight"},
                                                           {"p2p1e", "Straight"}});

    EditGrid loaded = EditGrid::from_circuit_data(puzzle, data);
    CHECK(loaded.bounds() == grid.bounds());
    CHECK(loaded.fragments() == grid.fragments());
    CHECK(loaded.wire_length() == 12);
    CHECK(loaded.build_errors().empty());
    CHECK(loaded.to_circuit_data() == data);
    CHECK_FALSE(loaded.can_undo());
}

TEST_CASE("Loading skips entries that do not fit the puzzle", "[circuit_data][edit_grid]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    CircuitData data;
    data.size = {3, 3};
    data.chips = {
        {"p1p1", "f0-Xor"},
        {"p9p9", "f0-And"},
        {"bogus", "f0-And"},
        {"p0p2", "f0-Widget"},
        {"p2p2", "f0-Clock"},
    };
    data.wires = {
        {"p0p0e", "Straight"},
        {"p1p1e", "Straight"},
        {"zzz", "Stub"},
    };

    const EditGrid grid = EditGrid::from_circuit_data(puzzle, data);
    REQUIRE(grid.chips().size() == 1);
    CHECK(grid.chips().begin()->first == Coords{1, 1});
    CHECK(grid.chips().begin()->second.type == ChipType(ChipKind::XOR));

    // The straight under the Xor goes, and so do the stubs it stranded
    const WireMap expected = {
        {{{-1, 0}, Direction::EAST}, WireShape::STUB},
        {{{0, 0}, Direction::WEST}, WireShape::STRAIGHT},
        {{{0, 0}, Direction::EAST}, WireShape::STRAIGHT},
        {{{1, 0}, Direction::WEST}, WireShape::STUB},
    };
    CHECK(grid.fragments() == expected);
}

TEST_CASE("Loading grows bounds too small for the interfaces", "[circuit_data][edit_grid]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::AUTOMATE_HELIOSTAT);
    CircuitData data;
    data.size = {1, 1};
    const EditGrid grid = EditGrid::from_circuit_data(puzzle, data);
    CHECK(grid.bounds().width >= 5);
    CHECK(grid.bounds().top_left() == Coords{0, 0});
    CHECK(grid.fragments().empty());
}
