/// @file test_puzzles.cpp
/// @brief Tests for the puzzle catalog and the built-in puzzle evaluators

#include <catch2/catch.hpp>

#include "state/puzzle.hpp"
#include "state/puzzle/catalog.hpp"

#include <set>
#include <stdexcept>

using namespace tachy;

namespace {

/// One slot per interface port, numbered in declaration order, each sized
/// to its port
struct PuzzleBench {
    InterfaceSlots slots;
    CircuitState state;

    static PuzzleBench for_puzzle(const Puzzle& puzzle) {
        InterfaceSlots slots;
        std::vector<WireSize> sizes;
        std::vector<WireLoc> locs;
        const CoordsRect bounds(Coords{0, 0}, puzzle.initial_board_size());
        for (const Interface& iface : puzzle.interfaces()) {
            const std::vector<PortSpec> placed = iface.placed_ports(bounds);
            slots.emplace_back();
            for (size_t i = 0; i < placed.size(); ++i) {
                slots.back().push_back({placed[i].loc, sizes.size()});
                sizes.push_back(iface.ports[i].size);
                locs.push_back(placed[i].loc);
            }
        }
        return {slots, CircuitState(sizes, locs)};
    }
};

} // namespace

TEST_CASE("Catalog lists every puzzle once in menu order", "[puzzle]") {
    const auto& catalog = puzzle_catalog();
    REQUIRE(catalog.size() == 5);
    CHECK(catalog.front() == PuzzleId::TUTORIAL_OR);
    CHECK(std::set<PuzzleId>(catalog.begin(), catalog.end()).size() == catalog.size());

    CHECK(puzzle_for(PuzzleId::TUTORIAL_OR).title() == "1-Bit Or Gate");
    CHECK(puzzle_for(PuzzleId::FABRICATE_XOR).kind() == PuzzleKind::FABRICATE);
    CHECK(puzzle_for(PuzzleId::AUTOMATE_HELIOSTAT).title() == "Heliostat");
    CHECK(puzzle_for(PuzzleId::SANDBOX_EVENT).kind() == PuzzleKind::SANDBOX);
    CHECK(puzzle_id_name(PuzzleId::AUTOMATE_HELIOSTAT) == "AutomateHeliostat");
    CHECK(puzzle_kind_name(PuzzleKind::AUTOMATE) == "Automate");
    CHECK(eval_score_name(EvalScore::TIME_STEPS) == "Time");
}

TEST_CASE("Unlocking", "[puzzle]") {
    SECTION("The first tutorial is always open") {
        CHECK(unlocked_puzzles({}) == std::vector<PuzzleId>{PuzzleId::TUTORIAL_OR});
        CHECK(unlocked_puzzles([](PuzzleId) { return false; }) ==
              std::vector<PuzzleId>{PuzzleId::TUTORIAL_OR});
    }

    SECTION("The predicate picks the rest, in menu order") {
        const auto unlocked = unlocked_puzzles([](PuzzleId id) {
            return id == PuzzleId::SANDBOX_EVENT || id == PuzzleId::FABRICATE_XOR;
        });
        CHECK(unlocked == std::vector<PuzzleId>{PuzzleId::TUTORIAL_OR, PuzzleId::FABRICATE_XOR,
                                                PuzzleId::SANDBOX_EVENT});
    }

    SECTION("Everything") {
        CHECK(unlocked_puzzles([](PuzzleId) { return true; }) == puzzle_catalog());
    }
}

TEST_CASE("Allowed chips follow the puzzle", "[puzzle]") {
    const auto tutorial = puzzle_for(PuzzleId::TUTORIAL_OR).allowed_chips();
    CHECK(tutorial.count(ChipKind::AND) == 1);
    CHECK(tutorial.count(ChipKind::NOT) == 1);
    CHECK(tutorial.count(ChipKind::OR) == 0);
    CHECK(tutorial.count(ChipKind::XOR) == 0);
    CHECK(tutorial.count(ChipKind::CLOCK) == 0);

    const auto behavior = puzzle_for(PuzzleId::SANDBOX_BEHAVIOR).allowed_chips();
    const auto event = puzzle_for(PuzzleId::SANDBOX_EVENT).allowed_chips();
    CHECK(behavior.count(ChipKind::XOR) == 1);
    for (ChipKind kind : behavior) {
        CHECK_FALSE(is_event_chip(kind));
        CHECK(event.count(kind) == 1);
    }
    CHECK(event.count(ChipKind::CLOCK) == 1);
    CHECK(event.count(ChipKind::DELAY) == 1);
}

TEST_CASE("Puzzle evaluators check their slot layout", "[puzzle]") {
    const InterfaceSlots none;
    for (PuzzleId id : puzzle_catalog()) {
        CHECK_THROWS_AS(puzzle_for(id).new_eval(none), std::invalid_argument);
    }
    InterfaceSlots two_then_one(2);
    two_then_one[0].resize(2);
    two_then_one[1].resize(1);
    CHECK_NOTHROW(puzzle::expect_slot_layout(two_then_one, {2, 1}, "Two"));
    CHECK_THROWS_AS(puzzle::expect_slot_layout(two_then_one, {1, 2}, "Two"),
                    std::invalid_argument);
}

TEST_CASE("Truth tables drive each row and record the output", "[puzzle]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::TUTORIAL_OR);
    PuzzleBench bench = PuzzleBench::for_puzzle(puzzle);
    auto eval = puzzle.new_eval(bench.slots);
    CHECK(eval->score_kind() == EvalScore::WIRE_LENGTH);

    // Play the part of a circuit that always outputs 1
    for (uint32_t row = 0; row < 4; ++row) {
        bench.state.set_time_step(row);
        eval->begin_time_step(bench.state);
        CHECK(bench.state.recv_behavior(0) == (row & 1));
        CHECK(bench.state.recv_behavior(1) == (row >> 1));
        bench.state.send_behavior(2, 1);
        eval->end_cycle(bench.state);
        eval->end_time_step(bench.state);
        bench.state.set_time_step(row + 1);
        CHECK(eval->task_is_completed(bench.state) == (row == 3));
    }

    const auto errors = bench.state.take_errors();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].time_step == 0);
    CHECK_FALSE(errors[0].fatal);
    CHECK(errors[0].port == bench.slots[2][0].loc);
    CHECK(errors[0].message == "Expected output 0 for inputs 0 and 0, but output was 1.");
    CHECK(eval->verification_data() == std::vector<uint64_t>{0, 0, 1, 1, 0, 1, 0, 1, 1, 1, 1, 1});
}

TEST_CASE("Heliostat", "[puzzle][heliostat]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::AUTOMATE_HELIOSTAT);
    PuzzleBench bench = PuzzleBench::for_puzzle(puzzle);
    REQUIRE(bench.state.num_slots() == 5);
    auto eval = puzzle.new_eval(bench.slots);
    CHECK(eval->score_kind() == EvalScore::TIME_STEPS);

    auto run_step = [&](uint32_t time_step, uint32_t motor) {
        bench.state.set_time_step(time_step);
        eval->begin_time_step(bench.state);
        bench.state.send_behavior(4, motor);
        eval->end_cycle(bench.state);
        eval->end_time_step(bench.state);
    };

    SECTION("Energy drains with distance and the motor moves the mirror") {
        run_step(0, 0x2);
        CHECK(bench.state.recv_behavior(0) == 3);
        CHECK(bench.state.recv_behavior(1) == 7);
        CHECK(bench.state.recv_behavior(2) == 15);
        CHECK(bench.state.recv_behavior(3) == 15);
        // floor(sqrt(120^2 + 80^2)) = 144
        CHECK(eval->verification_data() == std::vector<uint64_t>{3, 7, 14, 15, 941});

        run_step(1, 0x0);
        CHECK(bench.state.recv_behavior(2) == 14);
        // floor(sqrt(110^2 + 80^2)) = 136
        CHECK(eval->verification_data() == std::vector<uint64_t>{3, 7, 14, 15, 890});
        CHECK_FALSE(eval->task_is_completed(bench.state));
    }

    SECTION("The mirror stops at the edges") {
        run_step(0, 0x1);
        run_step(1, 0x8);
        const auto data = eval->verification_data();
        CHECK(data[2] == 15);
        CHECK(data[3] == 15);
    }

    SECTION("The optimum moves every twenty steps, the same way every run") {
        for (uint32_t step = 0; step < 20; ++step) {
            run_step(step, 0);
        }
        bench.state.set_time_step(20);
        eval->begin_time_step(bench.state);
        CHECK(bench.state.recv_behavior(0) == 10);
        CHECK(bench.state.recv_behavior(1) == 0);

        auto again = puzzle.new_eval(bench.slots);
        bench.state.set_time_step(0);
        again->begin_time_step(bench.state);
        CHECK(bench.state.recv_behavior(0) == 3);
        CHECK(bench.state.recv_behavior(1) == 7);
    }
}

TEST_CASE("Sandboxes publish a timer and never finish", "[puzzle][sandbox]") {
    SECTION("Behavior") {
        const Puzzle& puzzle = puzzle_for(PuzzleId::SANDBOX_BEHAVIOR);
        PuzzleBench bench = PuzzleBench::for_puzzle(puzzle);
        auto eval = puzzle.new_eval(bench.slots);
        bench.state.set_time_step(300);
        eval->begin_time_step(bench.state);
        CHECK(bench.state.recv_behavior(0) == 44);
        CHECK_FALSE(eval->task_is_completed(bench.state));
    }

    SECTION("Event") {
        const Puzzle& puzzle = puzzle_for(PuzzleId::SANDBOX_EVENT);
        PuzzleBench bench = PuzzleBench::for_puzzle(puzzle);
        REQUIRE(bench.state.num_slots() == 2);
        auto eval = puzzle.new_eval(bench.slots);
        bench.state.set_time_step(7);
        eval->begin_time_step(bench.state);
        CHECK(bench.state.recv_event(0) == 0u);
        CHECK(bench.state.recv_behavior(1) == 7);
        CHECK_FALSE(eval->task_is_completed(bench.state));
        CHECK(bench.state.take_errors().empty());
    }
}
