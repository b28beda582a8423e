/// @file test_eval.cpp
/// @brief End-to-end evaluation scenarios: build a board, start it, step it

#include <catch2/catch.hpp>

#include "state/edit_grid.hpp"
#include "state/eval.hpp"
#include "state/puzzle.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace tachy;
using namespace tachy::test;

namespace {

/// Xor between In1 (west), In2 (south) and Out (east) on a 3x3 board
EditGrid xor_board(const Puzzle& puzzle) {
    EditGrid grid = puzzle_grid(puzzle, 3, 3);
    place(grid, {1, 1}, ChipKind::XOR);
    draw(grid, {{-1, 1}, {0, 1}, {1, 1}});
    draw(grid, {{1, 3}, {1, 2}, {1, 1}});
    draw(grid, {{1, 1}, {2, 1}, {3, 1}});
    return grid;
}

/// Button -> Clock -> Counter.inc, with the counter driving a 4-bit sink
EditGrid counter_board(const Puzzle& puzzle) {
    EditGrid grid = puzzle_grid(puzzle, 5, 3);
    place(grid, {0, 0}, ChipKind::BUTTON);
    place(grid, {1, 0}, ChipKind::CLOCK);
    place(grid, {3, 1}, ChipKind::COUNTER);
    draw(grid, {{0, 0}, {1, 0}});
    draw(grid, {{1, 0}, {2, 0}, {3, 0}, {3, 1}});
    draw(grid, {{3, 1}, {4, 1}, {5, 1}});
    return grid;
}

/// Tick -> Sample -> Join -> Inc -> (loop breaker) -> back into Join, with
/// Latest reporting the loop value to a 4-bit sink on the east side
EditGrid loop_board(const Puzzle& puzzle, ChipKind breaker) {
    EditGrid grid = puzzle_grid(puzzle, 8, 4);
    place(grid, {0, 1}, ChipKind::SAMPLE);
    place(grid, {1, 1}, ChipKind::JOIN);
    place(grid, {2, 1}, ChipKind::INC);
    place(grid, {2, 2}, ChipType::constant(1), facing_north());
    place(grid, {3, 1}, breaker);
    place(grid, {5, 2}, ChipKind::LATEST);
    draw(grid, {{-1, 1}, {0, 1}});
    draw(grid, {{0, 1}, {1, 1}});
    draw(grid, {{1, 1}, {2, 1}});
    draw(grid, {{2, 2}, {2, 1}});
    draw(grid, {{2, 1}, {3, 1}});
    draw(grid, {{3, 1}, {4, 1}, {4, 2}, {4, 3}, {3, 3}, {2, 3}, {1, 3}, {1, 2}, {1, 1}});
    draw(grid, {{4, 2}, {5, 2}});
    draw(grid, {{5, 2}, {6, 2}, {7, 2}, {8, 2}});
    return grid;
}

FixturePuzzle loop_puzzle() {
    return FixturePuzzle({event_source("Tick", Direction::WEST),
                          behavior_sink("Value", Direction::EAST, WireSize::FOUR)});
}

/// Metronome -> Sample(Const 1) fanned out to both data ports of one Ram
EditGrid ram_board(const Puzzle& puzzle) {
    EditGrid grid = puzzle_grid(puzzle, 6, 5);
    place(grid, {0, 3}, ChipKind::SAMPLE);
    place(grid, {0, 4}, ChipType::constant(1), facing_north());
    place(grid, {2, 1}, ChipKind::RAM);
    draw(grid, {{-1, 3}, {0, 3}});
    draw(grid, {{0, 4}, {0, 3}});
    draw(grid, {{0, 3}, {1, 3}, {1, 2}, {1, 1}, {1, 0}, {2, 0}, {2, 1}});
    draw(grid, {{1, 3}, {2, 3}, {3, 3}, {3, 2}});
    return grid;
}

} // namespace

TEST_CASE("Xor truth table runs to completion without errors", "[eval][scenario]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = xor_board(puzzle);
    REQUIRE(grid.build_errors().empty());
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    const WireLoc out{{3, 1}, Direction::WEST};
    const std::vector<uint32_t> expected = {0, 1, 1, 0};
    for (size_t row = 0; row < expected.size(); ++row) {
        const StepOutcome outcome = eval.step_time_step();
        CHECK(outcome == (row + 1 < expected.size() ? StepOutcome::STEPPED : StepOutcome::COMPLETED));
        CHECK(grid.port_value(out) == expected[row]);
    }

    CHECK(eval.errors().empty());
    CHECK(eval.is_completed());
    CHECK(eval.time_step() == 4);
    CHECK(eval.score() == grid.wire_length());
    CHECK(eval.puzzle_eval().verification_data() ==
          std::vector<uint64_t>{0, 0, 0, 1, 0, 1, 0, 1, 1, 1, 1, 0});

    SECTION("Completed runs refuse to step further") {
        CHECK(eval.step_time_step() == StepOutcome::COMPLETED);
        CHECK(eval.time_step() == 4);
    }
}

TEST_CASE("Wrong fabrication output is a non-fatal error at the output port", "[eval]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = puzzle_grid(puzzle, 3, 3);
    place(grid, {1, 1}, ChipKind::AND);
    draw(grid, {{-1, 1}, {0, 1}, {1, 1}});
    draw(grid, {{1, 3}, {1, 2}, {1, 1}});
    draw(grid, {{1, 1}, {2, 1}, {3, 1}});
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    CHECK(eval.step_time_step() == StepOutcome::STEPPED);
    CHECK(eval.errors().empty());
    CHECK(eval.step_time_step() == StepOutcome::STEPPED);
    REQUIRE(eval.errors().size() == 1);
    const EvalError& error = eval.errors().front();
    CHECK_FALSE(error.fatal);
    CHECK(error.time_step == 1);
    CHECK(error.port == WireLoc{{3, 1}, Direction::WEST});

    // And disagrees with Xor on every row but the first
    CHECK(eval.step_time_step() == StepOutcome::STEPPED);
    CHECK(eval.step_time_step() == StepOutcome::COMPLETED);
    CHECK(eval.errors().size() == 3);
    CHECK(eval.errors().back().time_step == 3);
}

TEST_CASE("Button presses advance a counter through a clock", "[eval][scenario]") {
    FixturePuzzle puzzle({behavior_sink("Count", Direction::EAST, WireSize::FOUR)});
    EditGrid grid = counter_board(puzzle);
    REQUIRE(grid.build_errors().empty());
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    const WireLoc count{{5, 1}, Direction::WEST};
    REQUIRE(grid.net_size(*grid.net_at(count)) == WireSize::FOUR);

    // A clock emits in the step after the one that saw the press
    std::vector<uint32_t> readings;
    for (int step = 0; step < 4; ++step) {
        if (step < 3) {
            eval.interaction().press({0, 0});
        }
        REQUIRE(eval.step_time_step() == StepOutcome::STEPPED);
        readings.push_back(grid.port_value(count).value());
    }
    CHECK(readings == std::vector<uint32_t>{0, 1, 2, 3});
    CHECK(eval.errors().empty());
    CHECK(eval.interaction().empty());
}

TEST_CASE("Event wires show the event of the last time step", "[eval]") {
    FixturePuzzle puzzle({behavior_sink("Count", Direction::EAST, WireSize::FOUR)});
    EditGrid grid = counter_board(puzzle);
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    const WireLoc button{{0, 0}, Direction::EAST};
    const WireLoc clock{{1, 0}, Direction::EAST};
    CHECK_FALSE(grid.port_value(button).has_value());

    eval.interaction().press({0, 0});
    REQUIRE(eval.step_time_step() == StepOutcome::STEPPED);
    CHECK(grid.port_value(button) == 0u);
    CHECK_FALSE(grid.port_value(clock).has_value());

    REQUIRE(eval.step_time_step() == StepOutcome::STEPPED);
    CHECK_FALSE(grid.port_value(button).has_value());
    CHECK(grid.port_value(clock) == 0u);
}

TEST_CASE("Two presses in one step are replayed over extra subcycles", "[eval]") {
    FixturePuzzle puzzle({behavior_sink("Count", Direction::EAST, WireSize::FOUR)});
    EditGrid grid = puzzle_grid(puzzle, 5, 3);
    place(grid, {0, 0}, ChipKind::BUTTON);
    place(grid, {3, 1}, ChipKind::COUNTER);
    draw(grid, {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}});
    draw(grid, {{3, 1}, {4, 1}, {5, 1}});
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    eval.interaction().press({0, 0}, 2);
    CHECK(eval.step_subcycle() == StepOutcome::STEPPED);
    CHECK(eval.cycle_in_progress());
    CHECK(eval.subcycle() == 1);
    CHECK(eval.step_subcycle() == StepOutcome::STEPPED);
    CHECK_FALSE(eval.cycle_in_progress());
    CHECK(eval.time_step() == 1);
    CHECK(grid.port_value({{5, 1}, Direction::WEST}) == 2u);
}

TEST_CASE("A delay breaks an event loop", "[eval][scenario]") {
    FixturePuzzle puzzle = loop_puzzle();

    SECTION("With a Delay the board builds and the value climbs each subcycle") {
        EditGrid grid = loop_board(puzzle, ChipKind::DELAY);
        REQUIRE(grid.build_errors().empty());
        REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
        CircuitEval& eval = *grid.eval();

        const WireLoc latest{{8, 2}, Direction::WEST};
        for (uint32_t subcycle = 0; subcycle < 6; ++subcycle) {
            REQUIRE(eval.step_subcycle() == StepOutcome::STEPPED);
            CHECK(eval.cycle_in_progress());
            CHECK(grid.port_value(latest) == subcycle);
        }
        CHECK(eval.time_step() == 0);
        CHECK(eval.errors().empty());
    }

    SECTION("A loop that never settles hits the subcycle cap") {
        EditGrid grid = loop_board(puzzle, ChipKind::DELAY);
        Prefs prefs;
        prefs.max_subcycles_per_cycle = 8;
        REQUIRE(grid.start_eval(puzzle, prefs).empty());
        CircuitEval& eval = *grid.eval();

        CHECK(eval.step_cycle() == StepOutcome::ERRORED);
        CHECK(eval.subcycle() == 8);
        REQUIRE_FALSE(eval.errors().empty());
        CHECK(eval.errors().back().fatal);
        CHECK(eval.errors().back().message.find("did not settle") != std::string::npos);
        CHECK(eval.step_subcycle() == StepOutcome::ERRORED);

        eval.reset();
        CHECK_FALSE(eval.is_errored());
        CHECK(eval.errors().empty());
        CHECK(eval.step_subcycle() == StepOutcome::STEPPED);
    }

    SECTION("Without a Delay the loop is reported") {
        EditGrid grid = loop_board(puzzle, ChipKind::BREAK);
        REQUIRE(grid.build_errors().empty());
        const auto errors = grid.start_eval(puzzle, Prefs{});
        REQUIRE(errors.size() == 3);
        for (const auto& error : errors) {
            CHECK(error.kind == BuildErrorKind::COMBINATIONAL_LOOP);
            CHECK(error.net.has_value());
        }
        CHECK(grid.eval() == nullptr);
    }
}

TEST_CASE("Two writes to one RAM address in a subcycle stop the run", "[eval][scenario]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::SANDBOX_EVENT);
    EditGrid grid = ram_board(puzzle);
    REQUIRE(grid.build_errors().empty());
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
    CircuitEval& eval = *grid.eval();

    CHECK(eval.step_time_step() == StepOutcome::ERRORED);
    CHECK(eval.is_errored());
    REQUIRE(eval.errors().size() == 1);
    CHECK(eval.errors().front().fatal);
    CHECK(eval.errors().front().message.find("RAM address 0") != std::string::npos);

    CHECK(eval.step_time_step() == StepOutcome::ERRORED);
    CHECK(eval.step_subcycle() == StepOutcome::ERRORED);
    CHECK(eval.time_step() == 0);
    CHECK(eval.errors().size() == 1);

    SECTION("Reset clears the error and the run fails the same way again") {
        eval.reset();
        CHECK_FALSE(eval.is_errored());
        CHECK(eval.time_step() == 0);
        CHECK(eval.step_time_step() == StepOutcome::ERRORED);
        CHECK(eval.errors().size() == 1);
    }
}

TEST_CASE("Break chips pause stepping when asked to", "[eval]") {
    FixturePuzzle puzzle({event_source("Tick", Direction::WEST)});
    EditGrid grid = puzzle_grid(puzzle, 3, 3);
    place(grid, {1, 1}, ChipKind::BREAK);
    draw(grid, {{-1, 1}, {0, 1}, {1, 1}});

    SECTION("Stopping at breakpoints") {
        REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
        CircuitEval& eval = *grid.eval();
        CHECK(eval.step_time_step() == StepOutcome::BREAKPOINT);
        CHECK(eval.breakpoints() == std::vector<Coords>{{1, 1}});
        CHECK(eval.time_step() == 1);
    }

    SECTION("Ignoring breakpoints still records them") {
        Prefs prefs;
        prefs.stop_at_breakpoints = false;
        REQUIRE(grid.start_eval(puzzle, prefs).empty());
        CircuitEval& eval = *grid.eval();
        CHECK(eval.step_time_step() == StepOutcome::STEPPED);
        CHECK(eval.step_time_step() == StepOutcome::STEPPED);
        CHECK(eval.breakpoints().size() == 2);
    }
}

TEST_CASE("Completion reports the score", "[eval]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = xor_board(puzzle);
    std::string reported_title;
    uint32_t reported_score = 0;
    REQUIRE(grid
                .start_eval(puzzle, Prefs{},
                            [&](std::string_view title, uint32_t score) {
                                reported_title = std::string(title);
                                reported_score = score;
                            })
                .empty());
    CHECK(grid.eval()->step_cycle() == StepOutcome::STEPPED);
    CHECK(grid.eval()->step_cycle() == StepOutcome::STEPPED);
    CHECK(grid.eval()->step_cycle() == StepOutcome::STEPPED);
    CHECK(grid.eval()->step_cycle() == StepOutcome::COMPLETED);
    CHECK(reported_title == "1-Bit Xor Gate");
    CHECK(reported_score == 12);
}

TEST_CASE("Identical runs produce identical histories", "[eval]") {
    FixturePuzzle puzzle({behavior_sink("Count", Direction::EAST, WireSize::FOUR)});
    auto run = [&puzzle]() {
        EditGrid grid = counter_board(puzzle);
        REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());
        std::vector<uint32_t> history;
        for (int step = 0; step < 6; ++step) {
            if (step % 2 == 0) {
                grid.eval()->interaction().press({0, 0});
            }
            (void)grid.eval()->step_time_step();
            history.push_back(grid.port_value({{5, 1}, Direction::WEST}).value());
        }
        return history;
    };
    CHECK(run() == run());
}

TEST_CASE("The board is frozen while evaluating", "[eval][edit_grid]") {
    const Puzzle& puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = xor_board(puzzle);
    REQUIRE(grid.start_eval(puzzle, Prefs{}).empty());

    auto errors = grid.mutate({AddChip{{0, 0}, ChipKind::NOT, {}}});
    REQUIRE(errors.size() == 1);
    CHECK(errors.front().kind == GridErrorKind::EVAL_IN_PROGRESS);
    CHECK(grid.undo().front().kind == GridErrorKind::EVAL_IN_PROGRESS);

    grid.stop_eval();
    CHECK(grid.eval() == nullptr);
    CHECK_FALSE(grid.port_value({{3, 1}, Direction::WEST}).has_value());
    CHECK(grid.mutate({AddChip{{0, 0}, ChipKind::NOT, {}}}).empty());
}

TEST_CASE("Starting against a puzzle with other interfaces fails", "[eval]") {
    const Puzzle& xor_puzzle = puzzle_for(PuzzleId::FABRICATE_XOR);
    EditGrid grid = xor_board(xor_puzzle);
    const Puzzle& heliostat = puzzle_for(PuzzleId::AUTOMATE_HELIOSTAT);
    const auto errors = grid.start_eval(heliostat, Prefs{});
    REQUIRE(errors.size() == 2);
    CHECK(errors[0].kind == BuildErrorKind::INTERFACE_PORT_MISSING);
    CHECK(errors[1].kind == BuildErrorKind::INTERFACE_PORT_MISSING);
    CHECK(grid.eval() == nullptr);
}
