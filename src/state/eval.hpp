#pragma once

/// @file eval.hpp
/// @brief Evaluation blueprint, scheduling, and the step-driven runtime

#include "geom/coords.hpp"
#include "save/chip_type.hpp"
#include "state/chip/chip_eval.hpp"
#include "state/circuit_state.hpp"
#include "state/errors.hpp"
#include "state/port.hpp"
#include "state/prefs.hpp"
#include "state/puzzle.hpp"
#include "state/wire_size.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tachy {

/// A placed chip with the slot behind each of its ports
struct BlueprintChip {
    Coords coords;
    ChipType type;
    std::vector<PortSlot> slots;
};

/// Everything needed to (re)build a running circuit. Slots are net indices.
struct CircuitBlueprint {
    std::vector<WireSize> slot_sizes;
    /// Representative half-edge of each slot
    std::vector<WireLoc> slot_locs;
    /// Chips in Coords order
    std::vector<BlueprintChip> chips;
    /// Evaluator indices in evaluation order. Evaluators are numbered in
    /// creation order: chip by chip, then entry by entry.
    std::vector<size_t> schedule;
    InterfaceSlots interface_slots;
    uint32_t wire_length = 0;
};

/// Orders the blueprint's evaluators with Kahn's algorithm and stores the
/// result in `blueprint.schedule`.
/// @return One CombinationalLoop error per net that carries a value
///         between two evaluators caught in a loop
[[nodiscard]] std::vector<BuildError> schedule_blueprint(CircuitBlueprint& blueprint);

/// Result of one step call
enum class StepOutcome { STEPPED, BREAKPOINT, COMPLETED, ERRORED };

[[nodiscard]] std::string_view step_outcome_name(StepOutcome outcome);

/// Receives (puzzle title, score) when a run completes
using ScoreReporter = std::function<void(std::string_view, uint32_t)>;

/// Runs a circuit built from a blueprint.
///
/// Time is hierarchical. A subcycle is one pass over the schedule. Subcycles
/// repeat until no chip and not the puzzle asks for another; that is a
/// cycle. A time step is one cycle plus the bookkeeping between steps.
/// Fatal errors and task completion are terminal until reset().
///
/// The puzzle must outlive the evaluator.
class CircuitEval {
  public:
    CircuitEval(CircuitBlueprint blueprint, const Puzzle& puzzle, Prefs prefs,
                ScoreReporter reporter = {});

    CircuitEval(const CircuitEval&) = delete;
    CircuitEval& operator=(const CircuitEval&) = delete;

    /// Runs one subcycle, finishing the time step if the cycle settles
    StepOutcome step_subcycle();

    /// Runs subcycles until the current time step ends
    StepOutcome step_cycle();

    /// Runs the rest of the current time step. With one cycle per step this
    /// stops at the same place as step_cycle().
    StepOutcome step_time_step();

    /// Discards all runtime state and rebuilds it from the blueprint
    void reset();

    [[nodiscard]] uint32_t time_step() const { return state_.time_step(); }
    /// Subcycles run so far in the current cycle
    [[nodiscard]] uint32_t subcycle() const { return subcycles_in_cycle_; }
    [[nodiscard]] bool cycle_in_progress() const { return cycle_in_progress_; }

    [[nodiscard]] const CircuitState& state() const { return state_; }
    [[nodiscard]] const CircuitBlueprint& blueprint() const { return blueprint_; }
    [[nodiscard]] const Prefs& prefs() const { return prefs_; }

    /// Press buffer for Button and Toggle chips. Stable for the evaluator's
    /// lifetime.
    [[nodiscard]] CircuitInteraction& interaction() { return *interaction_; }

    /// Break chips that fired, oldest first
    [[nodiscard]] const std::vector<Coords>& breakpoints() const { return breakpoints_; }
    void clear_breakpoints() { breakpoints_.clear(); }

    /// Every error raised since the last reset, oldest first
    [[nodiscard]] const std::vector<EvalError>& errors() const { return errors_; }

    [[nodiscard]] bool is_completed() const { return score_.has_value(); }
    [[nodiscard]] bool is_errored() const { return errored_; }
    [[nodiscard]] std::optional<uint32_t> score() const { return score_; }

    [[nodiscard]] const PuzzleEval& puzzle_eval() const { return *puzzle_eval_; }

    /// The puzzle's pacing, or the override from Prefs
    [[nodiscard]] double seconds_per_time_step() const;

  private:
    void build_runtime();
    [[nodiscard]] StepOutcome terminal_outcome() const;
    /// Moves errors and breakpoints out of the state; returns true if a
    /// breakpoint fired
    bool collect_state();
    void finish_time_step();
    void complete();

    CircuitBlueprint blueprint_;
    const Puzzle* puzzle_;
    Prefs prefs_;
    ScoreReporter reporter_;

    std::unique_ptr<CircuitInteraction> interaction_;
    CircuitState state_;
    std::vector<std::unique_ptr<ChipEval>> evals_;
    std::unique_ptr<PuzzleEval> puzzle_eval_;

    bool cycle_in_progress_ = false;
    uint32_t subcycles_in_cycle_ = 0;
    bool errored_ = false;
    std::optional<uint32_t> score_;
    std::vector<EvalError> errors_;
    std::vector<Coords> breakpoints_;
};

} // namespace tachy
