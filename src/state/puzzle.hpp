#pragma once

/// @file puzzle.hpp
/// @brief Puzzle descriptions, their runtime evaluators, and the built-in catalog

#include "geom/coords.hpp"
#include "save/chip_type.hpp"
#include "state/circuit_state.hpp"
#include "state/interface.hpp"
#include "state/port.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string_view>
#include <vector>

namespace tachy {

enum class PuzzleKind { TUTORIAL, FABRICATE, AUTOMATE, SANDBOX };

/// How a completed run is scored
enum class EvalScore { WIRE_LENGTH, TIME_STEPS, VALUE };

[[nodiscard]] std::string_view puzzle_kind_name(PuzzleKind kind);
[[nodiscard]] std::string_view eval_score_name(EvalScore score);

/// The slot behind one interface port
struct InterfaceSlot {
    WireLoc loc;
    size_t slot = 0;
};

/// slots[interface][port], in the puzzle's declaration order
using InterfaceSlots = std::vector<std::vector<InterfaceSlot>>;

/// Per-run puzzle logic. The circuit evaluator owns the loop and calls
/// these hooks; the puzzle injects stimulus through its Source interface
/// ports, samples its Sink ports, and decides when the task is done.
class PuzzleEval {
  public:
    virtual ~PuzzleEval() = default;

    [[nodiscard]] virtual double seconds_per_time_step() const { return 0.1; }

    /// Called before the first subcycle of every time step
    virtual void begin_time_step(CircuitState& state) = 0;

    /// Called before every subcycle except the first of a time step
    virtual void begin_additional_cycle(CircuitState& state) { (void)state; }

    /// Called after every subcycle, while that subcycle's events are visible
    virtual void end_subcycle(CircuitState& state) { (void)state; }

    /// Called once the cycle settles, before the time step ends
    virtual void end_cycle(CircuitState& state) { (void)state; }

    [[nodiscard]] virtual bool needs_another_cycle(const CircuitState& state) const {
        (void)state;
        return false;
    }

    virtual void end_time_step(CircuitState& state) { (void)state; }

    /// Checked after each time step; the state's time step has already
    /// advanced
    [[nodiscard]] virtual bool task_is_completed(const CircuitState& state) const {
        (void)state;
        return false;
    }

    [[nodiscard]] virtual EvalScore score_kind() const { return EvalScore::WIRE_LENGTH; }

    /// Score for EvalScore::VALUE puzzles
    [[nodiscard]] virtual uint32_t score_value() const { return 0; }

    /// Puzzle-specific numbers for the host to display, such as a
    /// fabrication table filled in as the run progresses
    [[nodiscard]] virtual std::vector<uint64_t> verification_data() const { return {}; }
};

/// Static description of a puzzle
class Puzzle {
  public:
    virtual ~Puzzle() = default;

    [[nodiscard]] virtual std::string_view title() const = 0;
    [[nodiscard]] virtual PuzzleKind kind() const = 0;
    [[nodiscard]] virtual std::string_view description() const = 0;
    [[nodiscard]] virtual bool allows_events() const = 0;
    [[nodiscard]] virtual std::vector<Interface> interfaces() const = 0;
    [[nodiscard]] virtual CoordsSize initial_board_size() const = 0;

    /// Chip kinds the player may place. Event chips are excluded unless the
    /// puzzle allows events, as is anything in disallowed_chips().
    [[nodiscard]] std::set<ChipKind> allowed_chips() const;

    [[nodiscard]] virtual std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const = 0;

  protected:
    [[nodiscard]] virtual std::set<ChipKind> disallowed_chips() const { return {}; }
};

// --- Built-in catalog ---

enum class PuzzleId { TUTORIAL_OR, FABRICATE_XOR, AUTOMATE_HELIOSTAT, SANDBOX_BEHAVIOR, SANDBOX_EVENT };

/// Host-supplied unlock rule (progress tracking lives outside the core)
using PuzzleUnlockPredicate = std::function<bool(PuzzleId)>;

/// Every built-in puzzle, in menu order
[[nodiscard]] const std::vector<PuzzleId>& puzzle_catalog();

[[nodiscard]] const Puzzle& puzzle_for(PuzzleId id);
[[nodiscard]] std::string_view puzzle_id_name(PuzzleId id);

/// Puzzles the predicate unlocks, in menu order. The first tutorial is
/// always unlocked.
[[nodiscard]] std::vector<PuzzleId> unlocked_puzzles(const PuzzleUnlockPredicate& is_unlocked);

} // namespace tachy
