#pragma once

/// @file chip_eval.hpp
/// @brief Runtime evaluator interface for placed chips

#include "geom/coords.hpp"
#include "save/chip_type.hpp"
#include "state/circuit_state.hpp"
#include "state/wire_size.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace tachy {

/// The slot a chip port is wired to, with the slot's final size
struct PortSlot {
    size_t slot = 0;
    WireSize size = WireSize::ZERO;
};

/// Per-chip runtime behavior.
///
/// During each subcycle the scheduler calls eval() once, after every
/// evaluator producing this one's inputs. After the pass it polls
/// needs_another_cycle() on every evaluator; returning true requests another
/// subcycle. on_time_step() runs once between time steps.
class ChipEval {
  public:
    virtual ~ChipEval() = default;

    virtual void eval(CircuitState& state) = 0;

    [[nodiscard]] virtual bool needs_another_cycle(const CircuitState& state) {
        (void)state;
        return false;
    }

    virtual void on_time_step() {}
};

/// An evaluator together with the local port indices it writes
struct ChipEvalEntry {
    std::vector<size_t> outputs;
    std::unique_ptr<ChipEval> eval;
};

/// Builds the evaluators for one placed chip.
/// @param slots    One entry per chip port, in port-table order
/// @param interact Press buffer for Button and Toggle; must outlive the
///                 returned evaluators
/// @throws std::invalid_argument if `slots` does not match the port table
[[nodiscard]] std::vector<ChipEvalEntry> new_chip_evals(ChipType type, Coords coords,
                                                        const std::vector<PortSlot>& slots,
                                                        CircuitInteraction* interact);

} // namespace tachy
