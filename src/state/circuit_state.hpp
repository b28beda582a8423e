#pragma once

/// @file circuit_state.hpp
/// @brief Runtime slot storage shared by chip evaluators and the puzzle

#include "geom/coords.hpp"
#include "geom/fixed.hpp"
#include "state/errors.hpp"
#include "state/port.hpp"
#include "state/wire_size.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tachy {

/// Presses the player made on interactive chips, keyed by chip coords.
/// The host pushes presses between steps; Button and Toggle evaluators
/// consume them during eval.
class CircuitInteraction {
  public:
    /// Buffers `count` presses of the chip at `coords`
    void press(Coords coords, uint32_t count = 1);

    /// Consumes one buffered press; returns false if none is pending
    bool take_press(Coords coords);

    [[nodiscard]] uint32_t pending(Coords coords) const;
    [[nodiscard]] bool empty() const { return presses_.empty(); }
    void clear() { presses_.clear(); }

  private:
    std::map<Coords, uint32_t> presses_;
};

/// Value storage for every net of a running circuit.
///
/// Each net owns one slot in three parallel arrays: a behavior value, an
/// optional event, and an analog value. Values written to a slot are masked
/// to the slot's size. Events persist until the evaluator clears them at a
/// subcycle boundary, so every reader sees the same event.
class CircuitState {
  public:
    /// @param sizes Final size of each slot
    /// @param locs  Representative half-edge of each slot, used to attribute
    ///              runtime errors
    CircuitState(std::vector<WireSize> sizes, std::vector<WireLoc> locs);

    [[nodiscard]] size_t num_slots() const { return sizes_.size(); }
    [[nodiscard]] WireSize slot_size(size_t slot) const { return sizes_.at(slot); }
    [[nodiscard]] const WireLoc& slot_loc(size_t slot) const { return locs_.at(slot); }

    // --- Behavior ---
    void send_behavior(size_t slot, uint32_t value);
    [[nodiscard]] uint32_t recv_behavior(size_t slot) const { return behaviors_.at(slot); }

    // --- Events ---

    /// Raises a fatal DoubleEvent if the slot already holds an event
    void send_event(size_t slot, uint32_t value);
    [[nodiscard]] bool has_event(size_t slot) const { return events_.at(slot).has_value(); }
    [[nodiscard]] std::optional<uint32_t> recv_event(size_t slot) const { return events_.at(slot); }
    /// Latest event sent on the slot during the current time step, or the
    /// finished one until the next step begins. Unlike recv_event it
    /// survives the clearing between subcycles.
    [[nodiscard]] std::optional<uint32_t> last_event(size_t slot) const {
        return last_events_.at(slot);
    }

    // --- Analog ---
    void send_analog(size_t slot, Fixed value) { analogs_.at(slot) = value; }
    [[nodiscard]] Fixed recv_analog(size_t slot) const { return analogs_.at(slot); }

    /// Records that the Break chip at `coords` fired
    void breakpoint(Coords coords) { breakpoints_.push_back(coords); }

    /// Records an error at a slot's port
    void report_error(size_t slot, std::string message, bool fatal);
    /// Records an error with explicit attribution
    void report_error(std::optional<WireLoc> port, std::string message, bool fatal);
    void fatal_error(size_t slot, std::string message) { report_error(slot, std::move(message), true); }

    [[nodiscard]] uint32_t time_step() const { return time_step_; }
    [[nodiscard]] uint32_t subcycle() const { return subcycle_; }
    [[nodiscard]] bool has_fatal_error() const { return has_fatal_; }

    // --- Driven by CircuitEval ---
    void clear_events();
    void clear_last_events();
    void set_time_step(uint32_t time_step) { time_step_ = time_step; }
    void set_subcycle(uint32_t subcycle) { subcycle_ = subcycle; }
    [[nodiscard]] std::vector<EvalError> take_errors();
    [[nodiscard]] std::vector<Coords> take_breakpoints();

  private:
    std::vector<WireSize> sizes_;
    std::vector<WireLoc> locs_;
    std::vector<uint32_t> behaviors_;
    std::vector<std::optional<uint32_t>> events_;
    std::vector<std::optional<uint32_t>> last_events_;
    std::vector<Fixed> analogs_;

    std::vector<EvalError> errors_;
    std::vector<Coords> breakpoints_;
    uint32_t time_step_ = 0;
    uint32_t subcycle_ = 0;
    bool has_fatal_ = false;
};

} // namespace tachy
