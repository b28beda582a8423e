/// @file sandbox.cpp
/// @brief Free-form sandboxes that never complete

#include "state/puzzle/catalog.hpp"

namespace tachy::puzzle {

namespace {

/// Drives one 8-bit behavior source with the low byte of the time step
class SandboxBehaviorEval : public PuzzleEval {
  public:
    explicit SandboxBehaviorEval(const InterfaceSlots& slots) {
        expect_slot_layout(slots, {1}, "Behavior Sandbox");
        timer_ = slots[0][0].slot;
    }

    void begin_time_step(CircuitState& state) override {
        state.send_behavior(timer_, state.time_step() & 0xff);
    }

  private:
    size_t timer_ = 0;
};

/// Fires a 0-bit metronome event at the start of every time step and
/// publishes the low byte of the time step as a timer
class SandboxEventEval : public PuzzleEval {
  public:
    explicit SandboxEventEval(const InterfaceSlots& slots) {
        expect_slot_layout(slots, {2}, "Event Sandbox");
        metronome_ = slots[0][0].slot;
        timer_ = slots[0][1].slot;
    }

    void begin_time_step(CircuitState& state) override {
        state.send_event(metronome_, 0);
        state.send_behavior(timer_, state.time_step() & 0xff);
    }

  private:
    size_t metronome_ = 0;
    size_t timer_ = 0;
};

class SandboxBehaviorPuzzle : public Puzzle {
  public:
    std::string_view title() const override { return "Behavior Sandbox"; }
    PuzzleKind kind() const override { return PuzzleKind::SANDBOX; }
    std::string_view description() const override {
        return "Build any circuit you want using the behavior chips available so far.";
    }
    bool allows_events() const override { return false; }

    std::vector<Interface> interfaces() const override {
        return {{"Timer", Direction::WEST, InterfacePosition::right(0),
                 {{"Timer", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::EIGHT}}}};
    }

    CoordsSize initial_board_size() const override { return {12, 12}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        return std::make_unique<SandboxBehaviorEval>(slots);
    }
};

class SandboxEventPuzzle : public Puzzle {
  public:
    std::string_view title() const override { return "Event Sandbox"; }
    PuzzleKind kind() const override { return PuzzleKind::SANDBOX; }
    std::string_view description() const override {
        return "Build any circuit you want using the behavior and event chips available so far.";
    }
    bool allows_events() const override { return true; }

    std::vector<Interface> interfaces() const override {
        return {{"Clock", Direction::WEST, InterfacePosition::right(0),
                 {{"Metronome", PortFlow::SOURCE, PortColor::EVENT, WireSize::ZERO},
                  {"Timer", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::EIGHT}}}};
    }

    CoordsSize initial_board_size() const override { return {12, 12}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        return std::make_unique<SandboxEventEval>(slots);
    }
};

} // namespace

std::unique_ptr<Puzzle> new_sandbox_behavior() {
    return std::make_unique<SandboxBehaviorPuzzle>();
}

std::unique_ptr<Puzzle> new_sandbox_event() {
    return std::make_unique<SandboxEventPuzzle>();
}

} // namespace tachy::puzzle
