/// @file event.cpp
/// @brief Event routing, timing, and counting evaluators

#include "state/chip/chip_evals.hpp"

#include "util/debug_log.hpp"

#include <optional>
#include <stdexcept>

namespace tachy::chip {

namespace {

/// Fires at the start of every time step that follows a step in which it
/// received at least one event
class ClockEval : public ChipEval {
  public:
    ClockEval(size_t input, size_t output) : input_(input), output_(output) {}

    void eval(CircuitState& state) override {
        if (should_send_) {
            state.send_event(output_, 0);
            should_send_ = false;
        }
    }

    bool needs_another_cycle(const CircuitState& state) override {
        if (state.has_event(input_)) {
            received_ = true;
        }
        return false;
    }

    void on_time_step() override {
        should_send_ = received_;
        received_ = false;
    }

  private:
    size_t input_;
    size_t output_;
    bool received_ = false;
    bool should_send_ = false;
};

/// Latches an incoming event and re-emits it in the next subcycle
class DelayEval : public ChipEval {
  public:
    DelayEval(size_t input, size_t output) : input_(input), output_(output) {}

    void eval(CircuitState& state) override {
        if (pending_) {
            debug_log("Delay chip is sending value %u", *pending_);
            state.send_event(output_, *pending_);
            pending_.reset();
        }
    }

    bool needs_another_cycle(const CircuitState& state) override {
        if (auto value = state.recv_event(input_)) {
            pending_ = value;
            return true;
        }
        return false;
    }

  private:
    size_t input_;
    size_t output_;
    std::optional<uint32_t> pending_;
};

/// Routes each event to output 1 (South) when control is set, otherwise to
/// output 2 (East)
class DemuxEval : public ChipEval {
  public:
    DemuxEval(size_t input, size_t output1, size_t output2, size_t control)
        : input_(input), output1_(output1), output2_(output2), control_(control) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(input_)) {
            state.send_event(state.recv_behavior(control_) != 0 ? output1_ : output2_, *value);
        }
    }

  private:
    size_t input_;
    size_t output1_;
    size_t output2_;
    size_t control_;
};

class DiscardEval : public ChipEval {
  public:
    DiscardEval(size_t input, size_t output) : input_(input), output_(output) {}

    void eval(CircuitState& state) override {
        if (state.has_event(input_)) {
            state.send_event(output_, 0);
        }
    }

  private:
    size_t input_;
    size_t output_;
};

/// Passes events while the control input is 0
class FilterEval : public ChipEval {
  public:
    FilterEval(size_t input, size_t output, size_t control)
        : input_(input), output_(output), control_(control) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(input_)) {
            if (state.recv_behavior(control_) == 0) {
                state.send_event(output_, *value);
            }
        }
    }

  private:
    size_t input_;
    size_t output_;
    size_t control_;
};

/// Forwards whichever input fired; input 0 wins when both do
class JoinEval : public ChipEval {
  public:
    JoinEval(size_t input1, size_t input2, size_t output)
        : input1_(input1), input2_(input2), output_(output) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(input1_)) {
            state.send_event(output_, *value);
        } else if (auto other = state.recv_event(input2_)) {
            state.send_event(output_, *other);
        }
    }

  private:
    size_t input1_;
    size_t input2_;
    size_t output_;
};

class LatestEval : public ChipEval {
  public:
    LatestEval(size_t input, size_t output) : input_(input), output_(output) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(input_)) {
            state.send_behavior(output_, *value);
        }
    }

  private:
    size_t input_;
    size_t output_;
};

class SampleEval : public ChipEval {
  public:
    SampleEval(size_t event_in, size_t behavior_in, size_t output)
        : event_in_(event_in), behavior_in_(behavior_in), output_(output) {}

    void eval(CircuitState& state) override {
        if (state.has_event(event_in_)) {
            state.send_event(output_, state.recv_behavior(behavior_in_));
        }
    }

  private:
    size_t event_in_;
    size_t behavior_in_;
    size_t output_;
};

/// Register driven by set, increment, and decrement events, applied in
/// that order within one subcycle
class CounterEval : public ChipEval {
  public:
    CounterEval(size_t set, size_t inc, size_t dec, size_t output, WireSize size)
        : set_(set), inc_(inc), dec_(dec), output_(output), size_(size) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(set_)) {
            value_ = *value;
        }
        if (state.has_event(inc_)) {
            value_ += 1;
        }
        if (state.has_event(dec_)) {
            value_ -= 1;
        }
        value_ &= mask(size_);
        state.send_behavior(output_, value_);
    }

  private:
    size_t set_;
    size_t inc_;
    size_t dec_;
    size_t output_;
    WireSize size_;
    uint32_t value_ = 0;
};

} // namespace

std::vector<ChipEvalEntry> new_event_evals(ChipType type, const std::vector<PortSlot>& slots) {
    switch (type.kind) {
    case ChipKind::CLOCK:
        return single_eval<ClockEval>({1}, slots[0].slot, slots[1].slot);
    case ChipKind::DELAY:
        return single_eval<DelayEval>({1}, slots[0].slot, slots[1].slot);
    case ChipKind::DEMUX:
        return single_eval<DemuxEval>({1, 2}, slots[0].slot, slots[1].slot, slots[2].slot,
                                      slots[3].slot);
    case ChipKind::DISCARD:
        return single_eval<DiscardEval>({1}, slots[0].slot, slots[1].slot);
    case ChipKind::FILTER:
        return single_eval<FilterEval>({1}, slots[0].slot, slots[1].slot, slots[2].slot);
    case ChipKind::JOIN:
        return single_eval<JoinEval>({2}, slots[0].slot, slots[1].slot, slots[2].slot);
    case ChipKind::LATEST:
        return single_eval<LatestEval>({1}, slots[0].slot, slots[1].slot);
    case ChipKind::SAMPLE:
        return single_eval<SampleEval>({2}, slots[0].slot, slots[1].slot, slots[2].slot);
    case ChipKind::COUNTER:
        return single_eval<CounterEval>({3}, slots[0].slot, slots[1].slot, slots[2].slot,
                                        slots[3].slot, slots[3].size);
    default:
        throw std::invalid_argument("Not an event chip: " + type.to_string());
    }
}

} // namespace tachy::chip
