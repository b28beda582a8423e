/// @file arith.cpp
/// @brief Add, Sub, Mul, Halve, and Inc evaluators

#include "state/chip/chip_evals.hpp"

#include <stdexcept>

namespace tachy::chip {

namespace {

enum class ArithOp { ADD, SUB, MUL };

/// Modular arithmetic on two equal-width behavior inputs
class ArithEval : public ChipEval {
  public:
    ArithEval(ArithOp op, size_t input1, size_t input2, size_t output, WireSize size)
        : op_(op), input1_(input1), input2_(input2), output_(output), size_(size) {}

    void eval(CircuitState& state) override {
        const uint64_t a = state.recv_behavior(input1_);
        const uint64_t b = state.recv_behavior(input2_);
        uint64_t result = 0;
        switch (op_) {
        case ArithOp::ADD:
            result = a + b;
            break;
        case ArithOp::SUB:
            result = a - b;
            break;
        case ArithOp::MUL:
            result = a * b;
            break;
        }
        state.send_behavior(output_, static_cast<uint32_t>(result & mask(size_)));
    }

  private:
    ArithOp op_;
    size_t input1_;
    size_t input2_;
    size_t output_;
    WireSize size_;
};

class HalveEval : public ChipEval {
  public:
    HalveEval(size_t input, size_t output) : input_(input), output_(output) {}

    void eval(CircuitState& state) override {
        state.send_behavior(output_, state.recv_behavior(input_) >> 1);
    }

  private:
    size_t input_;
    size_t output_;
};

/// On each event, emits the event value plus the behavior input
class IncEval : public ChipEval {
  public:
    IncEval(size_t event_in, size_t behavior_in, size_t output, WireSize size)
        : event_in_(event_in), behavior_in_(behavior_in), output_(output), size_(size) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(event_in_)) {
            const uint32_t sum = *value + state.recv_behavior(behavior_in_);
            state.send_event(output_, sum & mask(size_));
        }
    }

  private:
    size_t event_in_;
    size_t behavior_in_;
    size_t output_;
    WireSize size_;
};

} // namespace

std::vector<ChipEvalEntry> new_arith_evals(ChipType type, const std::vector<PortSlot>& slots) {
    switch (type.kind) {
    case ChipKind::ADD:
        return single_eval<ArithEval>({2}, ArithOp::ADD, slots[0].slot, slots[1].slot,
                                      slots[2].slot, slots[2].size);
    case ChipKind::SUB:
        return single_eval<ArithEval>({2}, ArithOp::SUB, slots[0].slot, slots[1].slot,
                                      slots[2].slot, slots[2].size);
    case ChipKind::MUL:
        return single_eval<ArithEval>({2}, ArithOp::MUL, slots[0].slot, slots[1].slot,
                                      slots[2].slot, slots[2].size);
    case ChipKind::HALVE:
        return single_eval<HalveEval>({1}, slots[0].slot, slots[1].slot);
    case ChipKind::INC:
        return single_eval<IncEval>({2}, slots[0].slot, slots[1].slot, slots[2].slot,
                                    slots[2].size);
    default:
        throw std::invalid_argument("Not an arithmetic chip: " + type.to_string());
    }
}

} // namespace tachy::chip
