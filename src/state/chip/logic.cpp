/// @file logic.cpp
/// @brief Not, And, Or, Xor, and Mux evaluators

#include "state/chip/chip_evals.hpp"

#include <stdexcept>

namespace tachy::chip {

namespace {

class NotEval : public ChipEval {
  public:
    NotEval(size_t input, size_t output, WireSize size)
        : input_(input), output_(output), size_(size) {}

    void eval(CircuitState& state) override {
        state.send_behavior(output_, ~state.recv_behavior(input_) & mask(size_));
    }

  private:
    size_t input_;
    size_t output_;
    WireSize size_;
};

/// Bitwise And/Or/Xor over two equal-width inputs
class BitwiseEval : public ChipEval {
  public:
    BitwiseEval(ChipKind kind, size_t input1, size_t input2, size_t output)
        : kind_(kind), input1_(input1), input2_(input2), output_(output) {}

    void eval(CircuitState& state) override {
        const uint32_t a = state.recv_behavior(input1_);
        const uint32_t b = state.recv_behavior(input2_);
        switch (kind_) {
        case ChipKind::AND:
            state.send_behavior(output_, a & b);
            break;
        case ChipKind::OR:
            state.send_behavior(output_, a | b);
            break;
        default:
            state.send_behavior(output_, a ^ b);
            break;
        }
    }

  private:
    ChipKind kind_;
    size_t input1_;
    size_t input2_;
    size_t output_;
};

/// Control 0 selects input 0, anything else selects input 1
class MuxEval : public ChipEval {
  public:
    MuxEval(size_t input0, size_t input1, size_t output, size_t control)
        : input0_(input0), input1_(input1), output_(output), control_(control) {}

    void eval(CircuitState& state) override {
        const size_t selected = state.recv_behavior(control_) == 0 ? input0_ : input1_;
        state.send_behavior(output_, state.recv_behavior(selected));
    }

  private:
    size_t input0_;
    size_t input1_;
    size_t output_;
    size_t control_;
};

} // namespace

std::vector<ChipEvalEntry> new_logic_evals(ChipType type, const std::vector<PortSlot>& slots) {
    switch (type.kind) {
    case ChipKind::NOT:
        return single_eval<NotEval>({1}, slots[0].slot, slots[1].slot, slots[1].size);
    case ChipKind::AND:
    case ChipKind::OR:
    case ChipKind::XOR:
        return single_eval<BitwiseEval>({2}, type.kind, slots[0].slot, slots[1].slot,
                                        slots[2].slot);
    case ChipKind::MUX:
        return single_eval<MuxEval>({2}, slots[0].slot, slots[1].slot, slots[2].slot,
                                    slots[3].slot);
    default:
        throw std::invalid_argument("Not a logic chip: " + type.to_string());
    }
}

} // namespace tachy::chip
