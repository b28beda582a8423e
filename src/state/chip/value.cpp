/// @file value.cpp
/// @brief Const, Pack, and Unpack evaluators

#include "state/chip/chip_evals.hpp"

#include <stdexcept>

namespace tachy::chip {

namespace {

class ConstEval : public ChipEval {
  public:
    ConstEval(size_t output, uint32_t value) : output_(output), value_(value) {}

    void eval(CircuitState& state) override { state.send_behavior(output_, value_); }

  private:
    size_t output_;
    uint32_t value_;
};

/// Concatenates two halves: input 0 is the low half
class PackEval : public ChipEval {
  public:
    PackEval(size_t lo, size_t hi, size_t output, WireSize half_size)
        : lo_(lo), hi_(hi), output_(output), half_size_(half_size) {}

    void eval(CircuitState& state) override {
        const uint32_t lo = state.recv_behavior(lo_);
        const uint32_t hi = state.recv_behavior(hi_);
        state.send_behavior(output_, lo | (hi << num_bits(half_size_)));
    }

  private:
    size_t lo_;
    size_t hi_;
    size_t output_;
    WireSize half_size_;
};

class UnpackEval : public ChipEval {
  public:
    UnpackEval(size_t input, size_t lo, size_t hi, WireSize half_size)
        : input_(input), lo_(lo), hi_(hi), half_size_(half_size) {}

    void eval(CircuitState& state) override {
        const uint32_t input = state.recv_behavior(input_);
        state.send_behavior(lo_, input & mask(half_size_));
        state.send_behavior(hi_, input >> num_bits(half_size_));
    }

  private:
    size_t input_;
    size_t lo_;
    size_t hi_;
    WireSize half_size_;
};

} // namespace

std::vector<ChipEvalEntry> new_value_evals(ChipType type, const std::vector<PortSlot>& slots) {
    switch (type.kind) {
    case ChipKind::CONST:
        return single_eval<ConstEval>({0}, slots[0].slot, type.value);
    case ChipKind::PACK:
        return single_eval<PackEval>({2}, slots[0].slot, slots[1].slot, slots[2].slot,
                                     slots[0].size);
    case ChipKind::UNPACK:
        return single_eval<UnpackEval>({1, 2}, slots[0].slot, slots[1].slot, slots[2].slot,
                                       slots[1].size);
    default:
        throw std::invalid_argument("Not a value chip: " + type.to_string());
    }
}

} // namespace tachy::chip
