/// @file compare.cpp
/// @brief Cmp, CmpEq, and Eq evaluators

#include "state/chip/chip_evals.hpp"

#include <stdexcept>

namespace tachy::chip {

namespace {

class CompareEval : public ChipEval {
  public:
    CompareEval(ChipKind kind, size_t input1, size_t input2, size_t output)
        : kind_(kind), input1_(input1), input2_(input2), output_(output) {}

    void eval(CircuitState& state) override {
        const uint32_t a = state.recv_behavior(input1_);
        const uint32_t b = state.recv_behavior(input2_);
        bool result = false;
        if (kind_ == ChipKind::CMP) {
            result = a < b;
        } else if (kind_ == ChipKind::CMP_EQ) {
            result = a <= b;
        } else {
            result = a == b;
        }
        state.send_behavior(output_, result ? 1u : 0u);
    }

  private:
    ChipKind kind_;
    size_t input1_;
    size_t input2_;
    size_t output_;
};

} // namespace

std::vector<ChipEvalEntry> new_compare_evals(ChipType type, const std::vector<PortSlot>& slots) {
    switch (type.kind) {
    case ChipKind::CMP:
    case ChipKind::CMP_EQ:
    case ChipKind::EQ:
        return single_eval<CompareEval>({2}, type.kind, slots[0].slot, slots[1].slot,
                                        slots[2].slot);
    default:
        throw std::invalid_argument("Not a comparison chip: " + type.to_string());
    }
}

} // namespace tachy::chip
