/// @file chip_eval.cpp
/// @brief Dispatches chip kinds to their evaluator factories

#include "state/chip/chip_eval.hpp"

#include "state/chip/chip_data.hpp"
#include "state/chip/chip_evals.hpp"

#include <stdexcept>
#include <string>

namespace tachy {

std::vector<ChipEvalEntry> new_chip_evals(ChipType type, Coords coords,
                                          const std::vector<PortSlot>& slots,
                                          CircuitInteraction* interact) {
    const size_t num_ports = chip_data(type).ports.size();
    if (slots.size() != num_ports) {
        throw std::invalid_argument(type.to_string() + " expects " + std::to_string(num_ports) +
                                    " port slots, got " + std::to_string(slots.size()));
    }

    switch (type.kind) {
    case ChipKind::CONST:
    case ChipKind::PACK:
    case ChipKind::UNPACK:
        return chip::new_value_evals(type, slots);
    case ChipKind::ADD:
    case ChipKind::SUB:
    case ChipKind::MUL:
    case ChipKind::HALVE:
    case ChipKind::INC:
        return chip::new_arith_evals(type, slots);
    case ChipKind::CMP:
    case ChipKind::CMP_EQ:
    case ChipKind::EQ:
        return chip::new_compare_evals(type, slots);
    case ChipKind::NOT:
    case ChipKind::AND:
    case ChipKind::OR:
    case ChipKind::XOR:
    case ChipKind::MUX:
        return chip::new_logic_evals(type, slots);
    case ChipKind::CLOCK:
    case ChipKind::DELAY:
    case ChipKind::DEMUX:
    case ChipKind::DISCARD:
    case ChipKind::FILTER:
    case ChipKind::JOIN:
    case ChipKind::LATEST:
    case ChipKind::SAMPLE:
    case ChipKind::COUNTER:
        return chip::new_event_evals(type, slots);
    case ChipKind::BREAK:
    case ChipKind::RAM:
    case ChipKind::DISPLAY:
    case ChipKind::BUTTON:
    case ChipKind::TOGGLE:
        return chip::new_special_evals(type, coords, slots, interact);
    }
    throw std::invalid_argument("Unknown chip kind");
}

} // namespace tachy
