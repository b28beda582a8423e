#pragma once

/// @file chip_evals.hpp
/// @brief Per-category evaluator factories behind new_chip_evals

#include "state/chip/chip_eval.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace tachy::chip {

[[nodiscard]] std::vector<ChipEvalEntry> new_value_evals(ChipType type,
                                                         const std::vector<PortSlot>& slots);
[[nodiscard]] std::vector<ChipEvalEntry> new_arith_evals(ChipType type,
                                                         const std::vector<PortSlot>& slots);
[[nodiscard]] std::vector<ChipEvalEntry> new_compare_evals(ChipType type,
                                                           const std::vector<PortSlot>& slots);
[[nodiscard]] std::vector<ChipEvalEntry> new_logic_evals(ChipType type,
                                                         const std::vector<PortSlot>& slots);
[[nodiscard]] std::vector<ChipEvalEntry> new_event_evals(ChipType type,
                                                         const std::vector<PortSlot>& slots);
[[nodiscard]] std::vector<ChipEvalEntry> new_special_evals(ChipType type, Coords coords,
                                                           const std::vector<PortSlot>& slots,
                                                           CircuitInteraction* interact);

/// Wraps a single evaluator writing `outputs`
template <typename T, typename... Args>
std::vector<ChipEvalEntry> single_eval(std::vector<size_t> outputs, Args&&... args) {
    std::vector<ChipEvalEntry> entries;
    entries.push_back({std::move(outputs), std::make_unique<T>(std::forward<Args>(args)...)});
    return entries;
}

} // namespace tachy::chip
