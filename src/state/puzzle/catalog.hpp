#pragma once

/// @file catalog.hpp
/// @brief Factories for the built-in puzzles

#include "state/puzzle.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace tachy::puzzle {

[[nodiscard]] std::unique_ptr<Puzzle> new_tutorial_or();
[[nodiscard]] std::unique_ptr<Puzzle> new_fabricate_xor();
[[nodiscard]] std::unique_ptr<Puzzle> new_automate_heliostat();
[[nodiscard]] std::unique_ptr<Puzzle> new_sandbox_behavior();
[[nodiscard]] std::unique_ptr<Puzzle> new_sandbox_event();

/// Checks the slot layout a puzzle evaluator was built with
inline void expect_slot_layout(const InterfaceSlots& slots, const std::vector<size_t>& counts,
                               std::string_view title) {
    bool ok = slots.size() == counts.size();
    for (size_t i = 0; ok && i < counts.size(); ++i) {
        ok = slots[i].size() == counts[i];
    }
    if (!ok) {
        throw std::invalid_argument("Interface slots do not match the interfaces of " +
                                    std::string(title));
    }
}

} // namespace tachy::puzzle
