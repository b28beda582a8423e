#pragma once

/// @file test_helpers.hpp
/// @brief Small custom puzzles and board builders shared by the tests

#include <catch2/catch.hpp>

#include "state/edit_grid.hpp"
#include "state/puzzle.hpp"
#include "state/wire_path.hpp"

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tachy::test {

/// Fires a 0-value event on every event Source port and drives every
/// behavior Source port with `behavior_value` at the start of each time
/// step. Never completes.
class FixtureEval : public PuzzleEval {
  public:
    FixtureEval(InterfaceSlots slots, std::vector<std::vector<InterfacePort>> ports,
                uint32_t behavior_value)
        : slots_(std::move(slots)), ports_(std::move(ports)), behavior_value_(behavior_value) {}

    void begin_time_step(CircuitState& state) override {
        for (size_t i = 0; i < slots_.size(); ++i) {
            for (size_t j = 0; j < slots_[i].size(); ++j) {
                const InterfacePort& port = ports_[i][j];
                if (port.flow != PortFlow::SOURCE) {
                    continue;
                }
                if (port.color == PortColor::EVENT) {
                    state.send_event(slots_[i][j].slot, 0);
                } else if (port.color == PortColor::BEHAVIOR) {
                    state.send_behavior(slots_[i][j].slot, behavior_value_);
                }
            }
        }
    }

  private:
    InterfaceSlots slots_;
    std::vector<std::vector<InterfacePort>> ports_;
    uint32_t behavior_value_;
};

/// A puzzle with whatever interfaces a test needs, allowing every chip
class FixturePuzzle : public Puzzle {
  public:
    explicit FixturePuzzle(std::vector<Interface> interfaces, uint32_t behavior_value = 0)
        : interfaces_(std::move(interfaces)), behavior_value_(behavior_value) {}

    std::string_view title() const override { return "Fixture"; }
    PuzzleKind kind() const override { return PuzzleKind::SANDBOX; }
    std::string_view description() const override { return "Test harness."; }
    bool allows_events() const override { return true; }
    std::vector<Interface> interfaces() const override { return interfaces_; }
    CoordsSize initial_board_size() const override { return {8, 6}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        std::vector<std::vector<InterfacePort>> ports;
        for (const auto& iface : interfaces_) {
            ports.push_back(iface.ports);
        }
        return std::make_unique<FixtureEval>(slots, std::move(ports), behavior_value_);
    }

  private:
    std::vector<Interface> interfaces_;
    uint32_t behavior_value_;
};

inline Interface event_source(std::string name, Direction side) {
    return {name, side, InterfacePosition::center(),
            {{name, PortFlow::SOURCE, PortColor::EVENT, WireSize::ZERO}}};
}

inline Interface behavior_source(std::string name, Direction side, WireSize size) {
    return {name, side, InterfacePosition::center(),
            {{name, PortFlow::SOURCE, PortColor::BEHAVIOR, size}}};
}

inline Interface behavior_sink(std::string name, Direction side, WireSize size) {
    return {name, side, InterfacePosition::center(),
            {{name, PortFlow::SINK, PortColor::BEHAVIOR, size}}};
}

/// Every chip kind
inline std::set<ChipKind> all_chip_kinds() {
    std::set<ChipKind> kinds;
    for (const auto& [category, list] : chip_categories()) {
        kinds.insert(list.begin(), list.end());
    }
    return kinds;
}

/// An empty board at the origin with no interfaces and every chip allowed
inline EditGrid blank_grid(int32_t width, int32_t height) {
    return EditGrid(CoordsRect(0, 0, width, height), {}, all_chip_kinds());
}

/// Board with explicit bounds carrying a puzzle's interfaces and chip set
inline EditGrid puzzle_grid(const Puzzle& puzzle, int32_t width, int32_t height) {
    return EditGrid(CoordsRect(0, 0, width, height), puzzle.interfaces(), puzzle.allowed_chips());
}

inline void place(EditGrid& grid, Coords coords, ChipType type, Orientation orient = {}) {
    const auto errors = grid.mutate({AddChip{coords, type, orient}});
    INFO("placing " << type.to_string() << " at (" << coords.x << ", " << coords.y << ")");
    REQUIRE(errors.empty());
}

inline void draw(EditGrid& grid, const std::vector<Coords>& cells) {
    const auto errors = grid.mutate({wire_path_change(grid, cells)});
    if (!errors.empty()) {
        INFO(errors.front().message);
        REQUIRE(errors.empty());
    }
}

/// Rotation that turns a chip's East port to face North
inline Orientation facing_north() {
    return Orientation(3, false);
}

} // namespace tachy::test
