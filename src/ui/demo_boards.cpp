/// @file demo_boards.cpp
/// @brief Demo circuits assembled through the same change groups the editor uses

#include "ui/demo_boards.hpp"

#include "state/wire_path.hpp"
#include "util/debug_log.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tachy {

namespace {

/// Applies edits one group at a time and fails loudly on the first rejection
class DemoBuilder {
  public:
    explicit DemoBuilder(PuzzleId id) : grid_(puzzle_for(id)) {}

    DemoBuilder& chip(Coords coords, ChipType type, Orientation orient = {}) {
        apply({AddChip{coords, type, orient}}, "place " + type.to_string());
        return *this;
    }

    DemoBuilder& wire(const std::vector<Coords>& cells) {
        apply({wire_path_change(grid_, cells)}, "draw a wire");
        return *this;
    }

    EditGrid finish() {
        debug_log("Demo board ready: %u wire fragments, %zu chips, %zu build errors",
                  grid_.wire_length(), grid_.chips().size(), grid_.build_errors().size());
        return std::move(grid_);
    }

  private:
    void apply(std::vector<GridChange> changes, const std::string& what) {
        const auto errors = grid_.mutate(std::move(changes));
        if (!errors.empty()) {
            throw std::logic_error("Demo board could not " + what + ": " + errors.front().message);
        }
    }

    EditGrid grid_;
};

// Or from And and Not: Out = Not(And(Not(In1), Not(In2)))
EditGrid build_tutorial_or() {
    return DemoBuilder(PuzzleId::TUTORIAL_OR)
        .chip({1, 2}, ChipKind::NOT)
        .chip({3, 4}, ChipKind::NOT, Orientation(3, false))
        .chip({3, 2}, ChipKind::AND)
        .chip({5, 2}, ChipKind::NOT)
        .wire({{-1, 2}, {0, 2}, {1, 2}})
        .wire({{3, 6}, {3, 5}, {3, 4}})
        .wire({{1, 2}, {2, 2}, {3, 2}})
        .wire({{3, 4}, {3, 3}, {3, 2}})
        .wire({{3, 2}, {4, 2}, {5, 2}})
        .wire({{5, 2}, {6, 2}, {7, 2}, {8, 2}})
        .finish();
}

EditGrid build_fabricate_xor() {
    return DemoBuilder(PuzzleId::FABRICATE_XOR)
        .chip({3, 2}, ChipKind::XOR)
        .wire({{-1, 2}, {0, 2}, {1, 2}, {2, 2}, {3, 2}})
        .wire({{3, 6}, {3, 5}, {3, 4}, {3, 3}, {3, 2}})
        .wire({{3, 2}, {4, 2}, {5, 2}, {6, 2}, {7, 2}, {8, 2}})
        .finish();
}

// The timer shown on a display
EditGrid build_sandbox_behavior() {
    return DemoBuilder(PuzzleId::SANDBOX_BEHAVIOR)
        .chip({1, 11}, ChipKind::DISPLAY)
        .wire({{-1, 11}, {0, 11}, {1, 11}})
        .finish();
}

// A button counting presses onto a display, plus the timer on a second display
EditGrid build_sandbox_event() {
    return DemoBuilder(PuzzleId::SANDBOX_EVENT)
        .chip({1, 2}, ChipKind::BUTTON)
        .chip({3, 2}, ChipKind::COUNTER)
        .chip({5, 2}, ChipKind::DISPLAY)
        .chip({1, 11}, ChipKind::DISPLAY)
        .wire({{1, 2}, {2, 2}, {2, 1}, {3, 1}, {3, 2}})
        .wire({{3, 2}, {4, 2}, {5, 2}})
        .wire({{-1, 11}, {0, 11}, {1, 11}})
        .finish();
}

} // namespace

EditGrid build_demo_board(PuzzleId id) {
    switch (id) {
    case PuzzleId::TUTORIAL_OR:
        return build_tutorial_or();
    case PuzzleId::FABRICATE_XOR:
        return build_fabricate_xor();
    case PuzzleId::AUTOMATE_HELIOSTAT:
        return EditGrid(puzzle_for(id));
    case PuzzleId::SANDBOX_BEHAVIOR:
        return build_sandbox_behavior();
    case PuzzleId::SANDBOX_EVENT:
        return build_sandbox_event();
    }
    throw std::invalid_argument("Unknown puzzle id");
}

} // namespace tachy
