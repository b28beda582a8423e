/// @file demo_boards.hpp
/// @brief Prebuilt boards for each catalog puzzle, shown when the viewer opens a puzzle

#pragma once

#include "state/edit_grid.hpp"
#include "state/puzzle.hpp"

namespace tachy {

/// Builds a board for `id` sized to the puzzle's initial bounds. Tutorial,
/// Xor, and sandbox boards carry a working circuit; the heliostat board is
/// left empty for the player.
/// @throws std::logic_error if a prebuilt edit is rejected by the grid
[[nodiscard]] EditGrid build_demo_board(PuzzleId id);

} // namespace tachy
