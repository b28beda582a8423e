/// @file board_renderer.hpp
/// @brief Draws the board grid, interfaces, wires, and chips, with live values while running

#pragma once

#include "geom/coords.hpp"
#include "state/edit_grid.hpp"

#include <raylib.h>

#include <optional>

namespace tachy {

/// Maps board cells to screen pixels
struct BoardView {
    float cell = 40.0f;         ///< Pixels per cell
    Vector2 origin = {0, 0};    ///< Screen position of cell (0, 0)'s top-left corner

    [[nodiscard]] Rectangle cell_rect(Coords c) const;
    [[nodiscard]] Vector2 cell_center(Coords c) const;
    /// The cell under a screen point
    [[nodiscard]] Coords cell_at(Vector2 point) const;
};

/// Largest view that fits `bounds` plus the interface ring around it into
/// `area`, centered, with cells no larger than `max_cell`
[[nodiscard]] BoardView fit_board(const CoordsRect& bounds, Rectangle area, float max_cell);

/// Draws the whole board. While the grid is evaluating, wires and ports
/// carrying a nonzero value or a pending event are lit.
void draw_board(const EditGrid& grid, const BoardView& view);

/// Outlines the cells named by the grid's build errors, or by the
/// evaluation's errors while it runs
void draw_error_markers(const EditGrid& grid, const BoardView& view);

/// Interactive chip (Button or Toggle) under a screen point, by its top-left cell
[[nodiscard]] std::optional<Coords> interactive_chip_at(const EditGrid& grid, const BoardView& view,
                                                        Vector2 point);

} // namespace tachy
