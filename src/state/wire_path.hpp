#pragma once

/// @file wire_path.hpp
/// @brief Drawing a wire through a path of cells as a single change

#include "geom/coords.hpp"
#include "state/change.hpp"

#include <vector>

namespace tachy {

class EditGrid;

/// The ReplaceWires change that draws a wire along `cells`, each adjacent to
/// the next. In every cell the path visits, the new wire joins whatever
/// wires already sit there into one connected group, so crossing a straight
/// wire makes a Cross and touching a turn makes a split. The end cells get
/// a Stub toward their neighbor, or join that cell's existing wires. Cells
/// under a chip only ever get Stubs.
/// @throws std::invalid_argument if fewer than two cells are given or two
///         consecutive cells are not adjacent
[[nodiscard]] ReplaceWires wire_path_change(const EditGrid& grid, const std::vector<Coords>& cells);

} // namespace tachy
