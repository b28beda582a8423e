#pragma once

/// @file change.hpp
/// @brief Invertible grid edits and the collapse rules used by undo/redo

#include "geom/coords.hpp"
#include "geom/direction.hpp"
#include "geom/orientation.hpp"
#include "save/chip_type.hpp"
#include "save/wire_shape.hpp"
#include "state/port.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tachy {

/// Wire fragments keyed by half-edge
using WireMap = std::map<WireLoc, WireShape>;

/// Removes `old_wires` (which must match the grid exactly) and adds
/// `new_wires`
struct ReplaceWires {
    WireMap old_wires;
    WireMap new_wires;

    bool operator==(const ReplaceWires& other) const {
        return old_wires == other.old_wires && new_wires == other.new_wires;
    }
};

struct AddChip {
    Coords coords;
    ChipType type;
    Orientation orient;

    bool operator==(const AddChip& other) const {
        return coords == other.coords && type == other.type && orient == other.orient;
    }
};

struct RemoveChip {
    Coords coords;
    ChipType type;
    Orientation orient;

    bool operator==(const RemoveChip& other) const {
        return coords == other.coords && type == other.type && orient == other.orient;
    }
};

struct SetBounds {
    CoordsRect old_bounds;
    CoordsRect new_bounds;

    bool operator==(const SetBounds& other) const {
        return old_bounds == other.old_bounds && new_bounds == other.new_bounds;
    }
};

/// Removes every fragment in `wires`; each must lie in `rect`
struct MassRemoveWires {
    CoordsRect rect;
    WireMap wires;

    bool operator==(const MassRemoveWires& other) const {
        return rect == other.rect && wires == other.wires;
    }
};

/// Adds every fragment in `wires` at empty locations; each must lie in
/// `rect`
struct MassAddWires {
    CoordsRect rect;
    WireMap wires;

    bool operator==(const MassAddWires& other) const {
        return rect == other.rect && wires == other.wires;
    }
};

/// Adds a Stub on both sides of the edge at (coords, dir)
struct AddStubWire {
    Coords coords;
    Direction dir;

    bool operator==(const AddStubWire& other) const {
        return coords == other.coords && dir == other.dir;
    }
};

/// Removes the Stub pair on both sides of the edge at (coords, dir)
struct RemoveStubWire {
    Coords coords;
    Direction dir;

    bool operator==(const RemoveStubWire& other) const {
        return coords == other.coords && dir == other.dir;
    }
};

/// One atomic edit of an EditGrid
using GridChange = std::variant<ReplaceWires, AddChip, RemoveChip, SetBounds, MassRemoveWires,
                                MassAddWires, AddStubWire, RemoveStubWire>;

/// The change that exactly undoes `change`
[[nodiscard]] GridChange invert_change(const GridChange& change);

/// Inverts each change and reverses the order, so applying the result undoes
/// the original group
[[nodiscard]] std::vector<GridChange> invert_group(const std::vector<GridChange>& changes);

/// Inverts a group while fusing adjacent changes that cancel or combine.
/// Applying the result has the same effect as applying invert_group().
[[nodiscard]] std::vector<GridChange> invert_and_collapse_group(std::vector<GridChange> changes);

/// Collapses a group without inverting it
[[nodiscard]] std::vector<GridChange> collapse_group(std::vector<GridChange> changes);

/// Short description for diagnostics, e.g. "AddChip(And at (3, 1))"
[[nodiscard]] std::string describe_change(const GridChange& change);

} // namespace tachy
