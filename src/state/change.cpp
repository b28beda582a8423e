/// @file change.cpp
/// @brief Change inversion and group collapsing

#include "state/change.hpp"

#include "util/overloaded.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace tachy {

namespace {

std::string coords_text(Coords c) {
    return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}

std::string rect_text(const CoordsRect& r) {
    return "[" + std::to_string(r.x) + ", " + std::to_string(r.y) + " " +
           std::to_string(r.width) + "x" + std::to_string(r.height) + "]";
}

/// Drops entries present with the same shape in both maps
void drop_unchanged(WireMap& old_wires, WireMap& new_wires) {
    for (auto it = new_wires.begin(); it != new_wires.end();) {
        auto old_it = old_wires.find(it->first);
        if (old_it != old_wires.end() && old_it->second == it->second) {
            old_wires.erase(old_it);
            it = new_wires.erase(it);
        } else {
            ++it;
        }
    }
}

/// Fuses `later` (already inverted, so it runs first) with `earlier`
/// (inverted, runs second). Returns nothing when the pair cancels.
std::optional<GridChange> merge_replace(ReplaceWires later, ReplaceWires earlier) {
    WireMap& old1 = later.old_wires;
    WireMap& new1 = later.new_wires;
    for (auto& [loc, shape] : earlier.old_wires) {
        auto it = new1.find(loc);
        if (it != new1.end() && it->second == shape) {
            new1.erase(it);
        } else {
            old1[loc] = shape;
        }
    }
    for (auto& [loc, shape] : earlier.new_wires) {
        auto it = old1.find(loc);
        if (it != old1.end() && it->second == shape) {
            old1.erase(it);
        } else {
            new1[loc] = shape;
        }
    }
    if (old1.empty() && new1.empty()) {
        return std::nullopt;
    }
    return GridChange(std::move(later));
}

/// Tries to fuse `next` onto `prev`. Returns true if they were combined;
/// `result` then holds the fused change, or nothing if they cancel.
bool try_merge(const GridChange& prev, const GridChange& next, std::optional<GridChange>& result) {
    if (auto* a = std::get_if<ReplaceWires>(&prev)) {
        if (auto* b = std::get_if<ReplaceWires>(&next)) {
            result = merge_replace(*a, *b);
            return true;
        }
    } else if (auto* a = std::get_if<AddChip>(&prev)) {
        if (auto* b = std::get_if<RemoveChip>(&next)) {
            if (a->coords == b->coords && a->type == b->type && a->orient == b->orient) {
                result.reset();
                return true;
            }
        }
    } else if (auto* a = std::get_if<RemoveChip>(&prev)) {
        if (auto* b = std::get_if<AddChip>(&next)) {
            if (a->coords == b->coords && a->type == b->type && a->orient == b->orient) {
                result.reset();
                return true;
            }
        }
    } else if (auto* a = std::get_if<SetBounds>(&prev)) {
        if (auto* b = std::get_if<SetBounds>(&next)) {
            if (a->old_bounds == b->new_bounds) {
                result.reset();
            } else {
                result = GridChange(SetBounds{a->old_bounds, b->new_bounds});
            }
            return true;
        }
    } else if (auto* a = std::get_if<MassAddWires>(&prev)) {
        if (auto* b = std::get_if<MassRemoveWires>(&next)) {
            if (a->rect == b->rect && a->wires == b->wires) {
                result.reset();
                return true;
            }
        }
    } else if (auto* a = std::get_if<MassRemoveWires>(&prev)) {
        if (auto* b = std::get_if<MassAddWires>(&next)) {
            if (a->rect == b->rect && a->wires == b->wires) {
                result.reset();
                return true;
            }
        }
    } else if (auto* a = std::get_if<AddStubWire>(&prev)) {
        if (auto* b = std::get_if<RemoveStubWire>(&next)) {
            if (a->coords == b->coords && a->dir == b->dir) {
                result.reset();
                return true;
            }
        }
    } else if (auto* a = std::get_if<RemoveStubWire>(&prev)) {
        if (auto* b = std::get_if<AddStubWire>(&next)) {
            if (a->coords == b->coords && a->dir == b->dir) {
                result.reset();
                return true;
            }
        }
    }
    return false;
}

/// Simplifies a lone change; returns nothing if it is a no-op
std::optional<GridChange> simplify(GridChange change) {
    if (auto* replace = std::get_if<ReplaceWires>(&change)) {
        drop_unchanged(replace->old_wires, replace->new_wires);
        if (replace->old_wires.empty() && replace->new_wires.empty()) {
            return std::nullopt;
        }
    } else if (auto* bounds = std::get_if<SetBounds>(&change)) {
        if (bounds->old_bounds == bounds->new_bounds) {
            return std::nullopt;
        }
    }
    return change;
}

} // namespace

GridChange invert_change(const GridChange& change) {
    return std::visit(
        Overloaded{
            [](const ReplaceWires& c) -> GridChange { return ReplaceWires{c.new_wires, c.old_wires}; },
            [](const AddChip& c) -> GridChange { return RemoveChip{c.coords, c.type, c.orient}; },
            [](const RemoveChip& c) -> GridChange { return AddChip{c.coords, c.type, c.orient}; },
            [](const SetBounds& c) -> GridChange { return SetBounds{c.new_bounds, c.old_bounds}; },
            [](const MassRemoveWires& c) -> GridChange { return MassAddWires{c.rect, c.wires}; },
            [](const MassAddWires& c) -> GridChange { return MassRemoveWires{c.rect, c.wires}; },
            [](const AddStubWire& c) -> GridChange { return RemoveStubWire{c.coords, c.dir}; },
            [](const RemoveStubWire& c) -> GridChange { return AddStubWire{c.coords, c.dir}; },
        },
        change);
}

std::vector<GridChange> invert_group(const std::vector<GridChange>& changes) {
    std::vector<GridChange> inverted;
    inverted.reserve(changes.size());
    for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
        inverted.push_back(invert_change(*it));
    }
    return inverted;
}

std::vector<GridChange> invert_and_collapse_group(std::vector<GridChange> changes) {
    std::vector<GridChange> collapsed;
    while (!changes.empty()) {
        GridChange change = invert_change(changes.back());
        changes.pop_back();

        if (!collapsed.empty()) {
            std::optional<GridChange> merged;
            if (try_merge(collapsed.back(), change, merged)) {
                collapsed.pop_back();
                if (merged) {
                    collapsed.push_back(std::move(*merged));
                }
                continue;
            }
        }
        if (auto simplified = simplify(std::move(change))) {
            collapsed.push_back(std::move(*simplified));
        }
    }
    return collapsed;
}

std::vector<GridChange> collapse_group(std::vector<GridChange> changes) {
    return invert_group(invert_and_collapse_group(std::move(changes)));
}

std::string describe_change(const GridChange& change) {
    return std::visit(
        Overloaded{
            [](const ReplaceWires& c) {
                return "ReplaceWires(" + std::to_string(c.old_wires.size()) + " -> " +
                       std::to_string(c.new_wires.size()) + " fragments)";
            },
            [](const AddChip& c) {
                return "AddChip(" + c.type.to_string() + " at " + coords_text(c.coords) + ")";
            },
            [](const RemoveChip& c) {
                return "RemoveChip(" + c.type.to_string() + " at " + coords_text(c.coords) + ")";
            },
            [](const SetBounds& c) {
                return "SetBounds(" + rect_text(c.old_bounds) + " -> " + rect_text(c.new_bounds) +
                       ")";
            },
            [](const MassRemoveWires& c) {
                return "MassRemoveWires(" + std::to_string(c.wires.size()) + " fragments in " +
                       rect_text(c.rect) + ")";
            },
            [](const MassAddWires& c) {
                return "MassAddWires(" + std::to_string(c.wires.size()) + " fragments in " +
                       rect_text(c.rect) + ")";
            },
            [](const AddStubWire& c) {
                return "AddStubWire(" + coords_text(c.coords) + " " +
                       std::string(direction_name(c.dir)) + ")";
            },
            [](const RemoveStubWire& c) {
                return "RemoveStubWire(" + coords_text(c.coords) + " " +
                       std::string(direction_name(c.dir)) + ")";
            },
        },
        change);
}

} // namespace tachy
