/// @file wire_path.cpp
/// @brief Merging a drawn path into the wires already on the board

#include "state/wire_path.hpp"

#include "save/wire_shape.hpp"
#include "state/edit_grid.hpp"

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace tachy {

namespace {

std::optional<Direction> step_direction(Coords from, Coords to) {
    for (Direction dir : all_directions()) {
        if (from + dir == to) {
            return dir;
        }
    }
    return std::nullopt;
}

} // namespace

ReplaceWires wire_path_change(const EditGrid& grid, const std::vector<Coords>& cells) {
    if (cells.size() < 2) {
        throw std::invalid_argument("A wire path needs at least two cells");
    }

    std::map<Coords, std::set<Direction>> groups;
    for (size_t i = 0; i + 1 < cells.size(); ++i) {
        auto dir = step_direction(cells[i], cells[i + 1]);
        if (!dir) {
            throw std::invalid_argument("Wire path cells " + std::to_string(i) + " and " +
                                        std::to_string(i + 1) + " are not adjacent");
        }
        groups[cells[i]].insert(*dir);
        groups[cells[i + 1]].insert(-*dir);
    }

    ReplaceWires change;
    for (auto& [cell, group] : groups) {
        if (grid.chip_at(cell)) {
            // Wires only touch a chip at its edge, one Stub per side
            for (Direction dir : group) {
                if (!grid.wire_at(WireLoc{cell, dir})) {
                    change.new_wires.emplace(WireLoc{cell, dir}, WireShape::STUB);
                }
            }
            continue;
        }
        for (Direction dir : all_directions()) {
            if (auto shape = grid.wire_at(WireLoc{cell, dir})) {
                change.old_wires.emplace(WireLoc{cell, dir}, *shape);
                group.insert(dir);
            }
        }
        const std::vector<Direction> joined(group.begin(), group.end());
        for (Direction dir : joined) {
            change.new_wires.emplace(WireLoc{cell, dir}, shape_for_group(dir, joined));
        }
    }

    // Leave out fragments the path does not change
    for (auto it = change.old_wires.begin(); it != change.old_wires.end();) {
        auto added = change.new_wires.find(it->first);
        if (added != change.new_wires.end() && added->second == it->second) {
            change.new_wires.erase(added);
            it = change.old_wires.erase(it);
        } else {
            ++it;
        }
    }
    return change;
}

} // namespace tachy
