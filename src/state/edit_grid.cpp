/// @file edit_grid.cpp
/// @brief Change validation, undo/redo bookkeeping, typechecking, and eval startup

#include "state/edit_grid.hpp"

#include "state/chip/chip_data.hpp"
#include "util/debug_log.hpp"
#include "util/overloaded.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

namespace tachy {

namespace {

std::string coords_text(Coords c) {
    return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}

std::string loc_text(const WireLoc& loc) {
    return coords_text(loc.coords) + " " + std::string(direction_name(loc.dir));
}

GridError grid_error(GridErrorKind kind, std::string message, std::optional<Coords> coords) {
    return {kind, std::move(message), coords};
}

/// Connection set of a fragment, sorted so groups compare by value
std::vector<Direction> sorted_group(WireShape shape, Direction dir) {
    std::vector<Direction> group = connected_directions(shape, dir);
    std::sort(group.begin(), group.end());
    return group;
}

CoordsRect chip_footprint(Coords coords, ChipType type, Orientation orient) {
    return {coords, orient * type.size()};
}

} // namespace

EditGrid::EditGrid(const Puzzle& puzzle)
    : EditGrid(CoordsRect(Coords{0, 0}, puzzle.initial_board_size()), puzzle.interfaces(),
               puzzle.allowed_chips()) {}

EditGrid::EditGrid(CoordsRect bounds, std::vector<Interface> interfaces,
                   std::set<ChipKind> allowed_chips)
    : bounds_(bounds), interfaces_(std::move(interfaces)),
      allowed_chips_(std::move(allowed_chips)) {
    typecheck();
}

std::optional<WireShape> EditGrid::wire_at(const WireLoc& loc) const {
    auto it = fragments_.find(loc);
    if (it == fragments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::pair<Coords, PlacedChip>> EditGrid::chip_at(Coords cell) const {
    auto origin = chip_cells_.find(cell);
    if (origin == chip_cells_.end()) {
        return std::nullopt;
    }
    return std::make_pair(origin->second, chips_.at(origin->second));
}

std::optional<WireSize> EditGrid::net_size(size_t net) const {
    if (net >= net_sizes_.size()) {
        return std::nullopt;
    }
    return net_sizes_[net];
}

// --- Validation ---

std::optional<GridError> EditGrid::reject_if_evaluating() const {
    if (eval_) {
        return grid_error(GridErrorKind::EVAL_IN_PROGRESS,
                          "The board cannot be edited while the circuit is running.", std::nullopt);
    }
    return std::nullopt;
}

std::optional<GridError> EditGrid::check_placement(const WireLoc& loc, WireShape shape,
                                                   const CoordsRect& bounds) const {
    const Coords neighbor = loc.coords + loc.dir;
    const bool in_bounds = bounds.contains(loc.coords) ||
                           (shape == WireShape::STUB && bounds.contains(neighbor));
    if (!in_bounds) {
        return grid_error(GridErrorKind::WIRE_OUT_OF_BOUNDS,
                          "The wire at " + loc_text(loc) + " is outside the board.", loc.coords);
    }
    auto chip = chip_cells_.find(loc.coords);
    if (chip != chip_cells_.end()) {
        auto other = chip_cells_.find(neighbor);
        const bool leaves_chip = other == chip_cells_.end() || other->second != chip->second;
        if (shape != WireShape::STUB || !leaves_chip) {
            return grid_error(GridErrorKind::WIRE_UNDER_CHIP,
                              "The wire at " + loc_text(loc) + " runs underneath a chip.",
                              loc.coords);
        }
    }
    return std::nullopt;
}

std::vector<GridError> EditGrid::check_consistency(const std::set<Coords>& cells) const {
    std::set<Coords> region;
    for (Coords cell : cells) {
        region.insert(cell);
        for (Direction dir : all_directions()) {
            region.insert(cell + dir);
        }
    }

    std::vector<GridError> errors;
    for (Coords cell : region) {
        for (Direction dir : all_directions()) {
            auto it = fragments_.find(WireLoc{cell, dir});
            if (it == fragments_.end()) {
                continue;
            }
            const WireLoc& loc = it->first;
            if (fragments_.count(loc.across()) == 0) {
                errors.push_back(grid_error(GridErrorKind::WIRE_SHAPE_INCONSISTENT,
                                            "The wire at " + loc_text(loc) +
                                                " does not continue into the next cell.",
                                            cell));
                return errors;
            }
            const std::vector<Direction> group = sorted_group(it->second, dir);
            for (Direction partner : group) {
                auto other = fragments_.find(WireLoc{cell, partner});
                if (other == fragments_.end() || sorted_group(other->second, partner) != group) {
                    errors.push_back(grid_error(GridErrorKind::WIRE_SHAPE_INCONSISTENT,
                                                "The " +
                                                    std::string(wire_shape_name(it->second)) +
                                                    " wire at " + loc_text(loc) +
                                                    " does not match the wires beside it.",
                                                cell));
                    return errors;
                }
            }
        }
    }
    return errors;
}

// --- Applying changes ---

std::vector<GridError> EditGrid::replace_fragments(const WireMap& remove, const WireMap& add) {
    std::vector<GridError> errors;
    for (const auto& [loc, shape] : add) {
        if (fragments_.count(loc) != 0 && remove.count(loc) == 0) {
            errors.push_back(grid_error(GridErrorKind::REPLACE_WIRES_OLD_MISMATCH,
                                        "There is already a wire at " + loc_text(loc) + ".",
                                        loc.coords));
            return errors;
        }
        if (auto error = check_placement(loc, shape, bounds_)) {
            errors.push_back(std::move(*error));
            return errors;
        }
    }

    std::set<Coords> touched;
    for (const auto& [loc, shape] : remove) {
        fragments_.erase(loc);
        touched.insert(loc.coords);
    }
    for (const auto& [loc, shape] : add) {
        fragments_[loc] = shape;
        touched.insert(loc.coords);
    }

    errors = check_consistency(touched);
    if (!errors.empty()) {
        for (const auto& [loc, shape] : add) {
            fragments_.erase(loc);
        }
        for (const auto& [loc, shape] : remove) {
            fragments_[loc] = shape;
        }
    }
    return errors;
}

std::vector<GridError> EditGrid::add_chip(Coords coords, ChipType type, Orientation orient) {
    if (allowed_chips_.count(type.kind) == 0) {
        return {grid_error(GridErrorKind::CHIP_NOT_ALLOWED,
                           "The " + std::string(chip_kind_name(type.kind)) +
                               " chip is not available in this puzzle.",
                           coords)};
    }
    const CoordsRect footprint = chip_footprint(coords, type, orient);
    if (!bounds_.contains_rect(footprint)) {
        return {grid_error(GridErrorKind::CHIP_OUT_OF_BOUNDS,
                           "A " + type.to_string() + " chip at " + coords_text(coords) +
                               " would not fit on the board.",
                           coords)};
    }
    for (int32_t y = footprint.y; y < footprint.y + footprint.height; ++y) {
        for (int32_t x = footprint.x; x < footprint.x + footprint.width; ++x) {
            const Coords cell{x, y};
            if (chip_cells_.count(cell) != 0) {
                return {grid_error(GridErrorKind::CHIP_OVERLAPS,
                                   "A " + type.to_string() + " chip at " + coords_text(coords) +
                                       " would overlap another chip at " + coords_text(cell) + ".",
                                   cell)};
            }
            for (Direction dir : all_directions()) {
                auto wire = fragments_.find(WireLoc{cell, dir});
                if (wire != fragments_.end() &&
                    (wire->second != WireShape::STUB || footprint.contains(cell + dir))) {
                    return {grid_error(GridErrorKind::WIRE_UNDER_CHIP,
                                       "A " + type.to_string() + " chip at " +
                                           coords_text(coords) + " would cover the wire at " +
                                           loc_text(wire->first) + ".",
                                       cell)};
                }
            }
        }
    }

    chips_[coords] = PlacedChip{type, orient};
    for (int32_t y = footprint.y; y < footprint.y + footprint.height; ++y) {
        for (int32_t x = footprint.x; x < footprint.x + footprint.width; ++x) {
            chip_cells_[Coords{x, y}] = coords;
        }
    }
    return {};
}

std::vector<GridError> EditGrid::remove_chip(Coords coords, ChipType type, Orientation orient) {
    auto it = chips_.find(coords);
    if (it == chips_.end() || it->second.type != type || it->second.orient != orient) {
        return {grid_error(GridErrorKind::CHIP_MISMATCH,
                           "There is no " + type.to_string() + " chip in orientation " +
                               orient.to_string() + " at " + coords_text(coords) + ".",
                           coords)};
    }
    const CoordsRect footprint = chip_footprint(coords, type, orient);
    for (int32_t y = footprint.y; y < footprint.y + footprint.height; ++y) {
        for (int32_t x = footprint.x; x < footprint.x + footprint.width; ++x) {
            chip_cells_.erase(Coords{x, y});
        }
    }
    chips_.erase(it);
    return {};
}

std::vector<GridError> EditGrid::set_bounds(const CoordsRect& old_bounds,
                                            const CoordsRect& new_bounds) {
    if (old_bounds != bounds_) {
        return {grid_error(GridErrorKind::BOUNDS_MISMATCH,
                           "The board bounds changed before this edit was applied.",
                           std::nullopt)};
    }
    const CoordsSize min_size = min_bounds_size(interfaces_);
    if (new_bounds.width < min_size.width || new_bounds.height < min_size.height) {
        return {grid_error(GridErrorKind::BOUNDS_TOO_SMALL_FOR_INTERFACES,
                           "The board must be at least " + std::to_string(min_size.width) + "x" +
                               std::to_string(min_size.height) + " to fit its interfaces.",
                           std::nullopt)};
    }
    for (const auto& [coords, chip] : chips_) {
        if (!new_bounds.contains_rect(chip_footprint(coords, chip.type, chip.orient))) {
            return {grid_error(GridErrorKind::CHIP_OUT_OF_BOUNDS,
                               "The " + chip.type.to_string() + " chip at " + coords_text(coords) +
                                   " would be outside the new bounds.",
                               coords)};
        }
    }
    for (const auto& [loc, shape] : fragments_) {
        if (auto error = check_placement(loc, shape, new_bounds)) {
            return {std::move(*error)};
        }
    }
    bounds_ = new_bounds;
    return {};
}

std::vector<GridError> EditGrid::apply_change(const GridChange& change) {
    return std::visit(
        Overloaded{
            [this](const ReplaceWires& c) -> std::vector<GridError> {
                for (const auto& [loc, shape] : c.old_wires) {
                    auto it = fragments_.find(loc);
                    if (it == fragments_.end() || it->second != shape) {
                        return {grid_error(GridErrorKind::REPLACE_WIRES_OLD_MISMATCH,
                                           "The wire at " + loc_text(loc) +
                                               " is not the one this edit expected.",
                                           loc.coords)};
                    }
                }
                return replace_fragments(c.old_wires, c.new_wires);
            },
            [this](const AddChip& c) { return add_chip(c.coords, c.type, c.orient); },
            [this](const RemoveChip& c) { return remove_chip(c.coords, c.type, c.orient); },
            [this](const SetBounds& c) { return set_bounds(c.old_bounds, c.new_bounds); },
            [this](const MassRemoveWires& c) -> std::vector<GridError> {
                for (const auto& [loc, shape] : c.wires) {
                    if (!c.rect.contains(loc.coords)) {
                        return {grid_error(GridErrorKind::WIRE_OUT_OF_BOUNDS,
                                           "The wire at " + loc_text(loc) +
                                               " is outside the selection.",
                                           loc.coords)};
                    }
                    auto it = fragments_.find(loc);
                    if (it == fragments_.end() || it->second != shape) {
                        return {grid_error(GridErrorKind::REPLACE_WIRES_OLD_MISMATCH,
                                           "The wire at " + loc_text(loc) +
                                               " is not the one this edit expected.",
                                           loc.coords)};
                    }
                }
                return replace_fragments(c.wires, {});
            },
            [this](const MassAddWires& c) -> std::vector<GridError> {
                for (const auto& [loc, shape] : c.wires) {
                    if (!c.rect.contains(loc.coords)) {
                        return {grid_error(GridErrorKind::WIRE_OUT_OF_BOUNDS,
                                           "The wire at " + loc_text(loc) +
                                               " is outside the selection.",
                                           loc.coords)};
                    }
                }
                return replace_fragments({}, c.wires);
            },
            [this](const AddStubWire& c) {
                const WireMap stubs{{WireLoc{c.coords, c.dir}, WireShape::STUB},
                                    {WireLoc{c.coords + c.dir, -c.dir}, WireShape::STUB}};
                return replace_fragments({}, stubs);
            },
            [this](const RemoveStubWire& c) -> std::vector<GridError> {
                const WireMap stubs{{WireLoc{c.coords, c.dir}, WireShape::STUB},
                                    {WireLoc{c.coords + c.dir, -c.dir}, WireShape::STUB}};
                for (const auto& [loc, shape] : stubs) {
                    if (wire_at(loc) != shape) {
                        return {grid_error(GridErrorKind::REPLACE_WIRES_OLD_MISMATCH,
                                           "There is no stub wire at " + loc_text(loc) + ".",
                                           loc.coords)};
                    }
                }
                return replace_fragments(stubs, {});
            },
        },
        change);
}

std::vector<GridError> EditGrid::apply_group(const std::vector<GridChange>& changes) {
    for (size_t i = 0; i < changes.size(); ++i) {
        std::vector<GridError> errors = apply_change(changes[i]);
        if (errors.empty()) {
            continue;
        }
        debug_log("Rejected %s: %s", describe_change(changes[i]).c_str(),
                  errors.front().message.c_str());
        for (size_t j = i; j-- > 0;) {
            if (!apply_change(invert_change(changes[j])).empty()) {
                throw std::logic_error("Could not roll back " + describe_change(changes[j]));
            }
        }
        return errors;
    }
    return {};
}

// --- Undo / redo ---

std::vector<GridError> EditGrid::mutate(const std::vector<GridChange>& changes) {
    if (auto error = reject_if_evaluating()) {
        return {std::move(*error)};
    }
    commit_provisional_changes();
    std::vector<GridError> errors = apply_group(changes);
    if (!errors.empty()) {
        return errors;
    }
    std::vector<GridChange> inverse = invert_and_collapse_group(changes);
    if (!inverse.empty()) {
        undo_stack_.push_back(std::move(inverse));
        redo_stack_.clear();
    }
    typecheck();
    return {};
}

std::vector<GridError> EditGrid::try_mutate_provisionally(const std::vector<GridChange>& changes) {
    if (auto error = reject_if_evaluating()) {
        return {std::move(*error)};
    }
    std::vector<GridError> errors = apply_group(changes);
    if (!errors.empty()) {
        return errors;
    }
    provisional_.insert(provisional_.end(), changes.begin(), changes.end());
    typecheck();
    return {};
}

bool EditGrid::commit_provisional_changes() {
    if (provisional_.empty()) {
        return false;
    }
    std::vector<GridChange> inverse = invert_and_collapse_group(std::move(provisional_));
    provisional_.clear();
    if (!inverse.empty()) {
        undo_stack_.push_back(std::move(inverse));
        redo_stack_.clear();
    }
    return true;
}

std::vector<GridError> EditGrid::undo() {
    if (auto error = reject_if_evaluating()) {
        return {std::move(*error)};
    }
    commit_provisional_changes();
    if (undo_stack_.empty()) {
        return {grid_error(GridErrorKind::NOTHING_TO_UNDO, "There is nothing to undo.",
                           std::nullopt)};
    }
    std::vector<GridError> errors = apply_group(undo_stack_.back());
    if (!errors.empty()) {
        return errors;
    }
    redo_stack_.push_back(invert_group(undo_stack_.back()));
    undo_stack_.pop_back();
    typecheck();
    return {};
}

std::vector<GridError> EditGrid::redo() {
    if (auto error = reject_if_evaluating()) {
        return {std::move(*error)};
    }
    if (redo_stack_.empty()) {
        return {grid_error(GridErrorKind::NOTHING_TO_REDO, "There is nothing to redo.",
                           std::nullopt)};
    }
    std::vector<GridError> errors = apply_group(redo_stack_.back());
    if (!errors.empty()) {
        return errors;
    }
    undo_stack_.push_back(invert_and_collapse_group(redo_stack_.back()));
    redo_stack_.pop_back();
    typecheck();
    return {};
}

// --- Typecheck ---

void EditGrid::typecheck() {
    std::vector<PortSpec> ports;
    std::vector<PortConstraint> constraints;
    for (const auto& [coords, chip] : chips_) {
        const auto chip_port_list = chip_ports(chip.type, coords, chip.orient);
        ports.insert(ports.end(), chip_port_list.begin(), chip_port_list.end());
        const auto chip_constraint_list = chip_constraints(chip.type, coords, chip.orient);
        constraints.insert(constraints.end(), chip_constraint_list.begin(),
                           chip_constraint_list.end());
    }
    for (const auto& iface : interfaces_) {
        const auto placed = iface.placed_ports(bounds_);
        ports.insert(ports.end(), placed.begin(), placed.end());
        const auto iface_constraints = iface.constraints(bounds_);
        constraints.insert(constraints.end(), iface_constraints.begin(), iface_constraints.end());
    }

    nets_ = group_nets(fragments_, std::move(ports));
    build_errors_ = check_nets(nets_);

    for (const auto& iface : interfaces_) {
        const auto placed = iface.placed_ports(bounds_);
        for (size_t p = 0; p < placed.size(); ++p) {
            const WireLoc& loc = placed[p].loc;
            if (placed[p].flow == PortFlow::SINK && fragments_.count(loc) == 0) {
                build_errors_.push_back({BuildErrorKind::UNCONNECTED_PORT,
                                         "The " + iface.ports[p].name + " port of the " +
                                             iface.name + " interface is not connected.",
                                         nets_.net_at(loc), loc});
            }
        }
    }

    SizeSolution solution = solve_wire_sizes(nets_, constraints);
    net_sizes_ = std::move(solution.sizes);
    build_errors_.insert(build_errors_.end(), solution.errors.begin(), solution.errors.end());
}

// --- Evaluation ---

std::vector<BuildError> EditGrid::start_eval(const Puzzle& puzzle, const Prefs& prefs,
                                             ScoreReporter reporter) {
    if (eval_) {
        throw std::logic_error("An evaluation is already running");
    }
    std::vector<BuildError> errors = build_errors_;

    const std::vector<Interface> wanted = puzzle.interfaces();
    std::vector<const Interface*> matched;
    for (const auto& iface : wanted) {
        auto it = std::find_if(interfaces_.begin(), interfaces_.end(),
                               [&](const Interface& mine) { return mine.name == iface.name; });
        if (it == interfaces_.end() || it->ports.size() != iface.ports.size()) {
            errors.push_back({BuildErrorKind::INTERFACE_PORT_MISSING,
                              "The board has no " + iface.name + " interface with " +
                                  std::to_string(iface.ports.size()) + " port(s).",
                              std::nullopt, std::nullopt});
            continue;
        }
        matched.push_back(&*it);
    }
    if (!errors.empty()) {
        return errors;
    }

    CircuitBlueprint blueprint;
    for (size_t n = 0; n < nets_.nets.size(); ++n) {
        blueprint.slot_sizes.push_back(net_sizes_.at(n).value());
        blueprint.slot_locs.push_back(nets_.nets[n].representative);
    }
    for (const auto& [coords, chip] : chips_) {
        BlueprintChip placed{coords, chip.type, {}};
        for (const auto& port : chip_ports(chip.type, coords, chip.orient)) {
            const size_t net = nets_.net_at(port.loc).value();
            placed.slots.push_back({net, blueprint.slot_sizes[net]});
        }
        blueprint.chips.push_back(std::move(placed));
    }
    for (const Interface* iface : matched) {
        std::vector<InterfaceSlot> slots;
        for (const auto& port : iface->placed_ports(bounds_)) {
            slots.push_back({port.loc, nets_.net_at(port.loc).value()});
        }
        blueprint.interface_slots.push_back(std::move(slots));
    }
    blueprint.wire_length = wire_length();

    errors = schedule_blueprint(blueprint);
    if (!errors.empty()) {
        return errors;
    }

    debug_log("Starting evaluation of \"%s\" with %zu slots and %zu chips",
              std::string(puzzle.title()).c_str(), blueprint.slot_sizes.size(),
              blueprint.chips.size());
    eval_ = std::make_unique<CircuitEval>(std::move(blueprint), puzzle, prefs, std::move(reporter));
    return {};
}

void EditGrid::stop_eval() {
    eval_.reset();
}

std::optional<uint32_t> EditGrid::port_value(const WireLoc& loc) const {
    if (!eval_) {
        return std::nullopt;
    }
    auto net = nets_.net_at(loc);
    if (!net) {
        return std::nullopt;
    }
    const auto& color = nets_.nets[*net].color;
    if (color == PortColor::EVENT) {
        return eval_->state().last_event(*net);
    }
    if (color == PortColor::ANALOG) {
        return std::nullopt;
    }
    return eval_->state().recv_behavior(*net);
}

// --- Saved form ---

EditGrid EditGrid::from_circuit_data(const Puzzle& puzzle, const CircuitData& data) {
    const std::vector<Interface> interfaces = puzzle.interfaces();
    const CoordsSize min_size = min_bounds_size(interfaces);
    const CoordsSize size{std::max(data.size.width, min_size.width),
                          std::max(data.size.height, min_size.height)};
    EditGrid grid(CoordsRect(Coords{0, 0}, size), interfaces, puzzle.allowed_chips());
    const Coords origin = grid.bounds_.top_left();

    for (const auto& [key, value] : data.chips) {
        auto delta = decode_delta_key(key);
        auto chip = decode_chip_value(value);
        if (!delta || !chip) {
            debug_log("Skipping malformed chip entry %s = %s", key.c_str(), value.c_str());
            continue;
        }
        const auto errors = grid.add_chip(origin + *delta, chip->second, chip->first);
        if (!errors.empty()) {
            debug_log("Skipping chip %s: %s", key.c_str(), errors.front().message.c_str());
        }
    }

    WireMap wires = decode_wires(data.wires, origin);
    for (auto it = wires.begin(); it != wires.end();) {
        if (grid.check_placement(it->first, it->second, grid.bounds_)) {
            it = wires.erase(it);
        } else {
            ++it;
        }
    }
    // Dropping one fragment can strand its partners, so repeat until stable
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto it = wires.begin(); it != wires.end();) {
            const WireLoc& loc = it->first;
            bool ok = wires.count(loc.across()) != 0;
            const std::vector<Direction> group = sorted_group(it->second, loc.dir);
            for (Direction partner : group) {
                auto other = wires.find(WireLoc{loc.coords, partner});
                ok = ok && other != wires.end() && sorted_group(other->second, partner) == group;
            }
            if (ok) {
                ++it;
            } else {
                it = wires.erase(it);
                changed = true;
            }
        }
    }
    grid.fragments_ = std::move(wires);
    grid.typecheck();
    return grid;
}

CircuitData EditGrid::to_circuit_data() const {
    CircuitData data;
    data.size = bounds_.size();
    const Coords origin = bounds_.top_left();
    for (const auto& [coords, chip] : chips_) {
        data.chips.emplace(encode_delta_key(coords - origin),
                           encode_chip_value(chip.orient, chip.type));
    }
    data.wires = encode_wires(fragments_, origin);
    return data;
}

} // namespace tachy
