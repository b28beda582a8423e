#pragma once

/// @file edit_grid.hpp
/// @brief The editable board: chips, wires, bounds, undo/redo, and evaluation

#include "geom/coords.hpp"
#include "geom/orientation.hpp"
#include "save/chip_type.hpp"
#include "save/circuit_data.hpp"
#include "save/wire_shape.hpp"
#include "state/change.hpp"
#include "state/check.hpp"
#include "state/errors.hpp"
#include "state/eval.hpp"
#include "state/interface.hpp"
#include "state/prefs.hpp"
#include "state/puzzle.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace tachy {

/// A chip on the board, stored under its top-left cell
struct PlacedChip {
    ChipType type;
    Orientation orient;
};

/// The board a player edits.
///
/// All edits go through change groups, which apply atomically and record
/// their collapsed inverse for undo. Every accepted edit leaves the wire
/// map consistent: each fragment's in-cell partners exist with matching
/// shapes, and the half-edge across every fragment exists. While an
/// evaluation is running the board is frozen.
class EditGrid {
  public:
    /// Empty board sized for the puzzle, carrying its interfaces and chip
    /// restrictions
    explicit EditGrid(const Puzzle& puzzle);

    EditGrid(CoordsRect bounds, std::vector<Interface> interfaces,
             std::set<ChipKind> allowed_chips);

    /// Rebuilds a board from saved data, skipping entries that are
    /// malformed, not allowed, or would not fit
    [[nodiscard]] static EditGrid from_circuit_data(const Puzzle& puzzle, const CircuitData& data);

    /// Canonical saved form, keyed relative to the bounds' top-left cell
    [[nodiscard]] CircuitData to_circuit_data() const;

    EditGrid(EditGrid&&) = default;
    EditGrid& operator=(EditGrid&&) = default;

    // --- Contents ---
    [[nodiscard]] const CoordsRect& bounds() const { return bounds_; }
    [[nodiscard]] const WireMap& fragments() const { return fragments_; }
    [[nodiscard]] std::optional<WireShape> wire_at(const WireLoc& loc) const;
    [[nodiscard]] const std::map<Coords, PlacedChip>& chips() const { return chips_; }
    /// The chip covering `cell`, with its top-left cell
    [[nodiscard]] std::optional<std::pair<Coords, PlacedChip>> chip_at(Coords cell) const;
    [[nodiscard]] const std::vector<Interface>& interfaces() const { return interfaces_; }
    [[nodiscard]] const std::set<ChipKind>& allowed_chips() const { return allowed_chips_; }
    /// Number of wire fragments on the board
    [[nodiscard]] uint32_t wire_length() const { return static_cast<uint32_t>(fragments_.size()); }

    // --- Editing ---

    /// Applies a change group atomically. Returns the errors of the first
    /// change that failed, or nothing on success.
    std::vector<GridError> mutate(const std::vector<GridChange>& changes);

    /// Applies a change group without recording it for undo yet. Successive
    /// provisional groups accumulate until committed.
    std::vector<GridError> try_mutate_provisionally(const std::vector<GridChange>& changes);

    /// Pushes the accumulated provisional changes as one undo entry.
    /// Returns false if nothing was pending.
    bool commit_provisional_changes();

    [[nodiscard]] bool has_provisional_changes() const { return !provisional_.empty(); }

    std::vector<GridError> undo();
    std::vector<GridError> redo();
    [[nodiscard]] bool can_undo() const { return !undo_stack_.empty() || !provisional_.empty(); }
    [[nodiscard]] bool can_redo() const { return !redo_stack_.empty(); }

    // --- Typecheck ---
    [[nodiscard]] const NetGraph& nets() const { return nets_; }
    [[nodiscard]] const std::vector<BuildError>& build_errors() const { return build_errors_; }
    /// Solved size of a net; unset when its constraints conflict
    [[nodiscard]] std::optional<WireSize> net_size(size_t net) const;
    [[nodiscard]] std::optional<size_t> net_at(const WireLoc& loc) const { return nets_.net_at(loc); }

    // --- Evaluation ---

    /// Freezes the board and starts evaluating it against `puzzle`, which
    /// must outlive the evaluation. Returns the reasons the circuit cannot
    /// run, or nothing on success.
    /// @throws std::logic_error if an evaluation is already running
    std::vector<BuildError> start_eval(const Puzzle& puzzle, const Prefs& prefs,
                                       ScoreReporter reporter = {});
    void stop_eval();
    [[nodiscard]] CircuitEval* eval() { return eval_.get(); }
    [[nodiscard]] const CircuitEval* eval() const { return eval_.get(); }

    /// Current value on the net at `loc` while evaluating: the behavior
    /// value, or on event nets the latest event of the current time step
    /// (the finished one between steps)
    [[nodiscard]] std::optional<uint32_t> port_value(const WireLoc& loc) const;

  private:
    [[nodiscard]] std::vector<GridError> apply_group(const std::vector<GridChange>& changes);
    [[nodiscard]] std::vector<GridError> apply_change(const GridChange& change);

    [[nodiscard]] std::vector<GridError> replace_fragments(const WireMap& remove,
                                                           const WireMap& add);
    [[nodiscard]] std::vector<GridError> add_chip(Coords coords, ChipType type, Orientation orient);
    [[nodiscard]] std::vector<GridError> remove_chip(Coords coords, ChipType type,
                                                     Orientation orient);
    [[nodiscard]] std::vector<GridError> set_bounds(const CoordsRect& old_bounds,
                                                    const CoordsRect& new_bounds);

    [[nodiscard]] std::optional<GridError> check_placement(const WireLoc& loc, WireShape shape,
                                                           const CoordsRect& bounds) const;
    [[nodiscard]] std::vector<GridError> check_consistency(const std::set<Coords>& cells) const;
    [[nodiscard]] std::optional<GridError> reject_if_evaluating() const;

    void typecheck();

    CoordsRect bounds_;
    WireMap fragments_;
    std::map<Coords, PlacedChip> chips_;
    /// Every cell covered by a chip, mapped to the chip's top-left cell
    std::map<Coords, Coords> chip_cells_;
    std::vector<Interface> interfaces_;
    std::set<ChipKind> allowed_chips_;

    std::vector<std::vector<GridChange>> undo_stack_;
    std::vector<std::vector<GridChange>> redo_stack_;
    std::vector<GridChange> provisional_;

    NetGraph nets_;
    std::vector<std::optional<WireSize>> net_sizes_;
    std::vector<BuildError> build_errors_;

    std::unique_ptr<CircuitEval> eval_;
};

} // namespace tachy
