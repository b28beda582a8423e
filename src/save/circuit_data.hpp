#pragma once

/// @file circuit_data.hpp
/// @brief Compact saved form of a board and its key/value codecs

#include "geom/coords.hpp"
#include "geom/direction.hpp"
#include "geom/orientation.hpp"
#include "save/chip_type.hpp"
#include "state/change.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tachy {

/// A board as stored on disk. Keys are offsets from the top-left cell of
/// the bounds: "p2m3" is (+2, -3). Wire keys append a direction letter.
struct CircuitData {
    CoordsSize size;
    /// Delta key -> "<orientation>-<chip type>", e.g. "f1-Const(5)"
    std::map<std::string, std::string> chips;
    /// Wire key -> shape name, one entry per connected group in a cell
    std::map<std::string, std::string> wires;

    bool operator==(const CircuitData& other) const {
        return size == other.size && chips == other.chips && wires == other.wires;
    }
    bool operator!=(const CircuitData& other) const { return !(*this == other); }
};

[[nodiscard]] std::string encode_delta_key(CoordsDelta delta);
[[nodiscard]] std::optional<CoordsDelta> decode_delta_key(std::string_view key);

[[nodiscard]] std::string encode_wire_key(CoordsDelta delta, Direction dir);
[[nodiscard]] std::optional<std::pair<CoordsDelta, Direction>> decode_wire_key(std::string_view key);

[[nodiscard]] std::string encode_chip_value(Orientation orient, ChipType type);
[[nodiscard]] std::optional<std::pair<Orientation, ChipType>> decode_chip_value(std::string_view value);

/// Canonical wire entries: one fragment stands for its whole in-cell group,
/// and Stub pairs are written once from their East or South side.
[[nodiscard]] std::map<std::string, std::string> encode_wires(const WireMap& fragments,
                                                              Coords origin);

/// Expands each entry to its in-cell group, then adds a Stub across every
/// half-edge whose neighbor is missing. Malformed entries and entries that
/// would overlap a fragment already decoded are skipped.
[[nodiscard]] WireMap decode_wires(const std::map<std::string, std::string>& wires, Coords origin);

} // namespace tachy
