#pragma once

/// @file chip_type.hpp
/// @brief Chip kinds, their parameters, footprints, and text forms

#include "geom/coords.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tachy {

/// Kinds of chip that can be placed on the board
enum class ChipKind {
    // Value
    CONST,
    PACK,
    UNPACK,
    // Arithmetic
    ADD,
    SUB,
    MUL,
    HALVE,
    INC,
    // Comparison
    CMP,
    CMP_EQ,
    EQ,
    // Logic
    NOT,
    AND,
    OR,
    XOR,
    MUX,
    // Events
    CLOCK,
    DELAY,
    DEMUX,
    DISCARD,
    FILTER,
    JOIN,
    LATEST,
    SAMPLE,
    COUNTER,
    // Special
    BREAK,
    RAM,
    DISPLAY,
    BUTTON,
    TOGGLE
};

/// A chip kind plus its parameter: the constant for Const, the initial
/// state (0 or 1) for Toggle, and 0 for every other kind.
struct ChipType {
    ChipKind kind = ChipKind::AND;
    uint16_t value = 0;

    ChipType() = default;
    ChipType(ChipKind kind) : kind(kind) {}
    ChipType(ChipKind kind, uint16_t value) : kind(kind), value(value) {}

    [[nodiscard]] static ChipType constant(uint16_t value) { return {ChipKind::CONST, value}; }
    [[nodiscard]] static ChipType toggle(bool on) { return {ChipKind::TOGGLE, on ? uint16_t{1} : uint16_t{0}}; }

    /// Footprint in the default orientation
    [[nodiscard]] CoordsSize size() const;

    /// Chips the player operates directly while the circuit runs
    [[nodiscard]] bool is_interactive() const;

    /// Text form, e.g. "And", "Const(5)", "Toggle(true)"
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<ChipType> parse(std::string_view text);

    bool operator==(const ChipType& other) const { return kind == other.kind && value == other.value; }
    bool operator!=(const ChipType& other) const { return !(*this == other); }
    bool operator<(const ChipType& other) const {
        return kind != other.kind ? kind < other.kind : value < other.value;
    }
};

[[nodiscard]] std::string_view chip_kind_name(ChipKind kind);

/// True for chips that send or receive events
[[nodiscard]] bool is_event_chip(ChipKind kind);

/// Chip kinds grouped for a parts tray, in display order
[[nodiscard]] const std::vector<std::pair<std::string_view, std::vector<ChipKind>>>&
chip_categories();

} // namespace tachy
