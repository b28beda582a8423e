#pragma once

/// @file errors.hpp
/// @brief Structured diagnostics for grid edits, circuit builds, and evaluation

#include "geom/coords.hpp"
#include "state/port.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tachy {

/// Why a grid change was rejected
enum class GridErrorKind {
    CHIP_OVERLAPS,
    CHIP_OUT_OF_BOUNDS,
    CHIP_NOT_ALLOWED,
    CHIP_MISMATCH,
    WIRE_SHAPE_INCONSISTENT,
    WIRE_OUT_OF_BOUNDS,
    WIRE_UNDER_CHIP,
    REPLACE_WIRES_OLD_MISMATCH,
    BOUNDS_MISMATCH,
    BOUNDS_TOO_SMALL_FOR_INTERFACES,
    NOTHING_TO_UNDO,
    NOTHING_TO_REDO,
    EVAL_IN_PROGRESS
};

/// Why a circuit cannot be evaluated
enum class BuildErrorKind {
    WIRE_SIZE_CONFLICT,
    MULTIPLE_SOURCES,
    NO_SOURCE,
    PORT_COLOR_MISMATCH,
    ANALOG_MIXED_WITH_DIGITAL,
    UNCONNECTED_PORT,
    COMBINATIONAL_LOOP,
    INTERFACE_PORT_MISSING
};

[[nodiscard]] std::string_view grid_error_name(GridErrorKind kind);
[[nodiscard]] std::string_view build_error_name(BuildErrorKind kind);

/// A rejected grid change; `coords` points at the offending cell when there
/// is one.
struct GridError {
    GridErrorKind kind;
    std::string message;
    std::optional<Coords> coords;
};

/// A problem that prevents evaluation. `net` indexes the grid's net list;
/// `loc` is a representative half-edge to highlight.
struct BuildError {
    BuildErrorKind kind;
    std::string message;
    std::optional<size_t> net;
    std::optional<WireLoc> loc;
};

/// An error raised while the circuit runs. Fatal errors stop the evaluation.
struct EvalError {
    uint32_t time_step = 0;
    std::optional<WireLoc> port;
    std::string message;
    bool fatal = false;
};

} // namespace tachy
