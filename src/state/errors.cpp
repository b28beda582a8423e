/// @file errors.cpp
/// @brief Names for grid and build error kinds

#include "state/errors.hpp"

namespace tachy {

std::string_view grid_error_name(GridErrorKind kind) {
    switch (kind) {
    case GridErrorKind::CHIP_OVERLAPS:
        return "ChipOverlaps";
    case GridErrorKind::CHIP_OUT_OF_BOUNDS:
        return "ChipOutOfBounds";
    case GridErrorKind::CHIP_NOT_ALLOWED:
        return "ChipNotAllowed";
    case GridErrorKind::CHIP_MISMATCH:
        return "ChipMismatch";
    case GridErrorKind::WIRE_SHAPE_INCONSISTENT:
        return "WireShapeInconsistent";
    case GridErrorKind::WIRE_OUT_OF_BOUNDS:
        return "WireOutOfBounds";
    case GridErrorKind::WIRE_UNDER_CHIP:
        return "WireUnderChip";
    case GridErrorKind::REPLACE_WIRES_OLD_MISMATCH:
        return "ReplaceWiresOldMismatch";
    case GridErrorKind::BOUNDS_MISMATCH:
        return "BoundsMismatch";
    case GridErrorKind::BOUNDS_TOO_SMALL_FOR_INTERFACES:
        return "BoundsTooSmallForInterfaces";
    case GridErrorKind::NOTHING_TO_UNDO:
        return "NothingToUndo";
    case GridErrorKind::NOTHING_TO_REDO:
        return "NothingToRedo";
    case GridErrorKind::EVAL_IN_PROGRESS:
        return "EvalInProgress";
    }
    return "Unknown";
}

std::string_view build_error_name(BuildErrorKind kind) {
    switch (kind) {
    case BuildErrorKind::WIRE_SIZE_CONFLICT:
        return "WireSizeConflict";
    case BuildErrorKind::MULTIPLE_SOURCES:
        return "MultipleSources";
    case BuildErrorKind::NO_SOURCE:
        return "NoSource";
    case BuildErrorKind::PORT_COLOR_MISMATCH:
        return "PortColorMismatch";
    case BuildErrorKind::ANALOG_MIXED_WITH_DIGITAL:
        return "AnalogMixedWithDigital";
    case BuildErrorKind::UNCONNECTED_PORT:
        return "UnconnectedPort";
    case BuildErrorKind::COMBINATIONAL_LOOP:
        return "CombinationalLoop";
    case BuildErrorKind::INTERFACE_PORT_MISSING:
        return "InterfacePortMissing";
    }
    return "Unknown";
}

} // namespace tachy
