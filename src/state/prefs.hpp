#pragma once

/// @file prefs.hpp
/// @brief Host-supplied simulation tuning, passed explicitly to start_eval

#include <cstdint>
#include <optional>

namespace tachy {

struct Prefs {
    /// Subcycles allowed in one cycle before the run is declared
    /// non-convergent
    uint32_t max_subcycles_per_cycle = 64;

    /// Whether step_cycle / step_time_step pause after a Break chip fires
    bool stop_at_breakpoints = true;

    /// Overrides the puzzle's pacing in the viewer when set
    std::optional<double> seconds_per_time_step_override;
};

} // namespace tachy
