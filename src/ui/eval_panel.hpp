/// @file eval_panel.hpp
/// @brief Side panels for choosing a puzzle, driving an evaluation, and reading its status.
///
/// All UI is drawn using Raylib primitives. Panels report what the user asked
/// for; the main loop applies it to the grid after the frame is drawn.

#pragma once

#include "state/edit_grid.hpp"
#include "state/eval.hpp"
#include "state/puzzle.hpp"

#include <raylib.h>

#include <optional>
#include <string>
#include <vector>

namespace tachy {

/// Actions the control panel can request from the main loop
struct EvalAction {
    std::optional<PuzzleId> puzzle_selected; ///< Open another puzzle's board
    bool start_pressed = false;              ///< Freeze the board and start running
    bool stop_pressed = false;               ///< Back to editing
    bool play_pressed = false;               ///< Toggle automatic stepping
    bool subcycle_pressed = false;           ///< Run one subcycle
    bool step_pressed = false;               ///< Run to the end of the time step
    bool reset_pressed = false;              ///< Restart the run from time step 0
    bool undo_pressed = false;
    bool redo_pressed = false;
};

struct EvalPanelResult {
    EvalAction action;
    float panel_height = 0.0f;
};

/// Persistent viewer state, kept across frames
struct ViewerState {
    PuzzleId puzzle = PuzzleId::TUTORIAL_OR;
    std::vector<PuzzleId> unlocked;
    bool playing = false;
    /// Outcome of the most recent step, shown in the status panel
    std::optional<StepOutcome> last_outcome;
    /// Why the last start attempt failed
    std::vector<BuildError> start_errors;
    /// Completion reported by the evaluator, as "<title>: <score>"
    std::optional<std::string> reported_score;
};

/// Draws the puzzle list and the run controls.
/// @param state   Viewer state (read only; changes come back as actions)
/// @param grid    The open board
/// @param panel_x Left edge of the panel in screen coordinates
/// @param panel_y Top edge of the panel in screen coordinates
/// @param panel_w Width of the panel
/// @return Requested actions and rendered panel height for stacking
EvalPanelResult draw_control_panel(const ViewerState& state, const EditGrid& grid, float panel_x,
                                   float panel_y, float panel_w);

/// Draws time step, subcycle, outcome, score, verification data, and any
/// build or evaluation errors.
/// @return Rendered panel height
float draw_status_panel(const ViewerState& state, const EditGrid& grid, float panel_x,
                        float panel_y, float panel_w);

/// Draws the puzzle's title and wrapped description.
/// @return Rendered panel height
float draw_puzzle_panel(const Puzzle& puzzle, float panel_x, float panel_y, float panel_w);

} // namespace tachy
