/// @file main.cpp
/// @brief Tachyomancer board viewer entry point
///
/// Opens a prebuilt board for each catalog puzzle, runs it with the circuit
/// evaluator, and shows live wire values, errors, and scores. Interactive
/// chips respond to clicks while running.
/// Supports both native desktop and Emscripten/WASM builds.

#include "rendering/board_renderer.hpp"
#include "state/edit_grid.hpp"
#include "state/prefs.hpp"
#include "state/puzzle.hpp"
#include "ui/demo_boards.hpp"
#include "ui/eval_panel.hpp"
#include "util/debug_log.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr float MAX_CELL_PIXELS = 56.0f;
constexpr float UI_PANEL_WIDTH = 260.0f;
constexpr float UI_MARGIN = 10.0f;
constexpr float BOARD_PADDING = 30.0f;
constexpr float TITLE_HEIGHT = 40.0f;
constexpr int MAX_STEPS_PER_FRAME = 8;

/// The open board and how it is laid out on screen
struct AppState {
    std::unique_ptr<tachy::EditGrid> grid;
    tachy::BoardView view;
    tachy::Prefs prefs;
    double step_timer = 0.0;
};

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    tachy::ViewerState ui;
    AppState app;
};

/// Recomputes the board view to fit the current window.
/// Called on open and on window resize.
void refit_board(AppState& app) {
    const float screen_w = static_cast<float>(GetScreenWidth());
    const float screen_h = static_cast<float>(GetScreenHeight());
    const Rectangle area = {BOARD_PADDING, TITLE_HEIGHT + BOARD_PADDING,
                            screen_w - UI_PANEL_WIDTH - UI_MARGIN - 2.0f * BOARD_PADDING,
                            screen_h - TITLE_HEIGHT - 2.0f * BOARD_PADDING};
    app.view = tachy::fit_board(app.grid->bounds(), area, MAX_CELL_PIXELS);
}

void open_puzzle(FrameState& state, tachy::PuzzleId id) {
    auto& ui = state.ui;
    auto& app = state.app;
    try {
        app.grid = std::make_unique<tachy::EditGrid>(tachy::build_demo_board(id));
    } catch (const std::logic_error& e) {
        tachy::debug_log("%s; opening an empty board instead", e.what());
        app.grid = std::make_unique<tachy::EditGrid>(tachy::puzzle_for(id));
    }
    ui.puzzle = id;
    ui.playing = false;
    ui.last_outcome.reset();
    ui.start_errors.clear();
    ui.reported_score.reset();
    app.step_timer = 0.0;
    refit_board(app);
}

void start_run(FrameState& state) {
    auto& ui = state.ui;
    auto& app = state.app;
    if (app.grid->eval() != nullptr) {
        return;
    }
    tachy::ViewerState* viewer = &ui;
    ui.start_errors = app.grid->start_eval(
        tachy::puzzle_for(ui.puzzle), app.prefs, [viewer](std::string_view title, uint32_t score) {
            viewer->reported_score = std::string(title) + ": " + std::to_string(score);
        });
    if (!ui.start_errors.empty()) {
        tachy::debug_log("Cannot run: %s", ui.start_errors.front().message.c_str());
        return;
    }
    ui.last_outcome.reset();
    ui.reported_score.reset();
    app.step_timer = 0.0;
}

void stop_run(FrameState& state) {
    state.app.grid->stop_eval();
    state.ui.playing = false;
    state.ui.last_outcome.reset();
}

/// Applies one step; anything but STEPPED pauses playback
void record_step(tachy::ViewerState& ui, tachy::StepOutcome outcome) {
    ui.last_outcome = outcome;
    if (outcome != tachy::StepOutcome::STEPPED) {
        ui.playing = false;
    }
}

/// Steps whole time steps at the puzzle's pace while playing
void advance_playback(FrameState& state, float dt) {
    auto& ui = state.ui;
    auto& app = state.app;
    tachy::CircuitEval* eval = app.grid->eval();
    if (eval == nullptr || !ui.playing) {
        return;
    }
    const double interval = std::max(eval->seconds_per_time_step(), 1.0 / TARGET_FPS);
    app.step_timer += dt;
    int steps = 0;
    while (ui.playing && app.step_timer >= interval && steps < MAX_STEPS_PER_FRAME) {
        app.step_timer -= interval;
        record_step(ui, eval->step_time_step());
        ++steps;
    }
    if (steps == MAX_STEPS_PER_FRAME) {
        app.step_timer = 0.0;
    }
}

/// Shared by the panel buttons and the keyboard shortcuts
void apply_action(FrameState& state, const tachy::EvalAction& action) {
    auto& ui = state.ui;
    auto& app = state.app;

    if (action.puzzle_selected) {
        open_puzzle(state, *action.puzzle_selected);
        return;
    }
    if (action.start_pressed) {
        start_run(state);
    }
    if (action.stop_pressed) {
        stop_run(state);
        return;
    }
    if (action.undo_pressed || action.redo_pressed) {
        const auto errors = action.undo_pressed ? app.grid->undo() : app.grid->redo();
        if (!errors.empty()) {
            tachy::debug_log("%s", errors.front().message.c_str());
        }
        return;
    }

    tachy::CircuitEval* eval = app.grid->eval();
    if (eval == nullptr) {
        return;
    }
    if (action.play_pressed) {
        ui.playing = !ui.playing;
        app.step_timer = 0.0;
    }
    if (action.subcycle_pressed) {
        ui.playing = false;
        record_step(ui, eval->step_subcycle());
    }
    if (action.step_pressed) {
        ui.playing = false;
        record_step(ui, eval->step_time_step());
    }
    if (action.reset_pressed) {
        eval->reset();
        ui.playing = false;
        ui.last_outcome.reset();
        ui.reported_score.reset();
        app.step_timer = 0.0;
    }
}

tachy::EvalAction keyboard_action(const tachy::ViewerState& ui, bool running) {
    tachy::EvalAction action;
    for (size_t i = 0; i < ui.unlocked.size() && i < 9; ++i) {
        if (IsKeyPressed(KEY_ONE + static_cast<int>(i))) {
            action.puzzle_selected = ui.unlocked[i];
        }
    }
    action.start_pressed = IsKeyPressed(KEY_ENTER) && !running;
    action.stop_pressed = IsKeyPressed(KEY_E) && running;
    action.play_pressed = IsKeyPressed(KEY_SPACE) && running;
    action.step_pressed = IsKeyPressed(KEY_RIGHT) && running;
    action.subcycle_pressed = IsKeyPressed(KEY_S) && running;
    action.reset_pressed = IsKeyPressed(KEY_R) && running;
    const bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
    action.undo_pressed = ctrl && IsKeyPressed(KEY_Z) && !running;
    action.redo_pressed = ctrl && IsKeyPressed(KEY_Y) && !running;
    return action;
}

/// One frame of the application, called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    auto& ui = state.ui;
    auto& app = state.app;
    float dt = GetFrameTime();

    if (IsWindowResized()) {
        refit_board(app);
    }

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();

    // --- Keyboard shortcuts ---
    const tachy::EvalAction key_action = keyboard_action(ui, app.grid->eval() != nullptr);

    // --- Clicks on interactive chips ---
    if (tachy::CircuitEval* eval = app.grid->eval()) {
        if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
            if (auto chip = tachy::interactive_chip_at(*app.grid, app.view, GetMousePosition())) {
                eval->interaction().press(*chip);
            }
        }
    }

    // --- Update evaluation ---
    advance_playback(state, dt);

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    tachy::draw_board(*app.grid, app.view);
    tachy::draw_error_markers(*app.grid, app.view);

    const tachy::Puzzle& puzzle = tachy::puzzle_for(ui.puzzle);
    const std::string title(puzzle.title());
    int title_width = MeasureText(title.c_str(), 24);
    float board_area_w = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;
    DrawText(title.c_str(),
             static_cast<int>((board_area_w - static_cast<float>(title_width)) / 2.0f), 12, 24,
             {240, 240, 240, 255});

    // --- Right-side UI panels ---
    float panel_x = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;
    float panel_y = UI_MARGIN;

    tachy::EvalPanelResult controls =
        tachy::draw_control_panel(ui, *app.grid, panel_x, panel_y, UI_PANEL_WIDTH);
    panel_y += controls.panel_height + UI_MARGIN;
    panel_y += tachy::draw_status_panel(ui, *app.grid, panel_x, panel_y, UI_PANEL_WIDTH) + UI_MARGIN;
    tachy::draw_puzzle_panel(puzzle, panel_x, panel_y, UI_PANEL_WIDTH);

    // --- HUD: key hints ---
    const bool running = app.grid->eval() != nullptr;
    DrawText(running ? "SPACE play/pause  RIGHT step  S subcycle  R reset  E edit"
                     : "ENTER run  CTRL+Z undo  CTRL+Y redo  1-5 puzzles",
             10, screen_h - 24, 13, {140, 140, 140, 255});

    EndDrawing();

    // --- Process actions (take effect next frame) ---
    apply_action(state, controls.action);
    apply_action(state, key_action);
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback: unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Tachyomancer Board Viewer");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);

    // --- Create all mutable state ---
    FrameState state;
    state.ui.unlocked = tachy::unlocked_puzzles([](tachy::PuzzleId) { return true; });
    open_puzzle(state, state.ui.unlocked.front());

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop; state goes through void*.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    CloseWindow();
    return 0;
}
