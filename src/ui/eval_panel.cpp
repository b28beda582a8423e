/// @file eval_panel.cpp
/// @brief Implements the viewer side panels with custom-drawn Raylib UI elements

#include "ui/eval_panel.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

namespace tachy {

namespace {

// --- Layout constants ---
constexpr float ROW_HEIGHT = 22.0f;
constexpr float ROW_GAP = 6.0f;
constexpr float BUTTON_HEIGHT = 28.0f;
constexpr float BUTTON_GAP = 4.0f;
constexpr float PADDING = 10.0f;
constexpr int FONT_SIZE = 16;
constexpr int FONT_SIZE_SMALL = 13;
constexpr size_t MAX_LISTED_ERRORS = 6;

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color BUTTON_BG_ACTIVE = {40, 120, 60, 255};
const Color BUTTON_BG_SELECTED = {45, 75, 130, 255};
const Color BUTTON_TEXT = {220, 220, 230, 255};
const Color STATUS_COLOR = {180, 180, 100, 255};
const Color SUCCESS_COLOR = {80, 220, 130, 255};
const Color ERROR_COLOR = {240, 100, 100, 255};

/// Draw a button. Returns true if clicked this frame.
bool draw_button(const char* text, float x, float y, float w, float h, Color bg_normal,
                 Color bg_hover) {
    Rectangle rect = {x, y, w, h};
    Vector2 mouse = GetMousePosition();
    bool hovered = CheckCollisionPointRec(mouse, rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    DrawRectangleRec(rect, hovered ? bg_hover : bg_normal);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureText(text, FONT_SIZE_SMALL);
    DrawText(text, static_cast<int>(x + (w - static_cast<float>(tw)) / 2.0f),
             static_cast<int>(y + (h - static_cast<float>(FONT_SIZE_SMALL)) / 2.0f),
             FONT_SIZE_SMALL, BUTTON_TEXT);

    return clicked;
}

/// Draws wrapped text and returns consumed height.
float draw_wrapped_text(const std::string& text, float x, float y, float max_width, int font_size,
                        Color color, float line_gap = 2.0f) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float cy = y;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
                cy += static_cast<float>(font_size) + line_gap;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size);
    }

    return cy - y;
}

/// Measures wrapped text height without drawing.
float measure_wrapped_text(const std::string& text, float max_width, int font_size,
                           float line_gap = 2.0f) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float height = 0.0f;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                height += static_cast<float>(font_size) + line_gap;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        height += static_cast<float>(font_size);
    }

    return height;
}

void draw_panel_frame(float x, float y, float w, float h) {
    DrawRectangleRec({x, y, w, h}, BG_COLOR);
    DrawRectangleLinesEx({x, y, w, h}, 1.0f, BORDER_COLOR);
}

std::string join_values(const std::vector<uint64_t>& values) {
    std::string text;
    for (uint64_t value : values) {
        if (!text.empty()) {
            text += ' ';
        }
        text += std::to_string(value);
    }
    return text;
}

/// Messages to list under the status: the evaluator's errors while running,
/// otherwise the failed start attempt or the board's own build errors
std::vector<std::string> error_lines(const ViewerState& state, const EditGrid& grid) {
    std::vector<std::string> lines;
    if (const CircuitEval* eval = grid.eval()) {
        for (const auto& error : eval->errors()) {
            lines.push_back("t" + std::to_string(error.time_step) + (error.fatal ? " fatal: " : ": ") +
                            error.message);
        }
        return lines;
    }
    const auto& build = state.start_errors.empty() ? grid.build_errors() : state.start_errors;
    for (const auto& error : build) {
        lines.push_back(error.message);
    }
    return lines;
}

} // namespace

EvalPanelResult draw_control_panel(const ViewerState& state, const EditGrid& grid, float panel_x,
                                   float panel_y, float panel_w) {
    EvalPanelResult result;
    EvalAction& action = result.action;
    const bool running = grid.eval() != nullptr;

    float measure_y = panel_y + PADDING;
    measure_y += ROW_HEIGHT;                                                           // Title
    measure_y += static_cast<float>(state.unlocked.size()) * (BUTTON_HEIGHT + BUTTON_GAP); // Puzzles
    measure_y += ROW_GAP + BUTTON_HEIGHT + ROW_GAP;                                    // Start/Stop
    measure_y += BUTTON_HEIGHT + ROW_GAP;                                              // Step row
    measure_y += BUTTON_HEIGHT;                                                        // Undo row
    result.panel_height = (measure_y + PADDING) - panel_y;

    float content_w = panel_w - 2.0f * PADDING;
    float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;

    draw_panel_frame(panel_x, panel_y, panel_w, result.panel_height);

    DrawText("PUZZLES", static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += ROW_HEIGHT;

    for (size_t i = 0; i < state.unlocked.size(); ++i) {
        const PuzzleId id = state.unlocked[i];
        const std::string label =
            std::to_string(i + 1) + ". " + std::string(puzzle_for(id).title());
        if (draw_button(label.c_str(), cx, cy, content_w, BUTTON_HEIGHT,
                        id == state.puzzle ? BUTTON_BG_SELECTED : BUTTON_BG, BUTTON_BG_HOVER) &&
            id != state.puzzle) {
            action.puzzle_selected = id;
        }
        cy += BUTTON_HEIGHT + BUTTON_GAP;
    }
    cy += ROW_GAP;

    // Start | Stop
    if (running) {
        action.stop_pressed =
            draw_button("Edit", cx, cy, content_w, BUTTON_HEIGHT, BUTTON_BG, BUTTON_BG_HOVER);
    } else {
        action.start_pressed = draw_button("Run", cx, cy, content_w, BUTTON_HEIGHT,
                                           BUTTON_BG_ACTIVE, BUTTON_BG_HOVER);
    }
    cy += BUTTON_HEIGHT + ROW_GAP;

    // Play | Subcycle | Step | Reset (only meaningful while running)
    float btn_w = (content_w - 3.0f * BUTTON_GAP) / 4.0f;
    if (draw_button(state.playing ? "Pause" : "Play", cx, cy, btn_w, BUTTON_HEIGHT, BUTTON_BG,
                    BUTTON_BG_HOVER)) {
        action.play_pressed = running;
    }
    if (draw_button("Sub", cx + btn_w + BUTTON_GAP, cy, btn_w, BUTTON_HEIGHT, BUTTON_BG,
                    BUTTON_BG_HOVER)) {
        action.subcycle_pressed = running;
    }
    if (draw_button("Step", cx + 2.0f * (btn_w + BUTTON_GAP), cy, btn_w, BUTTON_HEIGHT, BUTTON_BG,
                    BUTTON_BG_HOVER)) {
        action.step_pressed = running;
    }
    if (draw_button("Reset", cx + 3.0f * (btn_w + BUTTON_GAP), cy, btn_w, BUTTON_HEIGHT,
                    BUTTON_BG, BUTTON_BG_HOVER)) {
        action.reset_pressed = running;
    }
    cy += BUTTON_HEIGHT + ROW_GAP;

    // Undo | Redo (only while editing)
    float half_w = (content_w - BUTTON_GAP) / 2.0f;
    if (draw_button("Undo", cx, cy, half_w, BUTTON_HEIGHT, BUTTON_BG, BUTTON_BG_HOVER)) {
        action.undo_pressed = !running;
    }
    if (draw_button("Redo", cx + half_w + BUTTON_GAP, cy, half_w, BUTTON_HEIGHT, BUTTON_BG,
                    BUTTON_BG_HOVER)) {
        action.redo_pressed = !running;
    }

    return result;
}

float draw_status_panel(const ViewerState& state, const EditGrid& grid, float panel_x,
                        float panel_y, float panel_w) {
    const CircuitEval* eval = grid.eval();
    const float content_w = panel_w - 2.0f * PADDING;

    std::vector<std::string> rows;
    Color headline_color = STATUS_COLOR;
    std::string headline;
    if (eval == nullptr) {
        headline = grid.build_errors().empty() ? "EDITING" : "EDITING (errors)";
        rows.push_back("Wire length: " + std::to_string(grid.wire_length()));
        rows.push_back("Chips: " + std::to_string(grid.chips().size()));
    } else {
        if (eval->is_errored()) {
            headline = "FAILED";
            headline_color = ERROR_COLOR;
        } else if (eval->is_completed()) {
            headline = "COMPLETE";
            headline_color = SUCCESS_COLOR;
        } else {
            headline = state.playing ? "RUNNING" : "PAUSED";
        }
        rows.push_back("Time step: " + std::to_string(eval->time_step()));
        rows.push_back("Subcycle: " + std::to_string(eval->subcycle()) +
                       (eval->cycle_in_progress() ? " (mid-cycle)" : ""));
        if (state.last_outcome) {
            rows.push_back("Last step: " + std::string(step_outcome_name(*state.last_outcome)));
        }
        if (auto score = eval->score()) {
            rows.push_back(std::string(eval_score_name(eval->puzzle_eval().score_kind())) +
                           " score: " + std::to_string(*score));
        }
        if (!eval->breakpoints().empty()) {
            const Coords at = eval->breakpoints().front();
            rows.push_back("Break at (" + std::to_string(at.x) + ", " + std::to_string(at.y) + ")");
        }
        const auto data = eval->puzzle_eval().verification_data();
        if (!data.empty()) {
            rows.push_back("Data: " + join_values(data));
        }
    }
    if (state.reported_score) {
        rows.push_back("Reported " + *state.reported_score);
    }

    std::vector<std::string> errors = error_lines(state, grid);
    const size_t hidden = errors.size() > MAX_LISTED_ERRORS ? errors.size() - MAX_LISTED_ERRORS : 0;
    errors.resize(std::min(errors.size(), MAX_LISTED_ERRORS));

    float height = PADDING + ROW_HEIGHT + static_cast<float>(rows.size()) * ROW_HEIGHT;
    for (const auto& line : errors) {
        height += measure_wrapped_text(line, content_w, FONT_SIZE_SMALL) + ROW_GAP;
    }
    if (hidden > 0) {
        height += ROW_HEIGHT;
    }
    height += PADDING;

    draw_panel_frame(panel_x, panel_y, panel_w, height);
    float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;

    DrawText(headline.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE,
             headline_color);
    cy += ROW_HEIGHT;
    for (const auto& row : rows) {
        DrawText(row.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE_SMALL,
                 LABEL_COLOR);
        cy += ROW_HEIGHT;
    }
    for (const auto& line : errors) {
        cy += draw_wrapped_text(line, cx, cy, content_w, FONT_SIZE_SMALL, ERROR_COLOR) + ROW_GAP;
    }
    if (hidden > 0) {
        char more[32];
        std::snprintf(more, sizeof(more), "... and %zu more", hidden);
        DrawText(more, static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE_SMALL, ERROR_COLOR);
    }

    return height;
}

float draw_puzzle_panel(const Puzzle& puzzle, float panel_x, float panel_y, float panel_w) {
    const float content_w = panel_w - 2.0f * PADDING;
    const std::string title = std::string(puzzle.title()) + " (" +
                              std::string(puzzle_kind_name(puzzle.kind())) + ")";
    const std::string description(puzzle.description());

    const float height = PADDING + ROW_HEIGHT +
                         measure_wrapped_text(description, content_w, FONT_SIZE_SMALL) + PADDING;
    draw_panel_frame(panel_x, panel_y, panel_w, height);

    const float cx = panel_x + PADDING;
    const float cy = panel_y + PADDING;
    DrawText(title.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    draw_wrapped_text(description, cx, cy + ROW_HEIGHT, content_w, FONT_SIZE_SMALL, LABEL_COLOR);
    return height;
}

} // namespace tachy
