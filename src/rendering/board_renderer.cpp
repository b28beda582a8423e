/// @file board_renderer.cpp
/// @brief Draws the board with raylib primitives: grid, interface boxes, wire fragments, chips

#include "rendering/board_renderer.hpp"

#include "state/chip/chip_data.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <string>

namespace tachy {

namespace {

// --- Color palette ---
const Color BOARD_FILL = {32, 32, 40, 255};
const Color GRID_LINE = {45, 45, 56, 255};
const Color BOARD_BORDER = {90, 90, 110, 255};
const Color IFACE_FILL = {50, 50, 70, 255};
const Color IFACE_BORDER = {110, 110, 150, 255};
const Color LABEL_COLOR = {240, 240, 240, 255};
const Color VALUE_COLOR = {255, 225, 145, 255};

const Color BEHAVIOR_IDLE = {70, 110, 70, 255};
const Color BEHAVIOR_LIT = {50, 220, 80, 255};
const Color EVENT_IDLE = {110, 80, 50, 255};
const Color EVENT_LIT = {255, 180, 60, 255};
const Color ANALOG_WIRE = {80, 130, 200, 255};
const Color UNTYPED_WIRE = {100, 100, 100, 255};
const Color ERROR_COLOR = {240, 70, 70, 255};

const Color SOURCE_DOT = {200, 200, 50, 255};
const Color SINK_DOT = {180, 180, 255, 255};

const Color ACCENT_VALUE = {150, 150, 190, 255};
const Color ACCENT_ARITH = {70, 210, 220, 255};
const Color ACCENT_COMPARE = {170, 120, 255, 255};
const Color ACCENT_LOGIC = {255, 165, 70, 255};
const Color ACCENT_EVENT = {240, 220, 90, 255};
const Color ACCENT_SPECIAL = {230, 110, 150, 255};
const Color CHIP_FILL = {60, 60, 68, 255};

constexpr float CORNER_ROUNDNESS = 0.25f;
constexpr int CORNER_SEGMENTS = 4;
constexpr float OUTLINE_THICKNESS = 2.0f;
constexpr float CHIP_INSET = 0.12f;  // fraction of a cell left around each chip
constexpr float PORT_DOT_RADIUS = 0.07f;

int label_font(float cell) {
    return std::clamp(static_cast<int>(cell * 0.3f), 8, 20);
}

Vector2 edge_midpoint(const BoardView& view, const WireLoc& loc) {
    const Vector2 center = view.cell_center(loc.coords);
    const CoordsDelta delta = direction_delta(loc.dir);
    return {center.x + static_cast<float>(delta.x) * view.cell / 2.0f,
            center.y + static_cast<float>(delta.y) * view.cell / 2.0f};
}

Rectangle footprint_rect(const BoardView& view, Coords coords, CoordsSize size) {
    const Rectangle top_left = view.cell_rect(coords);
    return {top_left.x, top_left.y, static_cast<float>(size.width) * view.cell,
            static_cast<float>(size.height) * view.cell};
}

Color chip_accent(ChipKind kind) {
    const auto& categories = chip_categories();
    static const Color ACCENTS[] = {ACCENT_VALUE, ACCENT_ARITH, ACCENT_COMPARE,
                                    ACCENT_LOGIC, ACCENT_EVENT, ACCENT_SPECIAL};
    for (size_t i = 0; i < categories.size(); ++i) {
        const auto& kinds = categories[i].second;
        if (std::find(kinds.begin(), kinds.end(), kind) != kinds.end()) {
            return ACCENTS[std::min(i, std::size(ACCENTS) - 1)];
        }
    }
    return ACCENT_VALUE;
}

/// Nets named by the current diagnostics
std::set<size_t> error_nets(const EditGrid& grid) {
    std::set<size_t> nets;
    if (grid.eval() != nullptr) {
        return nets;
    }
    for (const auto& error : grid.build_errors()) {
        if (error.net) {
            nets.insert(*error.net);
        }
    }
    return nets;
}

Color wire_color(const EditGrid& grid, const WireLoc& loc, const std::set<size_t>& bad_nets) {
    const auto net = grid.net_at(loc);
    if (!net) {
        return UNTYPED_WIRE;
    }
    if (bad_nets.count(*net) != 0) {
        return ERROR_COLOR;
    }
    const auto& color = grid.nets().nets.at(*net).color;
    if (!color) {
        return UNTYPED_WIRE;
    }
    const bool evaluating = grid.eval() != nullptr;
    switch (*color) {
    case PortColor::BEHAVIOR: {
        const auto value = grid.port_value(loc);
        return evaluating && value.value_or(0) != 0 ? BEHAVIOR_LIT : BEHAVIOR_IDLE;
    }
    case PortColor::EVENT:
        return evaluating && grid.port_value(loc).has_value() ? EVENT_LIT : EVENT_IDLE;
    case PortColor::ANALOG:
        return ANALOG_WIRE;
    }
    return UNTYPED_WIRE;
}

float wire_thickness(const EditGrid& grid, const WireLoc& loc, float cell) {
    const float base = std::max(1.5f, cell * 0.05f);
    const auto net = grid.net_at(loc);
    if (!net) {
        return base;
    }
    const auto size = grid.net_size(*net);
    if (!size || *size == WireSize::ANALOG) {
        return base;
    }
    // One step thicker per doubling of the width
    return base + static_cast<float>(std::log2(std::max(1u, num_bits(*size)))) * base * 0.5f;
}

void draw_grid(const CoordsRect& bounds, const BoardView& view) {
    const Rectangle board = footprint_rect(view, bounds.top_left(), bounds.size());
    DrawRectangleRec(board, BOARD_FILL);
    for (int32_t x = 1; x < bounds.width; ++x) {
        const float sx = board.x + static_cast<float>(x) * view.cell;
        DrawLineEx({sx, board.y}, {sx, board.y + board.height}, 1.0f, GRID_LINE);
    }
    for (int32_t y = 1; y < bounds.height; ++y) {
        const float sy = board.y + static_cast<float>(y) * view.cell;
        DrawLineEx({board.x, sy}, {board.x + board.width, sy}, 1.0f, GRID_LINE);
    }
    DrawRectangleLinesEx(board, OUTLINE_THICKNESS, BOARD_BORDER);
}

void draw_interfaces(const EditGrid& grid, const BoardView& view) {
    const int font = label_font(view.cell);
    for (const auto& iface : grid.interfaces()) {
        const Rectangle box = footprint_rect(view, iface.top_left(grid.bounds()), iface.size());
        DrawRectangleRounded(box, CORNER_ROUNDNESS, CORNER_SEGMENTS, IFACE_FILL);
        DrawRectangleRoundedLines(box, CORNER_ROUNDNESS, CORNER_SEGMENTS, OUTLINE_THICKNESS,
                                  IFACE_BORDER);

        const auto placed = iface.placed_ports(grid.bounds());
        for (size_t i = 0; i < placed.size(); ++i) {
            const Rectangle cell = view.cell_rect(placed[i].loc.coords);
            const std::string& name = iface.ports[i].name;
            const int text_w = MeasureText(name.c_str(), font);
            DrawText(name.c_str(), static_cast<int>(cell.x + (cell.width - text_w) / 2.0f),
                     static_cast<int>(cell.y + 2.0f), font, LABEL_COLOR);
            if (grid.eval() != nullptr) {
                if (auto value = grid.port_value(placed[i].loc)) {
                    const std::string text = std::to_string(*value);
                    const int value_w = MeasureText(text.c_str(), font);
                    DrawText(text.c_str(),
                             static_cast<int>(cell.x + (cell.width - value_w) / 2.0f),
                             static_cast<int>(cell.y + cell.height - font - 2.0f), font,
                             VALUE_COLOR);
                }
            }
        }
    }
}

void draw_wires(const EditGrid& grid, const BoardView& view) {
    const std::set<size_t> bad_nets = error_nets(grid);
    for (const auto& [loc, shape] : grid.fragments()) {
        const Vector2 from = view.cell_center(loc.coords);
        const Vector2 to = edge_midpoint(view, loc);
        const float thickness = wire_thickness(grid, loc, view.cell);
        DrawLineEx(from, to, thickness, wire_color(grid, loc, bad_nets));
        if (shape != WireShape::STRAIGHT && shape != WireShape::STUB) {
            // Joints get a dot so turns and splits read as connected
            DrawCircleV(from, thickness * 0.8f, wire_color(grid, loc, bad_nets));
        }
    }
}

void draw_chip(const EditGrid& grid, const BoardView& view, Coords coords, const PlacedChip& chip) {
    const CoordsSize size = chip.orient * chip.type.size();
    const Rectangle outer = footprint_rect(view, coords, size);
    const float inset = view.cell * CHIP_INSET;
    const Rectangle body = {outer.x + inset, outer.y + inset, outer.width - 2.0f * inset,
                            outer.height - 2.0f * inset};
    const Color accent = chip_accent(chip.type.kind);

    DrawRectangleRounded(body, CORNER_ROUNDNESS, CORNER_SEGMENTS, CHIP_FILL);
    DrawRectangleRoundedLines(body, CORNER_ROUNDNESS, CORNER_SEGMENTS, OUTLINE_THICKNESS, accent);

    const int font = label_font(view.cell);
    const std::string label = chip.type.to_string();
    const int text_w = MeasureText(label.c_str(), font);
    DrawText(label.c_str(), static_cast<int>(body.x + (body.width - text_w) / 2.0f),
             static_cast<int>(body.y + (body.height - font) / 2.0f), font, LABEL_COLOR);

    const auto ports = chip_ports(chip.type, coords, chip.orient);
    for (const auto& port : ports) {
        const Vector2 center = view.cell_center(port.loc.coords);
        const Vector2 edge = edge_midpoint(view, port.loc);
        // Pull the dot just inside the chip body
        const Vector2 dot = {edge.x + (center.x - edge.x) * 2.0f * CHIP_INSET,
                             edge.y + (center.y - edge.y) * 2.0f * CHIP_INSET};
        DrawCircleV(dot, view.cell * PORT_DOT_RADIUS,
                    port.flow == PortFlow::SOURCE ? SOURCE_DOT : SINK_DOT);
    }

    // Displays show the value on their input
    if (chip.type.kind == ChipKind::DISPLAY && grid.eval() != nullptr && !ports.empty()) {
        if (auto value = grid.port_value(ports.front().loc)) {
            const std::string text = std::to_string(*value);
            DrawText(text.c_str(), static_cast<int>(body.x + 4.0f),
                     static_cast<int>(body.y + body.height - font - 2.0f), font, VALUE_COLOR);
        }
    }
}

} // namespace

Rectangle BoardView::cell_rect(Coords c) const {
    return {origin.x + static_cast<float>(c.x) * cell, origin.y + static_cast<float>(c.y) * cell,
            cell, cell};
}

Vector2 BoardView::cell_center(Coords c) const {
    return {origin.x + (static_cast<float>(c.x) + 0.5f) * cell,
            origin.y + (static_cast<float>(c.y) + 0.5f) * cell};
}

Coords BoardView::cell_at(Vector2 point) const {
    return {static_cast<int32_t>(std::floor((point.x - origin.x) / cell)),
            static_cast<int32_t>(std::floor((point.y - origin.y) / cell))};
}

BoardView fit_board(const CoordsRect& bounds, Rectangle area, float max_cell) {
    // One ring of cells around the board holds the interfaces
    const float cols = static_cast<float>(bounds.width + 2);
    const float rows = static_cast<float>(bounds.height + 2);

    BoardView view;
    view.cell = std::min({area.width / cols, area.height / rows, max_cell});
    view.cell = std::max(view.cell, 4.0f);

    const float board_w = static_cast<float>(bounds.width) * view.cell;
    const float board_h = static_cast<float>(bounds.height) * view.cell;
    view.origin = {area.x + (area.width - board_w) / 2.0f - static_cast<float>(bounds.x) * view.cell,
                   area.y + (area.height - board_h) / 2.0f -
                       static_cast<float>(bounds.y) * view.cell};
    return view;
}

void draw_board(const EditGrid& grid, const BoardView& view) {
    draw_grid(grid.bounds(), view);
    draw_interfaces(grid, view);
    draw_wires(grid, view);
    for (const auto& [coords, chip] : grid.chips()) {
        draw_chip(grid, view, coords, chip);
    }
}

void draw_error_markers(const EditGrid& grid, const BoardView& view) {
    const float thickness = OUTLINE_THICKNESS * 1.5f;
    if (const CircuitEval* eval = grid.eval()) {
        for (const auto& error : eval->errors()) {
            if (error.port) {
                DrawRectangleLinesEx(view.cell_rect(error.port->coords), thickness, ERROR_COLOR);
            }
        }
        return;
    }
    for (const auto& error : grid.build_errors()) {
        if (error.loc) {
            DrawRectangleLinesEx(view.cell_rect(error.loc->coords), thickness, ERROR_COLOR);
        }
    }
}

std::optional<Coords> interactive_chip_at(const EditGrid& grid, const BoardView& view,
                                          Vector2 point) {
    auto chip = grid.chip_at(view.cell_at(point));
    if (!chip || !chip->second.type.is_interactive()) {
        return std::nullopt;
    }
    return chip->first;
}

} // namespace tachy
