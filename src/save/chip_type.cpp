/// @file chip_type.cpp
/// @brief Chip names, footprints, categories, and parsing

#include "save/chip_type.hpp"

#include <charconv>

namespace tachy {

namespace {

const ChipKind ALL_KINDS[] = {
    ChipKind::CONST,   ChipKind::PACK,   ChipKind::UNPACK,  ChipKind::ADD,    ChipKind::SUB,
    ChipKind::MUL,     ChipKind::HALVE,  ChipKind::INC,     ChipKind::CMP,    ChipKind::CMP_EQ,
    ChipKind::EQ,      ChipKind::NOT,    ChipKind::AND,     ChipKind::OR,     ChipKind::XOR,
    ChipKind::MUX,     ChipKind::CLOCK,  ChipKind::DELAY,   ChipKind::DEMUX,  ChipKind::DISCARD,
    ChipKind::FILTER,  ChipKind::JOIN,   ChipKind::LATEST,  ChipKind::SAMPLE, ChipKind::COUNTER,
    ChipKind::BREAK,   ChipKind::RAM,    ChipKind::DISPLAY, ChipKind::BUTTON, ChipKind::TOGGLE,
};

/// Extracts the text between "<prefix>(" and a trailing ")"
std::optional<std::string_view> parenthesized(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size() + 2 || text.substr(0, prefix.size()) != prefix ||
        text[prefix.size()] != '(' || text.back() != ')') {
        return std::nullopt;
    }
    return text.substr(prefix.size() + 1, text.size() - prefix.size() - 2);
}

} // namespace

std::string_view chip_kind_name(ChipKind kind) {
    switch (kind) {
    case ChipKind::CONST:
        return "Const";
    case ChipKind::PACK:
        return "Pack";
    case ChipKind::UNPACK:
        return "Unpack";
    case ChipKind::ADD:
        return "Add";
    case ChipKind::SUB:
        return "Sub";
    case ChipKind::MUL:
        return "Mul";
    case ChipKind::HALVE:
        return "Halve";
    case ChipKind::INC:
        return "Inc";
    case ChipKind::CMP:
        return "Cmp";
    case ChipKind::CMP_EQ:
        return "CmpEq";
    case ChipKind::EQ:
        return "Eq";
    case ChipKind::NOT:
        return "Not";
    case ChipKind::AND:
        return "And";
    case ChipKind::OR:
        return "Or";
    case ChipKind::XOR:
        return "Xor";
    case ChipKind::MUX:
        return "Mux";
    case ChipKind::CLOCK:
        return "Clock";
    case ChipKind::DELAY:
        return "Delay";
    case ChipKind::DEMUX:
        return "Demux";
    case ChipKind::DISCARD:
        return "Discard";
    case ChipKind::FILTER:
        return "Filter";
    case ChipKind::JOIN:
        return "Join";
    case ChipKind::LATEST:
        return "Latest";
    case ChipKind::SAMPLE:
        return "Sample";
    case ChipKind::COUNTER:
        return "Counter";
    case ChipKind::BREAK:
        return "Break";
    case ChipKind::RAM:
        return "Ram";
    case ChipKind::DISPLAY:
        return "Display";
    case ChipKind::BUTTON:
        return "Button";
    case ChipKind::TOGGLE:
        return "Toggle";
    }
    return "Unknown";
}

bool is_event_chip(ChipKind kind) {
    switch (kind) {
    case ChipKind::INC:
    case ChipKind::CLOCK:
    case ChipKind::DELAY:
    case ChipKind::DEMUX:
    case ChipKind::DISCARD:
    case ChipKind::FILTER:
    case ChipKind::JOIN:
    case ChipKind::LATEST:
    case ChipKind::SAMPLE:
    case ChipKind::COUNTER:
    case ChipKind::BREAK:
    case ChipKind::RAM:
    case ChipKind::BUTTON:
        return true;
    default:
        return false;
    }
}

CoordsSize ChipType::size() const {
    switch (kind) {
    case ChipKind::RAM:
        return {2, 2};
    case ChipKind::DISPLAY:
        return {2, 1};
    default:
        return {1, 1};
    }
}

bool ChipType::is_interactive() const {
    return kind == ChipKind::BUTTON || kind == ChipKind::TOGGLE;
}

std::string ChipType::to_string() const {
    std::string text(chip_kind_name(kind));
    if (kind == ChipKind::CONST) {
        text += "(" + std::to_string(value) + ")";
    } else if (kind == ChipKind::TOGGLE) {
        text += value != 0 ? "(true)" : "(false)";
    }
    return text;
}

std::optional<ChipType> ChipType::parse(std::string_view text) {
    if (auto inner = parenthesized(text, "Const")) {
        uint16_t value = 0;
        const char* first = inner->data();
        const char* last = first + inner->size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (inner->empty() || ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return ChipType::constant(value);
    }
    if (auto inner = parenthesized(text, "Toggle")) {
        if (*inner == "true") {
            return ChipType::toggle(true);
        }
        if (*inner == "false") {
            return ChipType::toggle(false);
        }
        return std::nullopt;
    }
    for (ChipKind kind : ALL_KINDS) {
        if (kind != ChipKind::CONST && kind != ChipKind::TOGGLE && chip_kind_name(kind) == text) {
            return ChipType(kind);
        }
    }
    return std::nullopt;
}

const std::vector<std::pair<std::string_view, std::vector<ChipKind>>>& chip_categories() {
    static const std::vector<std::pair<std::string_view, std::vector<ChipKind>>> categories = {
        {"Value", {ChipKind::CONST, ChipKind::PACK, ChipKind::UNPACK}},
        {"Arithmetic",
         {ChipKind::ADD, ChipKind::SUB, ChipKind::MUL, ChipKind::HALVE, ChipKind::INC}},
        {"Comparison", {ChipKind::CMP, ChipKind::CMP_EQ, ChipKind::EQ}},
        {"Logic", {ChipKind::NOT, ChipKind::AND, ChipKind::OR, ChipKind::XOR, ChipKind::MUX}},
        {"Events",
         {ChipKind::CLOCK, ChipKind::DELAY, ChipKind::DEMUX, ChipKind::DISCARD, ChipKind::FILTER,
          ChipKind::JOIN, ChipKind::LATEST, ChipKind::SAMPLE, ChipKind::COUNTER}},
        {"Special",
         {ChipKind::BREAK, ChipKind::RAM, ChipKind::DISPLAY, ChipKind::BUTTON, ChipKind::TOGGLE}},
    };
    return categories;
}

} // namespace tachy
