/// @file chip_data.cpp
/// @brief Chip port tables and their placement on the board

#include "state/chip/chip_data.hpp"

#include <algorithm>

namespace tachy {

namespace {

constexpr auto SOURCE = PortFlow::SOURCE;
constexpr auto SINK = PortFlow::SINK;
constexpr auto BEHAVIOR = PortColor::BEHAVIOR;
constexpr auto EVENT = PortColor::EVENT;

constexpr auto E = Direction::EAST;
constexpr auto S = Direction::SOUTH;
constexpr auto W = Direction::WEST;
constexpr auto N = Direction::NORTH;

using C = AbstractConstraint;

ChipPort port(PortFlow flow, PortColor color, Direction dir) {
    return {flow, color, {0, 0}, dir};
}

ChipPort port(PortFlow flow, PortColor color, CoordsDelta delta, Direction dir) {
    return {flow, color, delta, dir};
}

// --- Shared layouts ---

/// Two behavior sinks (W, S) feeding one behavior source (E) of equal width
ChipData binary_behavior_data() {
    return {{port(SINK, BEHAVIOR, W), port(SINK, BEHAVIOR, S), port(SOURCE, BEHAVIOR, E)},
            {C::equal(0, 1), C::equal(0, 2)},
            {{0, 2}, {1, 2}}};
}

/// Two behavior sinks (W, E) compared into a 1-bit source (N)
ChipData comparison_data() {
    return {{port(SINK, BEHAVIOR, W), port(SINK, BEHAVIOR, E), port(SOURCE, BEHAVIOR, N)},
            {C::equal(0, 1), C::exact(2, WireSize::ONE)},
            {{0, 2}, {1, 2}}};
}

/// Event in (W), event out (E), same width
ChipData event_pass_data(bool has_dependency) {
    ChipData data{{port(SINK, EVENT, W), port(SOURCE, EVENT, E)}, {C::equal(0, 1)}, {}};
    if (has_dependency) {
        data.dependencies.push_back({0, 1});
    }
    return data;
}

} // namespace

ChipData chip_data(ChipType type) {
    switch (type.kind) {
    // --- Value ---
    case ChipKind::CONST:
        return {{port(SOURCE, BEHAVIOR, E)}, {C::at_least(0, min_for_value(type.value))}, {}};
    case ChipKind::PACK:
        return {{port(SINK, BEHAVIOR, W), port(SINK, BEHAVIOR, N), port(SOURCE, BEHAVIOR, E)},
                {C::equal(0, 1), C::doubled(0, 2)},
                {{0, 2}, {1, 2}}};
    case ChipKind::UNPACK:
        return {{port(SINK, BEHAVIOR, W), port(SOURCE, BEHAVIOR, E), port(SOURCE, BEHAVIOR, N)},
                {C::equal(1, 2), C::doubled(1, 0)},
                {{0, 1}, {0, 2}}};

    // --- Arithmetic ---
    case ChipKind::ADD:
    case ChipKind::SUB:
    case ChipKind::MUL:
        return binary_behavior_data();
    case ChipKind::HALVE:
        return {{port(SINK, BEHAVIOR, W), port(SOURCE, BEHAVIOR, E)}, {C::doubled(1, 0)}, {{0, 1}}};
    case ChipKind::INC:
        return {{port(SINK, EVENT, W), port(SINK, BEHAVIOR, S), port(SOURCE, EVENT, E)},
                {C::equal(0, 1), C::equal(0, 2)},
                {{0, 2}, {1, 2}}};

    // --- Comparison ---
    case ChipKind::CMP:
    case ChipKind::CMP_EQ:
    case ChipKind::EQ:
        return comparison_data();

    // --- Logic ---
    case ChipKind::NOT:
        return {{port(SINK, BEHAVIOR, W), port(SOURCE, BEHAVIOR, E)}, {C::equal(0, 1)}, {{0, 1}}};
    case ChipKind::AND:
    case ChipKind::OR:
    case ChipKind::XOR:
        return binary_behavior_data();
    case ChipKind::MUX:
        return {{port(SINK, BEHAVIOR, W), port(SINK, BEHAVIOR, S), port(SOURCE, BEHAVIOR, E),
                 port(SINK, BEHAVIOR, N)},
                {C::equal(0, 1), C::equal(0, 2), C::exact(3, WireSize::ONE)},
                {{0, 2}, {1, 2}, {3, 2}}};

    // --- Events ---
    case ChipKind::CLOCK:
        return {{port(SINK, EVENT, W), port(SOURCE, EVENT, E)},
                {C::exact(0, WireSize::ZERO), C::exact(1, WireSize::ZERO)},
                {}};
    case ChipKind::DELAY:
        return event_pass_data(false);
    case ChipKind::DEMUX:
        return {{port(SINK, EVENT, W), port(SOURCE, EVENT, S), port(SOURCE, EVENT, E),
                 port(SINK, BEHAVIOR, N)},
                {C::equal(0, 1), C::equal(0, 2), C::exact(3, WireSize::ONE)},
                {{0, 1}, {0, 2}, {3, 1}, {3, 2}}};
    case ChipKind::DISCARD:
        return {{port(SINK, EVENT, W), port(SOURCE, EVENT, E)},
                {C::at_least(0, WireSize::ONE), C::exact(1, WireSize::ZERO)},
                {{0, 1}}};
    case ChipKind::FILTER:
        return {{port(SINK, EVENT, W), port(SOURCE, EVENT, E), port(SINK, BEHAVIOR, N)},
                {C::equal(0, 1), C::exact(2, WireSize::ONE)},
                {{0, 1}, {2, 1}}};
    case ChipKind::JOIN:
        return {{port(SINK, EVENT, W), port(SINK, EVENT, S), port(SOURCE, EVENT, E)},
                {C::equal(0, 1), C::equal(0, 2)},
                {{0, 2}, {1, 2}}};
    case ChipKind::LATEST:
        return {{port(SINK, EVENT, W), port(SOURCE, BEHAVIOR, E)}, {C::equal(0, 1)}, {{0, 1}}};
    case ChipKind::SAMPLE:
        return {{port(SINK, EVENT, W), port(SINK, BEHAVIOR, S), port(SOURCE, EVENT, E)},
                {C::exact(0, WireSize::ZERO), C::equal(1, 2)},
                {{0, 2}, {1, 2}}};
    case ChipKind::COUNTER:
        return {{port(SINK, EVENT, W), port(SINK, EVENT, N), port(SINK, EVENT, S),
                 port(SOURCE, BEHAVIOR, E)},
                {C::equal(0, 3), C::exact(1, WireSize::ZERO), C::exact(2, WireSize::ZERO)},
                {{0, 3}, {1, 3}, {2, 3}}};

    // --- Special ---
    case ChipKind::BREAK:
        return event_pass_data(true);
    case ChipKind::RAM:
        return {{port(SINK, BEHAVIOR, {0, 0}, W), port(SINK, EVENT, {0, 0}, N),
                 port(SOURCE, BEHAVIOR, {0, 1}, W), port(SINK, BEHAVIOR, {1, 1}, E),
                 port(SINK, EVENT, {1, 1}, S), port(SOURCE, BEHAVIOR, {1, 0}, E)},
                {C::at_most(0, WireSize::EIGHT), C::at_most(3, WireSize::EIGHT),
                 C::at_least(1, WireSize::ONE), C::at_least(4, WireSize::ONE), C::equal(0, 3),
                 C::equal(1, 4), C::equal(2, 5), C::equal(1, 2), C::equal(4, 5)},
                {{0, 2}, {1, 2}, {4, 2}, {3, 5}, {4, 5}, {1, 5}}};
    case ChipKind::DISPLAY:
        return {{port(SINK, BEHAVIOR, W)}, {}, {}};
    case ChipKind::BUTTON:
        return {{port(SOURCE, EVENT, E)}, {C::exact(0, WireSize::ZERO)}, {}};
    case ChipKind::TOGGLE:
        return {{port(SOURCE, BEHAVIOR, E)}, {C::exact(0, WireSize::ONE)}, {}};
    }
    return {};
}

WireSize port_max_size(const ChipData& data, size_t index) {
    WireSize max_size =
        data.ports.at(index).color == PortColor::ANALOG ? WireSize::ANALOG : WireSize::SIXTEEN;
    for (const auto& constraint : data.constraints) {
        if (constraint.a != index) {
            continue;
        }
        if (constraint.kind == ConstraintKind::EXACT) {
            return constraint.size;
        }
        if (constraint.kind == ConstraintKind::AT_MOST) {
            max_size = std::min(max_size, constraint.size);
        }
    }
    return max_size;
}

// --- Placement ---

namespace {

WireLoc place_port(const ChipPort& port, CoordsSize size, Coords coords, Orientation orient) {
    return {coords + orient.transform_in_size(port.delta, size), orient * port.dir};
}

} // namespace

std::vector<PortSpec> chip_ports(ChipType type, Coords coords, Orientation orient) {
    const ChipData data = chip_data(type);
    const CoordsSize size = type.size();
    std::vector<PortSpec> ports;
    ports.reserve(data.ports.size());
    for (const auto& port : data.ports) {
        ports.push_back({port.flow, port.color, place_port(port, size, coords, orient)});
    }
    return ports;
}

std::vector<PortConstraint> chip_constraints(ChipType type, Coords coords, Orientation orient) {
    const ChipData data = chip_data(type);
    const CoordsSize size = type.size();
    std::vector<PortConstraint> constraints;
    constraints.reserve(data.constraints.size());
    for (const auto& c : data.constraints) {
        constraints.push_back({c.kind, place_port(data.ports.at(c.a), size, coords, orient),
                               place_port(data.ports.at(c.b), size, coords, orient), c.size});
    }
    return constraints;
}

std::vector<PortDependency> chip_dependencies(ChipType type, Coords coords, Orientation orient) {
    const ChipData data = chip_data(type);
    const CoordsSize size = type.size();
    std::vector<PortDependency> deps;
    deps.reserve(data.dependencies.size());
    for (const auto& [sink, source] : data.dependencies) {
        deps.push_back({place_port(data.ports.at(sink), size, coords, orient),
                        place_port(data.ports.at(source), size, coords, orient)});
    }
    return deps;
}

} // namespace tachy
