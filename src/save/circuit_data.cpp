/// @file circuit_data.cpp
/// @brief Delta keys, chip values, and the canonical wire encoding

#include "save/circuit_data.hpp"

#include "save/wire_shape.hpp"

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace tachy {

namespace {

constexpr size_t MAX_KEY_DIGITS = 9;

void append_component(std::string& key, int32_t value) {
    key += value < 0 ? 'm' : 'p';
    key += std::to_string(std::abs(static_cast<int64_t>(value)));
}

/// Parses one "p<digits>" or "m<digits>" token starting at `pos`
std::optional<int32_t> parse_component(std::string_view key, size_t& pos) {
    if (pos >= key.size() || (key[pos] != 'p' && key[pos] != 'm')) {
        return std::nullopt;
    }
    const bool negative = key[pos] == 'm';
    ++pos;
    const size_t start = pos;
    int64_t value = 0;
    while (pos < key.size() && key[pos] >= '0' && key[pos] <= '9') {
        if (pos - start >= MAX_KEY_DIGITS) {
            return std::nullopt;
        }
        value = value * 10 + (key[pos] - '0');
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return static_cast<int32_t>(negative ? -value : value);
}

/// True if this fragment is the one written out for its in-cell group
bool is_canonical(const WireMap& fragments, const WireLoc& loc, WireShape shape) {
    switch (shape) {
    case WireShape::STUB: {
        auto across = fragments.find(loc.across());
        if (across == fragments.end()) {
            return true;
        }
        return across->second == WireShape::STUB &&
               (loc.dir == Direction::EAST || loc.dir == Direction::SOUTH);
    }
    case WireShape::STRAIGHT:
        return loc.dir == Direction::EAST || loc.dir == Direction::SOUTH;
    case WireShape::TURN_LEFT:
    case WireShape::SPLIT_TEE:
        return true;
    case WireShape::TURN_RIGHT:
    case WireShape::SPLIT_LEFT:
    case WireShape::SPLIT_RIGHT:
        return false;
    case WireShape::CROSS:
        return loc.dir == Direction::EAST;
    }
    return false;
}

} // namespace

std::string encode_delta_key(CoordsDelta delta) {
    std::string key;
    append_component(key, delta.x);
    append_component(key, delta.y);
    return key;
}

std::optional<CoordsDelta> decode_delta_key(std::string_view key) {
    size_t pos = 0;
    auto x = parse_component(key, pos);
    if (!x) {
        return std::nullopt;
    }
    auto y = parse_component(key, pos);
    if (!y || pos != key.size()) {
        return std::nullopt;
    }
    return CoordsDelta{*x, *y};
}

std::string encode_wire_key(CoordsDelta delta, Direction dir) {
    return encode_delta_key(delta) + direction_char(dir);
}

std::optional<std::pair<CoordsDelta, Direction>> decode_wire_key(std::string_view key) {
    if (key.empty()) {
        return std::nullopt;
    }
    auto dir = direction_from_char(key.back());
    auto delta = decode_delta_key(key.substr(0, key.size() - 1));
    if (!dir || !delta) {
        return std::nullopt;
    }
    return std::make_pair(*delta, *dir);
}

std::string encode_chip_value(Orientation orient, ChipType type) {
    return orient.to_string() + "-" + type.to_string();
}

std::optional<std::pair<Orientation, ChipType>> decode_chip_value(std::string_view value) {
    const size_t dash = value.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto orient = Orientation::parse(value.substr(0, dash));
    auto type = ChipType::parse(value.substr(dash + 1));
    if (!orient || !type) {
        return std::nullopt;
    }
    return std::make_pair(*orient, *type);
}

std::map<std::string, std::string> encode_wires(const WireMap& fragments, Coords origin) {
    std::map<std::string, std::string> wires;
    for (const auto& [loc, shape] : fragments) {
        if (is_canonical(fragments, loc, shape)) {
            wires.emplace(encode_wire_key(loc.coords - origin, loc.dir),
                          std::string(wire_shape_name(shape)));
        }
    }
    return wires;
}

WireMap decode_wires(const std::map<std::string, std::string>& wires, Coords origin) {
    WireMap fragments;
    for (const auto& [key, value] : wires) {
        auto parsed_key = decode_wire_key(key);
        auto shape = parse_wire_shape(value);
        if (!parsed_key || !shape) {
            continue;
        }
        const Coords cell = origin + parsed_key->first;
        const std::vector<Direction> group = connected_directions(*shape, parsed_key->second);

        bool overlaps = false;
        for (Direction dir : group) {
            overlaps = overlaps || fragments.count(WireLoc{cell, dir}) != 0;
        }
        if (overlaps) {
            continue;
        }
        for (Direction dir : group) {
            fragments.emplace(WireLoc{cell, dir}, shape_for_group(dir, group));
        }
    }

    std::vector<WireLoc> missing;
    for (const auto& [loc, shape] : fragments) {
        if (fragments.count(loc.across()) == 0) {
            missing.push_back(loc.across());
        }
    }
    for (const auto& loc : missing) {
        fragments.emplace(loc, WireShape::STUB);
    }
    return fragments;
}

} // namespace tachy
