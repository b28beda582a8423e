/// @file wire_size.cpp
/// @brief Wire size arithmetic and interval operations

#include "state/wire_size.hpp"

#include <algorithm>

namespace tachy {

uint32_t num_bits(WireSize size) {
    switch (size) {
    case WireSize::ZERO:
        return 0;
    case WireSize::ONE:
        return 1;
    case WireSize::TWO:
        return 2;
    case WireSize::FOUR:
        return 4;
    case WireSize::EIGHT:
        return 8;
    case WireSize::SIXTEEN:
        return 16;
    case WireSize::ANALOG:
        return 0;
    }
    return 0;
}

uint32_t mask(WireSize size) {
    uint32_t bits = num_bits(size);
    return bits == 0 ? 0u : (bits >= 32 ? 0xffffffffu : ((1u << bits) - 1u));
}

WireSize min_for_value(uint32_t value) {
    if (value > 0xff) {
        return WireSize::SIXTEEN;
    } else if (value > 0xf) {
        return WireSize::EIGHT;
    } else if (value > 0x3) {
        return WireSize::FOUR;
    } else if (value > 0x1) {
        return WireSize::TWO;
    } else if (value > 0) {
        return WireSize::ONE;
    }
    return WireSize::ZERO;
}

std::optional<WireSize> half(WireSize size) {
    switch (size) {
    case WireSize::ZERO:
    case WireSize::ONE:
        return WireSize::ZERO;
    case WireSize::TWO:
        return WireSize::ONE;
    case WireSize::FOUR:
        return WireSize::TWO;
    case WireSize::EIGHT:
        return WireSize::FOUR;
    case WireSize::SIXTEEN:
        return WireSize::EIGHT;
    case WireSize::ANALOG:
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<WireSize> double_size(WireSize size) {
    switch (size) {
    case WireSize::ZERO:
        return WireSize::ZERO;
    case WireSize::ONE:
        return WireSize::TWO;
    case WireSize::TWO:
        return WireSize::FOUR;
    case WireSize::FOUR:
        return WireSize::EIGHT;
    case WireSize::EIGHT:
        return WireSize::SIXTEEN;
    case WireSize::SIXTEEN:
    case WireSize::ANALOG:
        return std::nullopt;
    }
    return std::nullopt;
}

std::string_view wire_size_name(WireSize size) {
    switch (size) {
    case WireSize::ZERO:
        return "0";
    case WireSize::ONE:
        return "1";
    case WireSize::TWO:
        return "2";
    case WireSize::FOUR:
        return "4";
    case WireSize::EIGHT:
        return "8";
    case WireSize::SIXTEEN:
        return "16";
    case WireSize::ANALOG:
        return "Analog";
    }
    return "?";
}

std::optional<WireSize> parse_wire_size(std::string_view text) {
    struct Entry {
        std::string_view number;
        std::string_view name;
        WireSize size;
    };
    static const Entry entries[] = {
        {"0", "Zero", WireSize::ZERO},       {"1", "One", WireSize::ONE},
        {"2", "Two", WireSize::TWO},         {"4", "Four", WireSize::FOUR},
        {"8", "Eight", WireSize::EIGHT},     {"16", "Sixteen", WireSize::SIXTEEN},
        {"Analog", "Analog", WireSize::ANALOG},
    };
    for (const auto& entry : entries) {
        if (text == entry.number || text == entry.name) {
            return entry.size;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------
// WireSizeInterval
// -----------------------------------------------------------------------

std::optional<WireSize> WireSizeInterval::lower_bound() const {
    if (is_empty()) {
        return std::nullopt;
    }
    return lo_;
}

bool WireSizeInterval::make_at_least(WireSize size) {
    if (!is_empty() && lo_ < size) {
        lo_ = size;
        return true;
    }
    return false;
}

bool WireSizeInterval::make_at_most(WireSize size) {
    if (!is_empty() && hi_ > size) {
        hi_ = size;
        return true;
    }
    return false;
}

WireSizeInterval WireSizeInterval::intersection(const WireSizeInterval& other) const {
    return {std::max(lo_, other.lo_), std::min(hi_, other.hi_)};
}

WireSizeInterval WireSizeInterval::half() const {
    if (is_empty() || lo_ > WireSize::SIXTEEN) {
        return empty();
    }
    if (hi_ == WireSize::ZERO) {
        return exactly(WireSize::ZERO);
    }
    auto lo = tachy::half(std::max(lo_, WireSize::TWO));
    auto hi = tachy::half(std::min(hi_, WireSize::SIXTEEN));
    return {*lo, *hi};
}

WireSizeInterval WireSizeInterval::doubled() const {
    if (is_empty()) {
        return empty();
    }
    auto lo = double_size(lo_);
    if (!lo) {
        return empty();
    }
    auto hi = double_size(std::min(hi_, WireSize::SIXTEEN));
    return {*lo, hi.value_or(WireSize::SIXTEEN)};
}

bool WireSizeInterval::operator==(const WireSizeInterval& other) const {
    if (is_empty()) {
        return other.is_empty();
    }
    if (other.is_empty()) {
        return false;
    }
    return lo_ == other.lo_ && hi_ == other.hi_;
}

} // namespace tachy
