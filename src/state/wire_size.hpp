#pragma once

/// @file wire_size.hpp
/// @brief Wire bit-widths and the size intervals the width solver narrows

#include <cstdint>
#include <optional>
#include <string_view>

namespace tachy {

/// Width of a wire. Digital sizes are ordered by bit count; Analog sorts
/// after every digital size and never mixes with them.
enum class WireSize : uint8_t { ZERO, ONE, TWO, FOUR, EIGHT, SIXTEEN, ANALOG };

/// Number of bits carried (0 for Zero and Analog)
[[nodiscard]] uint32_t num_bits(WireSize size);

/// Bit mask for a digital size (0 for Zero and Analog)
[[nodiscard]] uint32_t mask(WireSize size);

/// Smallest digital size that can hold `value` (Sixteen for anything larger)
[[nodiscard]] WireSize min_for_value(uint32_t value);

/// Half of a digital size; Zero and One both halve to Zero
[[nodiscard]] std::optional<WireSize> half(WireSize size);

/// Double of a digital size; Sixteen has no double
[[nodiscard]] std::optional<WireSize> double_size(WireSize size);

[[nodiscard]] std::string_view wire_size_name(WireSize size);

/// Accepts "0", "1", ..., "16", "Analog", or the enumerator names
[[nodiscard]] std::optional<WireSize> parse_wire_size(std::string_view text);

/// Closed interval [lo, hi] of wire sizes; empty when lo > hi
class WireSizeInterval {
  public:
    WireSizeInterval(WireSize lo, WireSize hi) : lo_(lo), hi_(hi) {}

    [[nodiscard]] static WireSizeInterval empty() { return {WireSize::ANALOG, WireSize::ZERO}; }
    /// Every digital size
    [[nodiscard]] static WireSizeInterval full() { return {WireSize::ZERO, WireSize::SIXTEEN}; }
    [[nodiscard]] static WireSizeInterval exactly(WireSize size) { return {size, size}; }

    [[nodiscard]] WireSize lo() const { return lo_; }
    [[nodiscard]] WireSize hi() const { return hi_; }
    [[nodiscard]] bool is_empty() const { return lo_ > hi_; }
    [[nodiscard]] bool is_ambiguous() const { return lo_ < hi_; }
    [[nodiscard]] bool contains(WireSize size) const { return lo_ <= size && size <= hi_; }
    [[nodiscard]] std::optional<WireSize> lower_bound() const;

    /// Raises lo to at least `size`; returns true if the interval changed
    bool make_at_least(WireSize size);
    /// Lowers hi to at most `size`; returns true if the interval changed
    bool make_at_most(WireSize size);

    [[nodiscard]] WireSizeInterval intersection(const WireSizeInterval& other) const;
    /// Interval of sizes whose double lies in this interval
    [[nodiscard]] WireSizeInterval half() const;
    /// Interval of doubles of sizes in this interval
    [[nodiscard]] WireSizeInterval doubled() const;

    /// All empty intervals compare equal
    bool operator==(const WireSizeInterval& other) const;
    bool operator!=(const WireSizeInterval& other) const { return !(*this == other); }

  private:
    WireSize lo_;
    WireSize hi_;
};

} // namespace tachy
