#pragma once

/// @file fixed.hpp
/// @brief Saturating fixed-point scalar in [-1, 1] carried on analog wires

#include <cstdint>

namespace tachy {

/// Fixed-point value stored as an integer count of 1e-9 units, clamped to
/// [-1, 1]. Arithmetic saturates instead of overflowing, so analog chains
/// stay deterministic across platforms.
class Fixed {
  public:
    static constexpr int32_t LIMIT = 1'000'000'000;

    constexpr Fixed() = default;

    /// Builds from raw units, clamping to [-LIMIT, LIMIT]
    [[nodiscard]] static constexpr Fixed from_raw(int64_t raw) {
        if (raw > LIMIT) {
            raw = LIMIT;
        } else if (raw < -LIMIT) {
            raw = -LIMIT;
        }
        return Fixed(static_cast<int32_t>(raw));
    }

    /// Rounds numerator / denominator to the nearest unit
    /// @throws std::invalid_argument if denominator is zero
    [[nodiscard]] static Fixed from_ratio(int64_t numerator, int64_t denominator);
    [[nodiscard]] static Fixed from_f64(double value);

    /// Decodes the wire encoding produced by to_encoded()
    [[nodiscard]] static Fixed from_encoded(uint32_t bits);

    [[nodiscard]] static constexpr Fixed zero() { return Fixed(0); }
    [[nodiscard]] static constexpr Fixed one() { return Fixed(LIMIT); }

    [[nodiscard]] constexpr int32_t raw() const { return value_; }
    [[nodiscard]] double to_f64() const;
    [[nodiscard]] uint32_t to_encoded() const;

    [[nodiscard]] Fixed operator+(Fixed other) const;
    [[nodiscard]] Fixed operator-(Fixed other) const;
    [[nodiscard]] Fixed operator*(Fixed other) const;
    [[nodiscard]] Fixed operator-() const { return Fixed(-value_); }

    constexpr bool operator==(const Fixed& other) const { return value_ == other.value_; }
    constexpr bool operator!=(const Fixed& other) const { return value_ != other.value_; }
    constexpr bool operator<(const Fixed& other) const { return value_ < other.value_; }

  private:
    constexpr explicit Fixed(int32_t value) : value_(value) {}

    int32_t value_ = 0;
};

} // namespace tachy
