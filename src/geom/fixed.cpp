/// @file fixed.cpp
/// @brief Fixed-point conversions and saturating arithmetic

#include "geom/fixed.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>

namespace tachy {

Fixed Fixed::from_ratio(int64_t numerator, int64_t denominator) {
    if (denominator == 0) {
        throw std::invalid_argument("Fixed::from_ratio() requires a non-zero denominator");
    }
    if (denominator < 0) {
        numerator = -numerator;
        denominator = -denominator;
    }
    // Clamp before scaling so the multiplication cannot overflow
    if (numerator >= denominator) {
        return one();
    }
    if (numerator <= -denominator) {
        return -one();
    }
    int64_t scaled = numerator * LIMIT;
    int64_t half = denominator / 2;
    int64_t rounded = scaled >= 0 ? (scaled + half) / denominator : (scaled - half) / denominator;
    return from_raw(rounded);
}

Fixed Fixed::from_f64(double value) {
    if (std::isnan(value)) {
        return zero();
    }
    if (value >= 1.0) {
        return one();
    }
    if (value <= -1.0) {
        return -one();
    }
    return from_raw(static_cast<int64_t>(std::llround(value * static_cast<double>(LIMIT))));
}

Fixed Fixed::from_encoded(uint32_t bits) {
    int32_t raw = 0;
    std::memcpy(&raw, &bits, sizeof(raw));
    return from_raw(raw);
}

double Fixed::to_f64() const {
    return static_cast<double>(value_) / static_cast<double>(LIMIT);
}

uint32_t Fixed::to_encoded() const {
    uint32_t bits = 0;
    std::memcpy(&bits, &value_, sizeof(bits));
    return bits;
}

Fixed Fixed::operator+(Fixed other) const {
    return from_raw(static_cast<int64_t>(value_) + other.value_);
}

Fixed Fixed::operator-(Fixed other) const {
    return from_raw(static_cast<int64_t>(value_) - other.value_);
}

Fixed Fixed::operator*(Fixed other) const {
    return from_raw((static_cast<int64_t>(value_) * other.value_) / LIMIT);
}

} // namespace tachy
