#pragma once

/// @file orientation.hpp
/// @brief The eight rotate/mirror orientations a chip can be placed in

#include "geom/coords.hpp"
#include "geom/direction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tachy {

/// An element of the dihedral group of the square.
///
/// Applying an orientation first mirrors North/South (if `mirror` is set),
/// then rotates clockwise `rotate` quarter turns.
class Orientation {
  public:
    Orientation() = default;
    Orientation(uint8_t rotate, bool mirror) : rotate_(rotate % 4), mirror_(mirror) {}

    [[nodiscard]] uint8_t rotation() const { return rotate_; }
    [[nodiscard]] bool is_mirrored() const { return mirror_; }

    [[nodiscard]] Orientation rotate_cw() const { return {static_cast<uint8_t>(rotate_ + 1), mirror_}; }
    [[nodiscard]] Orientation rotate_ccw() const { return {static_cast<uint8_t>(rotate_ + 3), mirror_}; }
    [[nodiscard]] Orientation flip_horz() const;
    [[nodiscard]] Orientation flip_vert() const;
    [[nodiscard]] Orientation inverse() const;

    /// Composition: (a * b) applied to x equals a applied to (b applied to x)
    [[nodiscard]] Orientation operator*(Orientation other) const;
    [[nodiscard]] Direction operator*(Direction dir) const;
    /// Odd rotations transpose the size
    [[nodiscard]] CoordsSize operator*(CoordsSize size) const;

    /// Maps a cell offset inside an unrotated footprint of `size` to the
    /// offset of the same cell once the footprint is placed in this
    /// orientation.
    [[nodiscard]] CoordsDelta transform_in_size(CoordsDelta delta, CoordsSize size) const;

    /// Text form: "f<r>" when not mirrored, "t<r>" when mirrored
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Orientation> parse(std::string_view text);

    bool operator==(const Orientation& other) const {
        return rotate_ == other.rotate_ && mirror_ == other.mirror_;
    }
    bool operator!=(const Orientation& other) const { return !(*this == other); }
    bool operator<(const Orientation& other) const {
        return mirror_ != other.mirror_ ? !mirror_ : rotate_ < other.rotate_;
    }

  private:
    uint8_t rotate_ = 0;
    bool mirror_ = false;
};

} // namespace tachy
