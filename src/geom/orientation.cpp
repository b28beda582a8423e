/// @file orientation.cpp
/// @brief Orientation composition and its action on directions, sizes, and offsets

#include "geom/orientation.hpp"

namespace tachy {

Orientation Orientation::flip_horz() const {
    uint8_t rotate = (rotate_ % 2 == 0) ? static_cast<uint8_t>(rotate_ + 2) : rotate_;
    return {rotate, !mirror_};
}

Orientation Orientation::flip_vert() const {
    uint8_t rotate = (rotate_ % 2 == 1) ? static_cast<uint8_t>(rotate_ + 2) : rotate_;
    return {rotate, !mirror_};
}

Orientation Orientation::inverse() const {
    // A mirrored orientation is its own inverse
    if (mirror_) {
        return *this;
    }
    return {static_cast<uint8_t>((4 - rotate_) % 4), false};
}

Orientation Orientation::operator*(Orientation other) const {
    if (mirror_) {
        other = other.flip_vert();
    }
    return {static_cast<uint8_t>(other.rotate_ + rotate_), other.mirror_};
}

Direction Orientation::operator*(Direction dir) const {
    if (mirror_) {
        dir = tachy::flip_vert(dir);
    }
    for (uint8_t i = 0; i < rotate_; i++) {
        dir = tachy::rotate_cw(dir);
    }
    return dir;
}

CoordsSize Orientation::operator*(CoordsSize size) const {
    return (rotate_ % 2 == 1) ? size.transposed() : size;
}

CoordsDelta Orientation::transform_in_size(CoordsDelta delta, CoordsSize size) const {
    int32_t x = delta.x;
    int32_t y = mirror_ ? size.height - delta.y - 1 : delta.y;
    switch (rotate_) {
    case 0:
        return {x, y};
    case 1:
        return {size.height - y - 1, x};
    case 2:
        return {size.width - x - 1, size.height - y - 1};
    default:
        return {y, size.width - x - 1};
    }
}

std::string Orientation::to_string() const {
    std::string text;
    text.push_back(mirror_ ? 't' : 'f');
    text.push_back(static_cast<char>('0' + rotate_));
    return text;
}

std::optional<Orientation> Orientation::parse(std::string_view text) {
    if (text.size() != 2 || (text[0] != 'f' && text[0] != 't') || text[1] < '0' ||
        text[1] > '3') {
        return std::nullopt;
    }
    return Orientation(static_cast<uint8_t>(text[1] - '0'), text[0] == 't');
}

} // namespace tachy
