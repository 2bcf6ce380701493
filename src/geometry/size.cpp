#include <panelkit/geometry/size.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace panelkit::geometry {

namespace {

float sanitize_extent(float v) {
    if (std::isnan(v) || v < 0) return 0;
    return v;
}

} // namespace

Size::Size(float width, float height)
    : width_(sanitize_extent(width)), height_(sanitize_extent(height)) {}

Size Size::constrain(const Size& constraint) const {
    return {std::min(width_, constraint.width_), std::min(height_, constraint.height_)};
}

Size Size::deflate(const Thickness& t) const {
    // inf - finite stays inf, so an unconstrained axis remains unconstrained.
    return {width_ - t.horizontal_thickness(), height_ - t.vertical_thickness()};
}

Size Size::inflate(const Thickness& t) const {
    return {width_ + t.horizontal_thickness(), height_ + t.vertical_thickness()};
}

std::string Size::to_string() const {
    std::ostringstream oss;
    oss << "Size(" << width_ << ", " << height_ << ")";
    return oss.str();
}

Size operator+(const Size& a, const Size& b) {
    return {a.width() + b.width(), a.height() + b.height()};
}

Size operator-(const Size& a, const Size& b) {
    return {a.width() - b.width(), a.height() - b.height()};
}

Size operator*(const Size& s, float factor) {
    return {s.width() * factor, s.height() * factor};
}

Size operator/(const Size& s, float divisor) {
    if (divisor == 0) return Size::empty();
    return {s.width() / divisor, s.height() / divisor};
}

} // namespace panelkit::geometry
