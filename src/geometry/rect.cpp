#include <panelkit/geometry/rect.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace panelkit::geometry {

namespace {

float sanitize_extent(float v) {
    if (std::isnan(v) || v < 0) return 0;
    return v;
}

float sanitize_coord(float v) {
    return std::isnan(v) ? 0.0f : v;
}

} // namespace

Rect::Rect(float x, float y, float width, float height)
    : x_(sanitize_coord(x)), y_(sanitize_coord(y)),
      width_(sanitize_extent(width)), height_(sanitize_extent(height)) {}

Rect::Rect(const Point& position, const Size& size)
    : Rect(position.x, position.y, size.width(), size.height()) {}

Rect::Rect(const Size& size) : Rect(0, 0, size.width(), size.height()) {}

bool Rect::contains(const Point& p) const {
    return p.x >= x_ && p.x < right() && p.y >= y_ && p.y < bottom();
}

bool Rect::contains(const Rect& other) const {
    return other.x_ >= x_ && other.y_ >= y_ &&
           other.right() <= right() && other.bottom() <= bottom();
}

bool Rect::intersects_with(const Rect& other) const {
    return other.x_ < right() && other.right() > x_ &&
           other.y_ < bottom() && other.bottom() > y_;
}

Rect Rect::intersect(const Rect& other) const {
    if (!intersects_with(other)) return Rect::empty();
    float l = std::max(x_, other.x_);
    float t = std::max(y_, other.y_);
    float r = std::min(right(), other.right());
    float b = std::min(bottom(), other.bottom());
    return {l, t, r - l, b - t};
}

Rect Rect::unite(const Rect& other) const {
    if (is_empty()) return other;
    if (other.is_empty()) return *this;
    float l = std::min(x_, other.x_);
    float t = std::min(y_, other.y_);
    float r = std::max(right(), other.right());
    float b = std::max(bottom(), other.bottom());
    return {l, t, r - l, b - t};
}

Rect Rect::inflate(float dx, float dy) const {
    return {x_ - dx, y_ - dy, width_ + 2 * dx, height_ + 2 * dy};
}

Rect Rect::inflate(const Thickness& t) const {
    return {x_ - t.left, y_ - t.top,
            width_ + t.horizontal_thickness(), height_ + t.vertical_thickness()};
}

Rect Rect::deflate(const Thickness& t) const {
    return {x_ + t.left, y_ + t.top,
            width_ - t.horizontal_thickness(), height_ - t.vertical_thickness()};
}

std::string Rect::to_string() const {
    std::ostringstream oss;
    oss << "Rect(" << x_ << ", " << y_ << ", " << width_ << ", " << height_ << ")";
    return oss.str();
}

} // namespace panelkit::geometry
