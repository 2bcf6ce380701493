#pragma once
#include <panelkit/geometry/point.h>
#include <panelkit/geometry/size.h>
#include <panelkit/geometry/thickness.h>
#include <string>

namespace panelkit::geometry {

// Axis-aligned rectangle. Width and height are clamped to >= 0; edges,
// corners and center are derived on demand.
class Rect {
public:
    Rect() = default;
    Rect(float x, float y, float width, float height);
    Rect(const Point& position, const Size& size);
    explicit Rect(const Size& size);

    static Rect empty() { return {}; }

    float x() const { return x_; }
    float y() const { return y_; }
    float width() const { return width_; }
    float height() const { return height_; }

    float left() const { return x_; }
    float top() const { return y_; }
    float right() const { return x_ + width_; }
    float bottom() const { return y_ + height_; }

    Point top_left() const { return {left(), top()}; }
    Point top_right() const { return {right(), top()}; }
    Point bottom_left() const { return {left(), bottom()}; }
    Point bottom_right() const { return {right(), bottom()}; }
    Point center() const { return {x_ + width_ / 2, y_ + height_ / 2}; }

    Point position() const { return {x_, y_}; }
    Size size() const { return {width_, height_}; }

    bool is_empty() const { return width_ == 0 || height_ == 0; }

    // Half-open: the right and bottom edges are outside.
    bool contains(const Point& p) const;
    bool contains(const Rect& other) const;
    bool intersects_with(const Rect& other) const;

    Rect intersect(const Rect& other) const;
    Rect unite(const Rect& other) const;
    Rect offset(float dx, float dy) const { return {x_ + dx, y_ + dy, width_, height_}; }
    Rect inflate(float dx, float dy) const;
    Rect inflate(const Thickness& t) const;
    Rect deflate(const Thickness& t) const;

    Rect with_x(float x) const { return {x, y_, width_, height_}; }
    Rect with_y(float y) const { return {x_, y, width_, height_}; }
    Rect with_width(float width) const { return {x_, y_, width, height_}; }
    Rect with_height(float height) const { return {x_, y_, width_, height}; }

    std::string to_string() const;

private:
    float x_ = 0;
    float y_ = 0;
    float width_ = 0;
    float height_ = 0;
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x() == b.x() && a.y() == b.y() && a.width() == b.width() && a.height() == b.height();
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

} // namespace panelkit::geometry
