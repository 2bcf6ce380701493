#pragma once
#include <string>

namespace panelkit::geometry {

struct Point {
    float x = 0, y = 0;

    Point() = default;
    Point(float px, float py) : x(px), y(py) {}

    Point offset(float dx, float dy) const { return {x + dx, y + dy}; }

    std::string to_string() const;
};

inline Point operator+(const Point& a, const Point& b) { return {a.x + b.x, a.y + b.y}; }
inline Point operator-(const Point& a, const Point& b) { return {a.x - b.x, a.y - b.y}; }
inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

} // namespace panelkit::geometry
