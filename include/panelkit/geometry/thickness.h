#pragma once
#include <string>

namespace panelkit::geometry {

// Edge insets (margin, padding). Values may be negative; consumers clamp
// the sizes they produce, not the insets themselves.
struct Thickness {
    float left = 0, top = 0, right = 0, bottom = 0;

    Thickness() = default;
    explicit Thickness(float uniform) : left(uniform), top(uniform), right(uniform), bottom(uniform) {}
    Thickness(float horizontal, float vertical)
        : left(horizontal), top(vertical), right(horizontal), bottom(vertical) {}
    Thickness(float l, float t, float r, float b) : left(l), top(t), right(r), bottom(b) {}

    static Thickness zero() { return {}; }

    float horizontal_thickness() const { return left + right; }
    float vertical_thickness() const { return top + bottom; }
    bool is_zero() const { return left == 0 && top == 0 && right == 0 && bottom == 0; }

    std::string to_string() const;
};

inline Thickness operator+(const Thickness& a, const Thickness& b) {
    return {a.left + b.left, a.top + b.top, a.right + b.right, a.bottom + b.bottom};
}
inline Thickness operator-(const Thickness& a, const Thickness& b) {
    return {a.left - b.left, a.top - b.top, a.right - b.right, a.bottom - b.bottom};
}
inline bool operator==(const Thickness& a, const Thickness& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}
inline bool operator!=(const Thickness& a, const Thickness& b) { return !(a == b); }

} // namespace panelkit::geometry
