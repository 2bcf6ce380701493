#pragma once
#include <panelkit/geometry/thickness.h>
#include <limits>
#include <string>

namespace panelkit::geometry {

constexpr float kInfinity = std::numeric_limits<float>::infinity();

// Width/height pair. Both axes are clamped to >= 0 on construction and NaN
// collapses to 0, so a Size can never carry a negative or undefined extent.
// +inf on an axis means "unconstrained".
class Size {
public:
    Size() = default;
    Size(float width, float height);

    static Size empty() { return {}; }
    static Size infinity() { return {kInfinity, kInfinity}; }

    float width() const { return width_; }
    float height() const { return height_; }

    bool is_empty() const { return width_ == 0 || height_ == 0; }
    bool has_infinite_width() const { return width_ == kInfinity; }
    bool has_infinite_height() const { return height_ == kInfinity; }

    Size with_width(float width) const { return {width, height_}; }
    Size with_height(float height) const { return {width_, height}; }

    // Component-wise minimum with the constraint.
    Size constrain(const Size& constraint) const;

    Size deflate(const Thickness& t) const;
    Size inflate(const Thickness& t) const;

    std::string to_string() const;

private:
    float width_ = 0;
    float height_ = 0;
};

Size operator+(const Size& a, const Size& b);
Size operator-(const Size& a, const Size& b);
Size operator*(const Size& s, float factor);
Size operator/(const Size& s, float divisor);

inline bool operator==(const Size& a, const Size& b) {
    return a.width() == b.width() && a.height() == b.height();
}
inline bool operator!=(const Size& a, const Size& b) { return !(a == b); }

} // namespace panelkit::geometry
