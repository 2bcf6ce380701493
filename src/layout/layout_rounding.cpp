#include <panelkit/layout/layout_rounding.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace panelkit::layout {

namespace {

bool usable_scale(float dpi_scale) {
    return dpi_scale > 0 && std::isfinite(dpi_scale);
}

// Saturates instead of overflowing: casting an out-of-range float to int is
// undefined.
int to_int_saturated(double value) {
    constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
    constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(value, kMin, kMax));
}

float floor_to_pixel(float value, float dpi_scale) {
    if (!std::isfinite(value)) return value;
    return std::floor(value * dpi_scale) / dpi_scale;
}

float ceil_to_pixel(float value, float dpi_scale) {
    if (!std::isfinite(value)) return value;
    return std::ceil(value * dpi_scale) / dpi_scale;
}

} // namespace

float round_to_pixel(float value, float dpi_scale) {
    if (!std::isfinite(value) || !usable_scale(dpi_scale)) return value;
    // std::round already rounds half away from zero.
    return std::round(value * dpi_scale) / dpi_scale;
}

int round_to_pixel_int(float value, float dpi_scale) {
    if (!std::isfinite(value)) return 0;
    double scaled = usable_scale(dpi_scale) ? static_cast<double>(value) * dpi_scale : value;
    return to_int_saturated(std::round(scaled));
}

int ceil_to_pixel_int(float value, float dpi_scale) {
    if (!std::isfinite(value)) return 0;
    double scaled = usable_scale(dpi_scale) ? static_cast<double>(value) * dpi_scale : value;
    return to_int_saturated(std::ceil(scaled));
}

geometry::Size round_size_to_pixels(const geometry::Size& size, float dpi_scale) {
    if (!usable_scale(dpi_scale) || size.is_empty()) return size;
    return {round_to_pixel(size.width(), dpi_scale), round_to_pixel(size.height(), dpi_scale)};
}

// Edge math stays in float so extents beyond the int range survive.

geometry::Rect round_rect_to_pixels(const geometry::Rect& rect, float dpi_scale) {
    if (!usable_scale(dpi_scale) || rect.is_empty()) return rect;
    return {round_to_pixel(rect.x(), dpi_scale), round_to_pixel(rect.y(), dpi_scale),
            round_to_pixel(rect.width(), dpi_scale), round_to_pixel(rect.height(), dpi_scale)};
}

geometry::Rect snap_rect_edges_to_pixels(const geometry::Rect& rect, float dpi_scale) {
    if (!usable_scale(dpi_scale) || rect.is_empty()) return rect;

    float left = round_to_pixel(rect.left(), dpi_scale);
    float top = round_to_pixel(rect.top(), dpi_scale);
    float right = round_to_pixel(rect.right(), dpi_scale);
    float bottom = round_to_pixel(rect.bottom(), dpi_scale);

    return {left, top, std::max(0.0f, right - left), std::max(0.0f, bottom - top)};
}

geometry::Rect snap_rect_edges_to_pixels_outward(const geometry::Rect& rect, float dpi_scale) {
    if (!usable_scale(dpi_scale) || rect.is_empty()) return rect;

    float left = floor_to_pixel(rect.left(), dpi_scale);
    float top = floor_to_pixel(rect.top(), dpi_scale);
    float right = ceil_to_pixel(rect.right(), dpi_scale);
    float bottom = ceil_to_pixel(rect.bottom(), dpi_scale);

    return {left, top, std::max(0.0f, right - left), std::max(0.0f, bottom - top)};
}

} // namespace panelkit::layout
