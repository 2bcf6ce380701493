#pragma once
#include <panelkit/geometry/rect.h>
#include <panelkit/geometry/size.h>

namespace panelkit::layout {

// Device-pixel snapping. `dpi_scale` is device pixels per DIP (1.0 at
// 96 dpi). A scale that is zero, negative or non-finite disables snapping
// and the input is returned unchanged. Midpoints round away from zero.

float round_to_pixel(float value, float dpi_scale);
int round_to_pixel_int(float value, float dpi_scale);
int ceil_to_pixel_int(float value, float dpi_scale);

geometry::Size round_size_to_pixels(const geometry::Size& size, float dpi_scale);

// Rounds position and size independently so a rect keeps its pixel size
// while moving.
geometry::Rect round_rect_to_pixels(const geometry::Rect& rect, float dpi_scale);

// Rounds each edge; the size may change by one pixel.
geometry::Rect snap_rect_edges_to_pixels(const geometry::Rect& rect, float dpi_scale);

// Floors the leading edges and ceils the trailing ones; never shrinks.
geometry::Rect snap_rect_edges_to_pixels_outward(const geometry::Rect& rect, float dpi_scale);

} // namespace panelkit::layout
