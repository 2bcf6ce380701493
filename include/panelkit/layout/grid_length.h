#pragma once
#include <panelkit/core/config.h>
#include <panelkit/geometry/size.h>
#include <string>
#include <string_view>
#include <vector>

namespace panelkit::layout {

enum class GridUnitType { Auto, Pixel, Star };

// Sizing rule of a grid track. Negative or NaN values are clamped to 0.
class GridLength {
public:
    // 1*
    GridLength() = default;
    GridLength(float value, GridUnitType type);

    static GridLength auto_size() { return {1.0f, GridUnitType::Auto}; }
    static GridLength pixels(float value) { return {value, GridUnitType::Pixel}; }
    static GridLength stars(float weight = core::config::kDefaultStarWeight) {
        return {weight, GridUnitType::Star};
    }

    float value() const { return value_; }
    GridUnitType unit_type() const { return type_; }

    bool is_auto() const { return type_ == GridUnitType::Auto; }
    bool is_absolute() const { return type_ == GridUnitType::Pixel; }
    bool is_star() const { return type_ == GridUnitType::Star; }

    // "Auto", "120", "2*"
    std::string to_string() const;

private:
    float value_ = core::config::kDefaultStarWeight;
    GridUnitType type_ = GridUnitType::Star;
};

inline bool operator==(const GridLength& a, const GridLength& b) {
    return a.unit_type() == b.unit_type() && a.value() == b.value();
}
inline bool operator!=(const GridLength& a, const GridLength& b) { return !(a == b); }

// Parses a single token: "Auto" (any case), "*", "2.5*" or a pixel value.
// Throws std::invalid_argument on anything else.
GridLength parse_grid_length(std::string_view text);

// Parses a comma separated list such as "100,Auto,*". Empty entries are
// skipped.
std::vector<GridLength> parse_grid_lengths(std::string_view text);

// A row or column of a Grid. `actual_size` and `offset` are scratch state
// written by every layout pass and meaningless between passes.
struct TrackDefinition {
    GridLength length;
    float min = 0;
    float max = geometry::kInfinity;

    float actual_size = 0;
    float offset = 0;

    TrackDefinition() = default;
    explicit TrackDefinition(GridLength l, float min_size = 0, float max_size = geometry::kInfinity)
        : length(l), min(min_size), max(max_size) {}
};

using RowDefinition = TrackDefinition;
using ColumnDefinition = TrackDefinition;

} // namespace panelkit::layout
