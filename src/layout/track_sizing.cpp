#include <panelkit/layout/track_sizing.h>

#include <algorithm>
#include <cmath>

namespace panelkit::layout {

namespace {

float clamp_track(float value, const TrackDefinition& track) {
    return std::max(track.min, std::min(value, track.max));
}

float sanitize_spacing(float spacing) {
    return std::isnan(spacing) || spacing < 0 ? 0.0f : spacing;
}

// Largest per-track share of any child covering `index`. A spanning child
// splits its extent (minus the gaps it crosses) evenly over its tracks.
float auto_extent(int index, int count, float spacing,
                  const std::vector<TrackContribution>& contributions) {
    float extent = 0;
    for (const auto& item : contributions) {
        int start = std::clamp(item.start, 0, count - 1);
        int span = std::clamp(item.span, 1, count - start);
        if (index < start || index >= start + span) continue;

        float share = std::max(0.0f, item.desired - static_cast<float>(span - 1) * spacing) /
                      static_cast<float>(span);
        extent = std::max(extent, share);
    }
    return extent;
}

} // namespace

void resolve_track_sizes(std::vector<TrackDefinition>& tracks, float available,
                         float spacing, const std::vector<TrackContribution>& contributions) {
    if (tracks.empty()) return;

    spacing = sanitize_spacing(spacing);
    const int count = static_cast<int>(tracks.size());
    const bool bounded = std::isfinite(available);
    const float usable = bounded
        ? std::max(0.0f, available - static_cast<float>(count - 1) * spacing)
        : available;

    float fixed = 0;
    float total_weight = 0;
    for (int i = 0; i < count; ++i) {
        TrackDefinition& track = tracks[static_cast<std::size_t>(i)];
        const GridLength& length = track.length;

        if (length.is_absolute()) {
            track.actual_size = clamp_track(length.value(), track);
            fixed += track.actual_size;
        } else if (length.is_auto() || !bounded) {
            track.actual_size = clamp_track(auto_extent(i, count, spacing, contributions), track);
            fixed += track.actual_size;
        } else {
            total_weight += length.value();
        }
    }

    if (!bounded) return;

    // One distribution pass; a star track clamped by min/max does not hand
    // its excess back to the others.
    const float remaining = std::max(0.0f, usable - fixed);
    for (TrackDefinition& track : tracks) {
        if (!track.length.is_star()) continue;
        float share = total_weight > 0 ? remaining * track.length.value() / total_weight : 0.0f;
        track.actual_size = clamp_track(share, track);
    }
}

void resolve_track_offsets(std::vector<TrackDefinition>& tracks, float spacing) {
    spacing = sanitize_spacing(spacing);
    float offset = 0;
    for (TrackDefinition& track : tracks) {
        track.offset = offset;
        offset += track.actual_size + spacing;
    }
}

float tracks_extent(const std::vector<TrackDefinition>& tracks, float spacing) {
    if (tracks.empty()) return 0;
    return span_extent(tracks, 0, static_cast<int>(tracks.size()), spacing);
}

float span_extent(const std::vector<TrackDefinition>& tracks, int start, int span, float spacing) {
    if (tracks.empty()) return 0;
    spacing = sanitize_spacing(spacing);
    const int count = static_cast<int>(tracks.size());
    start = std::clamp(start, 0, count - 1);
    span = std::clamp(span, 1, count - start);

    float extent = static_cast<float>(span - 1) * spacing;
    for (int i = start; i < start + span; ++i) {
        extent += tracks[static_cast<std::size_t>(i)].actual_size;
    }
    return extent;
}

} // namespace panelkit::layout
