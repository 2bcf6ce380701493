#pragma once
#include <panelkit/layout/grid_length.h>
#include <vector>

namespace panelkit::layout {

// Desired extent of one child along one axis, covering tracks
// [start, start + span).
struct TrackContribution {
    int start = 0;
    int span = 1;
    float desired = 0;
};

// Resolves actual_size for every track. `available` is the extent of the
// whole axis including gaps and may be infinite, in which case star tracks
// size like auto tracks. Negative spacing is treated as 0.
void resolve_track_sizes(std::vector<TrackDefinition>& tracks, float available,
                         float spacing, const std::vector<TrackContribution>& contributions);

// Writes each track's offset as the running sum of sizes and gaps.
void resolve_track_offsets(std::vector<TrackDefinition>& tracks, float spacing);

// Sum of all track sizes plus the gaps between them.
float tracks_extent(const std::vector<TrackDefinition>& tracks, float spacing);

// Extent of tracks [start, start + span) including interior gaps. The range
// is clamped to the track list.
float span_extent(const std::vector<TrackDefinition>& tracks, int start, int span, float spacing);

} // namespace panelkit::layout
