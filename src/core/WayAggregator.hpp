#pragma once

/**
 * @file WayAggregator.hpp
 * @brief Per-way distance, climb and descent accumulation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include "ElevationIndex.hpp"

namespace wayslope {

/**
 * @brief Folds a way's consecutive node pairs into a WayStatistics record
 *
 * A way with n nodes has n-1 segments. Each segment adds its haversine
 * length to the distance. A segment whose end is strictly higher than its
 * start is a climb segment; every other segment, level ones included, is a
 * descent segment.
 *
 * With ClimbDistanceMode::PER_SEGMENT the segment length goes to
 * climb_distance or descent_distance, so the two always sum to distance.
 * ClimbDistanceMode::LEGACY_CUMULATIVE adds the running distance instead,
 * which double counts earlier segments but matches older result files.
 */
class WayAggregator {
public:
    explicit WayAggregator(ClimbDistanceMode mode = ClimbDistanceMode::PER_SEGMENT)
        : mode_(mode) {}

    /**
     * @brief Compute the statistics of one way
     * @throws MissingNodeError if a referenced node has no coordinates
     * @throws MissingElevationError if a referenced node was never sampled
     */
    WayStatistics aggregate(const Way& way, const ElevationIndex& elevations,
                            const NodeLookup& nodes) const;

    /**
     * @brief Number of segments in a way (n-1, or 0 for n <= 1)
     */
    static size_t segment_count(const Way& way) {
        return way.nodes.size() < 2 ? 0 : way.nodes.size() - 1;
    }

    ClimbDistanceMode get_mode() const { return mode_; }

private:
    ClimbDistanceMode mode_;
};

} // namespace wayslope
