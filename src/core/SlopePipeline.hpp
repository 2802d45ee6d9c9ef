#pragma once

/**
 * @file SlopePipeline.hpp
 * @brief Filter, resolve, sample and aggregate passes over a parsed network
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include "TagFilter.hpp"
#include "ElevationIndex.hpp"
#include "WayAggregator.hpp"
#include "StageTracker.hpp"
#include "Logger.hpp"
#include <vector>

namespace wayslope {

class ElevationSampler;

/**
 * @brief Single-threaded four-pass slope computation
 *
 * 1. select ways whose tags match the FilterSpec
 * 2. resolve the sorted, deduplicated set of referenced node ids
 * 3. sample every resolved node once into an ElevationIndex
 * 4. aggregate every selected way
 *
 * Results are returned sorted by way id. The index is complete before the
 * first way is aggregated.
 */
class SlopePipeline {
public:
    explicit SlopePipeline(ClimbDistanceMode mode = ClimbDistanceMode::PER_SEGMENT);

    /**
     * @brief Run all passes, sampling elevations from a raster
     */
    std::vector<WayStatistics> run(const Network& network, const ElevationSampler& sampler,
                                   const FilterSpec& spec);

    /**
     * @brief Run all passes with an arbitrary per-node elevation source
     */
    std::vector<WayStatistics> run(const Network& network,
                                   const ElevationIndex::SampleFunction& sample,
                                   const FilterSpec& spec);

    // Individual passes
    static std::vector<const Way*> select_ways(const Network& network, const FilterSpec& spec);
    static std::vector<ObjectId> resolve_node_ids(const std::vector<const Way*>& ways);
    static ElevationIndex build_elevation_index(const std::vector<ObjectId>& node_ids,
                                                const NodeLookup& nodes,
                                                const ElevationIndex::SampleFunction& sample);

    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const StageTracker& get_stage_tracker() const { return tracker_; }

private:
    WayAggregator aggregator_;
    PerformanceMetrics metrics_;
    StageTracker tracker_;
    Logger logger_;
};

} // namespace wayslope
