/**
 * @file SlopePipeline.cpp
 * @brief Slope pipeline orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SlopePipeline.hpp"
#include "ElevationSampler.hpp"
#include "SlopeErrors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace wayslope {

SlopePipeline::SlopePipeline(ClimbDistanceMode mode)
    : aggregator_(mode), logger_("SlopePipeline") {
}

std::vector<WayStatistics> SlopePipeline::run(const Network& network,
                                              const ElevationSampler& sampler,
                                              const FilterSpec& spec) {
    return run(network,
               [&sampler](const Node& node) { return sampler.sample(node.coordinate()); },
               spec);
}

std::vector<WayStatistics> SlopePipeline::run(const Network& network,
                                              const ElevationIndex::SampleFunction& sample,
                                              const FilterSpec& spec) {
    metrics_ = {};
    tracker_.clear();
    metrics_.ways_in_network = network.ways.size();

    // Pass 1 and 2: way selection and node resolution
    tracker_.startStage("selection");
    std::vector<const Way*> selected = select_ways(network, spec);
    std::vector<ObjectId> node_ids = resolve_node_ids(selected);
    tracker_.addStageData("selection", "ways", std::to_string(selected.size()));
    tracker_.addStageData("selection", "nodes", std::to_string(node_ids.size()));
    tracker_.completeStage("selection");

    metrics_.ways_selected = selected.size();
    logger_.info("Selected " + std::to_string(selected.size()) + " of " +
                 std::to_string(network.ways.size()) + " ways matching \"" +
                 to_string(spec) + "\" (" + std::to_string(node_ids.size()) + " nodes)");

    // Pass 3: elevation sampling
    tracker_.startStage("sampling");
    ElevationIndex elevations = build_elevation_index(node_ids, network.nodes, sample);
    tracker_.addStageData("sampling", "samples", std::to_string(elevations.size()));
    tracker_.completeStage("sampling");

    metrics_.nodes_sampled = elevations.size();
    logger_.detailed("Sampled elevation of " + std::to_string(elevations.size()) + " nodes");

    // Pass 4: aggregation
    tracker_.startStage("aggregation");
    std::vector<WayStatistics> results;
    results.reserve(selected.size());
    for (const Way* way : selected) {
        results.push_back(aggregator_.aggregate(*way, elevations, network.nodes));
        metrics_.segments_walked += WayAggregator::segment_count(*way);

        const WayStatistics& stats = results.back();
        metrics_.total_distance += stats.distance;
        metrics_.total_climb += stats.climb;
        metrics_.total_descent += stats.descent;
    }

    std::stable_sort(results.begin(), results.end(),
        [](const WayStatistics& a, const WayStatistics& b) { return a.way_id < b.way_id; });

    tracker_.addStageData("aggregation", "segments", std::to_string(metrics_.segments_walked));
    tracker_.completeStage("aggregation");

    metrics_.selection_time = tracker_.stageDuration("selection");
    metrics_.sampling_time = tracker_.stageDuration("sampling");
    metrics_.aggregation_time = tracker_.stageDuration("aggregation");

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(1)
            << "Aggregated " << results.size() << " ways over "
            << metrics_.segments_walked << " segments: "
            << metrics_.total_distance << " m distance, "
            << metrics_.total_climb << " m climb, "
            << metrics_.total_descent << " m descent";
    logger_.info(summary.str());
    logger_.detailed(tracker_.getTimingReport());

    return results;
}

std::vector<const Way*> SlopePipeline::select_ways(const Network& network, const FilterSpec& spec) {
    std::vector<const Way*> selected;
    for (const auto& way : network.ways) {
        if (matches(way.tags, spec)) {
            selected.push_back(&way);
        }
    }
    return selected;
}

std::vector<ObjectId> SlopePipeline::resolve_node_ids(const std::vector<const Way*>& ways) {
    std::vector<ObjectId> node_ids;
    for (const Way* way : ways) {
        node_ids.insert(node_ids.end(), way->nodes.begin(), way->nodes.end());
    }

    // Sorted order keeps sampling reproducible across runs
    std::sort(node_ids.begin(), node_ids.end());
    node_ids.erase(std::unique(node_ids.begin(), node_ids.end()), node_ids.end());
    return node_ids;
}

ElevationIndex SlopePipeline::build_elevation_index(const std::vector<ObjectId>& node_ids,
                                                    const NodeLookup& nodes,
                                                    const ElevationIndex::SampleFunction& sample) {
    std::vector<Node> resolved;
    resolved.reserve(node_ids.size());
    for (ObjectId id : node_ids) {
        auto it = nodes.find(id);
        if (it == nodes.end()) {
            throw MissingNodeError("node " + std::to_string(id) +
                                   " is referenced by a selected way but absent from the network");
        }
        resolved.push_back(it->second);
    }

    return ElevationIndex::build(resolved, sample);
}

} // namespace wayslope
