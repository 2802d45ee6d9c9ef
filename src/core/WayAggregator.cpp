/**
 * @file WayAggregator.cpp
 * @brief Per-way slope statistics
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "WayAggregator.hpp"
#include "Geodesy.hpp"
#include "SlopeErrors.hpp"

namespace wayslope {

namespace {

const Node& lookup_node(const NodeLookup& nodes, ObjectId node_id, ObjectId way_id) {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        throw MissingNodeError("node " + std::to_string(node_id) + " of way " +
                               std::to_string(way_id) + " is not in the node lookup");
    }
    return it->second;
}

} // namespace

WayStatistics WayAggregator::aggregate(const Way& way, const ElevationIndex& elevations,
                                       const NodeLookup& nodes) const {
    WayStatistics stats(way.id);

    for (size_t i = 1; i < way.nodes.size(); ++i) {
        const Node& a = lookup_node(nodes, way.nodes[i - 1], way.id);
        const Node& b = lookup_node(nodes, way.nodes[i], way.id);
        double elev_a = elevations.at(a.id);
        double elev_b = elevations.at(b.id);

        double segment = haversine_distance_m(a.coordinate(), b.coordinate());
        stats.distance += segment;

        double contribution = (mode_ == ClimbDistanceMode::LEGACY_CUMULATIVE)
            ? stats.distance : segment;

        if (elev_b > elev_a) {
            stats.climb_distance += contribution;
            stats.climb += elev_b - elev_a;
        } else {
            stats.descent_distance += contribution;
            stats.descent += elev_a - elev_b;
        }
    }

    return stats;
}

} // namespace wayslope
