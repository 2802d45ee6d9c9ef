/**
 * @file ElevationIndex.cpp
 * @brief Elevation index construction and lookup
 */

#include "ElevationIndex.hpp"
#include "SlopeErrors.hpp"

namespace wayslope {

ElevationIndex ElevationIndex::build(const std::vector<Node>& nodes, const SampleFunction& sample) {
    std::unordered_map<ObjectId, double> elevations;
    elevations.reserve(nodes.size());

    for (const auto& node : nodes) {
        if (elevations.find(node.id) != elevations.end()) {
            continue;
        }
        elevations.emplace(node.id, sample(node));
    }

    return ElevationIndex(std::move(elevations));
}

double ElevationIndex::at(ObjectId node_id) const {
    auto it = elevations_.find(node_id);
    if (it == elevations_.end()) {
        throw MissingElevationError("node " + std::to_string(node_id) +
                                    " was never sampled");
    }
    return it->second;
}

} // namespace wayslope
