#pragma once

/**
 * @file ElevationIndex.hpp
 * @brief Immutable node id to elevation mapping
 */

#include "way_slope.hpp"
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wayslope {

/**
 * @brief Elevation of every node referenced by the selected ways
 *
 * Built once by build(), then read-only.
 */
class ElevationIndex {
public:
    using SampleFunction = std::function<double(const Node&)>;

    ElevationIndex() = default;
    explicit ElevationIndex(std::unordered_map<ObjectId, double> elevations)
        : elevations_(std::move(elevations)) {}

    /**
     * @brief Sample each node once and collect the results
     *
     * Nodes are sampled in the given order. Duplicate ids are sampled once.
     * Any exception thrown by the sample function propagates unchanged.
     */
    static ElevationIndex build(const std::vector<Node>& nodes, const SampleFunction& sample);

    /**
     * @brief Elevation of a node
     * @throws MissingElevationError if the node was never sampled
     */
    double at(ObjectId node_id) const;

    bool contains(ObjectId node_id) const {
        return elevations_.find(node_id) != elevations_.end();
    }

    size_t size() const { return elevations_.size(); }
    bool empty() const { return elevations_.empty(); }

private:
    std::unordered_map<ObjectId, double> elevations_;
};

} // namespace wayslope
