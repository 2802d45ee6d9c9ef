#pragma once

/**
 * @file way_slope.hpp
 * @brief Main header for the way-slope elevation profile tool
 *
 * Core data model shared by the OSM reader, the elevation sampler, the
 * per-way aggregator and the JSON writer.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wayslope {

// ============================================================================
// Network Types
// ============================================================================

/**
 * @brief OSM object identifier (node or way)
 */
using ObjectId = std::int64_t;

/**
 * @brief Tag key/value mapping of a way
 */
using TagMap = std::map<std::string, std::string>;

/**
 * @brief Geographic coordinate in decimal degrees (WGS84)
 */
struct Coordinate {
    double lon = 0.0;
    double lat = 0.0;

    Coordinate() = default;
    Coordinate(double longitude, double latitude) : lon(longitude), lat(latitude) {}

    bool operator==(const Coordinate& other) const {
        return lon == other.lon && lat == other.lat;
    }
};

/**
 * @brief Single geographic point with a stable identity
 */
struct Node {
    ObjectId id = 0;
    double lat = 0.0;
    double lon = 0.0;

    Node() = default;
    Node(ObjectId node_id, double latitude, double longitude)
        : id(node_id), lat(latitude), lon(longitude) {}

    Coordinate coordinate() const { return Coordinate(lon, lat); }
};

/**
 * @brief Ordered path through a sequence of nodes, with descriptive tags
 */
struct Way {
    ObjectId id = 0;
    std::vector<ObjectId> nodes;
    TagMap tags;
};

/**
 * @brief Node lookup keyed by node id
 */
using NodeLookup = std::unordered_map<ObjectId, Node>;

/**
 * @brief Parsed network: selected ways and every node they reference
 *
 * The reader hands back ways and nodes as two separate collections, so no
 * consumer ever has to tell the object kinds apart at runtime.
 */
struct Network {
    std::vector<Way> ways;  // File order
    NodeLookup nodes;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Slope statistics of one way
 *
 * All lengths in meters. Values are never negative.
 */
struct WayStatistics {
    ObjectId way_id = 0;
    double distance = 0.0;
    double climb_distance = 0.0;
    double descent_distance = 0.0;
    double climb = 0.0;
    double descent = 0.0;

    WayStatistics() = default;
    explicit WayStatistics(ObjectId id) : way_id(id) {}
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Resampling used for the single-pixel raster read
 */
enum class ResamplingStrategy {
    NEAREST_NEIGHBOR,  ///< GRIORA_NearestNeighbour
    BILINEAR           ///< GRIORA_Bilinear
};

/**
 * @brief Layout of the JSON result document
 */
enum class OutputShape {
    OBJECT_BY_WAY_ID,  ///< {"<way_id>": {...}, ...}
    ARRAY_OF_RECORDS   ///< [{"way_id": ..., ...}, ...]
};

/**
 * @brief What a climb/descent segment adds to climb_distance/descent_distance
 */
enum class ClimbDistanceMode {
    PER_SEGMENT,       ///< Segment length; climb + descent distance == distance
    LEGACY_CUMULATIVE  ///< Running total so far; reproduces older outputs
};

/**
 * @brief Configuration for one slope computation run
 */
struct SlopeConfig {
    // Inputs and output
    std::string osm_file;
    std::string elevation_file;
    std::string output_file;

    // Way selection ("key" or "key=value", comma-separated)
    std::string filter = "highway";

    // Sampling
    ResamplingStrategy resampling = ResamplingStrategy::NEAREST_NEIGHBOR;
    bool allow_nodata = false;

    // Aggregation
    ClimbDistanceMode climb_distance_mode = ClimbDistanceMode::PER_SEGMENT;

    // Output
    OutputShape output_shape = OutputShape::OBJECT_BY_WAY_ID;
    int json_indent = -1;  // -1 = compact

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;  // 1=ERROR ... 6=TRACE
    std::optional<std::string> log_config;  // Facility form, e.g. "3,ElevationSampler=6"
    std::optional<std::string> log_file;

    bool dry_run = false;
};

/**
 * @brief Performance metrics and totals of a pipeline run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds network_loading_time{0};
    std::chrono::milliseconds selection_time{0};
    std::chrono::milliseconds sampling_time{0};
    std::chrono::milliseconds aggregation_time{0};
    std::chrono::milliseconds export_time{0};
    std::chrono::milliseconds total_time{0};

    size_t ways_in_network = 0;
    size_t ways_selected = 0;
    size_t nodes_sampled = 0;
    size_t segments_walked = 0;

    double total_distance = 0.0;
    double total_climb = 0.0;
    double total_descent = 0.0;
};

// String conversions for enum options
std::string to_string(ResamplingStrategy strategy);
std::string to_string(OutputShape shape);
std::string to_string(ClimbDistanceMode mode);

std::optional<ResamplingStrategy> parse_resampling_strategy(const std::string& name);
std::optional<OutputShape> parse_output_shape(const std::string& name);

// ============================================================================
// Main Processor Class
// ============================================================================

class StageTracker;

/**
 * @brief Runs a complete slope computation from files to JSON
 *
 * Stages: network loading, elevation raster opening, statistics computation
 * and export. Every stage throws a SlopeError subclass on failure; nothing
 * is written when an earlier stage fails.
 */
class WaySlopeProcessor {
public:
    /**
     * @throws ConfigurationError if the filter string is invalid
     */
    explicit WaySlopeProcessor(const SlopeConfig& config);
    ~WaySlopeProcessor();

    // Main pipeline
    void process();

    // Individual stages
    void load_network();
    void open_elevation();
    void compute_statistics();
    void export_results();

    // Accessors
    const Network& get_network() const;
    const std::vector<WayStatistics>& get_statistics() const;
    const PerformanceMetrics& get_metrics() const;
    const StageTracker& get_stage_tracker() const;
    const SlopeConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wayslope
