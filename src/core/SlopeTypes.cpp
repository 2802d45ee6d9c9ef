/**
 * @file SlopeTypes.cpp
 * @brief String conversions for configuration enums
 */

#include "way_slope.hpp"

namespace wayslope {

std::string to_string(ResamplingStrategy strategy) {
    switch (strategy) {
        case ResamplingStrategy::NEAREST_NEIGHBOR: return "nearest";
        case ResamplingStrategy::BILINEAR: return "bilinear";
    }
    return "unknown";
}

std::string to_string(OutputShape shape) {
    switch (shape) {
        case OutputShape::OBJECT_BY_WAY_ID: return "object";
        case OutputShape::ARRAY_OF_RECORDS: return "array";
    }
    return "unknown";
}

std::string to_string(ClimbDistanceMode mode) {
    switch (mode) {
        case ClimbDistanceMode::PER_SEGMENT: return "per-segment";
        case ClimbDistanceMode::LEGACY_CUMULATIVE: return "legacy-cumulative";
    }
    return "unknown";
}

std::optional<ResamplingStrategy> parse_resampling_strategy(const std::string& name) {
    if (name == "nearest" || name == "nearest-neighbor") return ResamplingStrategy::NEAREST_NEIGHBOR;
    if (name == "bilinear") return ResamplingStrategy::BILINEAR;
    return std::nullopt;
}

std::optional<OutputShape> parse_output_shape(const std::string& name) {
    if (name == "object") return OutputShape::OBJECT_BY_WAY_ID;
    if (name == "array") return OutputShape::ARRAY_OF_RECORDS;
    return std::nullopt;
}

} // namespace wayslope
