#pragma once

/**
 * @file SlopeErrors.hpp
 * @brief Exception types raised by the slope pipeline
 *
 * Every failure aborts the run. Errors are thrown where they are detected and
 * caught once, in main().
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <stdexcept>
#include <string>

namespace wayslope {

/**
 * @brief Base class of all way-slope errors
 */
class SlopeError : public std::runtime_error {
public:
    explicit SlopeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input file missing or unreadable
 */
class InputOpenError : public SlopeError {
public:
    explicit InputOpenError(const std::string& message)
        : SlopeError("Cannot open input: " + message) {}
};

/**
 * @brief Malformed network or raster structure
 */
class ParseError : public SlopeError {
public:
    explicit ParseError(const std::string& message)
        : SlopeError("Parse error: " + message) {}
};

/**
 * @brief Raster lacks an invertible affine geotransform
 */
class GeoTransformError : public SlopeError {
public:
    explicit GeoTransformError(const std::string& message)
        : SlopeError("Geotransform error: " + message) {}
};

/**
 * @brief Coordinate outside the raster, NoData cell or failed pixel read
 */
class SamplingError : public SlopeError {
public:
    explicit SamplingError(const std::string& message)
        : SlopeError("Sampling error: " + message) {}
};

/**
 * @brief A node required by a way was never sampled (internal bug)
 */
class MissingElevationError : public SlopeError {
public:
    explicit MissingElevationError(const std::string& message)
        : SlopeError("Missing elevation: " + message) {}
};

/**
 * @brief A node required by a way is absent from the node lookup (internal bug)
 */
class MissingNodeError : public SlopeError {
public:
    explicit MissingNodeError(const std::string& message)
        : SlopeError("Missing node: " + message) {}
};

/**
 * @brief Result could not be encoded as JSON
 */
class SerializationError : public SlopeError {
public:
    explicit SerializationError(const std::string& message)
        : SlopeError("Serialization error: " + message) {}
};

/**
 * @brief Output file could not be created or written
 */
class OutputWriteError : public SlopeError {
public:
    explicit OutputWriteError(const std::string& message)
        : SlopeError("Cannot write output: " + message) {}
};

/**
 * @brief Invalid user configuration (filter string, option values, config file)
 */
class ConfigurationError : public SlopeError {
public:
    explicit ConfigurationError(const std::string& message)
        : SlopeError("Configuration error: " + message) {}
};

} // namespace wayslope
