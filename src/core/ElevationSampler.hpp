#pragma once

/**
 * @file ElevationSampler.hpp
 * @brief Point elevation sampling from a GDAL raster
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace wayslope {

/**
 * @brief Fractional pixel position produced by the inverse geotransform
 */
struct PixelPosition {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Samples band 1 of a georeferenced raster at geographic coordinates
 *
 * The geotransform is read and inverted once when the raster is opened. Each
 * sample maps (lon, lat) to a fractional pixel, truncates it toward zero and
 * reads exactly one pixel. The sampler keeps no cache: callers sample each
 * node once.
 */
class ElevationSampler {
public:
    /**
     * @brief Open a raster file
     * @param filename Any single-band raster GDAL can open
     * @param strategy Resampling passed to the one-pixel read
     * @param allow_nodata Return the band's NoData value as an elevation
     *        instead of failing. Non-finite values always fail.
     * @throws InputOpenError, ParseError, GeoTransformError
     */
    explicit ElevationSampler(const std::string& filename,
                              ResamplingStrategy strategy = ResamplingStrategy::NEAREST_NEIGHBOR,
                              bool allow_nodata = false);
    ~ElevationSampler();

    ElevationSampler(ElevationSampler&&) noexcept;
    ElevationSampler& operator=(ElevationSampler&&) noexcept;

    /**
     * @brief Elevation at a geographic coordinate
     * @throws SamplingError if the pixel is outside the raster, the read
     *         fails, the value is not finite, or the value is NoData
     *         (unless allowed)
     */
    double sample(const Coordinate& coordinate) const;

    /**
     * @brief Apply the inverse geotransform without reading the raster
     */
    PixelPosition to_pixel(const Coordinate& coordinate) const;

    /**
     * @brief Truncate a fractional pixel coordinate toward zero
     *
     * -0.4 becomes 0 and 2.9 becomes 2. Never floor or round here: sampled
     * cells must stay identical to those of earlier releases.
     */
    static std::int64_t truncate_pixel_index(double fractional);

    std::pair<int, int> get_raster_dimensions() const;
    std::array<double, 6> get_geotransform() const;
    std::array<double, 6> get_inverse_geotransform() const;
    std::optional<double> get_nodata_value() const;
    ResamplingStrategy get_resampling() const;
    const std::string& get_filename() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wayslope
