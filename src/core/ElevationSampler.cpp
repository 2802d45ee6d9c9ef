/**
 * @file ElevationSampler.cpp
 * @brief GDAL-backed point elevation sampling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ElevationSampler.hpp"
#include "SlopeErrors.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <cpl_error.h>
#include <cmath>
#include <limits>
#include <sstream>

namespace wayslope {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

namespace {

std::string last_gdal_error() {
    const char* message = CPLGetLastErrorMsg();
    return (message && *message) ? std::string(message) : std::string("no GDAL error message");
}

GDALRIOResampleAlg to_gdal_resampling(ResamplingStrategy strategy) {
    switch (strategy) {
        case ResamplingStrategy::NEAREST_NEIGHBOR: return GRIORA_NearestNeighbour;
        case ResamplingStrategy::BILINEAR: return GRIORA_Bilinear;
    }
    return GRIORA_NearestNeighbour;
}

std::string describe(const Coordinate& coordinate) {
    std::ostringstream oss;
    oss.precision(9);
    oss << "(lon " << coordinate.lon << ", lat " << coordinate.lat << ")";
    return oss.str();
}

} // namespace

// ============================================================================
// ElevationSampler::Impl
// ============================================================================

class ElevationSampler::Impl {
public:
    Impl(const std::string& filename, ResamplingStrategy strategy, bool allow_nodata)
        : filename_(filename), strategy_(strategy), allow_nodata_(allow_nodata),
          logger_("ElevationSampler") {
        GDALAllRegister();

        CPLErrorReset();
        dataset_.reset(static_cast<GDALDataset*>(GDALOpen(filename.c_str(), GA_ReadOnly)));
        if (!dataset_) {
            throw InputOpenError(filename + " (" + last_gdal_error() + ")");
        }

        if (dataset_->GetRasterCount() < 1) {
            throw ParseError(filename + " contains no raster band");
        }
        band_ = dataset_->GetRasterBand(1);
        if (!band_) {
            throw ParseError(filename + ": failed to get raster band 1");
        }

        width_ = dataset_->GetRasterXSize();
        height_ = dataset_->GetRasterYSize();

        if (dataset_->GetGeoTransform(geotransform_.data()) != CE_None) {
            throw GeoTransformError(filename + " has no affine geotransform");
        }
        if (!GDALInvGeoTransform(geotransform_.data(), inverse_.data())) {
            throw GeoTransformError(filename + " has a non-invertible geotransform");
        }

        int has_nodata = 0;
        double nodata = band_->GetNoDataValue(&has_nodata);
        if (has_nodata) {
            nodata_value_ = nodata;
        }

        std::ostringstream msg;
        msg << "Opened elevation raster " << filename << ": "
            << width_ << " x " << height_ << " pixels, resampling "
            << to_string(strategy_);
        logger_.info(msg.str());

        std::ostringstream gt_msg;
        gt_msg.precision(12);
        gt_msg << "Geotransform: [" << geotransform_[0] << ", " << geotransform_[1] << ", "
               << geotransform_[2] << ", " << geotransform_[3] << ", "
               << geotransform_[4] << ", " << geotransform_[5] << "]";
        logger_.debug(gt_msg.str());
        if (nodata_value_) {
            logger_.debug("NoData value: " + std::to_string(*nodata_value_));
        }
    }

    PixelPosition to_pixel(const Coordinate& coordinate) const {
        PixelPosition pixel;
        GDALApplyGeoTransform(const_cast<double*>(inverse_.data()),
                              coordinate.lon, coordinate.lat, &pixel.x, &pixel.y);
        return pixel;
    }

    double sample(const Coordinate& coordinate) const {
        PixelPosition pixel = to_pixel(coordinate);

        constexpr double INDEX_LIMIT = static_cast<double>(std::numeric_limits<int>::max());
        if (!std::isfinite(pixel.x) || !std::isfinite(pixel.y) ||
            std::fabs(pixel.x) >= INDEX_LIMIT || std::fabs(pixel.y) >= INDEX_LIMIT) {
            throw SamplingError(describe(coordinate) + " maps to an unusable pixel position in " +
                                filename_);
        }

        std::int64_t px = truncate_pixel_index(pixel.x);
        std::int64_t py = truncate_pixel_index(pixel.y);

        if (px < 0 || py < 0 || px >= width_ || py >= height_) {
            std::ostringstream msg;
            msg << describe(coordinate) << " maps to pixel (" << px << ", " << py
                << ") outside raster " << filename_ << " of " << width_ << " x " << height_;
            throw SamplingError(msg.str());
        }

        GDALRasterIOExtraArg extra_arg;
        INIT_RASTERIO_EXTRA_ARG(extra_arg);
        extra_arg.eResampleAlg = to_gdal_resampling(strategy_);

        double value = 0.0;
        CPLErrorReset();
        CPLErr err = band_->RasterIO(GF_Read, static_cast<int>(px), static_cast<int>(py), 1, 1,
                                     &value, 1, 1, GDT_Float64, 0, 0, &extra_arg);
        if (err != CE_None) {
            std::ostringstream msg;
            msg << "reading pixel (" << px << ", " << py << ") of " << filename_
                << " for " << describe(coordinate) << " failed: " << last_gdal_error();
            throw SamplingError(msg.str());
        }

        // Non-finite values are rejected even when NoData is allowed
        if (!std::isfinite(value)) {
            throw SamplingError(describe(coordinate) + " has a non-finite elevation in " +
                                filename_);
        }
        if (!allow_nodata_) {
            if (nodata_value_ && value == *nodata_value_) {
                std::ostringstream msg;
                msg << describe(coordinate) << " falls on a NoData cell (" << px << ", " << py
                    << ") of " << filename_;
                throw SamplingError(msg.str());
            }
        }

        if (logger_.shouldOutput(LogLevel::TRACE)) {
            std::ostringstream msg;
            msg.precision(9);
            msg << describe(coordinate) << " -> pixel (" << pixel.x << ", " << pixel.y
                << ") -> (" << px << ", " << py << ") = " << value;
            logger_.trace(msg.str());
        }

        return value;
    }

    std::string filename_;
    ResamplingStrategy strategy_;
    bool allow_nodata_;
    GDALDatasetPtr dataset_;
    GDALRasterBand* band_ = nullptr;  // Owned by dataset_
    int width_ = 0;
    int height_ = 0;
    std::array<double, 6> geotransform_{};
    std::array<double, 6> inverse_{};
    std::optional<double> nodata_value_;
    Logger logger_;
};

// ============================================================================
// ElevationSampler public interface
// ============================================================================

ElevationSampler::ElevationSampler(const std::string& filename, ResamplingStrategy strategy,
                                   bool allow_nodata)
    : impl_(std::make_unique<Impl>(filename, strategy, allow_nodata)) {}

ElevationSampler::~ElevationSampler() = default;

ElevationSampler::ElevationSampler(ElevationSampler&&) noexcept = default;
ElevationSampler& ElevationSampler::operator=(ElevationSampler&&) noexcept = default;

double ElevationSampler::sample(const Coordinate& coordinate) const {
    return impl_->sample(coordinate);
}

PixelPosition ElevationSampler::to_pixel(const Coordinate& coordinate) const {
    return impl_->to_pixel(coordinate);
}

std::int64_t ElevationSampler::truncate_pixel_index(double fractional) {
    return static_cast<std::int64_t>(fractional);
}

std::pair<int, int> ElevationSampler::get_raster_dimensions() const {
    return {impl_->width_, impl_->height_};
}

std::array<double, 6> ElevationSampler::get_geotransform() const {
    return impl_->geotransform_;
}

std::array<double, 6> ElevationSampler::get_inverse_geotransform() const {
    return impl_->inverse_;
}

std::optional<double> ElevationSampler::get_nodata_value() const {
    return impl_->nodata_value_;
}

ResamplingStrategy ElevationSampler::get_resampling() const {
    return impl_->strategy_;
}

const std::string& ElevationSampler::get_filename() const {
    return impl_->filename_;
}

} // namespace wayslope
