/**
 * Shared helpers for way-slope unit tests: scratch directories, synthetic
 * GeoTIFF rasters and synthetic OSM PBF files.
 */
#pragma once

#include "way_slope.hpp"

#include <gdal_priv.h>
#include <osmpbf/fileformat.pb.h>
#include <osmpbf/osmformat.pb.h>
#include <zlib.h>
#include <arpa/inet.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace wayslope::test {

/**
 * Scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("wayslope-test-" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * Write a single-band Float64 GeoTIFF. values are row-major, width*height.
 */
inline void write_geotiff(const std::string& filename, int width, int height,
                          const std::array<double, 6>& geotransform,
                          const std::vector<double>& values,
                          std::optional<double> nodata = std::nullopt) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw std::runtime_error("GTiff driver unavailable");
    }

    GDALDataset* dataset = driver->Create(filename.c_str(), width, height, 1, GDT_Float64, nullptr);
    if (!dataset) {
        throw std::runtime_error("cannot create " + filename);
    }

    std::array<double, 6> gt = geotransform;
    dataset->SetGeoTransform(gt.data());

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (nodata) {
        band->SetNoDataValue(*nodata);
    }

    std::vector<double> pixels = values;
    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height, pixels.data(),
                                width, height, GDT_Float64, 0, 0);
    GDALClose(dataset);
    if (err != CE_None) {
        throw std::runtime_error("cannot write pixels of " + filename);
    }
}

/**
 * Geotransform of a north-up raster with its top-left corner at
 * (origin_lon, origin_lat) and square cells of `cell` degrees
 */
inline std::array<double, 6> north_up(double origin_lon, double origin_lat, double cell) {
    return {origin_lon, cell, 0.0, origin_lat, 0.0, -cell};
}

/**
 * Builds an OSM PBF file block by block
 */
class PbfBuilder {
public:
    struct TestWay {
        ObjectId id;
        std::vector<ObjectId> refs;
        TagMap tags;
    };

    explicit PbfBuilder(bool compress = true) : compress_(compress) {
        header_.add_required_features("OsmSchema-V0.6");
        header_.add_required_features("DenseNodes");
        header_.set_writingprogram("wayslope-tests");
    }

    void add_required_feature(const std::string& feature) {
        header_.add_required_features(feature);
    }

    void set_compress(bool compress) { compress_ = compress; }

    /// One OSMData block with dense nodes
    void add_dense_block(const std::vector<Node>& nodes) {
        OSMPBF::PrimitiveBlock block = new_block();
        OSMPBF::DenseNodes* dense = block.add_primitivegroup()->mutable_dense();

        std::int64_t last_id = 0;
        std::int64_t last_lat = 0;
        std::int64_t last_lon = 0;
        for (const auto& node : nodes) {
            std::int64_t lat = to_units(node.lat);
            std::int64_t lon = to_units(node.lon);
            dense->add_id(node.id - last_id);
            dense->add_lat(lat - last_lat);
            dense->add_lon(lon - last_lon);
            dense->add_keys_vals(0);
            last_id = node.id;
            last_lat = lat;
            last_lon = lon;
        }
        data_blocks_.push_back(block);
    }

    /// One OSMData block with plain (non-dense) nodes
    void add_plain_block(const std::vector<Node>& nodes) {
        OSMPBF::PrimitiveBlock block = new_block();
        OSMPBF::PrimitiveGroup* group = block.add_primitivegroup();
        for (const auto& node : nodes) {
            OSMPBF::Node* pbf_node = group->add_nodes();
            pbf_node->set_id(node.id);
            pbf_node->set_lat(to_units(node.lat));
            pbf_node->set_lon(to_units(node.lon));
        }
        data_blocks_.push_back(block);
    }

    /// One OSMData block with ways
    void add_way_block(const std::vector<TestWay>& ways) {
        OSMPBF::PrimitiveBlock block = new_block();
        std::map<std::string, std::uint32_t> strings;
        auto string_id = [&](const std::string& s) {
            auto it = strings.find(s);
            if (it != strings.end()) return it->second;
            auto id = static_cast<std::uint32_t>(block.stringtable().s_size());
            block.mutable_stringtable()->add_s(s);
            strings.emplace(s, id);
            return id;
        };

        OSMPBF::PrimitiveGroup* group = block.add_primitivegroup();
        for (const auto& way : ways) {
            OSMPBF::Way* pbf_way = group->add_ways();
            pbf_way->set_id(way.id);
            for (const auto& [key, value] : way.tags) {
                pbf_way->add_keys(string_id(key));
                pbf_way->add_vals(string_id(value));
            }
            ObjectId last = 0;
            for (ObjectId ref : way.refs) {
                pbf_way->add_refs(ref - last);
                last = ref;
            }
        }
        data_blocks_.push_back(block);
    }

    /// Raw block of an arbitrary type, stored uncompressed
    void add_unknown_block(const std::string& type, const std::string& payload) {
        extra_blocks_.emplace_back(type, payload);
    }

    void write(const std::string& filename) const {
        std::ofstream out(filename, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot create " + filename);
        }

        write_blob(out, "OSMHeader", header_.SerializeAsString(), compress_);
        for (const auto& [type, payload] : extra_blocks_) {
            write_blob(out, type, payload, false);
        }
        for (const auto& block : data_blocks_) {
            write_blob(out, "OSMData", block.SerializeAsString(), compress_);
        }
    }

    static void write_blob(std::ofstream& out, const std::string& type,
                           const std::string& payload, bool compress) {
        OSMPBF::Blob blob;
        if (compress) {
            uLongf bound = compressBound(static_cast<uLong>(payload.size()));
            std::string compressed(bound, '\0');
            if (compress2(reinterpret_cast<Bytef*>(compressed.data()), &bound,
                          reinterpret_cast<const Bytef*>(payload.data()),
                          static_cast<uLong>(payload.size()), Z_DEFAULT_COMPRESSION) != Z_OK) {
                throw std::runtime_error("zlib compression failed");
            }
            compressed.resize(bound);
            blob.set_zlib_data(compressed);
            blob.set_raw_size(static_cast<std::int32_t>(payload.size()));
        } else {
            blob.set_raw(payload);
        }
        std::string blob_bytes = blob.SerializeAsString();

        OSMPBF::BlobHeader header;
        header.set_type(type);
        header.set_datasize(static_cast<std::int32_t>(blob_bytes.size()));
        std::string header_bytes = header.SerializeAsString();

        std::uint32_t size = htonl(static_cast<std::uint32_t>(header_bytes.size()));
        out.write(reinterpret_cast<const char*>(&size), sizeof(size));
        out.write(header_bytes.data(), static_cast<std::streamsize>(header_bytes.size()));
        out.write(blob_bytes.data(), static_cast<std::streamsize>(blob_bytes.size()));
    }

private:
    static constexpr std::int32_t GRANULARITY = 100;

    static std::int64_t to_units(double degrees) {
        return static_cast<std::int64_t>(std::llround(degrees * 1e9 / GRANULARITY));
    }

    OSMPBF::PrimitiveBlock new_block() const {
        OSMPBF::PrimitiveBlock block;
        block.mutable_stringtable()->add_s("");
        block.set_granularity(GRANULARITY);
        return block;
    }

    bool compress_;
    OSMPBF::HeaderBlock header_;
    std::vector<OSMPBF::PrimitiveBlock> data_blocks_;
    std::vector<std::pair<std::string, std::string>> extra_blocks_;
};

} // namespace wayslope::test
