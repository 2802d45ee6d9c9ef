/**
 * @file OsmPbfReader.cpp
 * @brief OSM PBF blob framing, decompression and primitive decoding
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "OsmPbfReader.hpp"
#include "SlopeErrors.hpp"

#include <osmpbf/fileformat.pb.h>
#include <osmpbf/osmformat.pb.h>
#include <zlib.h>
#include <arpa/inet.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace wayslope {

namespace {

const std::string& string_at(const OSMPBF::StringTable& table, std::uint32_t index) {
    if (index >= static_cast<std::uint32_t>(table.s_size())) {
        throw ParseError("string table index " + std::to_string(index) +
                         " out of range (" + std::to_string(table.s_size()) + " entries)");
    }
    return table.s(static_cast<int>(index));
}

// Delta decoding on untrusted input; wraparound is a format error
std::int64_t add_delta(std::int64_t total, std::int64_t delta, const char* what) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(total, delta, &result)) {
        throw ParseError(std::string("delta-coded ") + what + " overflows 64 bits");
    }
    return result;
}

std::string inflate_blob(const OSMPBF::Blob& blob, const std::string& filename) {
    if (blob.has_raw()) {
        return blob.raw();
    }

    if (!blob.has_zlib_data()) {
        throw ParseError(filename + ": unsupported blob compression (only raw and zlib)");
    }
    if (!blob.has_raw_size() || blob.raw_size() < 0 ||
        blob.raw_size() > OsmPbfReader::MAX_BLOB_SIZE) {
        throw ParseError(filename + ": invalid raw_size " + std::to_string(blob.raw_size()));
    }

    std::string output(static_cast<size_t>(blob.raw_size()), '\0');
    uLongf output_size = static_cast<uLongf>(output.size());
    const std::string& compressed = blob.zlib_data();

    int result = uncompress(reinterpret_cast<Bytef*>(output.data()), &output_size,
                            reinterpret_cast<const Bytef*>(compressed.data()),
                            static_cast<uLong>(compressed.size()));
    if (result != Z_OK) {
        throw ParseError(filename + ": zlib decompression failed (code " +
                         std::to_string(result) + ")");
    }
    if (output_size != output.size()) {
        throw ParseError(filename + ": decompressed " + std::to_string(output_size) +
                         " bytes, expected " + std::to_string(output.size()));
    }
    return output;
}

} // namespace

OsmPbfReader::OsmPbfReader(const std::string& filename)
    : filename_(filename), logger_("OsmPbfReader") {
}

double OsmPbfReader::decode_coordinate(std::int64_t offset, std::int32_t granularity,
                                       std::int64_t value) {
    std::int64_t scaled = 0;
    std::int64_t nanodegrees = 0;
    if (__builtin_mul_overflow(static_cast<std::int64_t>(granularity), value, &scaled) ||
        __builtin_add_overflow(offset, scaled, &nanodegrees)) {
        throw ParseError("coordinate " + std::to_string(value) + " with granularity " +
                         std::to_string(granularity) + " and offset " + std::to_string(offset) +
                         " overflows 64 bits");
    }
    return static_cast<double>(nanodegrees) * 1e-9;
}

bool OsmPbfReader::is_supported_feature(const std::string& feature) {
    return feature == "OsmSchema-V0.6" ||
           feature == "DenseNodes" ||
           feature == "HistoricalInformation";
}

Network OsmPbfReader::read(const WaySelector& selector) {
    logger_.info("Reading OSM network from " + filename_);

    Network network;
    std::unordered_set<ObjectId> needed;
    size_t ways_seen = 0;

    // Pass 1: ways
    for_each_data_block([&](const OSMPBF::PrimitiveBlock& block) {
        for (const auto& group : block.primitivegroup()) {
            ways_seen += static_cast<size_t>(group.ways_size());
        }
        collect_ways(block, selector, network, needed);
    });

    logger_.detailed("Selected " + std::to_string(network.ways.size()) + " of " +
                     std::to_string(ways_seen) + " ways, " +
                     std::to_string(needed.size()) + " distinct nodes referenced");

    // Pass 2: referenced nodes
    if (!needed.empty()) {
        for_each_data_block([&](const OSMPBF::PrimitiveBlock& block) {
            collect_nodes(block, needed, network.nodes);
        });
    }

    for (const auto& way : network.ways) {
        for (ObjectId node_id : way.nodes) {
            if (network.nodes.find(node_id) == network.nodes.end()) {
                throw ParseError(filename_ + ": way " + std::to_string(way.id) +
                                 " references node " + std::to_string(node_id) +
                                 " which is not in the file");
            }
        }
    }

    logger_.info("Loaded " + std::to_string(network.ways.size()) + " ways and " +
                 std::to_string(network.nodes.size()) + " nodes (" +
                 std::to_string(file_info_.data_blocks) + " data blocks)");
    return network;
}

void OsmPbfReader::for_each_data_block(const BlockVisitor& visit) {
    std::ifstream input(filename_, std::ios::binary);
    if (!input) {
        throw InputOpenError(filename_ + ": " + std::strerror(errno));
    }

    file_info_ = PbfFileInfo{};

    std::string type;
    std::string payload;
    while (read_blob(input, type, payload)) {
        if (type == "OSMHeader") {
            OSMPBF::HeaderBlock header;
            if (!header.ParseFromString(payload)) {
                throw ParseError(filename_ + ": malformed HeaderBlock");
            }
            check_header(header);
            file_info_.header_blocks++;
        } else if (type == "OSMData") {
            OSMPBF::PrimitiveBlock block;
            if (!block.ParseFromString(payload)) {
                throw ParseError(filename_ + ": malformed PrimitiveBlock in data block " +
                                 std::to_string(file_info_.data_blocks));
            }
            file_info_.data_blocks++;
            visit(block);
        } else {
            logger_.debug("Skipping unknown block type '" + type + "'");
            file_info_.skipped_blocks++;
        }
    }
}

bool OsmPbfReader::read_blob(std::ifstream& input, std::string& type, std::string& payload) {
    std::uint32_t header_size = 0;
    input.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (input.gcount() == 0 && input.eof()) {
        return false;
    }
    if (input.gcount() != sizeof(header_size)) {
        throw ParseError(filename_ + ": truncated blob header length");
    }

    header_size = ntohl(header_size);
    if (header_size > MAX_BLOB_HEADER_SIZE) {
        throw ParseError(filename_ + ": BlobHeader of " + std::to_string(header_size) +
                         " bytes exceeds " + std::to_string(MAX_BLOB_HEADER_SIZE));
    }

    std::string buffer(header_size, '\0');
    input.read(buffer.data(), header_size);
    if (static_cast<std::uint32_t>(input.gcount()) != header_size) {
        throw ParseError(filename_ + ": truncated BlobHeader");
    }

    OSMPBF::BlobHeader header;
    if (!header.ParseFromString(buffer)) {
        throw ParseError(filename_ + ": malformed BlobHeader");
    }
    if (header.datasize() < 0 || header.datasize() > MAX_BLOB_SIZE) {
        throw ParseError(filename_ + ": blob of " + std::to_string(header.datasize()) +
                         " bytes exceeds " + std::to_string(MAX_BLOB_SIZE));
    }

    buffer.assign(static_cast<size_t>(header.datasize()), '\0');
    input.read(buffer.data(), header.datasize());
    if (input.gcount() != header.datasize()) {
        throw ParseError(filename_ + ": truncated '" + header.type() + "' blob");
    }

    OSMPBF::Blob blob;
    if (!blob.ParseFromString(buffer)) {
        throw ParseError(filename_ + ": malformed Blob");
    }

    type = header.type();
    payload = inflate_blob(blob, filename_);
    return true;
}

void OsmPbfReader::check_header(const OSMPBF::HeaderBlock& header) {
    for (const auto& feature : header.required_features()) {
        if (!is_supported_feature(feature)) {
            throw ParseError(filename_ + ": unsupported required feature '" + feature + "'");
        }
        file_info_.required_features.push_back(feature);
    }
    for (const auto& feature : header.optional_features()) {
        file_info_.optional_features.push_back(feature);
    }

    file_info_.writing_program = header.writingprogram();
    file_info_.source = header.source();
    logger_.debug("PBF header: writing program '" + file_info_.writing_program + "', " +
                  std::to_string(file_info_.required_features.size()) + " required features");
}

void OsmPbfReader::collect_ways(const OSMPBF::PrimitiveBlock& block, const WaySelector& selector,
                                Network& network, std::unordered_set<ObjectId>& needed) const {
    const auto& strings = block.stringtable();

    for (const auto& group : block.primitivegroup()) {
        for (const auto& pbf_way : group.ways()) {
            if (pbf_way.keys_size() != pbf_way.vals_size()) {
                throw ParseError(filename_ + ": way " + std::to_string(pbf_way.id()) +
                                 " has mismatched key/value counts");
            }

            TagMap tags;
            for (int i = 0; i < pbf_way.keys_size(); ++i) {
                tags[string_at(strings, pbf_way.keys(i))] = string_at(strings, pbf_way.vals(i));
            }

            if (!selector(tags)) {
                continue;
            }

            Way way;
            way.id = pbf_way.id();
            way.tags = std::move(tags);
            way.nodes.reserve(static_cast<size_t>(pbf_way.refs_size()));

            ObjectId ref = 0;
            for (std::int64_t delta : pbf_way.refs()) {
                ref = add_delta(ref, delta, "way node reference");
                way.nodes.push_back(ref);
                needed.insert(ref);
            }

            network.ways.push_back(std::move(way));
        }
    }
}

void OsmPbfReader::collect_nodes(const OSMPBF::PrimitiveBlock& block,
                                 const std::unordered_set<ObjectId>& needed,
                                 NodeLookup& nodes) const {
    const std::int64_t lat_offset = block.lat_offset();
    const std::int64_t lon_offset = block.lon_offset();
    const std::int32_t granularity = block.granularity();

    for (const auto& group : block.primitivegroup()) {
        for (const auto& pbf_node : group.nodes()) {
            if (needed.count(pbf_node.id()) == 0) {
                continue;
            }
            nodes[pbf_node.id()] = Node(pbf_node.id(),
                                        decode_coordinate(lat_offset, granularity, pbf_node.lat()),
                                        decode_coordinate(lon_offset, granularity, pbf_node.lon()));
        }

        if (!group.has_dense()) {
            continue;
        }

        const auto& dense = group.dense();
        if (dense.id_size() != dense.lat_size() || dense.id_size() != dense.lon_size()) {
            throw ParseError(filename_ + ": dense node block has " +
                             std::to_string(dense.id_size()) + " ids but " +
                             std::to_string(dense.lat_size()) + " latitudes and " +
                             std::to_string(dense.lon_size()) + " longitudes");
        }

        std::int64_t id = 0;
        std::int64_t lat = 0;
        std::int64_t lon = 0;
        for (int i = 0; i < dense.id_size(); ++i) {
            id = add_delta(id, dense.id(i), "dense node id");
            lat = add_delta(lat, dense.lat(i), "dense node latitude");
            lon = add_delta(lon, dense.lon(i), "dense node longitude");

            if (needed.count(id) == 0) {
                continue;
            }
            nodes[id] = Node(id,
                             decode_coordinate(lat_offset, granularity, lat),
                             decode_coordinate(lon_offset, granularity, lon));
        }
    }
}

} // namespace wayslope
