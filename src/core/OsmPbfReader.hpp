#pragma once

/**
 * @file OsmPbfReader.hpp
 * @brief OSM PBF network reader (ways and the nodes they reference)
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace OSMPBF {
class HeaderBlock;
class PrimitiveBlock;
}

namespace wayslope {

/**
 * @brief Contents of the OSMHeader block plus block counts
 */
struct PbfFileInfo {
    std::string writing_program;
    std::string source;
    std::vector<std::string> required_features;
    std::vector<std::string> optional_features;
    size_t header_blocks = 0;
    size_t data_blocks = 0;
    size_t skipped_blocks = 0;
};

/**
 * @brief Reads the ways selected by a tag predicate and all of their nodes
 *
 * The file is streamed twice. The first pass decodes ways, keeps those the
 * selector accepts and records their node ids. The second pass decodes plain
 * and dense nodes and keeps only recorded ids. Relations are ignored.
 */
class OsmPbfReader {
public:
    using WaySelector = std::function<bool(const TagMap&)>;

    static constexpr std::uint32_t MAX_BLOB_HEADER_SIZE = 64 * 1024;
    static constexpr std::int32_t MAX_BLOB_SIZE = 32 * 1024 * 1024;

    explicit OsmPbfReader(const std::string& filename);

    /**
     * @brief Parse the network
     * @throws InputOpenError if the file cannot be opened
     * @throws ParseError on malformed or truncated data, unsupported
     *         features or compression, or a selected way whose node is
     *         missing from the file
     */
    Network read(const WaySelector& selector);

    const PbfFileInfo& get_file_info() const { return file_info_; }
    const std::string& get_filename() const { return filename_; }

    /**
     * @brief Whether a required_features entry can be honored
     */
    static bool is_supported_feature(const std::string& feature);

    /**
     * @brief Convert a block-relative coordinate to degrees
     * @throws ParseError if offset + granularity * value overflows
     */
    static double decode_coordinate(std::int64_t offset, std::int32_t granularity,
                                    std::int64_t value);

private:
    using BlockVisitor = std::function<void(const OSMPBF::PrimitiveBlock&)>;

    void for_each_data_block(const BlockVisitor& visit);
    bool read_blob(std::ifstream& input, std::string& type, std::string& payload);
    void check_header(const OSMPBF::HeaderBlock& header);

    void collect_ways(const OSMPBF::PrimitiveBlock& block, const WaySelector& selector,
                      Network& network, std::unordered_set<ObjectId>& needed) const;
    void collect_nodes(const OSMPBF::PrimitiveBlock& block,
                       const std::unordered_set<ObjectId>& needed, NodeLookup& nodes) const;

    std::string filename_;
    PbfFileInfo file_info_;
    Logger logger_;
};

} // namespace wayslope
