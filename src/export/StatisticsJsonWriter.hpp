/**
 * @file StatisticsJsonWriter.hpp
 * @brief JSON export of per-way slope statistics
 *
 * Writes one record per way, either as an object keyed by way id or as an
 * array of records carrying the way id, in ascending way id order.
 */

#pragma once

#include "way_slope.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wayslope {

/**
 * @brief Serializes WayStatistics records to a JSON document
 *
 * Output is deterministic: the same records always produce the same bytes.
 */
class StatisticsJsonWriter {
public:
    struct Options {
        OutputShape shape;
        int indent;  // < 0 = compact

        Options()
            : shape(OutputShape::OBJECT_BY_WAY_ID),
              indent(-1) {}
    };

    StatisticsJsonWriter();
    explicit StatisticsJsonWriter(const Options& options);

    /**
     * @brief Build the JSON document
     * @param statistics Records in any order
     * @return Object keyed by way id, or array of records
     */
    nlohmann::ordered_json to_json(const std::vector<WayStatistics>& statistics) const;

    /**
     * @brief Serialize to text
     * @throws SerializationError if the document cannot be dumped
     */
    std::string to_json_string(const std::vector<WayStatistics>& statistics) const;

    /**
     * @brief Write the document to a file, replacing any existing file
     * @throws SerializationError, OutputWriteError
     */
    void write(const std::vector<WayStatistics>& statistics, const std::string& filename) const;

    const Options& get_options() const { return options_; }

private:
    Options options_;
};

} // namespace wayslope
