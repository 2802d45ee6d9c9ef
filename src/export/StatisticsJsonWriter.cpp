/**
 * @file StatisticsJsonWriter.cpp
 * @brief Implementation of slope statistics JSON export
 */

#include "StatisticsJsonWriter.hpp"
#include "SlopeErrors.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace wayslope {

namespace {

void add_statistics_fields(nlohmann::ordered_json& record, const WayStatistics& stats) {
    record["distance"] = stats.distance;
    record["climb_distance"] = stats.climb_distance;
    record["descent_distance"] = stats.descent_distance;
    record["climb"] = stats.climb;
    record["descent"] = stats.descent;
}

} // namespace

StatisticsJsonWriter::StatisticsJsonWriter()
    : options_() {}

StatisticsJsonWriter::StatisticsJsonWriter(const Options& options)
    : options_(options) {}

nlohmann::ordered_json StatisticsJsonWriter::to_json(
    const std::vector<WayStatistics>& statistics) const {

    std::vector<const WayStatistics*> sorted;
    sorted.reserve(statistics.size());
    for (const auto& stats : statistics) {
        sorted.push_back(&stats);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const WayStatistics* a, const WayStatistics* b) { return a->way_id < b->way_id; });

    if (options_.shape == OutputShape::ARRAY_OF_RECORDS) {
        nlohmann::ordered_json records = nlohmann::ordered_json::array();
        for (const WayStatistics* stats : sorted) {
            nlohmann::ordered_json record;
            record["way_id"] = stats->way_id;
            add_statistics_fields(record, *stats);
            records.push_back(std::move(record));
        }
        return records;
    }

    // Shape A: string keys, inserted in numeric id order
    nlohmann::ordered_json by_id = nlohmann::ordered_json::object();
    for (const WayStatistics* stats : sorted) {
        nlohmann::ordered_json record = nlohmann::ordered_json::object();
        add_statistics_fields(record, *stats);
        by_id[std::to_string(stats->way_id)] = std::move(record);
    }
    return by_id;
}

std::string StatisticsJsonWriter::to_json_string(
    const std::vector<WayStatistics>& statistics) const {
    try {
        return to_json(statistics).dump(options_.indent);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(e.what());
    }
}

void StatisticsJsonWriter::write(const std::vector<WayStatistics>& statistics,
                                 const std::string& filename) const {
    Logger logger("StatisticsJsonWriter");

    std::string document = to_json_string(statistics);

    std::ofstream file(filename, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw OutputWriteError(filename + ": " + std::strerror(errno));
    }

    file << document;
    file.flush();
    if (!file) {
        throw OutputWriteError(filename + ": write failed");
    }
    file.close();

    logger.info("Exported statistics of " + std::to_string(statistics.size()) +
                " ways (" + to_string(options_.shape) + " shape): " + filename);
    logger.debug("Wrote " + std::to_string(document.size()) + " bytes");
}

} // namespace wayslope
