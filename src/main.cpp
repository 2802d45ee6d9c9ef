/**
 * @file main.cpp
 * @brief Main entry point for the way slope tool
 *
 * Reads an OpenStreetMap PBF network and an elevation raster and writes
 * per-way distance, climb and descent statistics as JSON.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include "SlopeErrors.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include <iostream>
#include <filesystem>

using namespace wayslope;

/**
 * @brief Check that both input files exist and are regular files
 * @throws InputOpenError naming the first unusable input
 */
void validate_input_files(const SlopeConfig& config) {
    for (const std::string* path : {&config.osm_file, &config.elevation_file}) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*path, ec)) {
            throw InputOpenError(*path + ": " + (ec ? ec.message() : "not a regular file"));
        }
    }
}

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    Logger logger("way-slope");
    logger.detailed("=== Performance Summary ===");
    logger.detailed("Network loading: " + std::to_string(metrics.network_loading_time.count()) + "ms");
    logger.detailed("Way selection:   " + std::to_string(metrics.selection_time.count()) + "ms");
    logger.detailed("Sampling:        " + std::to_string(metrics.sampling_time.count()) + "ms");
    logger.detailed("Aggregation:     " + std::to_string(metrics.aggregation_time.count()) + "ms");
    logger.detailed("Export:          " + std::to_string(metrics.export_time.count()) + "ms");
    logger.detailed("Total time:      " + std::to_string(metrics.total_time.count()) + "ms");
    logger.detailed("Ways selected:   " + std::to_string(metrics.ways_selected) + " of " +
                    std::to_string(metrics.ways_in_network));
    logger.detailed("Nodes sampled:   " + std::to_string(metrics.nodes_sampled));
    logger.detailed("Segments walked: " + std::to_string(metrics.segments_walked));
}

/**
 * @brief Main entry point
 *
 * Exit codes: 0 success (also help, version and create-config), 1 run
 * failure, 2 usage or configuration error.
 */
int main(int argc, char* argv[]) {
    Logger logger("way-slope");

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();
        }

        const SlopeConfig& config = cli.get_config();
        cli.print_config();

        if (config.dry_run) {
            validate_input_files(config);
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        WaySlopeProcessor processor(config);
        processor.process();

        print_performance_summary(processor.get_metrics());
        logger.flush();
        return 0;

    } catch (const ConfigurationError& e) {
        logger.error(e.what());
        logger.flush();
        return 2;
    } catch (const SlopeError& e) {
        logger.error(e.what());
        logger.flush();
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        logger.flush();
        return 1;
    }
}
