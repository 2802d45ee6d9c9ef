/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "SlopeErrors.hpp"
#include "TagFilter.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

namespace wayslope {

namespace {

int parse_level_number(const std::string& text, const std::string& source) {
    int level = 0;
    std::istringstream iss(text);
    if (!(iss >> level) || !iss.eof() || level < 1 || level > 6) {
        throw ConfigurationError("invalid log level '" + text + "' from " + source +
                                 " (expected 1-6)");
    }
    return level;
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("way-slope",
        "Computes distance, climb and descent of every selected OpenStreetMap way\n"
        "by sampling an elevation raster at each of the way's nodes.\n");

    // Configuration file options
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // Selection and sampling options
    parser.add_option("filter", "f", "Way filter: comma-separated key or key=value conditions");
    parser.add_option("resampling", "", "Resampling for the raster read: nearest, bilinear");
    parser.add_flag("allow-nodata", "", "Use raw NoData values as elevations (they enter climb and descent)");
    parser.add_flag("legacy-climb-distance", "", "Accumulate the running way distance per segment");

    // Output options
    parser.add_option("output-shape", "", "JSON layout: object, array");
    parser.add_option("indent", "", "Pretty-print JSON with N spaces");

    // Logging and utility options
    parser.add_flag("silent", "s", "Errors only (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                Supports facility-specific: \"3,ElevationSampler=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Validate options and inputs without processing");
    parser.add_flag("version", "", "Show version information");

    exit_code_ = 0;

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "way-slope v" << WAYSLOPE_VERSION_STRING << std::endl;
        std::cout << "Per-way slope statistics from OpenStreetMap and elevation rasters" << std::endl;
        std::cout << "Built with GDAL, Protocol Buffers, zlib, nlohmann/json" << std::endl;
        return false;
    }

    // Handle create-config option
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        load_config_file(config_file.value());
        config_.config_file = config_file.value();
    }

    // Positional arguments override the configuration file
    const auto& positional = parser.get_positional();
    if (positional.size() == 3) {
        config_.osm_file = positional[0];
        config_.elevation_file = positional[1];
        config_.output_file = positional[2];
    } else if (!positional.empty()) {
        std::cerr << "Expected OSM_FILE ELEVATION_FILE OUTPUT_FILE, got "
                  << positional.size() << " argument(s)" << std::endl;
        std::cerr << "Run 'way-slope --help' for usage" << std::endl;
        exit_code_ = 2;
        return false;
    }

    parse_all_options(parser);
    parse_logging_options(parser);

    std::string missing;
    if (config_.osm_file.empty()) missing += " OSM_FILE";
    if (config_.elevation_file.empty()) missing += " ELEVATION_FILE";
    if (config_.output_file.empty()) missing += " OUTPUT_FILE";
    if (!missing.empty()) {
        std::cerr << "Missing required argument(s):" << missing << std::endl;
        std::cerr << "Run 'way-slope --help' for usage" << std::endl;
        exit_code_ = 2;
        return false;
    }

    // Reject malformed filters before any input is read
    parse_filter_spec(config_.filter);

    apply_logging_config();
    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("filter")) config_.filter = value.value();
    if (auto value = parser.get("resampling")) config_.resampling = parse_resampling(value.value());
    if (auto value = parser.get("output-shape")) config_.output_shape = parse_shape(value.value());

    if (parser.get_flag("allow-nodata")) config_.allow_nodata = true;
    if (parser.get_flag("legacy-climb-distance")) {
        config_.climb_distance_mode = ClimbDistanceMode::LEGACY_CUMULATIVE;
    }

    if (auto value = parser.get("indent")) {
        auto indent = parser.get_as<int>("indent");
        if (!indent.has_value() || indent.value() < 0) {
            throw ConfigurationError("invalid --indent '" + value.value() +
                                     "' (expected a non-negative integer)");
        }
        config_.json_indent = indent.value();
    }

    if (parser.get_flag("dry-run")) config_.dry_run = true;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > config file > defaults
    // 1. Environment variable
    const char* env_log_level = std::getenv("WAYSLOPE_LOG_LEVEL");
    if (env_log_level) {
        parse_log_level(env_log_level);
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        parse_log_level(value.value());
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        config_.log_config.reset();
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        config_.log_config.reset();
    }

    // 4. Log file configuration
    const char* env_log_file = std::getenv("WAYSLOPE_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
}

void CommandLineInterface::parse_log_level(const std::string& value) {
    if (value.find('=') == std::string::npos) {
        config_.log_level = parse_level_number(value, "log level");
        config_.log_config.reset();
        return;
    }

    // Facility-specific form; a leading bare number is the default level
    size_t comma_pos = value.find(',');
    std::string first_part = value.substr(0, comma_pos);
    if (first_part.find('=') == std::string::npos) {
        config_.log_level = parse_level_number(first_part, "log level");
    }
    config_.log_config = value;
}

void CommandLineInterface::apply_logging_config() const {
    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));

    if (config_.log_config.has_value() && !Logger::parseLogConfig(config_.log_config.value())) {
        throw ConfigurationError("invalid log configuration '" + config_.log_config.value() + "'");
    }

    if (config_.log_file.has_value() && !Logger::setLogFile(config_.log_file)) {
        throw ConfigurationError("cannot open log file '" + config_.log_file.value() + "'");
    }
}

void CommandLineInterface::print_config() const {
    Logger logger("CommandLineInterface");

    logger.detailed("=== way-slope Configuration ===");
    logger.detailed("OSM file:        " + config_.osm_file);
    logger.detailed("Elevation file:  " + config_.elevation_file);
    logger.detailed("Output file:     " + config_.output_file);
    logger.detailed("Filter:          " + to_string(parse_filter_spec(config_.filter)));
    logger.detailed("Resampling:      " + to_string(config_.resampling));
    logger.detailed("NoData samples:  " + std::string(config_.allow_nodata ? "allowed" : "rejected"));
    logger.detailed("Climb distance:  " + to_string(config_.climb_distance_mode));
    logger.detailed("Output shape:    " + to_string(config_.output_shape));
    logger.detailed("JSON indent:     " + (config_.json_indent < 0 ? std::string("compact")
                                                                   : std::to_string(config_.json_indent)));
    if (config_.config_file.has_value()) {
        logger.detailed("Config file:     " + config_.config_file.value());
    }
    if (config_.log_file.has_value()) {
        logger.detailed("Log file:        " + config_.log_file.value());
    }
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    const std::string default_config = R"({
  "osm_file": "",
  "elevation_file": "",
  "output_file": "",
  "filter": "highway",
  "resampling": "nearest",
  "allow_nodata": false,
  "legacy_climb_distance": false,
  "output_shape": "object",
  "indent": -1,
  "log_level": 3
}
)";

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << default_config;
    file.flush();
    return static_cast<bool>(file);
}

void CommandLineInterface::load_config_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("could not open config file: " + filename);
    }

    try {
        json config;
        file >> config;

        if (!config.is_object()) {
            throw ConfigurationError(filename + ": top level must be a JSON object");
        }

        // Inputs and output
        if (config.contains("osm_file")) config_.osm_file = config["osm_file"].get<std::string>();
        if (config.contains("elevation_file")) config_.elevation_file = config["elevation_file"].get<std::string>();
        if (config.contains("output_file")) config_.output_file = config["output_file"].get<std::string>();

        // Selection and sampling
        if (config.contains("filter")) config_.filter = config["filter"].get<std::string>();
        if (config.contains("resampling")) {
            config_.resampling = parse_resampling(config["resampling"].get<std::string>());
        }
        if (config.contains("allow_nodata")) config_.allow_nodata = config["allow_nodata"].get<bool>();
        if (config.contains("legacy_climb_distance")) {
            config_.climb_distance_mode = config["legacy_climb_distance"].get<bool>()
                ? ClimbDistanceMode::LEGACY_CUMULATIVE
                : ClimbDistanceMode::PER_SEGMENT;
        }

        // Output
        if (config.contains("output_shape")) {
            config_.output_shape = parse_shape(config["output_shape"].get<std::string>());
        }
        if (config.contains("indent") && !config["indent"].is_null()) {
            config_.json_indent = std::max(-1, config["indent"].get<int>());
        }

        // Logging
        if (config.contains("log_level")) {
            if (config["log_level"].is_string()) {
                parse_log_level(config["log_level"].get<std::string>());
            } else {
                config_.log_level = parse_level_number(
                    std::to_string(config["log_level"].get<int>()), filename);
            }
        }
        if (config.contains("log_file") && !config["log_file"].is_null()) {
            config_.log_file = config["log_file"].get<std::string>();
        }

    } catch (const json::exception& e) {
        throw ConfigurationError(filename + ": " + e.what());
    }
}

ResamplingStrategy CommandLineInterface::parse_resampling(const std::string& value) {
    auto strategy = parse_resampling_strategy(value);
    if (!strategy.has_value()) {
        throw ConfigurationError("unknown resampling '" + value + "' (expected nearest or bilinear)");
    }
    return strategy.value();
}

OutputShape CommandLineInterface::parse_shape(const std::string& value) {
    auto shape = parse_output_shape(value);
    if (!shape.has_value()) {
        throw ConfigurationError("unknown output shape '" + value + "' (expected object or array)");
    }
    return shape.value();
}

} // namespace wayslope
