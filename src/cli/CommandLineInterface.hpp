/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the way slope tool
 */

#pragma once

#include "way_slope.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>

namespace wayslope {

/**
 * @brief Parses arguments, config files and environment into a SlopeConfig
 *
 * Option precedence: command line > environment (WAYSLOPE_LOG_LEVEL,
 * WAYSLOPE_LOG_FILE) > configuration file > defaults.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if processing should run; false if the program should
     *         exit with exit_code() (help, version, create-config, usage error)
     * @throws ConfigurationError on invalid option values or config files
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Get the parsed configuration
     */
    const SlopeConfig& get_config() const { return config_; }

    /**
     * @brief Exit code to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    bool is_dry_run() const { return config_.dry_run; }

    /**
     * @brief Log the current configuration at DETAILED level
     */
    void print_config() const;

    // Configuration file methods
    static bool create_default_config_file(const std::string& filename);
    void load_config_file(const std::string& filename);

private:
    SlopeConfig config_;
    int exit_code_ = 0;

    void parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);
    void parse_log_level(const std::string& value);
    void apply_logging_config() const;

    static ResamplingStrategy parse_resampling(const std::string& value);
    static OutputShape parse_shape(const std::string& value);
};

} // namespace wayslope
