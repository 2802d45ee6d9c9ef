/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for long/short options and positionals
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace wayslope {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --name VALUE, --name=VALUE, -n VALUE, boolean flags and
 * positional arguments. parse() returns false for unknown options, missing
 * values and help requests; help_requested() tells them apart.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;
        
        // Default constructor for std::map
        Option() : required(false), has_value(true) {}
        
        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };
    
    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}
    
    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;
        
        // Store all arguments
        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }
        
        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }
        
        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];
            
            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);
                
                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                bool inline_value = eq_pos != std::string::npos;
                std::string value;
                if (inline_value) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }
                
                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }
                
                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }
                
            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);
                
                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }
                
                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];
                
                if (option.has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }
        
        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }
        
        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }
        
        return true;
    }
    
    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }
    
    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }
    
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }
        
        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }
    
    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }
    
    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << "WAY SLOPE - Per-way distance, climb and descent from OSM and a DEM\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS] OSM_FILE ELEVATION_FILE OUTPUT_FILE\n";
        std::cout << "    " << program_name_ << " --config run.json [OPTIONS]\n\n";

        if (!description_.empty()) {
            std::cout << description_ << "\n";
        }

        std::cout << "ARGUMENTS:\n";
        std::cout << "    OSM_FILE                 OpenStreetMap network in PBF format\n";
        std::cout << "    ELEVATION_FILE           Elevation raster readable by GDAL (GeoTIFF, HGT, VRT...)\n";
        std::cout << "    OUTPUT_FILE              JSON result file (overwritten)\n\n";

        std::cout << "SELECTION OPTIONS:\n";
        print_help_section("filter", "Ways to include: comma-separated key or key=value (default: highway)");
        std::cout << "\n";

        std::cout << "SAMPLING OPTIONS:\n";
        print_help_section("resampling", "Raster read resampling: nearest, bilinear (default: nearest)");
        print_help_section("allow-nodata", "Use the raw NoData value (e.g. -9999) as the elevation instead\n"
                           "                             of failing; climb and descent then include it");
        print_help_section("legacy-climb-distance", "Add the running way distance per segment (older result files)");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output-shape", "object (keyed by way id, default) or array (records)");
        print_help_section("indent", "Pretty-print JSON with N spaces (default: compact)");
        std::cout << "\n";

        std::cout << "CONFIGURATION:\n";
        print_help_section("config", "Load options from a JSON file (command line wins)");
        print_help_section("create-config", "Write a default configuration file and exit");
        print_help_section("dry-run", "Validate options and inputs without processing");
        std::cout << "\n";

        std::cout << "LOGGING:\n";
        print_help_section("log-level", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        std::cout << "                             Facility form: \"3,ElevationSampler=6\"\n";
        print_help_section("verbose", "Same as --log-level 6");
        print_help_section("silent", "Errors only (same as --log-level 1)");
        print_help_section("log-file", "Also log to file (append if exists)");
        std::cout << "\n";

        std::cout << "HELP:\n";
        std::cout << "    -h, --help               Show this help\n";
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " region.osm.pbf srtm.tif slopes.json\n";
        std::cout << "    " << program_name_ << " -f highway=track,cycleway region.osm.pbf dem.vrt out.json\n";
        std::cout << "    " << program_name_ << " --output-shape array --indent 2 region.osm.pbf dem.tif out.json\n";
    }

private:
    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string usage = "    ";
            usage += option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
            usage += "--" + option.long_name;
            if (option.has_value) {
                usage += " VALUE";
            }
            std::cout << usage;
            std::cout << std::string(usage.size() < 29 ? 29 - usage.size() : 1, ' ')
                      << description << "\n";
        }
    }
    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace wayslope