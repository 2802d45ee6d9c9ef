/**
 * Unit tests for command line and configuration file handling
 */
#include <gtest/gtest.h>
#include "../src/cli/CommandLineInterface.hpp"
#include "Logger.hpp"
#include "SlopeErrors.hpp"
#include "test_fixtures.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <initializer_list>

using namespace wayslope;
using json = nlohmann::json;

namespace {

/**
 * Owns a mutable argv built from strings; argv[0] is the program name
 */
class ArgumentList {
public:
    ArgumentList(std::initializer_list<std::string> args) {
        storage_.push_back("way-slope");
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    ArgumentList(const ArgumentList&) = delete;
    ArgumentList& operator=(const ArgumentList&) = delete;

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class CommandLineInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("WAYSLOPE_LOG_LEVEL");
        unsetenv("WAYSLOPE_LOG_FILE");
    }

    void TearDown() override {
        unsetenv("WAYSLOPE_LOG_LEVEL");
        unsetenv("WAYSLOPE_LOG_FILE");
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
        Logger::setLogFile(std::nullopt);
    }

    bool parse(ArgumentList args) {
        return cli.parse_arguments(args.argc(), args.argv());
    }

    void write_config(const std::string& path, const json& config) {
        std::ofstream(path) << config.dump(2);
    }

    CommandLineInterface cli;
    test::TempDir dir;
};

TEST_F(CommandLineInterfaceTest, PositionalArgumentsWithDefaults) {
    ASSERT_TRUE(parse({"map.osm.pbf", "dem.tif", "out.json"}));

    const SlopeConfig& config = cli.get_config();
    EXPECT_EQ(config.osm_file, "map.osm.pbf");
    EXPECT_EQ(config.elevation_file, "dem.tif");
    EXPECT_EQ(config.output_file, "out.json");
    EXPECT_EQ(config.filter, "highway");
    EXPECT_EQ(config.resampling, ResamplingStrategy::NEAREST_NEIGHBOR);
    EXPECT_FALSE(config.allow_nodata);
    EXPECT_EQ(config.climb_distance_mode, ClimbDistanceMode::PER_SEGMENT);
    EXPECT_EQ(config.output_shape, OutputShape::OBJECT_BY_WAY_ID);
    EXPECT_EQ(config.json_indent, -1);
    EXPECT_EQ(config.log_level, 3);
    EXPECT_FALSE(cli.is_dry_run());
}

TEST_F(CommandLineInterfaceTest, AllProcessingOptions) {
    ASSERT_TRUE(parse({"--filter", "highway=primary,surface", "--resampling", "bilinear",
                       "--allow-nodata", "--legacy-climb-distance", "--output-shape", "array",
                       "--indent=4", "--dry-run", "a.pbf", "b.tif", "c.json"}));

    const SlopeConfig& config = cli.get_config();
    EXPECT_EQ(config.filter, "highway=primary,surface");
    EXPECT_EQ(config.resampling, ResamplingStrategy::BILINEAR);
    EXPECT_TRUE(config.allow_nodata);
    EXPECT_EQ(config.climb_distance_mode, ClimbDistanceMode::LEGACY_CUMULATIVE);
    EXPECT_EQ(config.output_shape, OutputShape::ARRAY_OF_RECORDS);
    EXPECT_EQ(config.json_indent, 4);
    EXPECT_TRUE(cli.is_dry_run());
}

TEST_F(CommandLineInterfaceTest, ShortFilterOption) {
    ASSERT_TRUE(parse({"-f", "railway", "a.pbf", "b.tif", "c.json"}));
    EXPECT_EQ(cli.get_config().filter, "railway");
}

TEST_F(CommandLineInterfaceTest, HelpExitsWithZero) {
    EXPECT_FALSE(parse({"--help"}));
    EXPECT_EQ(cli.exit_code(), 0);
}

TEST_F(CommandLineInterfaceTest, VersionExitsWithZero) {
    EXPECT_FALSE(parse({"--version"}));
    EXPECT_EQ(cli.exit_code(), 0);
}

TEST_F(CommandLineInterfaceTest, UnknownOptionIsUsageError) {
    EXPECT_FALSE(parse({"--frobnicate", "a.pbf", "b.tif", "c.json"}));
    EXPECT_EQ(cli.exit_code(), 2);
}

TEST_F(CommandLineInterfaceTest, WrongPositionalCountIsUsageError) {
    EXPECT_FALSE(parse({"a.pbf", "b.tif"}));
    EXPECT_EQ(cli.exit_code(), 2);

    CommandLineInterface other;
    ArgumentList four({"a", "b", "c", "d"});
    EXPECT_FALSE(other.parse_arguments(four.argc(), four.argv()));
    EXPECT_EQ(other.exit_code(), 2);
}

TEST_F(CommandLineInterfaceTest, MissingInputsIsUsageError) {
    EXPECT_FALSE(parse({"--filter", "highway"}));
    EXPECT_EQ(cli.exit_code(), 2);
}

TEST_F(CommandLineInterfaceTest, InvalidOptionValuesThrow) {
    EXPECT_THROW(parse({"--resampling", "cubic", "a", "b", "c"}), ConfigurationError);

    CommandLineInterface shape_cli;
    ArgumentList shape_args({"--output-shape", "csv", "a", "b", "c"});
    EXPECT_THROW(shape_cli.parse_arguments(shape_args.argc(), shape_args.argv()), ConfigurationError);

    CommandLineInterface indent_cli;
    ArgumentList indent_args({"--indent=-1", "a", "b", "c"});
    EXPECT_THROW(indent_cli.parse_arguments(indent_args.argc(), indent_args.argv()), ConfigurationError);

    CommandLineInterface text_indent_cli;
    ArgumentList text_indent_args({"--indent", "wide", "a", "b", "c"});
    EXPECT_THROW(text_indent_cli.parse_arguments(text_indent_args.argc(), text_indent_args.argv()),
                 ConfigurationError);
}

TEST_F(CommandLineInterfaceTest, MalformedFilterThrowsBeforeProcessing) {
    EXPECT_THROW(parse({"--filter", "=primary", "a", "b", "c"}), ConfigurationError);

    CommandLineInterface other;
    ArgumentList args({"--filter", "highway,,surface", "a", "b", "c"});
    EXPECT_THROW(other.parse_arguments(args.argc(), args.argv()), ConfigurationError);
}

TEST_F(CommandLineInterfaceTest, EmptyInlineValueIsNotTakenFromNextArgument) {
    EXPECT_THROW(parse({"--filter=", "a.pbf", "dem.tif", "out.json"}), ConfigurationError);

    CommandLineInterface indent_cli;
    ArgumentList args({"--indent=", "a.pbf", "dem.tif", "out.json"});
    EXPECT_THROW(indent_cli.parse_arguments(args.argc(), args.argv()), ConfigurationError);
}

TEST_F(CommandLineInterfaceTest, InlineValueKeepsPositionals) {
    ASSERT_TRUE(parse({"--filter=highway=primary", "a.pbf", "dem.tif", "out.json"}));
    EXPECT_EQ(cli.get_config().filter, "highway=primary");
    EXPECT_EQ(cli.get_config().osm_file, "a.pbf");
    EXPECT_EQ(cli.get_config().output_file, "out.json");
}

TEST_F(CommandLineInterfaceTest, LogLevelOptions) {
    ASSERT_TRUE(parse({"--log-level", "5", "a", "b", "c"}));
    EXPECT_EQ(cli.get_config().log_level, 5);
    EXPECT_EQ(Logger::getFacilityLevel("OsmPbfReader"), LogLevel::DEBUG);
}

TEST_F(CommandLineInterfaceTest, FacilityLogLevels) {
    ASSERT_TRUE(parse({"--log-level", "2,ElevationSampler=6", "a", "b", "c"}));
    EXPECT_EQ(cli.get_config().log_level, 2);
    ASSERT_TRUE(cli.get_config().log_config.has_value());
    EXPECT_EQ(Logger::getFacilityLevel("ElevationSampler"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("OsmPbfReader"), LogLevel::WARNING);
}

TEST_F(CommandLineInterfaceTest, InvalidLogLevelThrows) {
    EXPECT_THROW(parse({"--log-level", "9", "a", "b", "c"}), ConfigurationError);

    CommandLineInterface other;
    ArgumentList args({"--log-level", "loud", "a", "b", "c"});
    EXPECT_THROW(other.parse_arguments(args.argc(), args.argv()), ConfigurationError);
}

TEST_F(CommandLineInterfaceTest, SilentAndVerboseFlags) {
    ASSERT_TRUE(parse({"--silent", "a", "b", "c"}));
    EXPECT_EQ(cli.get_config().log_level, 1);

    CommandLineInterface verbose_cli;
    ArgumentList args({"-v", "a", "b", "c"});
    ASSERT_TRUE(verbose_cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(verbose_cli.get_config().log_level, 6);
}

TEST_F(CommandLineInterfaceTest, EnvironmentLogLevelBelowCommandLine) {
    setenv("WAYSLOPE_LOG_LEVEL", "5", 1);
    ASSERT_TRUE(parse({"a", "b", "c"}));
    EXPECT_EQ(cli.get_config().log_level, 5);

    CommandLineInterface other;
    ArgumentList args({"--log-level", "2", "a", "b", "c"});
    ASSERT_TRUE(other.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(other.get_config().log_level, 2);
}

TEST_F(CommandLineInterfaceTest, LogFileOption) {
    std::string log_path = dir.file("run.log");
    ASSERT_TRUE(parse({"--log-file", log_path, "a", "b", "c"}));
    ASSERT_TRUE(cli.get_config().log_file.has_value());
    EXPECT_EQ(cli.get_config().log_file.value(), log_path);
}

TEST_F(CommandLineInterfaceTest, ConfigFileSuppliesOptions) {
    std::string config_path = dir.file("config.json");
    write_config(config_path, {
        {"osm_file", "region.osm.pbf"},
        {"elevation_file", "region.tif"},
        {"output_file", "region.json"},
        {"filter", "highway=primary"},
        {"resampling", "bilinear"},
        {"allow_nodata", true},
        {"legacy_climb_distance", true},
        {"output_shape", "array"},
        {"indent", 2},
        {"log_level", 4},
    });

    ASSERT_TRUE(parse({"--config", config_path}));

    const SlopeConfig& config = cli.get_config();
    EXPECT_EQ(config.osm_file, "region.osm.pbf");
    EXPECT_EQ(config.elevation_file, "region.tif");
    EXPECT_EQ(config.output_file, "region.json");
    EXPECT_EQ(config.filter, "highway=primary");
    EXPECT_EQ(config.resampling, ResamplingStrategy::BILINEAR);
    EXPECT_TRUE(config.allow_nodata);
    EXPECT_EQ(config.climb_distance_mode, ClimbDistanceMode::LEGACY_CUMULATIVE);
    EXPECT_EQ(config.output_shape, OutputShape::ARRAY_OF_RECORDS);
    EXPECT_EQ(config.json_indent, 2);
    EXPECT_EQ(config.log_level, 4);
    ASSERT_TRUE(config.config_file.has_value());
    EXPECT_EQ(config.config_file.value(), config_path);
}

TEST_F(CommandLineInterfaceTest, CommandLineOverridesConfigFile) {
    std::string config_path = dir.file("config.json");
    write_config(config_path, {
        {"osm_file", "region.osm.pbf"},
        {"elevation_file", "region.tif"},
        {"output_file", "region.json"},
        {"filter", "highway=primary"},
        {"output_shape", "array"},
    });

    ASSERT_TRUE(parse({"-c", config_path, "--output-shape", "object", "--filter", "railway",
                       "x.pbf", "y.tif", "z.json"}));

    const SlopeConfig& config = cli.get_config();
    EXPECT_EQ(config.osm_file, "x.pbf");
    EXPECT_EQ(config.elevation_file, "y.tif");
    EXPECT_EQ(config.output_file, "z.json");
    EXPECT_EQ(config.filter, "railway");
    EXPECT_EQ(config.output_shape, OutputShape::OBJECT_BY_WAY_ID);
}

TEST_F(CommandLineInterfaceTest, BadConfigFilesThrow) {
    EXPECT_THROW(cli.load_config_file(dir.file("missing.json")), ConfigurationError);

    std::string broken = dir.file("broken.json");
    std::ofstream(broken) << "{ \"filter\": ";
    EXPECT_THROW(cli.load_config_file(broken), ConfigurationError);

    std::string wrong_type = dir.file("wrong_type.json");
    write_config(wrong_type, {{"allow_nodata", "sometimes"}});
    EXPECT_THROW(cli.load_config_file(wrong_type), ConfigurationError);

    std::string bad_value = dir.file("bad_value.json");
    write_config(bad_value, {{"resampling", "cubic"}});
    EXPECT_THROW(cli.load_config_file(bad_value), ConfigurationError);

    std::string not_object = dir.file("array.json");
    std::ofstream(not_object) << "[1, 2, 3]";
    EXPECT_THROW(cli.load_config_file(not_object), ConfigurationError);
}

TEST_F(CommandLineInterfaceTest, DefaultConfigFileLoadsToDefaults) {
    std::string config_path = dir.file("default.json");
    ASSERT_TRUE(CommandLineInterface::create_default_config_file(config_path));

    ASSERT_TRUE(parse({"--config", config_path, "a.pbf", "b.tif", "c.json"}));

    const SlopeConfig& config = cli.get_config();
    SlopeConfig defaults;
    EXPECT_EQ(config.filter, defaults.filter);
    EXPECT_EQ(config.resampling, defaults.resampling);
    EXPECT_EQ(config.allow_nodata, defaults.allow_nodata);
    EXPECT_EQ(config.climb_distance_mode, defaults.climb_distance_mode);
    EXPECT_EQ(config.output_shape, defaults.output_shape);
    EXPECT_EQ(config.json_indent, defaults.json_indent);
    EXPECT_EQ(config.log_level, defaults.log_level);
}

TEST_F(CommandLineInterfaceTest, CreateConfigOption) {
    std::string config_path = dir.file("created.json");
    EXPECT_FALSE(parse({"--create-config", config_path}));
    EXPECT_EQ(cli.exit_code(), 0);

    std::ifstream file(config_path);
    ASSERT_TRUE(file.is_open());
    json config = json::parse(file);
    EXPECT_EQ(config.at("filter"), "highway");
    EXPECT_EQ(config.at("output_shape"), "object");
}

TEST_F(CommandLineInterfaceTest, CreateConfigFailure) {
    EXPECT_FALSE(CommandLineInterface::create_default_config_file(dir.file("no-such-dir/c.json")));

    EXPECT_FALSE(parse({"--create-config", dir.file("no-such-dir/c.json")}));
    EXPECT_EQ(cli.exit_code(), 1);
}
