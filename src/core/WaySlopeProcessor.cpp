/**
 * @file WaySlopeProcessor.cpp
 * @brief End-to-end way slope processing pipeline
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include "SlopeErrors.hpp"
#include "TagFilter.hpp"
#include "ElevationSampler.hpp"
#include "OsmPbfReader.hpp"
#include "SlopePipeline.hpp"
#include "StageTracker.hpp"
#include "Logger.hpp"
#include "../export/StatisticsJsonWriter.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace wayslope {

// ============================================================================
// WaySlopeProcessor::Impl
// ============================================================================

class WaySlopeProcessor::Impl {
public:
    explicit Impl(const SlopeConfig& config)
        : config_(config),
          filter_(parse_filter_spec(config.filter)),
          logger_("WaySlopeProcessor") {
    }

    void process() {
        auto start_time = std::chrono::steady_clock::now();

        metrics_ = {};
        statistics_.clear();
        tracker_.clear();

        logger_.info("Computing way slopes: " + config_.osm_file + " + " +
                     config_.elevation_file + " -> " + config_.output_file);
        logger_.detailed("Filter: " + to_string(filter_) +
                         ", resampling: " + to_string(config_.resampling) +
                         ", climb distance: " + to_string(config_.climb_distance_mode) +
                         ", output: " + to_string(config_.output_shape));

        load_network();
        open_elevation();
        compute_statistics();
        export_results();

        metrics_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        log_summary();
    }

    void load_network() {
        run_stage("network_loading", [this]() {
            OsmPbfReader reader(config_.osm_file);
            const FilterSpec& spec = filter_;
            network_ = reader.read([&spec](const TagMap& tags) { return matches(tags, spec); });

            tracker_.addStageData("network_loading", "ways", std::to_string(network_.ways.size()));
            tracker_.addStageData("network_loading", "nodes", std::to_string(network_.nodes.size()));
        });
        metrics_.network_loading_time = tracker_.stageDuration("network_loading");
        network_loaded_ = true;
    }

    void open_elevation() {
        run_stage("elevation_loading", [this]() {
            sampler_ = std::make_unique<ElevationSampler>(
                config_.elevation_file, config_.resampling, config_.allow_nodata);

            auto [width, height] = sampler_->get_raster_dimensions();
            tracker_.addStageData("elevation_loading", "size",
                                  std::to_string(width) + "x" + std::to_string(height));
        });
    }

    void compute_statistics() {
        if (!network_loaded_) {
            load_network();
        }
        if (!sampler_) {
            open_elevation();
        }

        run_stage("statistics", [this]() {
            SlopePipeline pipeline(config_.climb_distance_mode);
            statistics_ = pipeline.run(network_, *sampler_, filter_);

            const PerformanceMetrics& computed = pipeline.get_metrics();
            metrics_.selection_time = computed.selection_time;
            metrics_.sampling_time = computed.sampling_time;
            metrics_.aggregation_time = computed.aggregation_time;
            metrics_.ways_in_network = computed.ways_in_network;
            metrics_.ways_selected = computed.ways_selected;
            metrics_.nodes_sampled = computed.nodes_sampled;
            metrics_.segments_walked = computed.segments_walked;
            metrics_.total_distance = computed.total_distance;
            metrics_.total_climb = computed.total_climb;
            metrics_.total_descent = computed.total_descent;
        });
    }

    void export_results() {
        run_stage("export", [this]() {
            StatisticsJsonWriter::Options options;
            options.shape = config_.output_shape;
            options.indent = config_.json_indent;

            StatisticsJsonWriter writer(options);
            writer.write(statistics_, config_.output_file);
        });
        metrics_.export_time = tracker_.stageDuration("export");
    }

    const Network& get_network() const { return network_; }
    const std::vector<WayStatistics>& get_statistics() const { return statistics_; }
    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const StageTracker& get_stage_tracker() const { return tracker_; }
    const SlopeConfig& get_config() const { return config_; }

private:
    SlopeConfig config_;
    FilterSpec filter_;
    Logger logger_;
    StageTracker tracker_;

    Network network_;
    bool network_loaded_ = false;
    std::unique_ptr<ElevationSampler> sampler_;
    std::vector<WayStatistics> statistics_;
    PerformanceMetrics metrics_;

    // Marks the stage failed before the error propagates
    template<typename Work>
    void run_stage(const std::string& stage_name, Work&& work) {
        tracker_.startStage(stage_name);
        try {
            work();
        } catch (const std::exception& e) {
            tracker_.completeStage(stage_name, false, e.what());
            throw;
        }
        tracker_.completeStage(stage_name);
    }

    void log_summary() const {
        std::ostringstream totals;
        totals << std::fixed << std::setprecision(1)
               << metrics_.total_distance << " m distance, "
               << metrics_.total_climb << " m climb, "
               << metrics_.total_descent << " m descent";

        logger_.info("Processed " + std::to_string(metrics_.ways_selected) + " ways (" +
                     std::to_string(metrics_.nodes_sampled) + " nodes sampled) in " +
                     std::to_string(metrics_.total_time.count()) + " ms");
        logger_.info("Totals: " + totals.str());
        logger_.detailed(tracker_.getTimingReport());
    }
};

// ============================================================================
// WaySlopeProcessor Public Interface
// ============================================================================

WaySlopeProcessor::WaySlopeProcessor(const SlopeConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

WaySlopeProcessor::~WaySlopeProcessor() = default;

void WaySlopeProcessor::process() {
    impl_->process();
}

void WaySlopeProcessor::load_network() {
    impl_->load_network();
}

void WaySlopeProcessor::open_elevation() {
    impl_->open_elevation();
}

void WaySlopeProcessor::compute_statistics() {
    impl_->compute_statistics();
}

void WaySlopeProcessor::export_results() {
    impl_->export_results();
}

const Network& WaySlopeProcessor::get_network() const {
    return impl_->get_network();
}

const std::vector<WayStatistics>& WaySlopeProcessor::get_statistics() const {
    return impl_->get_statistics();
}

const PerformanceMetrics& WaySlopeProcessor::get_metrics() const {
    return impl_->get_metrics();
}

const StageTracker& WaySlopeProcessor::get_stage_tracker() const {
    return impl_->get_stage_tracker();
}

const SlopeConfig& WaySlopeProcessor::get_config() const {
    return impl_->get_config();
}

} // namespace wayslope
