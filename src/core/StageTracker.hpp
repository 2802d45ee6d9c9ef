/**
 * @file StageTracker.hpp
 * @brief Pipeline stage tracking for timing reports and debugging
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace wayslope {

/**
 * @brief One named pipeline stage
 */
struct PipelineStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::map<std::string, std::string> stage_data;  // Stage-specific key/value info

    explicit PipelineStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Records start/end of pipeline stages and reports their timings
 *
 * Usage pattern:
 *   tracker.startStage("sampling");
 *   ... work ...
 *   tracker.addStageData("sampling", "nodes", std::to_string(n));
 *   tracker.completeStage("sampling");
 */
class StageTracker {
public:
    StageTracker();

    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true,
                       const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key,
                      const std::string& value);

    /**
     * @brief Duration of a completed stage, zero if unknown or still running
     */
    std::chrono::milliseconds stageDuration(const std::string& stage_name) const;

    std::string getCurrentStage() const;
    std::string getTimingReport() const;
    size_t getCompletedStageCount() const;

    const std::vector<PipelineStage>& getStages() const { return stages_; }

    void clear();

private:
    std::vector<PipelineStage> stages_;
    Logger logger_;

    static std::string formatDuration(std::chrono::milliseconds duration);

    PipelineStage* findStage(const std::string& stage_name);
    const PipelineStage* findStage(const std::string& stage_name) const;
};

} // namespace wayslope
