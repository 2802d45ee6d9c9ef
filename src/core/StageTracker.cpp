/**
 * @file StageTracker.cpp
 * @brief Implementation of pipeline stage tracking
 */

#include "StageTracker.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace wayslope {

StageTracker::StageTracker() : logger_("StageTracker") {
}

void StageTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.detailed("[STAGE START] " + stage_name);
}

void StageTracker::completeStage(const std::string& stage_name, bool successful,
                                 const std::string& error) {
    PipelineStage* stage = findStage(stage_name);
    if (!stage) {
        logger_.warning("Completing unknown stage: " + stage_name);
        return;
    }

    stage->complete(successful, error);

    std::string message = "[STAGE COMPLETE] " + stage_name +
                          " (" + formatDuration(stage->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.detailed(message);
}

void StageTracker::addStageData(const std::string& stage_name, const std::string& key,
                                const std::string& value) {
    PipelineStage* stage = findStage(stage_name);
    if (stage) {
        stage->stage_data[key] = value;
        logger_.debug("[STAGE DATA] " + stage_name + ": " + key + " = " + value);
    }
}

std::chrono::milliseconds StageTracker::stageDuration(const std::string& stage_name) const {
    const PipelineStage* stage = findStage(stage_name);
    return stage ? stage->duration() : std::chrono::milliseconds(0);
}

std::string StageTracker::getCurrentStage() const {
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (!it->completed) {
            return it->stage_name;
        }
    }
    return "";
}

std::string StageTracker::getTimingReport() const {
    std::ostringstream oss;
    oss << "=== Stage Timings ===\n";

    std::chrono::milliseconds total{0};
    for (const auto& stage : stages_) {
        oss << "  " << std::left << std::setw(20) << stage.stage_name
            << formatDuration(stage.duration());
        if (!stage.completed) {
            oss << " (incomplete)";
        } else if (!stage.successful) {
            oss << " (failed)";
        }
        oss << "\n";
        for (const auto& [key, value] : stage.stage_data) {
            oss << "      " << key << ": " << value << "\n";
        }
        total += stage.duration();
    }

    oss << "  " << std::left << std::setw(20) << "total" << formatDuration(total);
    return oss.str();
}

size_t StageTracker::getCompletedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
        [](const PipelineStage& stage) { return stage.completed; }));
}

void StageTracker::clear() {
    stages_.clear();
}

std::string StageTracker::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    return oss.str();
}

PipelineStage* StageTracker::findStage(const std::string& stage_name) {
    // Latest stage with this name wins
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) {
            return &(*it);
        }
    }
    return nullptr;
}

const PipelineStage* StageTracker::findStage(const std::string& stage_name) const {
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) {
            return &(*it);
        }
    }
    return nullptr;
}

} // namespace wayslope
