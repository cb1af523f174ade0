/*
 * StrideGraph - Architecture Threat Modeling Engine
 * Copyright (C) 2026 StrideGraph Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * StrideGraph - ANALYSIS CONFIGURATION
 * ============================================================================
 *
 * @file AnalysisConfig.hpp
 * @brief Tunable thresholds and severity weights for one analysis run.
 *
 * The configuration is an explicit value handed to every pipeline stage;
 * there is no process-wide configuration state. A JSON file may overlay
 * any subset of the defaults:
 *
 * @code
 *   {
 *     "confidenceThreshold": 0.25,
 *     "iouMergeThreshold": 0.5,
 *     "proximityThreshold": 0.65,
 *     "maxParallelRuns": 4,
 *     "severityWeights": { "Tampering": 0.9, "Repudiation": 0.5 }
 *   }
 * @endcode
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "../Model/ThreatModelTypes.hpp"
#include "../Utils/JSONUtils.hpp"

namespace StrideGraph {
namespace Config {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace ConfigConstants {

    /// @brief Detections below this confidence are dropped
    inline constexpr double DEFAULT_CONFIDENCE_THRESHOLD = 0.25;

    /// @brief Detections overlapping above this IoU are merged
    inline constexpr double DEFAULT_IOU_MERGE_THRESHOLD = 0.5;

    /// @brief Component pairs at or above this proximity are connected
    inline constexpr double DEFAULT_PROXIMITY_THRESHOLD = 0.65;

    /// @brief Concurrent runs in batch mode
    inline constexpr uint32_t DEFAULT_MAX_PARALLEL_RUNS = 4;

    inline constexpr uint32_t MAX_PARALLEL_RUNS_LIMIT = 256;

}  // namespace ConfigConstants

// ============================================================================
// STRUCTURES
// ============================================================================

struct AnalysisConfig {
    double confidenceThreshold = ConfigConstants::DEFAULT_CONFIDENCE_THRESHOLD;
    double iouMergeThreshold = ConfigConstants::DEFAULT_IOU_MERGE_THRESHOLD;
    double proximityThreshold = ConfigConstants::DEFAULT_PROXIMITY_THRESHOLD;
    Model::SeverityWeights severityWeights = Model::DefaultSeverityWeights();
    uint32_t maxParallelRuns = ConfigConstants::DEFAULT_MAX_PARALLEL_RUNS;
};

struct ConfigError {
    std::string message;
    std::string key;                       ///< Offending key, if any
    std::filesystem::path path;            ///< Source file, if any

    [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
};

// ============================================================================
// OPERATIONS
// ============================================================================

/**
 * @brief Check every value is finite and inside its documented range.
 *
 * Thresholds and weights must lie in [0,1]; maxParallelRuns in [1,256].
 */
[[nodiscard]] bool ValidateConfig(const AnalysisConfig& config, ConfigError* err = nullptr) noexcept;

/**
 * @brief Overlay the keys present in @p j onto the defaults, then validate.
 *
 * Unknown keys are logged and ignored. @p out is only written on success.
 */
[[nodiscard]] bool ConfigFromJson(const Utils::JSON::Json& j, AnalysisConfig& out,
                                  ConfigError* err = nullptr) noexcept;

[[nodiscard]] bool LoadConfigFromFile(const std::filesystem::path& path, AnalysisConfig& out,
                                      ConfigError* err = nullptr) noexcept;

[[nodiscard]] Utils::JSON::Json ConfigToJson(const AnalysisConfig& config);

}  // namespace Config
}  // namespace StrideGraph
