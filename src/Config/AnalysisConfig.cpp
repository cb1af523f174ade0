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

#include "pch.h"
#include "AnalysisConfig.hpp"

#include "../Utils/Logger.hpp"

namespace StrideGraph {
namespace Config {

using Utils::JSON::Json;

namespace {

    void SetError(ConfigError* err, std::string message, std::string key = {}) {
        if (err) {
            err->message = std::move(message);
            err->key = std::move(key);
        }
    }

    [[nodiscard]] bool CheckUnitRange(double value, const char* key, ConfigError* err) {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            SetError(err, std::string(key) + " must be a number in [0,1]", key);
            return false;
        }
        return true;
    }

    [[nodiscard]] bool ReadNumber(const Json& j, const char* key, double& out, ConfigError* err) {
        if (!j.contains(key)) {
            return true;
        }
        const Json& v = j.at(key);
        if (!v.is_number()) {
            SetError(err, std::string(key) + " must be a number", key);
            return false;
        }
        out = v.get<double>();
        return true;
    }

}  // namespace

bool ValidateConfig(const AnalysisConfig& config, ConfigError* err) noexcept {
    if (!CheckUnitRange(config.confidenceThreshold, "confidenceThreshold", err) ||
        !CheckUnitRange(config.iouMergeThreshold, "iouMergeThreshold", err) ||
        !CheckUnitRange(config.proximityThreshold, "proximityThreshold", err)) {
        return false;
    }

    for (const auto category : Model::kAllStrideCategories) {
        const double w = config.severityWeights.Of(category);
        if (!std::isfinite(w) || w < 0.0 || w > 1.0) {
            SetError(err, std::string("severity weight for ") + Model::ToString(category) +
                          " must be a number in [0,1]",
                     "severityWeights");
            return false;
        }
    }

    if (config.maxParallelRuns == 0 ||
        config.maxParallelRuns > ConfigConstants::MAX_PARALLEL_RUNS_LIMIT) {
        SetError(err, "maxParallelRuns must be between 1 and " +
                      std::to_string(ConfigConstants::MAX_PARALLEL_RUNS_LIMIT),
                 "maxParallelRuns");
        return false;
    }
    return true;
}

bool ConfigFromJson(const Json& j, AnalysisConfig& out, ConfigError* err) noexcept {
    try {
        if (!j.is_object()) {
            SetError(err, "configuration root must be a JSON object");
            return false;
        }

        AnalysisConfig cfg;
        if (!ReadNumber(j, "confidenceThreshold", cfg.confidenceThreshold, err) ||
            !ReadNumber(j, "iouMergeThreshold", cfg.iouMergeThreshold, err) ||
            !ReadNumber(j, "proximityThreshold", cfg.proximityThreshold, err)) {
            return false;
        }

        if (j.contains("maxParallelRuns")) {
            const Json& v = j.at("maxParallelRuns");
            if (!v.is_number_integer() || v.get<int64_t>() < 0) {
                SetError(err, "maxParallelRuns must be a positive integer", "maxParallelRuns");
                return false;
            }
            const int64_t runs = v.get<int64_t>();
            cfg.maxParallelRuns = runs > static_cast<int64_t>(UINT32_MAX)
                ? UINT32_MAX
                : static_cast<uint32_t>(runs);
        }

        if (j.contains("severityWeights")) {
            const Json& weights = j.at("severityWeights");
            if (!weights.is_object()) {
                SetError(err, "severityWeights must be an object keyed by STRIDE category",
                         "severityWeights");
                return false;
            }
            for (const auto& [name, value] : weights.items()) {
                const auto category = Model::ParseStrideCategory(name);
                if (!category) {
                    SetError(err, "unknown STRIDE category '" + name + "' in severityWeights",
                             "severityWeights");
                    return false;
                }
                if (!value.is_number()) {
                    SetError(err, "severity weight for '" + name + "' must be a number",
                             "severityWeights");
                    return false;
                }
                cfg.severityWeights.Set(*category, value.get<double>());
            }
        }

        for (const auto& [key, value] : j.items()) {
            if (key != "confidenceThreshold" && key != "iouMergeThreshold" &&
                key != "proximityThreshold" && key != "maxParallelRuns" &&
                key != "severityWeights") {
                SG_LOG_WARN("Config", "Ignoring unknown configuration key '%s'", key.c_str());
            }
        }

        if (!ValidateConfig(cfg, err)) {
            return false;
        }

        out = cfg;
        return true;
    }
    catch (const std::exception& e) {
        SetError(err, e.what());
        return false;
    }
}

bool LoadConfigFromFile(const std::filesystem::path& path, AnalysisConfig& out, ConfigError* err) noexcept {
    Json j;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, j, &jsonErr)) {
        if (err) {
            err->message = "cannot load configuration: " + jsonErr.message;
            err->path = path;
        }
        SG_LOG_ERROR("Config", "Failed to load %s: %s", path.string().c_str(), jsonErr.message.c_str());
        return false;
    }

    if (!ConfigFromJson(j, out, err)) {
        if (err) {
            err->path = path;
        }
        SG_LOG_ERROR("Config", "Invalid configuration in %s: %s", path.string().c_str(),
                     err ? err->message.c_str() : "validation failed");
        return false;
    }

    SG_LOG_INFO("Config", "Loaded analysis configuration from %s", path.string().c_str());
    return true;
}

Json ConfigToJson(const AnalysisConfig& config) {
    Json weights = Json::object();
    for (const auto category : Model::kAllStrideCategories) {
        weights[Model::CategoryIdentifier(category)] = config.severityWeights.Of(category);
    }

    Json j = Json::object();
    j["confidenceThreshold"] = config.confidenceThreshold;
    j["iouMergeThreshold"] = config.iouMergeThreshold;
    j["proximityThreshold"] = config.proximityThreshold;
    j["maxParallelRuns"] = config.maxParallelRuns;
    j["severityWeights"] = std::move(weights);
    return j;
}

}  // namespace Config
}  // namespace StrideGraph
