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
 * @file DetectionLoader.hpp
 * @brief Reads detector output files into RawDetection sequences.
 *
 * Input format:
 * @code
 *   {
 *     "source": "aws_diagram.png",
 *     "image": { "width": 1600, "height": 900 },
 *     "units": "pixels",                       // or "normalized"
 *     "detections": [
 *       { "label": "API Gateway", "confidence": 0.91, "bbox": [120, 80, 200, 90] },
 *       { "label": "db", "confidence": 0.88,
 *         "bbox": { "x": 900, "y": 400, "width": 150, "height": 120 } }
 *     ]
 *   }
 * @endcode
 *
 * Only the document structure is checked here. Value problems (negative
 * sizes, confidences outside [0,1], zero image size) are left for the
 * normalizer, which skips such detections with a diagnostic.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../Model/ThreatModelTypes.hpp"
#include "../Utils/JSONUtils.hpp"

namespace StrideGraph::Pipeline {

    struct DetectionInput {
        std::string source;                           ///< Diagram label
        Model::ImageDimensions image;
        std::vector<Model::RawDetection> detections;  ///< Boxes in pixels
    };

    struct DetectionLoadError {
        std::string message;
        std::filesystem::path path;
        std::optional<size_t> detectionIndex;

        [[nodiscard]] std::string ToString() const;
    };

    [[nodiscard]] bool DetectionsFromJson(const Utils::JSON::Json& j,
                                          DetectionInput& out,
                                          DetectionLoadError* err = nullptr) noexcept;

    /**
     * @brief Load a detection file. "source" defaults to the file name.
     */
    [[nodiscard]] bool LoadDetectionsFromFile(const std::filesystem::path& path,
                                              DetectionInput& out,
                                              DetectionLoadError* err = nullptr) noexcept;

} // namespace StrideGraph::Pipeline
