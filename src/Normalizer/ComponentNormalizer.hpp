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
 * StrideGraph - Component Normalizer
 * ============================================================================
 *
 * @file ComponentNormalizer.hpp
 * @brief Turns raw detector output into canonical DetectedComponent records
 *
 * Steps, in order:
 *   1. Validate each detection (image size, confidence, box shape) and
 *      record a Diagnostic for every detection that is skipped
 *   2. Normalize pixel boxes to [0,1] image space
 *   3. Drop detections below the confidence threshold
 *   4. Map labels to ComponentType (unmapped -> Unknown)
 *   5. Greedy IoU deduplication in descending confidence order
 *   6. Assign ids 1..N by ascending (x, y)
 *
 * Input order never influences the output: every ordering decision uses an
 * explicit sort key.
 *
 * Thread Safety:
 *   Stateless apart from immutable thresholds; const methods may run
 *   concurrently.
 * ============================================================================
 */

#pragma once

#include <span>
#include <vector>

#include "../Config/AnalysisConfig.hpp"
#include "../Model/ThreatModelTypes.hpp"

namespace StrideGraph::Normalizer {

    /// Tolerance for boxes that overshoot the image edge by rounding error
    inline constexpr double kBoxEdgeTolerance = 1e-6;

    struct NormalizationResult {
        std::vector<Model::DetectedComponent> components;   ///< Sorted by id
        std::vector<Model::Diagnostic> diagnostics;
    };

    class ComponentNormalizer {
    public:
        explicit ComponentNormalizer(const Config::AnalysisConfig& config) noexcept;

        /**
         * @brief Normalize one image's detections.
         *
         * @param detections Raw detector output, boxes in pixels, any order
         * @param image Pixel dimensions of the analyzed image
         * @return Components and the diagnostics for skipped/merged detections.
         *         Empty input yields an empty result.
         */
        [[nodiscard]] NormalizationResult Normalize(
            std::span<const Model::RawDetection> detections,
            const Model::ImageDimensions& image
        ) const;

        /**
         * @brief Re-apply threshold, deduplication and id assignment to
         *        already normalized components.
         *
         * Applied to the output of Normalize() it returns the same components.
         */
        [[nodiscard]] NormalizationResult Renormalize(
            std::span<const Model::DetectedComponent> components
        ) const;

    private:
        struct Candidate {
            size_t inputIndex = 0;
            Model::ComponentType type = Model::ComponentType::Unknown;
            std::string label;
            Model::BoundingBox box;
            double confidence = 0.0;
        };

        void Deduplicate(std::vector<Candidate>& candidates,
                         std::vector<Model::Diagnostic>& diagnostics) const;

        [[nodiscard]] static std::vector<Model::DetectedComponent> AssignIds(
            std::vector<Candidate>&& kept);

        double m_confidenceThreshold;
        double m_iouMergeThreshold;
    };

} // namespace StrideGraph::Normalizer
