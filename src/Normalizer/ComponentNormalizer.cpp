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
 * StrideGraph - Component Normalizer Implementation
 * ============================================================================
 *
 * @file ComponentNormalizer.cpp
 * @brief Validation, normalization and greedy IoU deduplication
 *
 * Deduplication is the classic greedy non-maximum suppression: candidates
 * are visited from highest to lowest confidence and a candidate survives
 * only if it overlaps no survivor by more than the merge threshold. After
 * the pass every surviving pair has IoU <= threshold, which is what makes
 * a second pass a no-op.
 * ============================================================================
 */

#include "pch.h"
#include "ComponentNormalizer.hpp"
#include "LabelMapper.hpp"

#include "../Model/Geometry.hpp"
#include "../Utils/StringUtils.hpp"

#include <tuple>

namespace StrideGraph::Normalizer {

    using Model::BoundingBox;
    using Model::DetectedComponent;
    using Model::Diagnostic;
    using Model::DiagnosticCode;

    namespace {

        [[nodiscard]] bool IsFiniteBox(const BoundingBox& b) noexcept {
            return std::isfinite(b.x) && std::isfinite(b.y) &&
                   std::isfinite(b.width) && std::isfinite(b.height);
        }

        [[nodiscard]] std::string DescribeDetection(size_t index, const std::string& label) {
            return "detection #" + std::to_string(index) + " ('" + label + "')";
        }

        [[nodiscard]] double ClampUnit(double v) noexcept {
            return std::clamp(v, 0.0, 1.0);
        }

    }  // namespace

    ComponentNormalizer::ComponentNormalizer(const Config::AnalysisConfig& config) noexcept
        : m_confidenceThreshold(config.confidenceThreshold)
        , m_iouMergeThreshold(config.iouMergeThreshold) {
    }

    NormalizationResult ComponentNormalizer::Normalize(
        std::span<const Model::RawDetection> detections,
        const Model::ImageDimensions& image
    ) const {
        NormalizationResult result;
        if (detections.empty()) {
            return result;
        }

        if (!image.IsValid()) {
            for (size_t i = 0; i < detections.size(); ++i) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::InvalidImageDimensions,
                    DescribeDetection(i, detections[i].label) + " skipped: image dimensions are zero"
                });
            }
            return result;
        }

        const double w = static_cast<double>(image.width);
        const double h = static_cast<double>(image.height);

        std::vector<Candidate> candidates;
        candidates.reserve(detections.size());

        for (size_t i = 0; i < detections.size(); ++i) {
            const Model::RawDetection& det = detections[i];

            if (!std::isfinite(det.confidence) || det.confidence < 0.0 || det.confidence > 1.0) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::InvalidConfidence,
                    DescribeDetection(i, det.label) + " skipped: confidence outside [0,1]"
                });
                continue;
            }

            if (!IsFiniteBox(det.box) || det.box.width <= 0.0 || det.box.height <= 0.0) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::MalformedBox,
                    DescribeDetection(i, det.label) + " skipped: box has non-positive or non-finite size"
                });
                continue;
            }

            BoundingBox box{ det.box.x / w, det.box.y / h, det.box.width / w, det.box.height / h };

            if (box.x < -kBoxEdgeTolerance || box.y < -kBoxEdgeTolerance ||
                box.Right() > 1.0 + kBoxEdgeTolerance || box.Bottom() > 1.0 + kBoxEdgeTolerance) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::BoxOutOfRange,
                    DescribeDetection(i, det.label) + " skipped: box lies outside the image"
                });
                continue;
            }

            // absorb rounding overshoot
            box.x = ClampUnit(box.x);
            box.y = ClampUnit(box.y);
            box.width = std::min(box.width, 1.0 - box.x);
            box.height = std::min(box.height, 1.0 - box.y);

            if (box.width <= 0.0 || box.height <= 0.0) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::MalformedBox,
                    DescribeDetection(i, det.label) + " skipped: box has no area inside the image"
                });
                continue;
            }

            if (det.confidence < m_confidenceThreshold) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::LowConfidence,
                    DescribeDetection(i, det.label) + " dropped: confidence " +
                        Utils::StringUtils::FormatFixed(det.confidence, 3) + " below threshold " +
                        Utils::StringUtils::FormatFixed(m_confidenceThreshold, 3)
                });
                continue;
            }

            Candidate c;
            c.inputIndex = i;
            c.label = Utils::StringUtils::Trim(det.label);
            c.type = MapLabel(c.label);
            c.box = box;
            c.confidence = det.confidence;
            candidates.push_back(std::move(c));
        }

        Deduplicate(candidates, result.diagnostics);
        result.components = AssignIds(std::move(candidates));

        std::sort(result.diagnostics.begin(), result.diagnostics.end(),
                  [](const Diagnostic& a, const Diagnostic& b) {
                      return a.detectionIndex < b.detectionIndex;
                  });
        return result;
    }

    NormalizationResult ComponentNormalizer::Renormalize(
        std::span<const DetectedComponent> components
    ) const {
        NormalizationResult result;

        std::vector<Candidate> candidates;
        candidates.reserve(components.size());
        for (size_t i = 0; i < components.size(); ++i) {
            const DetectedComponent& comp = components[i];
            if (comp.confidence < m_confidenceThreshold) {
                result.diagnostics.push_back({
                    i, DiagnosticCode::LowConfidence,
                    DescribeDetection(i, comp.label) + " dropped: confidence below threshold"
                });
                continue;
            }
            candidates.push_back({ i, comp.type, comp.label, comp.box, comp.confidence });
        }

        Deduplicate(candidates, result.diagnostics);
        result.components = AssignIds(std::move(candidates));
        return result;
    }

    void ComponentNormalizer::Deduplicate(
        std::vector<Candidate>& candidates,
        std::vector<Diagnostic>& diagnostics
    ) const {
        std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            if (a.confidence != b.confidence) {
                return a.confidence > b.confidence;
            }
            return std::tie(a.box.x, a.box.y, a.box.width, a.box.height, a.label, a.inputIndex) <
                   std::tie(b.box.x, b.box.y, b.box.width, b.box.height, b.label, b.inputIndex);
        });

        std::vector<Candidate> kept;
        kept.reserve(candidates.size());

        for (Candidate& candidate : candidates) {
            double bestIou = 0.0;
            const Candidate* bestMatch = nullptr;
            for (const Candidate& survivor : kept) {
                const double iou = Model::IntersectionOverUnion(candidate.box, survivor.box);
                if (iou > bestIou) {
                    bestIou = iou;
                    bestMatch = &survivor;
                }
            }

            if (bestMatch && bestIou > m_iouMergeThreshold) {
                diagnostics.push_back({
                    candidate.inputIndex, DiagnosticCode::MergedDuplicate,
                    DescribeDetection(candidate.inputIndex, candidate.label) +
                        " merged into detection #" + std::to_string(bestMatch->inputIndex) +
                        " (IoU " + Utils::StringUtils::FormatFixed(bestIou, 3) + ")"
                });
                continue;
            }
            kept.push_back(std::move(candidate));
        }

        candidates = std::move(kept);
    }

    std::vector<DetectedComponent> ComponentNormalizer::AssignIds(std::vector<Candidate>&& kept) {
        std::sort(kept.begin(), kept.end(), [](const Candidate& a, const Candidate& b) {
            const auto ta = static_cast<uint8_t>(a.type);
            const auto tb = static_cast<uint8_t>(b.type);
            return std::tie(a.box.x, a.box.y, a.box.width, a.box.height, ta, a.label, a.confidence) <
                   std::tie(b.box.x, b.box.y, b.box.width, b.box.height, tb, b.label, b.confidence);
        });

        std::vector<DetectedComponent> components;
        components.reserve(kept.size());
        Model::ComponentId nextId = 1;
        for (Candidate& c : kept) {
            DetectedComponent comp;
            comp.id = nextId++;
            comp.type = c.type;
            comp.label = std::move(c.label);
            comp.box = c.box;
            comp.confidence = c.confidence;
            components.push_back(std::move(comp));
        }
        return components;
    }

} // namespace StrideGraph::Normalizer
