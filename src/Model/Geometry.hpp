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
 * StrideGraph - Bounding Box Geometry
 * ============================================================================
 *
 * @file Geometry.hpp
 * @brief Overlap and distance measures between component bounding boxes
 *
 * Intersection-over-Union drives deduplication in the normalizer; center
 * distance over the image diagonal drives relationship inference.
 *
 * Distances are measured in pixel space (normalized deltas scaled by the
 * image width and height) so that a wide diagram does not shrink horizontal
 * gaps relative to vertical ones.
 * ============================================================================
 */

#pragma once

#include <algorithm>
#include <cmath>

#include "ThreatModelTypes.hpp"

namespace StrideGraph::Model {

    /**
     * @brief Intersection-over-Union of two boxes in the same coordinate space.
     *
     * @return Value in [0,1]; 0 when either box has no area
     */
    [[nodiscard]] inline double IntersectionOverUnion(const BoundingBox& a, const BoundingBox& b) noexcept {
        const double left = std::max(a.x, b.x);
        const double top = std::max(a.y, b.y);
        const double right = std::min(a.Right(), b.Right());
        const double bottom = std::min(a.Bottom(), b.Bottom());

        const double iw = right - left;
        const double ih = bottom - top;
        if (iw <= 0.0 || ih <= 0.0) {
            return 0.0;
        }

        const double intersection = iw * ih;
        const double unionArea = a.Area() + b.Area() - intersection;
        if (unionArea <= 0.0) {
            return 0.0;
        }
        return std::clamp(intersection / unionArea, 0.0, 1.0);
    }

    /**
     * @brief Distance between box centers divided by the image diagonal.
     *
     * Boxes are normalized; @p image supplies the aspect ratio.
     *
     * @return Value in [0,1] for boxes inside the image
     */
    [[nodiscard]] inline double NormalizedCenterDistance(
        const BoundingBox& a,
        const BoundingBox& b,
        const ImageDimensions& image
    ) noexcept {
        const double w = static_cast<double>(image.width);
        const double h = static_cast<double>(image.height);
        const double diagonal = std::hypot(w, h);
        if (diagonal <= 0.0) {
            return 1.0;
        }

        const double dx = (a.CenterX() - b.CenterX()) * w;
        const double dy = (a.CenterY() - b.CenterY()) * h;
        return std::hypot(dx, dy) / diagonal;
    }

    /**
     * @brief Proximity score: 1 - normalized center distance, clamped to [0,1].
     */
    [[nodiscard]] inline double ProximityScore(
        const BoundingBox& a,
        const BoundingBox& b,
        const ImageDimensions& image
    ) noexcept {
        return std::clamp(1.0 - NormalizedCenterDistance(a, b, image), 0.0, 1.0);
    }

} // namespace StrideGraph::Model
