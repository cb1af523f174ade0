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
 * StrideGraph - Relationship Inferencer
 * ============================================================================
 *
 * @file RelationshipInferencer.hpp
 * @brief Derives CommunicatesWith edges from component geometry
 *
 * Architecture diagrams carry no connector information once they pass
 * through the detector, so adjacency on the canvas stands in for it:
 *
 *   proximity = 1 - |center(a) - center(b)| / imageDiagonal
 *
 * A pair is connected when proximity >= threshold. Pairs whose types have
 * a canonical direction (User -> API, Server -> Database, ...) get one
 * directed edge in that orientation. All other pairs get a single
 * undirected edge stored with sourceId < targetId.
 *
 * Invariants of the output:
 *   - no self-edges
 *   - at most one relationship per unordered component pair
 *   - relationships sorted by (sourceId, targetId)
 * ============================================================================
 */

#pragma once

#include <span>
#include <vector>

#include "../Config/AnalysisConfig.hpp"
#include "../Model/ThreatModelTypes.hpp"

namespace StrideGraph::Inference {

    /**
     * @brief Orientation of an edge between two component types.
     */
    enum class EdgeOrientation : uint8_t {
        Forward    = 0,   ///< first -> second
        Reverse    = 1,   ///< second -> first
        Undirected = 2
    };

    /**
     * @brief One entry of the canonical direction table.
     */
    struct CanonicalDirection {
        Model::ComponentType from;
        Model::ComponentType to;
    };

    /// The canonical direction table, in lookup order
    [[nodiscard]] std::span<const CanonicalDirection> CanonicalDirections() noexcept;

    /**
     * @brief Orientation of an edge between a component of type @p first and
     *        one of type @p second.
     */
    [[nodiscard]] EdgeOrientation OrientationFor(Model::ComponentType first,
                                                 Model::ComponentType second) noexcept;

    class RelationshipInferencer {
    public:
        explicit RelationshipInferencer(const Config::AnalysisConfig& config) noexcept;

        /**
         * @brief Infer relationships between normalized components.
         *
         * @param components Components with ids 1..N (any order)
         * @param image Pixel dimensions used to scale distances
         * @return Relationships sorted by (sourceId, targetId); empty for
         *         fewer than two components
         */
        [[nodiscard]] std::vector<Model::Relationship> Infer(
            std::span<const Model::DetectedComponent> components,
            const Model::ImageDimensions& image
        ) const;

        /**
         * @brief Assemble a ThreatGraph from normalized components.
         *
         * Components are stored sorted by id; relationships and adjacency are
         * computed here.
         *
         * @throws std::logic_error if component ids are not exactly 1..N
         */
        [[nodiscard]] Model::ThreatGraph BuildGraph(
            std::vector<Model::DetectedComponent> components,
            const Model::ImageDimensions& image
        ) const;

        /// adjacency[i] = indices into @p relationships whose sourceId == i + 1
        [[nodiscard]] static std::vector<std::vector<size_t>> BuildAdjacency(
            size_t componentCount,
            std::span<const Model::Relationship> relationships
        );

    private:
        double m_proximityThreshold;
    };

} // namespace StrideGraph::Inference
