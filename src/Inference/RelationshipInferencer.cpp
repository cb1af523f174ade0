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
#include "RelationshipInferencer.hpp"

#include "../Model/Geometry.hpp"

#include <stdexcept>
#include <tuple>

namespace StrideGraph::Inference {

    using Model::ComponentType;
    using Model::DetectedComponent;
    using Model::Relationship;

    namespace {

        constexpr std::array<CanonicalDirection, 8> kCanonicalDirections = {{
            { ComponentType::User,         ComponentType::API },
            { ComponentType::API,          ComponentType::Server },
            { ComponentType::Server,       ComponentType::Database },
            { ComponentType::LoadBalancer, ComponentType::Server },
            { ComponentType::User,         ComponentType::LoadBalancer },
            { ComponentType::LoadBalancer, ComponentType::API },
            { ComponentType::API,          ComponentType::Database },
            { ComponentType::User,         ComponentType::Server },
        }};

    }  // namespace

    std::span<const CanonicalDirection> CanonicalDirections() noexcept {
        return kCanonicalDirections;
    }

    EdgeOrientation OrientationFor(ComponentType first, ComponentType second) noexcept {
        for (const auto& dir : kCanonicalDirections) {
            if (dir.from == first && dir.to == second) {
                return EdgeOrientation::Forward;
            }
            if (dir.from == second && dir.to == first) {
                return EdgeOrientation::Reverse;
            }
        }
        return EdgeOrientation::Undirected;
    }

    RelationshipInferencer::RelationshipInferencer(const Config::AnalysisConfig& config) noexcept
        : m_proximityThreshold(config.proximityThreshold) {
    }

    std::vector<Relationship> RelationshipInferencer::Infer(
        std::span<const DetectedComponent> components,
        const Model::ImageDimensions& image
    ) const {
        std::vector<Relationship> relationships;
        // Proximity needs a diagonal; with no image size the normalizer has already
        // recorded InvalidImageDimensions for every detection
        if (components.size() < 2 || !image.IsValid()) {
            return relationships;
        }

        for (size_t i = 0; i < components.size(); ++i) {
            for (size_t j = i + 1; j < components.size(); ++j) {
                const DetectedComponent& a = components[i];
                const DetectedComponent& b = components[j];
                if (a.id == b.id) {
                    continue;
                }

                const double proximity = Model::ProximityScore(a.box, b.box, image);
                if (proximity < m_proximityThreshold) {
                    continue;
                }

                Relationship rel;
                rel.kind = Model::RelationshipKind::CommunicatesWith;
                rel.confidence = std::clamp(proximity, 0.0, 1.0);

                switch (OrientationFor(a.type, b.type)) {
                case EdgeOrientation::Forward:
                    rel.sourceId = a.id;
                    rel.targetId = b.id;
                    rel.directed = true;
                    break;
                case EdgeOrientation::Reverse:
                    rel.sourceId = b.id;
                    rel.targetId = a.id;
                    rel.directed = true;
                    break;
                case EdgeOrientation::Undirected:
                    rel.sourceId = std::min(a.id, b.id);
                    rel.targetId = std::max(a.id, b.id);
                    rel.directed = false;
                    break;
                }
                relationships.push_back(rel);
            }
        }

        std::sort(relationships.begin(), relationships.end(),
                  [](const Relationship& x, const Relationship& y) {
                      return std::tie(x.sourceId, x.targetId) < std::tie(y.sourceId, y.targetId);
                  });
        return relationships;
    }

    Model::ThreatGraph RelationshipInferencer::BuildGraph(
        std::vector<DetectedComponent> components,
        const Model::ImageDimensions& image
    ) const {
        std::sort(components.begin(), components.end(),
                  [](const DetectedComponent& a, const DetectedComponent& b) { return a.id < b.id; });

        for (size_t i = 0; i < components.size(); ++i) {
            if (components[i].id != static_cast<Model::ComponentId>(i + 1)) {
                throw std::logic_error("component ids must be exactly 1..N (found id " +
                                       std::to_string(components[i].id) + " at position " +
                                       std::to_string(i + 1) + ")");
            }
        }

        Model::ThreatGraph graph;
        graph.image = image;
        graph.relationships = Infer(components, image);
        graph.adjacency = BuildAdjacency(components.size(), graph.relationships);
        graph.components = std::move(components);
        return graph;
    }

    std::vector<std::vector<size_t>> RelationshipInferencer::BuildAdjacency(
        size_t componentCount,
        std::span<const Relationship> relationships
    ) {
        std::vector<std::vector<size_t>> adjacency(componentCount);
        for (size_t r = 0; r < relationships.size(); ++r) {
            const Model::ComponentId source = relationships[r].sourceId;
            if (source == 0 || source > componentCount) {
                throw std::logic_error("relationship " + relationships[r].Tag() +
                                       " references a missing component");
            }
            adjacency[source - 1].push_back(r);
        }
        return adjacency;
    }

} // namespace StrideGraph::Inference
