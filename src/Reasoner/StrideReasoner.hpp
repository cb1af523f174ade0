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
 * StrideGraph - STRIDE Reasoner
 * ============================================================================
 *
 * @file StrideReasoner.hpp
 * @brief Resolves STRIDE findings for every node and edge of a ThreatGraph
 *
 * Nodes: every Node rule of the component's type yields one finding.
 *
 * Edges: EdgeSource rules of the source type, then EdgeTarget rules of the
 * target type. An undirected edge has no source or target, so both roles are
 * consulted for both endpoints, lower id first. Categories are deduplicated
 * per edge; the first row of a category supplies its templates.
 *
 * severity = weight(category) x confidence, rounded to 3 decimals.
 *
 * The reasoner is a pure function: no I/O, no logging, no shared state.
 * ============================================================================
 */

#pragma once

#include <vector>

#include "../Model/ThreatModelTypes.hpp"
#include "../Rules/RuleTable.hpp"

namespace StrideGraph::Reasoner {

    /// Round to 3 decimals (half away from zero)
    [[nodiscard]] double RoundSeverity(double value) noexcept;

    /// weight(category) x confidence, rounded
    [[nodiscard]] double ComputeSeverity(Model::StrideCategory category,
                                         double confidence,
                                         const Model::SeverityWeights& weights) noexcept;

    /**
     * @brief Findings for every component then every relationship of @p graph.
     *
     * Output order: components by id (rule order within a component), then
     * relationships in graph order (category first-seen order within an edge).
     *
     * @throws std::logic_error if the graph references a missing component or
     *         a template cannot be rendered
     */
    [[nodiscard]] std::vector<Model::ThreatFinding> Analyze(
        const Model::ThreatGraph& graph,
        const Rules::RuleTable& table,
        const Model::SeverityWeights& weights = Model::DefaultSeverityWeights()
    );

} // namespace StrideGraph::Reasoner
