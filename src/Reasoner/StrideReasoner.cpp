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
#include "StrideReasoner.hpp"

#include "../Rules/RuleTemplate.hpp"
#include "../Utils/StringUtils.hpp"

#include <stdexcept>

namespace StrideGraph::Reasoner {

    using Model::DetectedComponent;
    using Model::Relationship;
    using Model::RuleEntry;
    using Model::RuleRole;
    using Model::ThreatFinding;
    using Rules::TemplateFields;

    namespace {

        [[nodiscard]] TemplateFields NodeFields(const DetectedComponent& c) {
            return {
                { "id", c.Tag() },
                { "name", c.DisplayName() },
                { "type", Model::ToString(c.type) },
                { "confidence", Utils::StringUtils::FormatFixed(c.confidence, 2) },
            };
        }

        [[nodiscard]] TemplateFields EdgeFields(const DetectedComponent& src,
                                                const DetectedComponent& dst,
                                                const Relationship& rel) {
            return {
                { "source", src.DisplayName() },
                { "target", dst.DisplayName() },
                { "sourceId", src.Tag() },
                { "targetId", dst.Tag() },
                { "sourceType", Model::ToString(src.type) },
                { "targetType", Model::ToString(dst.type) },
                { "confidence", Utils::StringUtils::FormatFixed(rel.confidence, 2) },
            };
        }

        [[nodiscard]] const DetectedComponent& RequireComponent(const Model::ThreatGraph& graph,
                                                                Model::ComponentId id,
                                                                const Relationship& rel) {
            const DetectedComponent* c = graph.FindComponent(id);
            if (!c) {
                throw std::logic_error("relationship " + rel.Tag() + " references missing component C" +
                                       std::to_string(id));
            }
            return *c;
        }

        [[nodiscard]] std::vector<const RuleEntry*> EdgeRules(const Rules::RuleTable& table,
                                                              const DetectedComponent& src,
                                                              const DetectedComponent& dst,
                                                              bool directed) {
            std::vector<const RuleEntry*> rows;
            auto append = [&rows](std::vector<const RuleEntry*>&& more) {
                rows.insert(rows.end(), more.begin(), more.end());
            };

            if (directed) {
                append(table.Find(src.type, RuleRole::EdgeSource));
                append(table.Find(dst.type, RuleRole::EdgeTarget));
            }
            else {
                // src is the lower id for undirected edges
                append(table.Find(src.type, RuleRole::EdgeSource));
                append(table.Find(src.type, RuleRole::EdgeTarget));
                append(table.Find(dst.type, RuleRole::EdgeSource));
                append(table.Find(dst.type, RuleRole::EdgeTarget));
            }
            return rows;
        }

    }  // namespace

    double RoundSeverity(double value) noexcept {
        return std::round(value * 1000.0) / 1000.0;
    }

    double ComputeSeverity(Model::StrideCategory category, double confidence,
                           const Model::SeverityWeights& weights) noexcept {
        return RoundSeverity(weights.Of(category) * std::clamp(confidence, 0.0, 1.0));
    }

    std::vector<ThreatFinding> Analyze(
        const Model::ThreatGraph& graph,
        const Rules::RuleTable& table,
        const Model::SeverityWeights& weights
    ) {
        std::vector<ThreatFinding> findings;

        for (const DetectedComponent& component : graph.components) {
            const auto rows = table.Find(component.type, RuleRole::Node);
            if (rows.empty()) {
                continue;
            }

            const TemplateFields fields = NodeFields(component);
            for (const RuleEntry* rule : rows) {
                ThreatFinding f;
                f.subjectKind = Model::SubjectKind::Component;
                f.componentId = component.id;
                f.category = rule->category;
                f.description = Rules::RenderTemplate(rule->descriptionTemplate, fields);
                f.countermeasure = Rules::RenderTemplate(rule->countermeasureTemplate, fields);
                f.severity = ComputeSeverity(rule->category, component.confidence, weights);
                f.level = Model::SeverityLevelFor(f.severity);
                findings.push_back(std::move(f));
            }
        }

        for (const Relationship& rel : graph.relationships) {
            if (rel.sourceId == rel.targetId) {
                throw std::logic_error("self-relationship " + rel.Tag() + " in threat graph");
            }

            const DetectedComponent& src = RequireComponent(graph, rel.sourceId, rel);
            const DetectedComponent& dst = RequireComponent(graph, rel.targetId, rel);

            const auto rows = EdgeRules(table, src, dst, rel.directed);
            if (rows.empty()) {
                continue;
            }

            const TemplateFields fields = EdgeFields(src, dst, rel);
            std::array<bool, Model::kStrideCategoryCount> seen{};

            for (const RuleEntry* rule : rows) {
                const auto slot = static_cast<size_t>(rule->category);
                if (seen[slot]) {
                    continue;
                }
                seen[slot] = true;

                ThreatFinding f;
                f.subjectKind = Model::SubjectKind::Relationship;
                f.sourceId = rel.sourceId;
                f.targetId = rel.targetId;
                f.category = rule->category;
                f.description = Rules::RenderTemplate(rule->descriptionTemplate, fields);
                f.countermeasure = Rules::RenderTemplate(rule->countermeasureTemplate, fields);
                f.severity = ComputeSeverity(rule->category, rel.confidence, weights);
                f.level = Model::SeverityLevelFor(f.severity);
                findings.push_back(std::move(f));
            }
        }

        return findings;
    }

} // namespace StrideGraph::Reasoner
