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
#include "ReportComposer.hpp"

#include "../Utils/StringUtils.hpp"

#include <cstring>
#include <stdexcept>
#include <tuple>

namespace StrideGraph::Report {

    using Model::DetectedComponent;
    using Model::Relationship;
    using Model::ThreatFinding;
    using Utils::StringUtils::FormatFixed;

    namespace {

        [[nodiscard]] std::string ComponentTitle(const DetectedComponent& c) {
            return c.DisplayName() + " (" + c.Tag() + ")";
        }

        [[nodiscard]] std::string RelationshipTitle(const DetectedComponent& src,
                                                    const DetectedComponent& dst,
                                                    bool directed) {
            return ComponentTitle(src) + (directed ? " -> " : " <-> ") + ComponentTitle(dst);
        }

        /// Descending severity, then ascending category display name
        [[nodiscard]] bool FindingBefore(const ThreatFinding& a, const ThreatFinding& b) noexcept {
            if (a.severity != b.severity) {
                return a.severity > b.severity;
            }
            return std::strcmp(Model::ToString(a.category), Model::ToString(b.category)) < 0;
        }

        [[nodiscard]] std::string BuildExecutiveSummary(const ReportSummary& s) {
            if (s.componentCount == 0) {
                return "No components were found in the diagram. No threats were identified.";
            }

            std::string text = "Analyzed " + std::to_string(s.componentCount) +
                               (s.componentCount == 1 ? " component" : " components") + " and " +
                               std::to_string(s.relationshipCount) +
                               (s.relationshipCount == 1 ? " relationship" : " relationships") + ". ";

            if (!s.highest) {
                return text + "No threats were identified.";
            }

            text += "Identified " + std::to_string(s.findingCount) +
                    (s.findingCount == 1 ? " threat" : " threats") + "; overall risk is " +
                    Model::ToString(*s.overallRisk) + ". ";

            const auto& top = *s.highest;
            text += "The highest-severity finding is " + std::string(Model::ToString(top.finding.category)) +
                    " on " + top.subjectTitle + " (severity " + FormatFixed(top.finding.severity, 3) + ").";

            const size_t urgent = s.bySeverity[static_cast<size_t>(Model::SeverityLevel::Critical)] +
                                  s.bySeverity[static_cast<size_t>(Model::SeverityLevel::High)];
            if (urgent > 0) {
                text += " " + std::to_string(urgent) + (urgent == 1 ? " finding is" : " findings are") +
                        " rated High or Critical and should be addressed first.";
            }
            return text;
        }

    }  // namespace

    const char* RiskLabel(const std::optional<Model::SeverityLevel>& level) noexcept {
        return level ? Model::ToString(*level) : "None";
    }

    ReportModel BuildReportModel(const Model::ThreatGraph& graph,
                                 const std::vector<ThreatFinding>& findings,
                                 const ReportOptions& options) {
        ReportModel model;
        model.options = options;
        model.components = graph.components;
        model.relationships = graph.relationships;
        model.diagnostics = graph.diagnostics;

        std::sort(model.components.begin(), model.components.end(),
                  [](const DetectedComponent& a, const DetectedComponent& b) { return a.id < b.id; });
        std::sort(model.relationships.begin(), model.relationships.end(),
                  [](const Relationship& a, const Relationship& b) {
                      return std::tie(a.sourceId, a.targetId) < std::tie(b.sourceId, b.targetId);
                  });

        // One block per subject; index maps for attaching findings
        std::map<Model::ComponentId, size_t> componentBlock;
        std::map<std::pair<Model::ComponentId, Model::ComponentId>, size_t> relationshipBlock;

        for (const DetectedComponent& c : model.components) {
            SubjectBlock block;
            block.kind = Model::SubjectKind::Component;
            block.componentId = c.id;
            block.title = ComponentTitle(c);
            block.typeLabel = Model::ToString(c.type);
            componentBlock.emplace(c.id, model.blocks.size());
            model.blocks.push_back(std::move(block));
        }

        for (const Relationship& r : model.relationships) {
            const DetectedComponent* src = graph.FindComponent(r.sourceId);
            const DetectedComponent* dst = graph.FindComponent(r.targetId);
            if (!src || !dst) {
                throw std::logic_error("relationship " + r.Tag() + " references a missing component");
            }

            SubjectBlock block;
            block.kind = Model::SubjectKind::Relationship;
            block.sourceId = r.sourceId;
            block.targetId = r.targetId;
            block.directed = r.directed;
            block.title = RelationshipTitle(*src, *dst, r.directed);
            block.typeLabel = std::string(Model::ToString(src->type)) + (r.directed ? " -> " : " <-> ") +
                              Model::ToString(dst->type);
            relationshipBlock.emplace(std::make_pair(r.sourceId, r.targetId), model.blocks.size());
            model.blocks.push_back(std::move(block));
        }

        for (const ThreatFinding& f : findings) {
            size_t blockIndex = 0;
            if (f.subjectKind == Model::SubjectKind::Component) {
                const auto it = componentBlock.find(f.componentId);
                if (it == componentBlock.end()) {
                    throw std::logic_error("finding refers to unknown component C" + std::to_string(f.componentId));
                }
                blockIndex = it->second;
            }
            else {
                const auto it = relationshipBlock.find({ f.sourceId, f.targetId });
                if (it == relationshipBlock.end()) {
                    throw std::logic_error("finding refers to unknown relationship C" + std::to_string(f.sourceId) +
                                           "/C" + std::to_string(f.targetId));
                }
                blockIndex = it->second;
            }
            model.blocks[blockIndex].findings.push_back(f);
        }

        ReportSummary& summary = model.summary;
        summary.componentCount = model.components.size();
        summary.relationshipCount = model.relationships.size();
        summary.findingCount = findings.size();

        for (SubjectBlock& block : model.blocks) {
            std::stable_sort(block.findings.begin(), block.findings.end(), FindingBefore);

            for (const ThreatFinding& f : block.findings) {
                ++summary.bySeverity[static_cast<size_t>(f.level)];
                ++summary.byCategory[static_cast<size_t>(f.category)];

                // Strictly greater: ties keep the earliest in report order
                if (!summary.highest || f.severity > summary.highest->finding.severity) {
                    summary.highest = HighestFinding{ f, block.title };
                }
            }
        }

        if (summary.highest) {
            summary.overallRisk = Model::SeverityLevelFor(summary.highest->finding.severity);
        }

        model.executiveSummary = BuildExecutiveSummary(summary);
        return model;
    }

    ComposedReport ComposeReport(const Model::ThreatGraph& graph,
                                 const std::vector<ThreatFinding>& findings,
                                 const ReportOptions& options) {
        const ReportModel model = BuildReportModel(graph, findings, options);

        ComposedReport report;
        report.document = RenderMarkdown(model);
        report.record = RenderJson(model);
        return report;
    }

} // namespace StrideGraph::Report
