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
 * StrideGraph - Report Composer
 * ============================================================================
 *
 * @file ReportComposer.hpp
 * @brief Orders and groups findings and renders the threat report
 *
 * Composition happens in two steps:
 *
 *   BuildReportModel()  findings -> ordered, grouped ReportModel
 *   ComposeReport()     ReportModel -> Markdown document + JSON record
 *
 * Both renderings walk the same model, so they agree on content and order.
 *
 * Ordering:
 *   - one block per graph subject: components by id, then relationships
 *     by (sourceId, targetId)
 *   - inside a block: descending severity, then category display name
 *
 * Identical input yields byte-identical output. The report carries no
 * timestamp unless ReportOptions::generatedAt is set.
 * ============================================================================
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "../Model/ThreatModelTypes.hpp"
#include "../Utils/JSONUtils.hpp"

namespace StrideGraph::Report {

    inline constexpr const char* REPORT_TITLE = "STRIDE Threat Modeling Report";

    struct ReportOptions {
        std::string sourceLabel;                  ///< Diagram name shown in the header
        std::optional<std::string> generatedAt;   ///< Caller-supplied timestamp
        std::string ruleTableVersion;             ///< Omitted when empty
    };

    /**
     * @brief Findings of one component or relationship, already ordered.
     */
    struct SubjectBlock {
        Model::SubjectKind kind = Model::SubjectKind::Component;
        Model::ComponentId componentId = 0;
        Model::ComponentId sourceId = 0;
        Model::ComponentId targetId = 0;
        bool directed = true;
        std::string title;
        std::string typeLabel;                    ///< "Server" or "User -> API"
        std::vector<Model::ThreatFinding> findings;
    };

    struct HighestFinding {
        Model::ThreatFinding finding;
        std::string subjectTitle;
    };

    struct ReportSummary {
        size_t componentCount = 0;
        size_t relationshipCount = 0;
        size_t findingCount = 0;
        std::optional<HighestFinding> highest;
        std::optional<Model::SeverityLevel> overallRisk;     ///< nullopt: no findings
        std::array<size_t, 4> bySeverity{};                  ///< indexed by SeverityLevel
        std::array<size_t, Model::kStrideCategoryCount> byCategory{};
    };

    struct ReportModel {
        ReportOptions options;
        ReportSummary summary;
        std::string executiveSummary;
        std::vector<Model::DetectedComponent> components;
        std::vector<Model::Relationship> relationships;
        std::vector<Model::Diagnostic> diagnostics;
        std::vector<SubjectBlock> blocks;
    };

    struct ComposedReport {
        std::string document;                     ///< Markdown
        Utils::JSON::Json record;                 ///< Same content, machine-readable
    };

    /**
     * @brief Group and order @p findings against the subjects of @p graph.
     *
     * @throws std::logic_error if a finding refers to a subject that is not
     *         part of the graph
     */
    [[nodiscard]] ReportModel BuildReportModel(const Model::ThreatGraph& graph,
                                               const std::vector<Model::ThreatFinding>& findings,
                                               const ReportOptions& options = {});

    [[nodiscard]] std::string RenderMarkdown(const ReportModel& model);
    [[nodiscard]] Utils::JSON::Json RenderJson(const ReportModel& model);

    /// BuildReportModel + both renderings
    [[nodiscard]] ComposedReport ComposeReport(const Model::ThreatGraph& graph,
                                               const std::vector<Model::ThreatFinding>& findings,
                                               const ReportOptions& options = {});

    /// Display text for an optional risk level ("None" when absent)
    [[nodiscard]] const char* RiskLabel(const std::optional<Model::SeverityLevel>& level) noexcept;

} // namespace StrideGraph::Report
