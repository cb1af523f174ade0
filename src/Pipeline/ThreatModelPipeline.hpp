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
 * StrideGraph - Threat Model Pipeline
 * ============================================================================
 *
 * @file ThreatModelPipeline.hpp
 * @brief Public entry points of the engine
 *
 *   BuildThreatGraph(detections, image, config)   -> ThreatGraph
 *   Analyze(graph, rules[, weights])              -> findings
 *   ComposeReport(graph, findings[, options])     -> document + record
 *
 * The three stages are pure functions. ThreatModelPipeline chains them for
 * one image (Run) or many images concurrently (RunBatch); it is the layer
 * that logs.
 *
 * Thread Safety:
 *   A pipeline holds its configuration by value and the rule table by const
 *   reference. Run/RunBatch are const and may be called concurrently. Each
 *   run owns its graph and findings.
 * ============================================================================
 */

#pragma once

#include <span>
#include <string>
#include <vector>

#include "../Config/AnalysisConfig.hpp"
#include "../Model/ThreatModelTypes.hpp"
#include "../Report/ReportComposer.hpp"
#include "../Rules/RuleTable.hpp"

namespace StrideGraph::Pipeline {

    /**
     * @brief Normalize detections and infer relationships.
     *
     * Deterministic for identical input and thresholds; detection order does
     * not matter. Skipped or merged detections are reported in
     * ThreatGraph::diagnostics.
     */
    [[nodiscard]] Model::ThreatGraph BuildThreatGraph(std::span<const Model::RawDetection> detections,
                                                      const Model::ImageDimensions& image,
                                                      const Config::AnalysisConfig& config);

    /// STRIDE findings for every node and edge of @p graph
    [[nodiscard]] std::vector<Model::ThreatFinding> Analyze(
        const Model::ThreatGraph& graph,
        const Rules::RuleTable& table,
        const Model::SeverityWeights& weights = Model::DefaultSeverityWeights());

    /// Ordered Markdown document and equivalent JSON record
    [[nodiscard]] Report::ComposedReport ComposeReport(const Model::ThreatGraph& graph,
                                                       const std::vector<Model::ThreatFinding>& findings,
                                                       const Report::ReportOptions& options = {});

    struct AnalysisRequest {
        std::string name;                             ///< Used in logs; defaults the report source label
        Model::ImageDimensions image;
        std::vector<Model::RawDetection> detections;
        Report::ReportOptions reportOptions;
    };

    struct AnalysisResult {
        std::string name;
        Model::ThreatGraph graph;
        std::vector<Model::ThreatFinding> findings;
        Report::ComposedReport report;
        std::optional<Model::SeverityLevel> overallRisk;
    };

    class ThreatModelPipeline {
    public:
        /**
         * @param rules Must outlive the pipeline
         * @throws std::invalid_argument if @p config fails ValidateConfig
         */
        ThreatModelPipeline(Config::AnalysisConfig config, const Rules::RuleTable& rules);

        [[nodiscard]] AnalysisResult Run(const AnalysisRequest& request) const;

        /**
         * @brief Analyze independent images on worker tasks.
         *
         * At most maxParallelRuns analyses run at once. Results are in
         * request order and equal what sequential Run() calls produce.
         */
        [[nodiscard]] std::vector<AnalysisResult> RunBatch(std::span<const AnalysisRequest> requests) const;

        [[nodiscard]] const Config::AnalysisConfig& GetConfig() const noexcept { return m_config; }
        [[nodiscard]] const Rules::RuleTable& GetRules() const noexcept { return m_rules; }

    private:
        Config::AnalysisConfig m_config;
        const Rules::RuleTable& m_rules;
    };

} // namespace StrideGraph::Pipeline
