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
#include "ThreatModelPipeline.hpp"

#include "../Inference/RelationshipInferencer.hpp"
#include "../Normalizer/ComponentNormalizer.hpp"
#include "../Reasoner/StrideReasoner.hpp"
#include "../Utils/Logger.hpp"

#include <stdexcept>

namespace StrideGraph::Pipeline {

    Model::ThreatGraph BuildThreatGraph(std::span<const Model::RawDetection> detections,
                                        const Model::ImageDimensions& image,
                                        const Config::AnalysisConfig& config) {
        const Normalizer::ComponentNormalizer normalizer(config);
        Normalizer::NormalizationResult normalized = normalizer.Normalize(detections, image);

        const Inference::RelationshipInferencer inferencer(config);
        Model::ThreatGraph graph = inferencer.BuildGraph(std::move(normalized.components), image);
        graph.diagnostics = std::move(normalized.diagnostics);
        return graph;
    }

    std::vector<Model::ThreatFinding> Analyze(const Model::ThreatGraph& graph,
                                              const Rules::RuleTable& table,
                                              const Model::SeverityWeights& weights) {
        return Reasoner::Analyze(graph, table, weights);
    }

    Report::ComposedReport ComposeReport(const Model::ThreatGraph& graph,
                                         const std::vector<Model::ThreatFinding>& findings,
                                         const Report::ReportOptions& options) {
        return Report::ComposeReport(graph, findings, options);
    }

    ThreatModelPipeline::ThreatModelPipeline(Config::AnalysisConfig config, const Rules::RuleTable& rules)
        : m_config(std::move(config))
        , m_rules(rules) {
        Config::ConfigError err;
        if (!Config::ValidateConfig(m_config, &err)) {
            throw std::invalid_argument("invalid analysis configuration: " + err.message);
        }
    }

    AnalysisResult ThreatModelPipeline::Run(const AnalysisRequest& request) const {
        SG_LOG_SCOPE("Pipeline");

        AnalysisResult result;
        result.name = request.name;
        result.graph = BuildThreatGraph(request.detections, request.image, m_config);

        for (const auto& d : result.graph.diagnostics) {
            SG_LOG_DEBUG("Pipeline", "[%s] %s: %s", request.name.c_str(), Model::ToString(d.code), d.message.c_str());
        }

        result.findings = Analyze(result.graph, m_rules, m_config.severityWeights);

        Report::ReportOptions options = request.reportOptions;
        if (options.sourceLabel.empty()) {
            options.sourceLabel = request.name;
        }
        if (options.ruleTableVersion.empty()) {
            options.ruleTableVersion = m_rules.Version();
        }

        const Report::ReportModel model = Report::BuildReportModel(result.graph, result.findings, options);
        result.overallRisk = model.summary.overallRisk;
        result.report.document = Report::RenderMarkdown(model);
        result.report.record = Report::RenderJson(model);

        SG_LOG_INFO("Pipeline", "[%s] %zu detections -> %zu components, %zu relationships, %zu findings (risk %s, %zu skipped/merged)",
                    request.name.c_str(), request.detections.size(), result.graph.components.size(),
                    result.graph.relationships.size(), result.findings.size(),
                    Report::RiskLabel(result.overallRisk), result.graph.diagnostics.size());
        return result;
    }

    std::vector<AnalysisResult> ThreatModelPipeline::RunBatch(std::span<const AnalysisRequest> requests) const {
        std::vector<AnalysisResult> results;
        results.reserve(requests.size());
        if (requests.empty()) {
            return results;
        }

        const size_t window = std::max<size_t>(1, m_config.maxParallelRuns);
        SG_LOG_INFO("Pipeline", "Analyzing %zu images (up to %zu in parallel)", requests.size(), window);

        // Waves of at most `window` tasks; collecting in order keeps results in request order
        for (size_t begin = 0; begin < requests.size(); begin += window) {
            const size_t end = std::min(requests.size(), begin + window);

            std::vector<std::future<AnalysisResult>> wave;
            wave.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                wave.push_back(std::async(std::launch::async,
                                          [this, &request = requests[i]]() { return Run(request); }));
            }

            for (auto& task : wave) {
                results.push_back(task.get());
            }
        }
        return results;
    }

} // namespace StrideGraph::Pipeline
