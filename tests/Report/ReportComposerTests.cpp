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
#include <gtest/gtest.h>

#include <stdexcept>

#include "TestHelpers.hpp"
#include "Report/ReportComposer.hpp"
#include "Reasoner/StrideReasoner.hpp"
#include "Rules/RuleTable.hpp"

using namespace StrideGraph;
using namespace StrideGraph::Testing;
using Model::ComponentType;
using Model::SeverityLevel;
using Model::StrideCategory;
using Model::ThreatFinding;
using Utils::JSON::Json;

namespace {

    ThreatFinding NodeFinding(Model::ComponentId id, StrideCategory category, double severity) {
        ThreatFinding f;
        f.subjectKind = Model::SubjectKind::Component;
        f.componentId = id;
        f.category = category;
        f.description = std::string(Model::ToString(category)) + " on C" + std::to_string(id);
        f.countermeasure = "Mitigate";
        f.severity = severity;
        f.level = Model::SeverityLevelFor(severity);
        return f;
    }

    ThreatFinding EdgeFinding(Model::ComponentId src, Model::ComponentId dst,
                              StrideCategory category, double severity) {
        ThreatFinding f = NodeFinding(0, category, severity);
        f.subjectKind = Model::SubjectKind::Relationship;
        f.sourceId = src;
        f.targetId = dst;
        return f;
    }

    /// User(1) -> API(2) -> Database(3), plus an isolated Server(4)
    Model::ThreatGraph SampleGraph() {
        return MakeGraph(
            { Comp(1, ComponentType::User, 0.05, 0.05, 0.1, 0.1, 0.9, "Customer"),
              Comp(2, ComponentType::API, 0.25, 0.05, 0.1, 0.1, 0.8, "Orders API"),
              Comp(3, ComponentType::Database, 0.45, 0.05, 0.1, 0.1, 0.7, "Orders DB"),
              Comp(4, ComponentType::Server, 0.85, 0.85, 0.1, 0.1, 0.6) },
            { Edge(1, 2, 0.86), Edge(2, 3, 0.86) });
    }

    size_t CountOccurrences(const std::string& text, const std::string& needle) {
        size_t count = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }

}  // namespace

// ============================================================================
// Empty Input
// ============================================================================

TEST(ReportComposerTests, EmptyGraphProducesAValidEmptyReport) {
    const auto report = Report::ComposeReport(MakeGraph({}), {});

    const Json& j = report.record;
    EXPECT_EQ(j["title"], Report::REPORT_TITLE);
    EXPECT_EQ(j["overallRisk"], "None");
    EXPECT_EQ(j["summary"]["components"], 0);
    EXPECT_EQ(j["summary"]["relationships"], 0);
    EXPECT_EQ(j["summary"]["findings"], 0);
    EXPECT_TRUE(j["summary"]["highestFinding"].is_null());
    EXPECT_TRUE(j["subjects"].empty());
    EXPECT_FALSE(j.contains("generatedAt"));

    const std::string& md = report.document;
    EXPECT_EQ(md.rfind("# STRIDE Threat Modeling Report\n", 0), 0u);
    EXPECT_NE(md.find("**Overall Risk Level:** **None**"), std::string::npos);
    EXPECT_NE(md.find("No components were found in the diagram."), std::string::npos);
    EXPECT_NE(md.find("_No components were found; there is nothing to analyze._"), std::string::npos);
    EXPECT_NE(md.find("## Risk Summary Matrix"), std::string::npos);
}

TEST(ReportComposerTests, ComponentsWithoutFindingsStillGetBlocks) {
    const auto graph = MakeGraph({ Comp(1, ComponentType::Server, 0.4, 0.4, 0.2, 0.2) });
    const auto model = Report::BuildReportModel(graph, {});

    ASSERT_EQ(model.blocks.size(), 1u);
    EXPECT_TRUE(model.blocks[0].findings.empty());
    EXPECT_FALSE(model.summary.overallRisk.has_value());
    EXPECT_EQ(Report::RiskLabel(model.summary.overallRisk), std::string("None"));

    const std::string md = Report::RenderMarkdown(model);
    EXPECT_NE(md.find("### Server (C1) [Server]"), std::string::npos);
    EXPECT_NE(md.find("_No threats identified._"), std::string::npos);
}

// ============================================================================
// Ordering
// ============================================================================

TEST(ReportComposerTests, BlocksFollowComponentsThenRelationships) {
    const auto graph = SampleGraph();
    const std::vector<ThreatFinding> findings = {
        EdgeFinding(2, 3, StrideCategory::Tampering, 0.5),
        NodeFinding(3, StrideCategory::Tampering, 0.4),
        EdgeFinding(1, 2, StrideCategory::Spoofing, 0.6),
        NodeFinding(1, StrideCategory::Spoofing, 0.7),
    };
    const auto model = Report::BuildReportModel(graph, findings);

    ASSERT_EQ(model.blocks.size(), 6u);
    EXPECT_EQ(model.blocks[0].title, "Customer (C1)");
    EXPECT_EQ(model.blocks[1].title, "Orders API (C2)");
    EXPECT_EQ(model.blocks[2].title, "Orders DB (C3)");
    EXPECT_EQ(model.blocks[3].title, "Server (C4)");
    EXPECT_EQ(model.blocks[4].title, "Customer (C1) -> Orders API (C2)");
    EXPECT_EQ(model.blocks[4].typeLabel, "User -> API");
    EXPECT_EQ(model.blocks[5].title, "Orders API (C2) -> Orders DB (C3)");

    EXPECT_EQ(model.blocks[0].findings.size(), 1u);
    EXPECT_TRUE(model.blocks[1].findings.empty());
    EXPECT_EQ(model.blocks[4].findings.size(), 1u);
    EXPECT_EQ(model.blocks[5].findings.size(), 1u);
}

TEST(ReportComposerTests, FindingsSortBySeverityThenCategoryName) {
    const auto graph = SampleGraph();
    const std::vector<ThreatFinding> findings = {
        NodeFinding(2, StrideCategory::Repudiation, 0.4),
        NodeFinding(2, StrideCategory::Tampering, 0.72),
        NodeFinding(2, StrideCategory::Spoofing, 0.64),
        NodeFinding(2, StrideCategory::ElevationOfPrivilege, 0.64),
        NodeFinding(2, StrideCategory::DenialOfService, 0.64),
    };
    const auto model = Report::BuildReportModel(graph, findings);

    const auto& block = model.blocks[1];
    ASSERT_EQ(block.findings.size(), 5u);
    EXPECT_EQ(block.findings[0].category, StrideCategory::Tampering);
    // Ties: "Denial of Service" < "Elevation of Privilege" < "Spoofing"
    EXPECT_EQ(block.findings[1].category, StrideCategory::DenialOfService);
    EXPECT_EQ(block.findings[2].category, StrideCategory::ElevationOfPrivilege);
    EXPECT_EQ(block.findings[3].category, StrideCategory::Spoofing);
    EXPECT_EQ(block.findings[4].category, StrideCategory::Repudiation);
}

TEST(ReportComposerTests, FindingOrderDoesNotDependOnInputOrder) {
    const auto graph = SampleGraph();
    std::vector<ThreatFinding> findings = Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn());
    const auto forward = Report::ComposeReport(graph, findings);

    std::reverse(findings.begin(), findings.end());
    const auto backward = Report::ComposeReport(graph, findings);

    EXPECT_EQ(forward.document, backward.document);
    EXPECT_EQ(forward.record, backward.record);
}

// ============================================================================
// Summary
// ============================================================================

TEST(ReportComposerTests, HighestFindingTiesKeepTheFirstInReportOrder) {
    const auto graph = SampleGraph();
    const std::vector<ThreatFinding> findings = {
        EdgeFinding(1, 2, StrideCategory::Spoofing, 0.8),
        NodeFinding(3, StrideCategory::Tampering, 0.8),
        NodeFinding(1, StrideCategory::Repudiation, 0.2),
    };
    const auto model = Report::BuildReportModel(graph, findings);

    ASSERT_TRUE(model.summary.highest.has_value());
    EXPECT_EQ(model.summary.highest->subjectTitle, "Orders DB (C3)");
    EXPECT_EQ(model.summary.highest->finding.category, StrideCategory::Tampering);
    ASSERT_TRUE(model.summary.overallRisk.has_value());
    EXPECT_EQ(*model.summary.overallRisk, SeverityLevel::Critical);
}

TEST(ReportComposerTests, CountsMatchTheFindings) {
    const auto graph = SampleGraph();
    const auto findings = Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn());
    const auto model = Report::BuildReportModel(graph, findings);

    const auto& s = model.summary;
    EXPECT_EQ(s.componentCount, 4u);
    EXPECT_EQ(s.relationshipCount, 2u);
    EXPECT_EQ(s.findingCount, findings.size());

    size_t bySeverity = 0;
    for (const size_t n : s.bySeverity) {
        bySeverity += n;
    }
    size_t byCategory = 0;
    for (const size_t n : s.byCategory) {
        byCategory += n;
    }
    size_t inBlocks = 0;
    for (const auto& b : model.blocks) {
        inBlocks += b.findings.size();
    }
    EXPECT_EQ(bySeverity, findings.size());
    EXPECT_EQ(byCategory, findings.size());
    EXPECT_EQ(inBlocks, findings.size());

    double maxSeverity = 0.0;
    for (const auto& f : findings) {
        maxSeverity = std::max(maxSeverity, f.severity);
    }
    ASSERT_TRUE(s.highest.has_value());
    EXPECT_DOUBLE_EQ(s.highest->finding.severity, maxSeverity);
}

TEST(ReportComposerTests, UnknownSubjectIsALogicError) {
    const auto graph = SampleGraph();
    EXPECT_THROW((void)Report::BuildReportModel(graph, { NodeFinding(9, StrideCategory::Spoofing, 0.5) }),
                 std::logic_error);
    EXPECT_THROW((void)Report::BuildReportModel(graph, { EdgeFinding(2, 1, StrideCategory::Spoofing, 0.5) }),
                 std::logic_error);
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ReportComposerTests, MarkdownAndJsonCarryTheSameFindings) {
    const auto graph = SampleGraph();
    const auto findings = Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn());
    const auto report = Report::ComposeReport(graph, findings, { "web_app.png", std::nullopt, "rules-7" });

    const Json& j = report.record;
    EXPECT_EQ(j["source"], "web_app.png");
    EXPECT_EQ(j["ruleTableVersion"], "rules-7");
    ASSERT_EQ(j["subjects"].size(), 6u);

    size_t jsonFindings = 0;
    for (const auto& subject : j["subjects"]) {
        EXPECT_NE(report.document.find("### " + subject["title"].get<std::string>() + " ["), std::string::npos)
            << subject["title"];
        for (const auto& f : subject["findings"]) {
            ++jsonFindings;
            EXPECT_NE(report.document.find(f["description"].get<std::string>()), std::string::npos);
        }
    }
    EXPECT_EQ(jsonFindings, findings.size());
    EXPECT_EQ(j["summary"]["findings"], findings.size());

    EXPECT_NE(report.document.find("**Source Diagram:** `web_app.png`"), std::string::npos);
    EXPECT_NE(report.document.find("**Rule Table:** rules-7"), std::string::npos);
    EXPECT_EQ(report.document.find("**Generated:**"), std::string::npos);
    EXPECT_EQ(j["overallRisk"], Report::RiskLabel(Report::BuildReportModel(graph, findings).summary.overallRisk));
}

TEST(ReportComposerTests, TimestampAppearsOnlyWhenSupplied) {
    const auto graph = SampleGraph();
    Report::ReportOptions options;
    options.generatedAt = "2026-01-02T03:04:05Z";

    const auto report = Report::ComposeReport(graph, {}, options);
    EXPECT_NE(report.document.find("**Generated:** 2026-01-02T03:04:05Z"), std::string::npos);
    EXPECT_EQ(report.record["generatedAt"], "2026-01-02T03:04:05Z");
}

TEST(ReportComposerTests, SectionsAppearInOrder) {
    auto graph = SampleGraph();
    graph.diagnostics.push_back({ 3, Model::DiagnosticCode::LowConfidence, "detection #3 ('cache') skipped" });
    const auto report = Report::ComposeReport(graph, Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn()));
    const std::string& md = report.document;

    const std::vector<std::string> headings = {
        "## Executive Summary", "## Summary", "## Identified Components", "## Data Flow",
        "## Detection Notes", "## STRIDE Threat Analysis", "## Risk Summary Matrix",
        "### By Severity", "### By STRIDE Category",
    };
    size_t last = 0;
    for (const auto& h : headings) {
        const size_t pos = md.find(h + "\n");
        ASSERT_NE(pos, std::string::npos) << h;
        EXPECT_GT(pos, last) << h;
        last = pos;
    }
    EXPECT_EQ(CountOccurrences(md, "## Detection Notes"), 1u);
    EXPECT_NE(md.find("`LowConfidence` detection #3"), std::string::npos);
    ASSERT_EQ(report.record["diagnostics"].size(), 1u);
    EXPECT_EQ(report.record["diagnostics"][0]["detectionIndex"], 3);
}

TEST(ReportComposerTests, PipesInLabelsAreEscapedInTables) {
    const auto graph = MakeGraph({ Comp(1, ComponentType::API, 0.4, 0.4, 0.2, 0.2, 0.9, "a|b") });
    const auto report = Report::ComposeReport(graph, Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn()));

    EXPECT_NE(report.document.find("**a\\|b**"), std::string::npos);
    EXPECT_EQ(report.record["components"][0]["name"], "a|b");
}

TEST(ReportComposerTests, LineBreaksInLabelsCannotOpenNewSections) {
    const auto graph = MakeGraph(
        { Comp(1, ComponentType::User, 0.05, 0.05, 0.1, 0.1, 0.9, "Customer"),
          Comp(2, ComponentType::API, 0.25, 0.05, 0.1, 0.1, 0.8, "Orders API\n## Injected\r\n# Title") },
        { Edge(1, 2, 0.86) });
    const auto report = Report::ComposeReport(graph, Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn()));
    const std::string& md = report.document;

    EXPECT_EQ(md.find("\n## Injected"), std::string::npos);
    EXPECT_EQ(md.find("\n# Title"), std::string::npos);
    EXPECT_EQ(md.find('\r'), std::string::npos);
    EXPECT_EQ(CountOccurrences(md, "\n# "), 0u);
    EXPECT_NE(md.find("### Orders API ## Injected  # Title (C2) [API]"), std::string::npos);
    EXPECT_NE(md.find("**Orders API ## Injected  # Title (C2)**"), std::string::npos);

    // The record keeps the label as detected
    EXPECT_EQ(report.record["components"][1]["name"], "Orders API\n## Injected\r\n# Title");
}

TEST(ReportComposerTests, IdenticalInputGivesIdenticalOutput) {
    const auto graph = SampleGraph();
    const auto findings = Reasoner::Analyze(graph, Rules::RuleTable::BuiltIn());

    const auto a = Report::ComposeReport(graph, findings, { "x.png", std::nullopt, "v1" });
    const auto b = Report::ComposeReport(graph, findings, { "x.png", std::nullopt, "v1" });
    EXPECT_EQ(a.document, b.document);
    EXPECT_EQ(a.record.dump(), b.record.dump());
}
