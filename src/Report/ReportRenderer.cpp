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
 * StrideGraph - Report Rendering
 * ============================================================================
 *
 * @file ReportRenderer.cpp
 * @brief Markdown and JSON renderings of a ReportModel
 *
 * Markdown layout:
 *   header (source, optional timestamp, overall risk)
 *   Executive Summary, Summary table
 *   Identified Components, Data Flow, Detection Notes (when present)
 *   STRIDE Threat Analysis (one block per subject)
 *   Risk Summary Matrix (by severity, by category), footer
 *
 * The JSON record carries the same sections under the same order.
 * Numbers are printed through FormatFixed so output never depends on the
 * process locale.
 * ============================================================================
 */

#include "pch.h"
#include "ReportComposer.hpp"

#include "../Utils/StringUtils.hpp"

#include <sstream>

namespace StrideGraph::Report {

    using Model::SeverityLevel;
    using Model::ThreatFinding;
    using Utils::JSON::Json;
    using Utils::StringUtils::EscapeMarkdownCell;
    using Utils::StringUtils::EscapeMarkdownInline;
    using Utils::StringUtils::FormatFixed;

    namespace {

        constexpr const char* kDisclaimer =
            "*This report was generated automatically from detected architecture components "
            "using STRIDE threat modeling rules. Findings must be reviewed and validated by a "
            "qualified security professional.*";

        constexpr std::array<SeverityLevel, 4> kSeverityOrder = {
            SeverityLevel::Critical, SeverityLevel::High, SeverityLevel::Medium, SeverityLevel::Low
        };

        [[nodiscard]] std::string BoxText(const Model::BoundingBox& b) {
            return FormatFixed(b.x, 3) + ", " + FormatFixed(b.y, 3) + ", " +
                   FormatFixed(b.width, 3) + ", " + FormatFixed(b.height, 3);
        }

        [[nodiscard]] std::string HighestText(const ReportSummary& s) {
            if (!s.highest) {
                return "None";
            }
            return std::string(Model::ToString(s.highest->finding.category)) + " on " +
                   s.highest->subjectTitle + " (" + FormatFixed(s.highest->finding.severity, 3) + ", " +
                   Model::ToString(s.highest->finding.level) + ")";
        }

        [[nodiscard]] const Model::DetectedComponent* FindIn(const ReportModel& m, Model::ComponentId id) {
            for (const auto& c : m.components) {
                if (c.id == id) {
                    return &c;
                }
            }
            return nullptr;
        }

        void WriteComponents(std::ostringstream& md, const ReportModel& m) {
            md << "## Identified Components\n\n";
            if (m.components.empty()) {
                md << "_No components were found in the diagram._\n\n";
                return;
            }

            md << "| # | Component | Type | Confidence | Bounding Box (x, y, w, h) |\n";
            md << "|---|-----------|------|------------|---------------------------|\n";
            for (const auto& c : m.components) {
                md << "| " << c.Tag() << " | **" << EscapeMarkdownCell(c.DisplayName()) << "** | "
                   << Model::ToString(c.type) << " | " << FormatFixed(c.confidence, 2) << " | "
                   << BoxText(c.box) << " |\n";
            }
            md << "\n";
        }

        void WriteDataFlow(std::ostringstream& md, const ReportModel& m) {
            md << "## Data Flow\n\n";
            if (m.relationships.empty()) {
                md << "_No relationships were inferred._\n\n";
                return;
            }

            // Relationships are sorted by sourceId, so each source forms one run
            size_t i = 0;
            while (i < m.relationships.size()) {
                const Model::ComponentId sourceId = m.relationships[i].sourceId;
                const auto* source = FindIn(m, sourceId);
                md << "### "
                   << EscapeMarkdownInline(source ? source->DisplayName() + " (" + source->Tag() + ")"
                                                  : "C" + std::to_string(sourceId))
                   << "\n\n";

                for (; i < m.relationships.size() && m.relationships[i].sourceId == sourceId; ++i) {
                    const auto& r = m.relationships[i];
                    const auto* target = FindIn(m, r.targetId);
                    md << "- " << (r.directed ? "->" : "<->") << " **"
                       << EscapeMarkdownInline(target ? target->DisplayName() + " (" + target->Tag() + ")"
                                                      : "C" + std::to_string(r.targetId))
                       << "**: " << Model::ToString(r.kind) << ", confidence " << FormatFixed(r.confidence, 2)
                       << "\n";
                }
                md << "\n";
            }
        }

        void WriteDiagnostics(std::ostringstream& md, const ReportModel& m) {
            if (m.diagnostics.empty()) {
                return;
            }
            md << "## Detection Notes\n\n";
            for (const auto& d : m.diagnostics) {
                md << "- `" << Model::ToString(d.code) << "` " << EscapeMarkdownInline(d.message) << "\n";
            }
            md << "\n";
        }

        void WriteBlock(std::ostringstream& md, const SubjectBlock& block) {
            md << "### " << EscapeMarkdownInline(block.title) << " [" << block.typeLabel << "]\n\n";
            if (block.findings.empty()) {
                md << "_No threats identified._\n\n";
                return;
            }

            md << "| Category | Threat | Severity | Countermeasure |\n";
            md << "|----------|--------|----------|----------------|\n";
            for (const ThreatFinding& f : block.findings) {
                md << "| **" << Model::ToString(f.category) << "** | " << EscapeMarkdownCell(f.description)
                   << " | " << Model::ToString(f.level) << " (" << FormatFixed(f.severity, 3) << ") | "
                   << EscapeMarkdownCell(f.countermeasure) << " |\n";
            }
            md << "\n";
        }

        void WriteRiskMatrix(std::ostringstream& md, const ReportSummary& s) {
            md << "## Risk Summary Matrix\n\n";

            md << "### By Severity\n\n";
            md << "| Severity | Count |\n";
            md << "|----------|-------|\n";
            for (const auto level : kSeverityOrder) {
                md << "| " << Model::ToString(level) << " | " << s.bySeverity[static_cast<size_t>(level)] << " |\n";
            }
            md << "\n";

            md << "### By STRIDE Category\n\n";
            md << "| Category | Count |\n";
            md << "|----------|-------|\n";
            for (const auto category : Model::kAllStrideCategories) {
                md << "| " << Model::ToString(category) << " | " << s.byCategory[static_cast<size_t>(category)] << " |\n";
            }
            md << "\n";
        }

        [[nodiscard]] Json FindingJson(const ThreatFinding& f) {
            Json j = Json::object();
            j["category"] = Model::ToString(f.category);
            j["categoryId"] = Model::CategoryIdentifier(f.category);
            j["description"] = f.description;
            j["countermeasure"] = f.countermeasure;
            j["severity"] = f.severity;
            j["level"] = Model::ToString(f.level);
            return j;
        }

    }  // namespace

    std::string RenderMarkdown(const ReportModel& m) {
        std::ostringstream md;
        const ReportSummary& s = m.summary;

        md << "# " << REPORT_TITLE << "\n\n";
        md << "**Source Diagram:** `" << (m.options.sourceLabel.empty() ? "unspecified" : EscapeMarkdownInline(m.options.sourceLabel)) << "`  \n";
        if (m.options.generatedAt) {
            md << "**Generated:** " << *m.options.generatedAt << "  \n";
        }
        if (!m.options.ruleTableVersion.empty()) {
            md << "**Rule Table:** " << m.options.ruleTableVersion << "  \n";
        }
        md << "**Overall Risk Level:** **" << RiskLabel(s.overallRisk) << "**\n\n";
        md << "---\n\n";

        md << "## Executive Summary\n\n" << EscapeMarkdownInline(m.executiveSummary) << "\n\n";

        md << "## Summary\n\n";
        md << "| Metric | Value |\n";
        md << "|--------|-------|\n";
        md << "| Components | " << s.componentCount << " |\n";
        md << "| Relationships | " << s.relationshipCount << " |\n";
        md << "| Findings | " << s.findingCount << " |\n";
        md << "| Highest-Severity Finding | " << EscapeMarkdownCell(HighestText(s)) << " |\n\n";

        WriteComponents(md, m);
        WriteDataFlow(md, m);
        WriteDiagnostics(md, m);

        md << "---\n\n";
        md << "## STRIDE Threat Analysis\n\n";
        if (m.blocks.empty()) {
            md << "_No components were found; there is nothing to analyze._\n\n";
        }
        for (const SubjectBlock& block : m.blocks) {
            WriteBlock(md, block);
        }

        md << "---\n\n";
        WriteRiskMatrix(md, s);

        md << "---\n\n" << kDisclaimer << "\n";
        return md.str();
    }

    Json RenderJson(const ReportModel& m) {
        const ReportSummary& s = m.summary;

        Json j = Json::object();
        j["title"] = REPORT_TITLE;
        j["source"] = m.options.sourceLabel;
        if (m.options.generatedAt) {
            j["generatedAt"] = *m.options.generatedAt;
        }
        if (!m.options.ruleTableVersion.empty()) {
            j["ruleTableVersion"] = m.options.ruleTableVersion;
        }
        j["overallRisk"] = RiskLabel(s.overallRisk);
        j["executiveSummary"] = m.executiveSummary;

        Json summary = Json::object();
        summary["components"] = s.componentCount;
        summary["relationships"] = s.relationshipCount;
        summary["findings"] = s.findingCount;
        if (s.highest) {
            Json top = FindingJson(s.highest->finding);
            top["subject"] = s.highest->subjectTitle;
            summary["highestFinding"] = std::move(top);
        }
        else {
            summary["highestFinding"] = nullptr;
        }
        j["summary"] = std::move(summary);

        Json components = Json::array();
        for (const auto& c : m.components) {
            Json box = Json::object();
            box["x"] = c.box.x;
            box["y"] = c.box.y;
            box["width"] = c.box.width;
            box["height"] = c.box.height;

            Json jc = Json::object();
            jc["id"] = c.id;
            jc["tag"] = c.Tag();
            jc["name"] = c.DisplayName();
            jc["type"] = Model::ToString(c.type);
            jc["confidence"] = c.confidence;
            jc["boundingBox"] = std::move(box);
            components.push_back(std::move(jc));
        }
        j["components"] = std::move(components);

        Json relationships = Json::array();
        for (const auto& r : m.relationships) {
            Json jr = Json::object();
            jr["sourceId"] = r.sourceId;
            jr["targetId"] = r.targetId;
            jr["kind"] = Model::ToString(r.kind);
            jr["directed"] = r.directed;
            jr["confidence"] = r.confidence;
            relationships.push_back(std::move(jr));
        }
        j["relationships"] = std::move(relationships);

        Json diagnostics = Json::array();
        for (const auto& d : m.diagnostics) {
            Json jd = Json::object();
            jd["detectionIndex"] = d.detectionIndex;
            jd["code"] = Model::ToString(d.code);
            jd["message"] = d.message;
            diagnostics.push_back(std::move(jd));
        }
        j["diagnostics"] = std::move(diagnostics);

        Json subjects = Json::array();
        for (const SubjectBlock& block : m.blocks) {
            Json jb = Json::object();
            jb["kind"] = Model::ToString(block.kind);
            if (block.kind == Model::SubjectKind::Component) {
                jb["componentId"] = block.componentId;
            }
            else {
                jb["sourceId"] = block.sourceId;
                jb["targetId"] = block.targetId;
                jb["directed"] = block.directed;
            }
            jb["title"] = block.title;
            jb["type"] = block.typeLabel;

            Json jf = Json::array();
            for (const ThreatFinding& f : block.findings) {
                jf.push_back(FindingJson(f));
            }
            jb["findings"] = std::move(jf);
            subjects.push_back(std::move(jb));
        }
        j["subjects"] = std::move(subjects);

        Json bySeverity = Json::object();
        for (const auto level : kSeverityOrder) {
            bySeverity[Model::ToString(level)] = s.bySeverity[static_cast<size_t>(level)];
        }
        Json byCategory = Json::object();
        for (const auto category : Model::kAllStrideCategories) {
            byCategory[Model::ToString(category)] = s.byCategory[static_cast<size_t>(category)];
        }
        Json matrix = Json::object();
        matrix["bySeverity"] = std::move(bySeverity);
        matrix["byCategory"] = std::move(byCategory);
        j["riskMatrix"] = std::move(matrix);

        return j;
    }

} // namespace StrideGraph::Report
