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

#include "TestHelpers.hpp"
#include "Model/Geometry.hpp"
#include "Normalizer/ComponentNormalizer.hpp"

using namespace StrideGraph;
using namespace StrideGraph::Testing;
using Model::ComponentType;
using Model::DiagnosticCode;
using Normalizer::ComponentNormalizer;

namespace {

    [[nodiscard]] size_t CountCode(const std::vector<Model::Diagnostic>& diags, DiagnosticCode code) {
        return static_cast<size_t>(std::count_if(diags.begin(), diags.end(),
            [code](const Model::Diagnostic& d) { return d.code == code; }));
    }

}  // namespace

class ComponentNormalizerTest : public ::testing::Test {
protected:
    Config::AnalysisConfig config_;
    ComponentNormalizer normalizer_{ config_ };
};

// ============================================================================
// Basic Contract
// ============================================================================

TEST_F(ComponentNormalizerTest, EmptyInputYieldsEmptyResult) {
    const auto result = normalizer_.Normalize({}, kSquareImage);
    EXPECT_TRUE(result.components.empty());
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(ComponentNormalizerTest, NormalizesPixelBoxesToUnitSpace) {
    const std::vector<Model::RawDetection> dets = { Det("Server", 0.8, 200, 100, 400, 50) };
    const auto result = normalizer_.Normalize(dets, { 2000, 500 });

    ASSERT_EQ(result.components.size(), 1u);
    const auto& c = result.components[0];
    EXPECT_EQ(c.id, 1u);
    EXPECT_EQ(c.type, ComponentType::Server);
    EXPECT_DOUBLE_EQ(c.box.x, 0.1);
    EXPECT_DOUBLE_EQ(c.box.y, 0.2);
    EXPECT_DOUBLE_EQ(c.box.width, 0.2);
    EXPECT_DOUBLE_EQ(c.box.height, 0.1);
    EXPECT_DOUBLE_EQ(c.confidence, 0.8);
}

TEST_F(ComponentNormalizerTest, TrimsLabelsAndMapsAliases) {
    const std::vector<Model::RawDetection> dets = {
        Det("  API Gateway ", 0.9, 100, 100, 100, 100),
        Det("load-balancer", 0.9, 400, 100, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 2u);
    EXPECT_EQ(result.components[0].label, "API Gateway");
    EXPECT_EQ(result.components[0].type, ComponentType::API);
    EXPECT_EQ(result.components[1].type, ComponentType::LoadBalancer);
}

TEST_F(ComponentNormalizerTest, UnmappedLabelsBecomeUnknownInsteadOfRejected) {
    const std::vector<Model::RawDetection> dets = { Det("Quantum Flux Capacitor", 0.7, 10, 10, 50, 50) };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components[0].type, ComponentType::Unknown);
    EXPECT_TRUE(result.diagnostics.empty());
}

// ============================================================================
// Thresholds & Skipped Detections
// ============================================================================

TEST_F(ComponentNormalizerTest, DropsDetectionsBelowConfidenceThreshold) {
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.2, 100, 100, 100, 100),
        Det("Database", 0.25, 400, 100, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components[0].type, ComponentType::Database);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::LowConfidence);
    EXPECT_EQ(result.diagnostics[0].detectionIndex, 0u);
}

TEST_F(ComponentNormalizerTest, SkipsMalformedAndOutOfRangeBoxesWithDiagnostics) {
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.9, 100, 100, 0, 100),          // zero width
        Det("Server", 0.9, 100, 100, 100, -5),         // negative height
        Det("Server", 0.9, 950, 100, 100, 100),        // past the right edge
        Det("Server", 0.9, -20, 100, 100, 100),        // left of the image
        Det("Server", 1.5, 100, 400, 100, 100),        // confidence out of range
        Det("Server", 0.9, 500, 500, 100, 100),        // valid
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_DOUBLE_EQ(result.components[0].box.x, 0.5);

    ASSERT_EQ(result.diagnostics.size(), 5u);
    EXPECT_EQ(CountCode(result.diagnostics, DiagnosticCode::MalformedBox), 2u);
    EXPECT_EQ(CountCode(result.diagnostics, DiagnosticCode::BoxOutOfRange), 2u);
    EXPECT_EQ(CountCode(result.diagnostics, DiagnosticCode::InvalidConfidence), 1u);

    for (size_t i = 0; i < result.diagnostics.size(); ++i) {
        EXPECT_EQ(result.diagnostics[i].detectionIndex, i);
        EXPECT_FALSE(result.diagnostics[i].message.empty());
    }
}

TEST_F(ComponentNormalizerTest, NonFiniteValuesAreSkipped) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    const std::vector<Model::RawDetection> dets = {
        Det("Server", nan, 100, 100, 100, 100),
        Det("Server", 0.9, inf, 100, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    EXPECT_TRUE(result.components.empty());
    ASSERT_EQ(result.diagnostics.size(), 2u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::InvalidConfidence);
    EXPECT_EQ(result.diagnostics[1].code, DiagnosticCode::MalformedBox);
}

TEST_F(ComponentNormalizerTest, ZeroImageDimensionsSkipEveryDetection) {
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.9, 10, 10, 10, 10),
        Det("User", 0.9, 50, 10, 10, 10),
    };
    const auto result = normalizer_.Normalize(dets, { 0, 600 });

    EXPECT_TRUE(result.components.empty());
    ASSERT_EQ(result.diagnostics.size(), 2u);
    EXPECT_EQ(CountCode(result.diagnostics, DiagnosticCode::InvalidImageDimensions), 2u);
}

TEST_F(ComponentNormalizerTest, ToleratesRoundingOvershootAtImageEdge) {
    const std::vector<Model::RawDetection> dets = { Det("Database", 0.9, 800, 900, 200.0005, 100) };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_LE(result.components[0].box.Right(), 1.0);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(ComponentNormalizerTest, BoxClampedToZeroSizeIsMalformed) {
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.9, 1000, 100, 0.0005, 100),    // starts on the right edge
        Det("Database", 0.9, 100, 1000, 100, 0.0005),  // starts on the bottom edge
        Det("User", 0.9, 500, 500, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components[0].type, ComponentType::User);

    ASSERT_EQ(result.diagnostics.size(), 2u);
    EXPECT_EQ(result.diagnostics[0].detectionIndex, 0u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::MalformedBox);
    EXPECT_EQ(result.diagnostics[1].detectionIndex, 1u);
    EXPECT_EQ(result.diagnostics[1].code, DiagnosticCode::MalformedBox);
}

// ============================================================================
// Deduplication
// ============================================================================

TEST_F(ComponentNormalizerTest, MergesDuplicateDetectionKeepingHigherConfidence) {
    // IoU(A, A') = (160 * 200) / (200 * 200) = 0.8
    const std::vector<Model::RawDetection> dets = {
        Det("database", 0.85, 100, 100, 160, 200),
        Det("Database", 0.9, 100, 100, 200, 200),
    };
    ASSERT_NEAR(Model::IntersectionOverUnion({ 0.1, 0.1, 0.16, 0.2 }, { 0.1, 0.1, 0.2, 0.2 }), 0.8, 1e-9);

    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    const auto& c = result.components[0];
    EXPECT_EQ(c.type, ComponentType::Database);
    EXPECT_DOUBLE_EQ(c.confidence, 0.9);
    EXPECT_EQ(c.label, "Database");
    EXPECT_DOUBLE_EQ(c.box.width, 0.2);

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::MergedDuplicate);
    EXPECT_EQ(result.diagnostics[0].detectionIndex, 0u);
}

TEST_F(ComponentNormalizerTest, KeepsModeratelyOverlappingDetections) {
    // IoU = (100 * 200) / (2 * 200 * 200 - 100 * 200) = 1/3
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.9, 100, 100, 200, 200),
        Det("Server", 0.8, 200, 100, 200, 200),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);
    EXPECT_EQ(result.components.size(), 2u);
}

TEST_F(ComponentNormalizerTest, MergedTypeComesFromWinningDetection) {
    const std::vector<Model::RawDetection> dets = {
        Det("Server", 0.6, 300, 300, 100, 100),
        Det("API", 0.95, 302, 301, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components[0].type, ComponentType::API);
    EXPECT_DOUBLE_EQ(result.components[0].box.x, 0.302);
}

TEST_F(ComponentNormalizerTest, CustomIouThresholdIsHonoured) {
    Config::AnalysisConfig strict;
    strict.iouMergeThreshold = 0.9;
    const ComponentNormalizer normalizer(strict);

    const std::vector<Model::RawDetection> dets = {
        Det("database", 0.85, 100, 100, 160, 200),
        Det("Database", 0.9, 100, 100, 200, 200),
    };
    EXPECT_EQ(normalizer.Normalize(dets, kSquareImage).components.size(), 2u);
}

// ============================================================================
// Id Assignment & Determinism
// ============================================================================

TEST_F(ComponentNormalizerTest, AssignsIdsByAscendingPosition) {
    const std::vector<Model::RawDetection> dets = {
        Det("Database", 0.9, 700, 100, 100, 100),
        Det("User", 0.9, 100, 500, 100, 100),
        Det("Server", 0.9, 400, 100, 100, 100),
        Det("API", 0.9, 100, 100, 100, 100),
    };
    const auto result = normalizer_.Normalize(dets, kSquareImage);

    ASSERT_EQ(result.components.size(), 4u);
    EXPECT_EQ(result.components[0].type, ComponentType::API);
    EXPECT_EQ(result.components[1].type, ComponentType::User);
    EXPECT_EQ(result.components[2].type, ComponentType::Server);
    EXPECT_EQ(result.components[3].type, ComponentType::Database);
    for (size_t i = 0; i < result.components.size(); ++i) {
        EXPECT_EQ(result.components[i].id, static_cast<Model::ComponentId>(i + 1));
    }
}

TEST_F(ComponentNormalizerTest, InputOrderDoesNotAffectOutput) {
    std::vector<Model::RawDetection> dets = {
        Det("User", 0.9, 50, 50, 100, 100),
        Det("API", 0.88, 250, 50, 100, 100),
        Det("api", 0.7, 255, 52, 100, 100),
        Det("Server", 0.91, 450, 60, 120, 100),
        Det("Database", 0.8, 700, 80, 100, 140),
        Det("thing", 0.5, 300, 600, 80, 80),
    };
    const auto reference = normalizer_.Normalize(dets, kSquareImage);

    std::reverse(dets.begin(), dets.end());
    const auto reversed = normalizer_.Normalize(dets, kSquareImage);
    ExpectSameComponents(reference.components, reversed.components);

    std::rotate(dets.begin(), dets.begin() + 2, dets.end());
    const auto rotated = normalizer_.Normalize(dets, kSquareImage);
    ExpectSameComponents(reference.components, rotated.components);
}

TEST_F(ComponentNormalizerTest, RenormalizingOutputChangesNothing) {
    const std::vector<Model::RawDetection> dets = {
        Det("Database", 0.9, 100, 100, 200, 200),
        Det("database", 0.85, 100, 100, 160, 200),
        Det("Server", 0.7, 180, 150, 200, 200),
        Det("Server", 0.65, 600, 600, 150, 150),
        Det("User", 0.3, 640, 620, 150, 150),
        Det("API", 0.95, 400, 50, 100, 60),
    };
    const auto first = normalizer_.Normalize(dets, kSquareImage);
    ASSERT_FALSE(first.components.empty());

    const auto second = normalizer_.Renormalize(first.components);
    EXPECT_TRUE(second.diagnostics.empty());
    ExpectSameComponents(first.components, second.components);

    const auto third = normalizer_.Renormalize(second.components);
    ExpectSameComponents(second.components, third.components);
}
