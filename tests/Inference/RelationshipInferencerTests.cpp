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

#include <set>
#include <tuple>
#include <stdexcept>

#include "TestHelpers.hpp"
#include "Inference/RelationshipInferencer.hpp"

using namespace StrideGraph;
using namespace StrideGraph::Testing;
using Inference::EdgeOrientation;
using Inference::RelationshipInferencer;
using Model::ComponentType;

class RelationshipInferencerTest : public ::testing::Test {
protected:
    Config::AnalysisConfig config_;
    RelationshipInferencer inferencer_{ config_ };
};

// ============================================================================
// Direction Table
// ============================================================================

TEST(EdgeOrientationTests, CanonicalPairsAreOrientedEitherWay) {
    EXPECT_EQ(Inference::OrientationFor(ComponentType::User, ComponentType::API), EdgeOrientation::Forward);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::API, ComponentType::User), EdgeOrientation::Reverse);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::API, ComponentType::Server), EdgeOrientation::Forward);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::Database, ComponentType::Server), EdgeOrientation::Reverse);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::LoadBalancer, ComponentType::Server), EdgeOrientation::Forward);
}

TEST(EdgeOrientationTests, OtherPairsAreUndirected) {
    EXPECT_EQ(Inference::OrientationFor(ComponentType::Server, ComponentType::Server), EdgeOrientation::Undirected);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::User, ComponentType::Database), EdgeOrientation::Undirected);
    EXPECT_EQ(Inference::OrientationFor(ComponentType::Unknown, ComponentType::API), EdgeOrientation::Undirected);
}

TEST(EdgeOrientationTests, TableHasNoContradictoryEntries) {
    const auto table = Inference::CanonicalDirections();
    for (const auto& a : table) {
        EXPECT_NE(a.from, a.to);
        for (const auto& b : table) {
            EXPECT_FALSE(a.from == b.to && a.to == b.from);
        }
    }
}

// ============================================================================
// Inference
// ============================================================================

TEST_F(RelationshipInferencerTest, FewerThanTwoComponentsYieldNoRelationships) {
    EXPECT_TRUE(inferencer_.Infer({}, kSquareImage).empty());

    const std::vector<Model::DetectedComponent> one = { Comp(1, ComponentType::Server, 0.1, 0.1, 0.1, 0.1) };
    EXPECT_TRUE(inferencer_.Infer(one, kSquareImage).empty());
}

TEST_F(RelationshipInferencerTest, ZeroSizedImageYieldsNoRelationships) {
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.1, 0.1, 0.1, 0.1),
        Comp(2, ComponentType::API, 0.1, 0.1, 0.1, 0.1),
    };
    EXPECT_TRUE(inferencer_.Infer(comps, Model::ImageDimensions{ 0, 0 }).empty());
    EXPECT_TRUE(inferencer_.Infer(comps, Model::ImageDimensions{ 1000, 0 }).empty());
}

TEST_F(RelationshipInferencerTest, NearbyUserAndApiConnectUserToApi) {
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.05, 0.05, 0.1, 0.1),
        Comp(2, ComponentType::API, 0.25, 0.05, 0.1, 0.1),
    };
    const auto rels = inferencer_.Infer(comps, kSquareImage);

    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].sourceId, 1u);
    EXPECT_EQ(rels[0].targetId, 2u);
    EXPECT_TRUE(rels[0].directed);
    EXPECT_EQ(rels[0].kind, Model::RelationshipKind::CommunicatesWith);
    // 200 px apart on a 1000 x 1000 canvas
    EXPECT_NEAR(rels[0].confidence, 1.0 - 200.0 / std::hypot(1000.0, 1000.0), 1e-9);
}

TEST_F(RelationshipInferencerTest, CanonicalDirectionOverridesIdOrder) {
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::Database, 0.05, 0.05, 0.1, 0.1),
        Comp(2, ComponentType::Server, 0.25, 0.05, 0.1, 0.1),
    };
    const auto rels = inferencer_.Infer(comps, kSquareImage);

    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].sourceId, 2u);
    EXPECT_EQ(rels[0].targetId, 1u);
    EXPECT_TRUE(rels[0].directed);
}

TEST_F(RelationshipInferencerTest, FarApartComponentsDoNotConnect) {
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.0, 0.0, 0.1, 0.1),
        Comp(2, ComponentType::API, 0.9, 0.9, 0.1, 0.1),
    };
    EXPECT_TRUE(inferencer_.Infer(comps, kSquareImage).empty());
}

TEST_F(RelationshipInferencerTest, AdjacentThirdsConnectOppositeThirdsDoNot) {
    // Centers at 1/6, 1/2 and 5/6 of the width
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.1167, 0.45, 0.1, 0.1),
        Comp(2, ComponentType::API, 0.45, 0.45, 0.1, 0.1),
        Comp(3, ComponentType::Server, 0.7833, 0.45, 0.1, 0.1),
    };
    const auto rels = inferencer_.Infer(comps, kSquareImage);

    ASSERT_EQ(rels.size(), 2u);
    EXPECT_EQ(rels[0].sourceId, 1u);
    EXPECT_EQ(rels[0].targetId, 2u);
    EXPECT_EQ(rels[1].sourceId, 2u);
    EXPECT_EQ(rels[1].targetId, 3u);
}

TEST_F(RelationshipInferencerTest, SymmetricPairsBecomeOneUndirectedRelationship) {
    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::Server, 0.1, 0.1, 0.1, 0.1),
        Comp(2, ComponentType::Server, 0.3, 0.1, 0.1, 0.1),
    };
    const auto rels = inferencer_.Infer(comps, kSquareImage);

    ASSERT_EQ(rels.size(), 1u);
    EXPECT_FALSE(rels[0].directed);
    EXPECT_EQ(rels[0].sourceId, 1u);
    EXPECT_EQ(rels[0].targetId, 2u);
    EXPECT_EQ(rels[0].Tag(), "C1<->C2");
}

TEST_F(RelationshipInferencerTest, ThresholdIsConfigurable) {
    Config::AnalysisConfig loose;
    loose.proximityThreshold = 0.0;
    const RelationshipInferencer inferencer(loose);

    const std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.0, 0.0, 0.1, 0.1),
        Comp(2, ComponentType::API, 0.9, 0.9, 0.1, 0.1),
    };
    EXPECT_EQ(inferencer.Infer(comps, kSquareImage).size(), 1u);
}

TEST_F(RelationshipInferencerTest, NoSelfEdgesAndAtMostOneRelationshipPerPair) {
    Config::AnalysisConfig loose;
    loose.proximityThreshold = 0.3;
    const RelationshipInferencer inferencer(loose);

    std::vector<Model::DetectedComponent> comps;
    Model::ComponentId id = 1;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            const auto type = Model::kAllComponentTypes[(row * 3 + col) % Model::kAllComponentTypes.size()];
            comps.push_back(Comp(id++, type, 0.05 + col * 0.3, 0.05 + row * 0.3, 0.1, 0.1));
        }
    }

    const auto rels = inferencer.Infer(comps, kSquareImage);
    ASSERT_FALSE(rels.empty());

    std::set<std::pair<Model::ComponentId, Model::ComponentId>> pairs;
    for (size_t i = 0; i < rels.size(); ++i) {
        const auto& r = rels[i];
        EXPECT_NE(r.sourceId, r.targetId);
        EXPECT_GE(r.confidence, 0.0);
        EXPECT_LE(r.confidence, 1.0);
        if (!r.directed) {
            EXPECT_LT(r.sourceId, r.targetId);
        }
        const auto key = std::minmax(r.sourceId, r.targetId);
        EXPECT_TRUE(pairs.insert({ key.first, key.second }).second) << r.Tag();

        if (i > 0) {
            EXPECT_LE(std::tie(rels[i - 1].sourceId, rels[i - 1].targetId), std::tie(r.sourceId, r.targetId));
        }
    }
}

// ============================================================================
// Graph Assembly
// ============================================================================

TEST_F(RelationshipInferencerTest, BuildGraphFillsAdjacencyBySource) {
    std::vector<Model::DetectedComponent> comps = {
        Comp(3, ComponentType::Database, 0.45, 0.1, 0.1, 0.1),
        Comp(1, ComponentType::User, 0.05, 0.1, 0.1, 0.1),
        Comp(2, ComponentType::Server, 0.25, 0.1, 0.1, 0.1),
    };
    const auto graph = inferencer_.BuildGraph(std::move(comps), kSquareImage);

    ASSERT_EQ(graph.components.size(), 3u);
    for (size_t i = 0; i < graph.components.size(); ++i) {
        EXPECT_EQ(graph.components[i].id, static_cast<Model::ComponentId>(i + 1));
    }

    ASSERT_EQ(graph.adjacency.size(), 3u);
    for (size_t c = 0; c < graph.adjacency.size(); ++c) {
        for (const size_t r : graph.adjacency[c]) {
            EXPECT_EQ(graph.relationships[r].sourceId, static_cast<Model::ComponentId>(c + 1));
        }
    }

    size_t listed = 0;
    for (const auto& out : graph.adjacency) {
        listed += out.size();
    }
    EXPECT_EQ(listed, graph.relationships.size());
    EXPECT_NE(graph.FindComponent(2), nullptr);
    EXPECT_EQ(graph.FindComponent(4), nullptr);
}

TEST_F(RelationshipInferencerTest, BuildGraphRejectsNonContiguousIds) {
    std::vector<Model::DetectedComponent> comps = {
        Comp(1, ComponentType::User, 0.05, 0.1, 0.1, 0.1),
        Comp(3, ComponentType::Server, 0.25, 0.1, 0.1, 0.1),
    };
    EXPECT_THROW((void)inferencer_.BuildGraph(std::move(comps), kSquareImage), std::logic_error);
}
