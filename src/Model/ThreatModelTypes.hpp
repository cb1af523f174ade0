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
 * StrideGraph - Threat Model Types
 * ============================================================================
 *
 * @file ThreatModelTypes.hpp
 * @brief Value types shared by every stage of the analysis pipeline.
 *
 * The types form an index-based graph: components are addressed by a
 * 1-based ComponentId (their position in ThreatGraph::components plus one)
 * and relationships refer to components only through ids, never through
 * pointers, so a graph is a plain copyable value.
 *
 * Thread Safety:
 *   Plain value types. A ThreatGraph is never mutated after it is built and
 *   may be read from any number of threads.
 * ============================================================================
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StrideGraph::Model {

    // ============================================================================
    // Enumerations
    // ============================================================================

    /**
     * @brief Closed set of architecture component types.
     *
     * Labels the detector emits that match none of these become Unknown.
     */
    enum class ComponentType : uint8_t {
        Server       = 0,
        Database     = 1,
        User         = 2,
        LoadBalancer = 3,
        API          = 4,
        Unknown      = 5
    };

    inline constexpr std::array<ComponentType, 6> kAllComponentTypes = {
        ComponentType::Server, ComponentType::Database, ComponentType::User,
        ComponentType::LoadBalancer, ComponentType::API, ComponentType::Unknown
    };

    /**
     * @brief The six STRIDE threat categories.
     */
    enum class StrideCategory : uint8_t {
        Spoofing              = 0,
        Tampering             = 1,
        Repudiation           = 2,
        InformationDisclosure = 3,
        DenialOfService       = 4,
        ElevationOfPrivilege  = 5
    };

    inline constexpr size_t kStrideCategoryCount = 6;

    inline constexpr std::array<StrideCategory, kStrideCategoryCount> kAllStrideCategories = {
        StrideCategory::Spoofing, StrideCategory::Tampering, StrideCategory::Repudiation,
        StrideCategory::InformationDisclosure, StrideCategory::DenialOfService,
        StrideCategory::ElevationOfPrivilege
    };

    /**
     * @brief Role a component plays for a rule lookup.
     */
    enum class RuleRole : uint8_t {
        Node       = 0,   ///< The component itself
        EdgeSource = 1,   ///< Component is the origin of a relationship
        EdgeTarget = 2    ///< Component is the destination of a relationship
    };

    enum class RelationshipKind : uint8_t {
        CommunicatesWith = 0
    };

    enum class SubjectKind : uint8_t {
        Component    = 0,
        Relationship = 1
    };

    /**
     * @brief Severity band derived from a numeric severity score.
     */
    enum class SeverityLevel : uint8_t {
        Low      = 0,
        Medium   = 1,
        High     = 2,
        Critical = 3
    };

    [[nodiscard]] const char* ToString(ComponentType type) noexcept;
    [[nodiscard]] const char* ToString(StrideCategory category) noexcept;
    [[nodiscard]] const char* ToString(RuleRole role) noexcept;
    [[nodiscard]] const char* ToString(RelationshipKind kind) noexcept;
    [[nodiscard]] const char* ToString(SubjectKind kind) noexcept;
    [[nodiscard]] const char* ToString(SeverityLevel level) noexcept;

    /// Enum identifier of a category ("InformationDisclosure"); ToString gives the display name
    [[nodiscard]] const char* CategoryIdentifier(StrideCategory category) noexcept;

    /// Case/punctuation-insensitive parsers. Accept the enum identifier or display name.
    [[nodiscard]] std::optional<ComponentType> ParseComponentType(std::string_view text);
    [[nodiscard]] std::optional<StrideCategory> ParseStrideCategory(std::string_view text);
    [[nodiscard]] std::optional<RuleRole> ParseRuleRole(std::string_view text);

    /**
     * @brief Map a severity score to its band.
     *
     * >= 0.75 Critical, >= 0.5 High, >= 0.25 Medium, otherwise Low.
     */
    [[nodiscard]] SeverityLevel SeverityLevelFor(double severity) noexcept;

    // ============================================================================
    // Geometry
    // ============================================================================

    using ComponentId = uint32_t;

    /**
     * @brief Axis-aligned rectangle, top-left origin.
     *
     * In a DetectedComponent the values are normalized to [0,1] image space.
     */
    struct BoundingBox {
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;

        [[nodiscard]] double Right() const noexcept { return x + width; }
        [[nodiscard]] double Bottom() const noexcept { return y + height; }
        [[nodiscard]] double CenterX() const noexcept { return x + width * 0.5; }
        [[nodiscard]] double CenterY() const noexcept { return y + height * 0.5; }
        [[nodiscard]] double Area() const noexcept { return width * height; }

        bool operator==(const BoundingBox&) const = default;
    };

    struct ImageDimensions {
        uint32_t width = 0;
        uint32_t height = 0;

        [[nodiscard]] bool IsValid() const noexcept { return width > 0 && height > 0; }
    };

    // ============================================================================
    // Pipeline Records
    // ============================================================================

    /**
     * @brief One raw output of the external detector. Box is in pixels.
     */
    struct RawDetection {
        std::string label;
        double confidence = 0.0;
        BoundingBox box;
    };

    /**
     * @brief Canonical component produced by the normalizer.
     */
    struct DetectedComponent {
        ComponentId id = 0;
        ComponentType type = ComponentType::Unknown;
        std::string label;                 ///< Trimmed detector label
        BoundingBox box;                   ///< Normalized to [0,1]
        double confidence = 0.0;

        /// "C<id>"
        [[nodiscard]] std::string Tag() const;

        /// Label, or the type name when the detector label was blank
        [[nodiscard]] std::string DisplayName() const;
    };

    struct Relationship {
        ComponentId sourceId = 0;
        ComponentId targetId = 0;
        RelationshipKind kind = RelationshipKind::CommunicatesWith;
        bool directed = true;              ///< false: single canonical edge, sourceId < targetId
        double confidence = 0.0;           ///< Geometric proximity in [0,1]

        /// "C1->C2" or "C1<->C2"
        [[nodiscard]] std::string Tag() const;
    };

    enum class DiagnosticCode : uint8_t {
        InvalidImageDimensions = 0,
        InvalidConfidence      = 1,
        LowConfidence          = 2,
        MalformedBox           = 3,
        BoxOutOfRange          = 4,
        MergedDuplicate        = 5
    };

    [[nodiscard]] const char* ToString(DiagnosticCode code) noexcept;

    /**
     * @brief Note recorded for a detection that was skipped or merged.
     */
    struct Diagnostic {
        size_t detectionIndex = 0;         ///< Position in the caller's input sequence
        DiagnosticCode code = DiagnosticCode::MalformedBox;
        std::string message;
    };

    /**
     * @brief Nodes and edges of one analyzed image.
     *
     * components[i].id == i + 1; relationships sorted by (sourceId, targetId);
     * adjacency[i] lists the indices into relationships whose sourceId is i + 1.
     */
    struct ThreatGraph {
        ImageDimensions image;
        std::vector<DetectedComponent> components;
        std::vector<Relationship> relationships;
        std::vector<std::vector<size_t>> adjacency;
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] const DetectedComponent* FindComponent(ComponentId id) const noexcept;
        [[nodiscard]] bool Empty() const noexcept { return components.empty(); }
    };

    // ============================================================================
    // Rules & Findings
    // ============================================================================

    struct RuleEntry {
        ComponentType componentType = ComponentType::Unknown;
        RuleRole role = RuleRole::Node;
        StrideCategory category = StrideCategory::Spoofing;
        std::string descriptionTemplate;
        std::string countermeasureTemplate;
    };

    /**
     * @brief Per-category base weight used to derive a finding's severity.
     */
    struct SeverityWeights {
        std::array<double, kStrideCategoryCount> weights{};

        [[nodiscard]] double Of(StrideCategory category) const noexcept {
            return weights[static_cast<size_t>(category)];
        }
        void Set(StrideCategory category, double weight) noexcept {
            weights[static_cast<size_t>(category)] = weight;
        }
    };

    /// EoP 1.0, Tampering 0.9, Spoofing 0.8, Information Disclosure 0.8, DoS 0.7, Repudiation 0.5
    [[nodiscard]] SeverityWeights DefaultSeverityWeights() noexcept;

    struct ThreatFinding {
        SubjectKind subjectKind = SubjectKind::Component;
        ComponentId componentId = 0;       ///< Set for SubjectKind::Component
        ComponentId sourceId = 0;          ///< Set for SubjectKind::Relationship
        ComponentId targetId = 0;          ///< Set for SubjectKind::Relationship
        StrideCategory category = StrideCategory::Spoofing;
        std::string description;
        std::string countermeasure;
        double severity = 0.0;             ///< baseSeverity(category) x confidence, 3 decimals
        SeverityLevel level = SeverityLevel::Low;
    };

} // namespace StrideGraph::Model
