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
#include "ThreatModelTypes.hpp"

#include "../Utils/StringUtils.hpp"

namespace StrideGraph::Model {

    using Utils::StringUtils::FoldKey;

    const char* ToString(ComponentType type) noexcept {
        switch (type) {
        case ComponentType::Server:       return "Server";
        case ComponentType::Database:     return "Database";
        case ComponentType::User:         return "User";
        case ComponentType::LoadBalancer: return "LoadBalancer";
        case ComponentType::API:          return "API";
        case ComponentType::Unknown:      return "Unknown";
        }
        return "Unknown";
    }

    const char* ToString(StrideCategory category) noexcept {
        switch (category) {
        case StrideCategory::Spoofing:              return "Spoofing";
        case StrideCategory::Tampering:             return "Tampering";
        case StrideCategory::Repudiation:           return "Repudiation";
        case StrideCategory::InformationDisclosure: return "Information Disclosure";
        case StrideCategory::DenialOfService:       return "Denial of Service";
        case StrideCategory::ElevationOfPrivilege:  return "Elevation of Privilege";
        }
        return "Spoofing";
    }

    const char* CategoryIdentifier(StrideCategory category) noexcept {
        switch (category) {
        case StrideCategory::Spoofing:              return "Spoofing";
        case StrideCategory::Tampering:             return "Tampering";
        case StrideCategory::Repudiation:           return "Repudiation";
        case StrideCategory::InformationDisclosure: return "InformationDisclosure";
        case StrideCategory::DenialOfService:       return "DenialOfService";
        case StrideCategory::ElevationOfPrivilege:  return "ElevationOfPrivilege";
        }
        return "Spoofing";
    }

    const char* ToString(RuleRole role) noexcept {
        switch (role) {
        case RuleRole::Node:       return "Node";
        case RuleRole::EdgeSource: return "EdgeSource";
        case RuleRole::EdgeTarget: return "EdgeTarget";
        }
        return "Node";
    }

    const char* ToString(RelationshipKind kind) noexcept {
        switch (kind) {
        case RelationshipKind::CommunicatesWith: return "CommunicatesWith";
        }
        return "CommunicatesWith";
    }

    const char* ToString(SubjectKind kind) noexcept {
        switch (kind) {
        case SubjectKind::Component:    return "Component";
        case SubjectKind::Relationship: return "Relationship";
        }
        return "Component";
    }

    const char* ToString(SeverityLevel level) noexcept {
        switch (level) {
        case SeverityLevel::Low:      return "Low";
        case SeverityLevel::Medium:   return "Medium";
        case SeverityLevel::High:     return "High";
        case SeverityLevel::Critical: return "Critical";
        }
        return "Low";
    }

    const char* ToString(DiagnosticCode code) noexcept {
        switch (code) {
        case DiagnosticCode::InvalidImageDimensions: return "InvalidImageDimensions";
        case DiagnosticCode::InvalidConfidence:      return "InvalidConfidence";
        case DiagnosticCode::LowConfidence:          return "LowConfidence";
        case DiagnosticCode::MalformedBox:           return "MalformedBox";
        case DiagnosticCode::BoxOutOfRange:          return "BoxOutOfRange";
        case DiagnosticCode::MergedDuplicate:        return "MergedDuplicate";
        }
        return "MalformedBox";
    }

    std::optional<ComponentType> ParseComponentType(std::string_view text) {
        const std::string key = FoldKey(text);
        for (const ComponentType type : kAllComponentTypes) {
            if (key == FoldKey(ToString(type))) {
                return type;
            }
        }
        return std::nullopt;
    }

    std::optional<StrideCategory> ParseStrideCategory(std::string_view text) {
        // "Information Disclosure" and "InformationDisclosure" fold to the same key
        const std::string key = FoldKey(text);
        for (const StrideCategory category : kAllStrideCategories) {
            if (key == FoldKey(ToString(category))) {
                return category;
            }
        }
        return std::nullopt;
    }

    std::optional<RuleRole> ParseRuleRole(std::string_view text) {
        const std::string key = FoldKey(text);
        for (const RuleRole role : { RuleRole::Node, RuleRole::EdgeSource, RuleRole::EdgeTarget }) {
            if (key == FoldKey(ToString(role))) {
                return role;
            }
        }
        return std::nullopt;
    }

    SeverityLevel SeverityLevelFor(double severity) noexcept {
        if (severity >= 0.75) {
            return SeverityLevel::Critical;
        }
        if (severity >= 0.5) {
            return SeverityLevel::High;
        }
        if (severity >= 0.25) {
            return SeverityLevel::Medium;
        }
        return SeverityLevel::Low;
    }

    SeverityWeights DefaultSeverityWeights() noexcept {
        SeverityWeights w;
        w.Set(StrideCategory::Spoofing, 0.8);
        w.Set(StrideCategory::Tampering, 0.9);
        w.Set(StrideCategory::Repudiation, 0.5);
        w.Set(StrideCategory::InformationDisclosure, 0.8);
        w.Set(StrideCategory::DenialOfService, 0.7);
        w.Set(StrideCategory::ElevationOfPrivilege, 1.0);
        return w;
    }

    std::string DetectedComponent::Tag() const {
        return "C" + std::to_string(id);
    }

    std::string DetectedComponent::DisplayName() const {
        return label.empty() ? std::string(ToString(type)) : label;
    }

    std::string Relationship::Tag() const {
        return "C" + std::to_string(sourceId) + (directed ? "->" : "<->") + "C" + std::to_string(targetId);
    }

    const DetectedComponent* ThreatGraph::FindComponent(ComponentId id) const noexcept {
        if (id == 0 || id > components.size()) {
            return nullptr;
        }
        const DetectedComponent& c = components[id - 1];
        return c.id == id ? &c : nullptr;
    }

} // namespace StrideGraph::Model
