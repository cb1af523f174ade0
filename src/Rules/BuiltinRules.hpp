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
 * @file BuiltinRules.hpp
 * @brief The rule records compiled into the engine.
 */

#pragma once

#include <span>

#include "../Model/ThreatModelTypes.hpp"

namespace StrideGraph::Rules {

    inline constexpr const char* BUILTIN_RULES_VERSION = "stride-builtin-1.2";

    struct RuleRecord {
        Model::ComponentType componentType;
        Model::RuleRole role;
        Model::StrideCategory category;
        const char* description;
        const char* countermeasure;
    };

    [[nodiscard]] std::span<const RuleRecord> BuiltinRuleRecords() noexcept;

} // namespace StrideGraph::Rules
