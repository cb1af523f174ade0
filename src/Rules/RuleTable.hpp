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
 * StrideGraph - Rule Table
 * ============================================================================
 *
 * @file RuleTable.hpp
 * @brief Versioned, read-only mapping (component type, role) -> STRIDE rules
 *
 * The table is pure data: adding a component type or a threat means adding
 * rows, never touching the reasoner. A table only exists in a validated
 * state; every factory checks:
 *   - completeness: each ComponentType has at least one Node rule
 *   - templates are non-empty and well-formed
 *   - templates only use the placeholders of their role
 *
 * JSON format (also produced by ToJson):
 * @code
 *   {
 *     "version": "my-rules-1",
 *     "rules": [
 *       { "componentType": "API", "role": "Node", "category": "Spoofing",
 *         "description": "...{name}...", "countermeasure": "..." }
 *     ]
 *   }
 * @endcode
 *
 * Thread Safety:
 *   Immutable after construction. Share by const reference across any
 *   number of concurrent analyses.
 * ============================================================================
 */

#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../Model/ThreatModelTypes.hpp"
#include "../Utils/JSONUtils.hpp"

namespace StrideGraph::Rules {

    struct RuleTableError {
        std::string message;
        std::filesystem::path path;                   ///< Set when loading from a file
        std::optional<size_t> ruleIndex;              ///< Offending row, if any

        [[nodiscard]] std::string ToString() const;
    };

    class RuleTable {
    public:
        /**
         * @brief Build a table from rows, validating it.
         *
         * @return std::nullopt with @p err filled when validation fails
         */
        [[nodiscard]] static std::optional<RuleTable> FromEntries(
            std::string version,
            std::vector<Model::RuleEntry> entries,
            RuleTableError* err = nullptr
        );

        [[nodiscard]] static std::optional<RuleTable> FromJson(
            const Utils::JSON::Json& j,
            RuleTableError* err = nullptr
        ) noexcept;

        [[nodiscard]] static std::optional<RuleTable> LoadFromFile(
            const std::filesystem::path& path,
            RuleTableError* err = nullptr
        ) noexcept;

        /**
         * @brief The compiled-in table, built once per process.
         *
         * @throws std::logic_error if the compiled-in rows fail validation
         */
        [[nodiscard]] static const RuleTable& BuiltIn();

        [[nodiscard]] const std::string& Version() const noexcept { return m_version; }
        [[nodiscard]] std::span<const Model::RuleEntry> Entries() const noexcept { return m_entries; }
        [[nodiscard]] size_t Size() const noexcept { return m_entries.size(); }

        /// Rows for (type, role) in table order; empty when there are none
        [[nodiscard]] std::vector<const Model::RuleEntry*> Find(Model::ComponentType type,
                                                                Model::RuleRole role) const;

        [[nodiscard]] Utils::JSON::Json ToJson() const;

    private:
        static constexpr size_t kRoleCount = 3;
        static constexpr size_t kSlotCount = Model::kAllComponentTypes.size() * kRoleCount;

        RuleTable() = default;

        [[nodiscard]] static size_t SlotOf(Model::ComponentType type, Model::RuleRole role) noexcept {
            return static_cast<size_t>(type) * kRoleCount + static_cast<size_t>(role);
        }

        std::string m_version;
        std::vector<Model::RuleEntry> m_entries;
        std::array<std::vector<size_t>, kSlotCount> m_index;
    };

} // namespace StrideGraph::Rules
