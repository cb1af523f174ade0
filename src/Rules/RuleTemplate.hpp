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
 * @file RuleTemplate.hpp
 * @brief "{placeholder}" templates used by rule descriptions and countermeasures.
 *
 * Syntax: text with {name} placeholders, name = [A-Za-z]+. There is no
 * escape sequence; a lone '{' or '}' is a syntax error.
 *
 * Node rules may use:  {id} {name} {type} {confidence}
 * Edge rules may use:  {source} {target} {sourceId} {targetId}
 *                      {sourceType} {targetType} {confidence}
 */

#pragma once

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../Model/ThreatModelTypes.hpp"

namespace StrideGraph::Rules {

    using TemplateFields = std::map<std::string, std::string, std::less<>>;

    /// Placeholder names a template of @p role may reference
    [[nodiscard]] std::span<const std::string_view> AllowedPlaceholders(Model::RuleRole role) noexcept;

    /**
     * @brief Collect the placeholder names of a template, in order of appearance.
     *
     * @param error Receives a description of the first syntax error
     * @return false on a syntax error
     */
    [[nodiscard]] bool ExtractPlaceholders(std::string_view tmpl,
                                           std::vector<std::string>& names,
                                           std::string& error);

    /**
     * @brief Substitute every placeholder of @p tmpl from @p fields.
     *
     * @throws std::logic_error on a syntax error or a placeholder that has no
     *         field. Templates are validated when a RuleTable is built, so
     *         this indicates a bug in the caller.
     */
    [[nodiscard]] std::string RenderTemplate(std::string_view tmpl, const TemplateFields& fields);

} // namespace StrideGraph::Rules
