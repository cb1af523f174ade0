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
#include "RuleTemplate.hpp"

#include <stdexcept>

namespace StrideGraph::Rules {

    namespace {

        constexpr std::array<std::string_view, 4> kNodePlaceholders = {
            "id", "name", "type", "confidence"
        };

        constexpr std::array<std::string_view, 7> kEdgePlaceholders = {
            "source", "target", "sourceId", "targetId", "sourceType", "targetType", "confidence"
        };

        [[nodiscard]] bool IsNameChar(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        /**
         * Walks the template once; @p onText gets literal runs, @p onField
         * gets placeholder names. Returns false with @p error set on bad syntax.
         */
        template <typename TextFn, typename FieldFn>
        bool Scan(std::string_view tmpl, TextFn&& onText, FieldFn&& onField, std::string& error) {
            size_t pos = 0;
            while (pos < tmpl.size()) {
                const size_t open = tmpl.find_first_of("{}", pos);
                if (open == std::string_view::npos) {
                    onText(tmpl.substr(pos));
                    break;
                }
                if (tmpl[open] == '}') {
                    error = "unmatched '}' at offset " + std::to_string(open);
                    return false;
                }
                onText(tmpl.substr(pos, open - pos));

                const size_t close = tmpl.find('}', open + 1);
                if (close == std::string_view::npos) {
                    error = "unterminated placeholder at offset " + std::to_string(open);
                    return false;
                }
                const std::string_view name = tmpl.substr(open + 1, close - open - 1);
                if (name.empty() || !std::all_of(name.begin(), name.end(), IsNameChar)) {
                    error = "invalid placeholder '{" + std::string(name) + "}'";
                    return false;
                }
                onField(name);
                pos = close + 1;
            }
            return true;
        }

    }  // namespace

    std::span<const std::string_view> AllowedPlaceholders(Model::RuleRole role) noexcept {
        if (role == Model::RuleRole::Node) {
            return kNodePlaceholders;
        }
        return kEdgePlaceholders;
    }

    bool ExtractPlaceholders(std::string_view tmpl, std::vector<std::string>& names, std::string& error) {
        names.clear();
        return Scan(
            tmpl,
            [](std::string_view) {},
            [&names](std::string_view name) { names.emplace_back(name); },
            error);
    }

    std::string RenderTemplate(std::string_view tmpl, const TemplateFields& fields) {
        std::string out;
        out.reserve(tmpl.size() + 32);

        std::string error;
        const bool ok = Scan(
            tmpl,
            [&out](std::string_view text) { out.append(text); },
            [&](std::string_view name) {
                const auto it = fields.find(name);
                if (it == fields.end()) {
                    throw std::logic_error("template references missing field '{" +
                                           std::string(name) + "}': " + std::string(tmpl));
                }
                out.append(it->second);
            },
            error);

        if (!ok) {
            throw std::logic_error("malformed template (" + error + "): " + std::string(tmpl));
        }
        return out;
    }

} // namespace StrideGraph::Rules
