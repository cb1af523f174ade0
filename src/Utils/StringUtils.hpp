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
#pragma once
/**
 * @file StringUtils.hpp
 * @brief Locale-independent string helpers shared by the engine modules.
 */

#include <string>
#include <string_view>

namespace StrideGraph {
	namespace Utils {
		namespace StringUtils {

			/// ASCII lower-casing (locale independent)
			[[nodiscard]] std::string ToLower(std::string_view s);

			/// Strip leading/trailing ASCII whitespace
			[[nodiscard]] std::string Trim(std::string_view s);

			/**
			 * @brief Lower-case and drop every non-alphanumeric character.
			 *
			 * "Load Balancer", "load-balancer" and "LOAD_BALANCER" all fold
			 * to "loadbalancer".
			 */
			[[nodiscard]] std::string FoldKey(std::string_view s);

			/**
			 * @brief Fixed-point formatting with the "C" locale ("0.900").
			 */
			[[nodiscard]] std::string FormatFixed(double value, int precision);

			/// Escape '|' and newlines so text is safe inside a Markdown table cell
			[[nodiscard]] std::string EscapeMarkdownCell(std::string_view s);

			/// Fold CR/LF to spaces so text stays on its heading or list line
			[[nodiscard]] std::string EscapeMarkdownInline(std::string_view s);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace StrideGraph
