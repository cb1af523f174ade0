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
#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace StrideGraph {
	namespace Utils {
		namespace StringUtils {

			std::string ToLower(std::string_view s) {
				std::string out(s);
				std::transform(out.begin(), out.end(), out.begin(),
				               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
				return out;
			}

			std::string Trim(std::string_view s) {
				size_t begin = 0;
				size_t end = s.size();
				while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
					++begin;
				}
				while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
					--end;
				}
				return std::string(s.substr(begin, end - begin));
			}

			std::string FoldKey(std::string_view s) {
				std::string out;
				out.reserve(s.size());
				for (const char c : s) {
					const auto uc = static_cast<unsigned char>(c);
					if (std::isalnum(uc)) {
						out.push_back(static_cast<char>(std::tolower(uc)));
					}
				}
				return out;
			}

			std::string FormatFixed(double value, int precision) {
				std::ostringstream oss;
				oss.imbue(std::locale::classic());
				oss << std::fixed << std::setprecision(precision) << value;
				std::string text = oss.str();
				// "-0.000" -> "0.000"
				if (text.size() > 1 && text[0] == '-' &&
				    text.find_first_not_of("-0.") == std::string::npos) {
					text.erase(0, 1);
				}
				return text;
			}

			std::string EscapeMarkdownCell(std::string_view s) {
				std::string out;
				out.reserve(s.size());
				for (const char c : s) {
					if (c == '|') {
						out += "\\|";
					}
					else if (c == '\n' || c == '\r') {
						out.push_back(' ');
					}
					else {
						out.push_back(c);
					}
				}
				return out;
			}

			std::string EscapeMarkdownInline(std::string_view s) {
				std::string out(s);
				std::replace_if(out.begin(), out.end(), [](char c) { return c == '\n' || c == '\r'; }, ' ');
				return out;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace StrideGraph
