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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file helpers for StrideGraph.
 *
 * Provides:
 * - Safe parsing with depth limits (detection files are untrusted input)
 * - Files are written to a temporary sibling and renamed into place
 * - Dot/bracket path navigation with typed getters
 *
 * Implementation uses nlohmann/json with non-throwing wrappers.
 *
 * @note Nothing here throws; failures come back as false plus an Error.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace StrideGraph {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json (ordered keys keep output stable)
			using Json = nlohmann::ordered_json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 64;

			/// Default file size limit for LoadFromFile (16MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 16ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Empty when there is no error
				std::filesystem::path path;       ///< Empty for in-memory text
				size_t byteOffset = 0;            ///< Where parsing stopped; 0 when not applicable

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
				}
			};

			struct ParseOptions {
				bool allowComments = true;         ///< Accept // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing
				int indentSpaces = 2;              ///< Spaces per indent level
				bool ensureAscii = false;          ///< \uXXXX for anything outside ASCII
			};

			struct SaveOptions : StringifyOptions {
				bool atomicReplace = true;         ///< Write to temp file then rename
			};

			// ============================================================================
			// Text / File
			// ============================================================================

			/**
			 * @brief Parse @p jsonText into @p out; @p out is null on failure.
			 * @return true on success; on failure @p out is null and @p err is filled
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			/**
			 * @brief Load and parse a JSON file, refusing files above @p maxBytes.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Save JSON to file, creating parent directories.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const SaveOptions& opt = {}) noexcept;

			/**
			 * @brief Write raw text with the same atomic-replace semantics as SaveToFile.
			 */
			[[nodiscard]] bool SaveTextToFile(const std::filesystem::path& path, std::string_view text,
			                                  Error* err = nullptr, bool atomicReplace = true) noexcept;

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Convert "a.b[0].c" (or an existing "/a/b") to a JSON Pointer.
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/**
			 * @brief Get typed value from Json using a path.
			 * @return true if path exists and conversion succeeded
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) {
						out = j.template get<T>();
						return true;
					}

					const Json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const std::exception&) {
					return false;
				}
			}

			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace StrideGraph
