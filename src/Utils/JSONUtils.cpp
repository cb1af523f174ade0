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
 * @file JSONUtils.cpp
 * @brief Non-throwing wrappers over nlohmann/json.
 */

#include "pch.h"
#include "JSONUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace StrideGraph {
	namespace Utils {
		namespace JSON {

			namespace fs = std::filesystem;

			namespace {

				void SetError(Error* err, std::string message, const fs::path& path = {},
				              size_t byteOffset = 0) {
					if (!err) {
						return;
					}
					err->message = std::move(message);
					err->path = path;
					err->byteOffset = byteOffset;
				}

				/**
				 * @brief Scan raw text for bracket nesting deeper than @p maxDepth.
				 *
				 * Runs before the parser so hostile input cannot drive recursion.
				 * Brackets inside string literals are ignored.
				 */
				[[nodiscard]] bool ExceedsDepth(std::string_view text, size_t maxDepth, size_t& offset) noexcept {
					size_t depth = 0;
					bool inString = false;
					bool escaped = false;
					for (size_t i = 0; i < text.size(); ++i) {
						const char c = text[i];
						if (inString) {
							if (escaped) {
								escaped = false;
							}
							else if (c == '\\') {
								escaped = true;
							}
							else if (c == '"') {
								inString = false;
							}
							continue;
						}
						if (c == '"') {
							inString = true;
						}
						else if (c == '{' || c == '[') {
							if (++depth > maxDepth) {
								offset = i;
								return true;
							}
						}
						else if ((c == '}' || c == ']') && depth > 0) {
							--depth;
						}
					}
					return false;
				}

				[[nodiscard]] std::string_view StripBom(std::string_view text) noexcept {
					if (text.size() >= 3 &&
					    static_cast<unsigned char>(text[0]) == 0xEF &&
					    static_cast<unsigned char>(text[1]) == 0xBB &&
					    static_cast<unsigned char>(text[2]) == 0xBF) {
						text.remove_prefix(3);
					}
					return text;
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				out = nullptr;
				jsonText = StripBom(jsonText);

				size_t offset = 0;
				if (ExceedsDepth(jsonText, opt.maxDepth, offset)) {
					SetError(err, "JSON nesting exceeds maximum depth of " + std::to_string(opt.maxDepth),
					         {}, offset);
					return false;
				}

				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);
					return true;
				}
				catch (const nlohmann::json::parse_error& e) {
					out = nullptr;
					SetError(err, e.what(), {}, e.byte);
					return false;
				}
				catch (const std::exception& e) {
					out = nullptr;
					SetError(err, e.what());
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
					             Json::error_handler_t::replace);
					return true;
				}
				catch (const std::exception&) {
					out.clear();
					return false;
				}
			}

			bool LoadFromFile(const fs::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				out = nullptr;
				try {
					std::error_code ec;
					if (!fs::is_regular_file(path, ec)) {
						SetError(err, "file not found", path);
						return false;
					}

					const auto size = fs::file_size(path, ec);
					if (ec) {
						SetError(err, "cannot stat file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						SetError(err, "file exceeds size limit of " + std::to_string(maxBytes) + " bytes", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						SetError(err, "cannot open file", path);
						return false;
					}
					std::ostringstream buffer;
					buffer << in.rdbuf();
					const std::string text = buffer.str();

					if (!Parse(text, out, err, opt)) {
						if (err) {
							err->path = path;
						}
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					out = nullptr;
					SetError(err, e.what(), path);
					return false;
				}
			}

			bool SaveTextToFile(const fs::path& path, std::string_view text, Error* err,
			                    bool atomicReplace) noexcept {
				try {
					std::error_code ec;
					if (path.has_parent_path()) {
						fs::create_directories(path.parent_path(), ec);
						if (ec) {
							SetError(err, "cannot create directory: " + ec.message(), path);
							return false;
						}
					}

					const fs::path target = atomicReplace ? fs::path(path.string() + ".tmp") : path;
					{
						std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
						if (!outFile) {
							SetError(err, "cannot open file for writing", target);
							return false;
						}
						outFile.write(text.data(), static_cast<std::streamsize>(text.size()));
						outFile.flush();
						if (!outFile) {
							SetError(err, "write failed", target);
							return false;
						}
					}

					if (atomicReplace) {
						fs::rename(target, path, ec);
						if (ec) {
							fs::remove(target, ec);
							SetError(err, "cannot replace file: " + ec.message(), path);
							return false;
						}
					}
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, e.what(), path);
					return false;
				}
			}

			bool SaveToFile(const fs::path& path, const Json& j, Error* err, const SaveOptions& opt) noexcept {
				std::string text;
				if (!Stringify(j, text, opt)) {
					SetError(err, "serialization failed", path);
					return false;
				}
				text.push_back('\n');
				return SaveTextToFile(path, text, err, opt.atomicReplace);
			}

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") {
						return {};
					}
					if (pathLike.front() == '/') {
						return std::string(pathLike);
					}

					std::string out;
					std::string token;
					auto flush = [&]() {
						out.push_back('/');
						for (const char c : token) {
							if (c == '~') {
								out += "~0";
							}
							else if (c == '/') {
								out += "~1";
							}
							else {
								out.push_back(c);
							}
						}
						token.clear();
					};

					for (size_t i = 0; i < pathLike.size(); ++i) {
						const char c = pathLike[i];
						if (c == '.') {
							if (!token.empty()) {
								flush();
							}
						}
						else if (c == '[') {
							if (!token.empty()) {
								flush();
							}
							const size_t close = pathLike.find(']', i);
							if (close == std::string_view::npos) {
								return {};
							}
							token.assign(pathLike.substr(i + 1, close - i - 1));
							flush();
							i = close;
						}
						else {
							token.push_back(c);
						}
					}
					if (!token.empty()) {
						flush();
					}
					return out;
				}
				catch (const std::exception&) {
					return {};
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) {
						return true;
					}
					return j.contains(Json::json_pointer(jp));
				}
				catch (const std::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace StrideGraph
