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
#include "RuleTable.hpp"
#include "RuleTemplate.hpp"
#include "BuiltinRules.hpp"

#include "../Utils/Logger.hpp"

#include <stdexcept>

namespace StrideGraph::Rules {

    using Model::RuleEntry;
    using Utils::JSON::Json;

    namespace {

        void SetError(RuleTableError* err, std::string message, std::optional<size_t> index = std::nullopt) {
            if (err) {
                err->message = std::move(message);
                err->ruleIndex = index;
            }
        }

        [[nodiscard]] std::string RowLabel(size_t index, const RuleEntry& e) {
            return "rule #" + std::to_string(index) + " (" + Model::ToString(e.componentType) + "/" +
                   Model::ToString(e.role) + "/" + Model::CategoryIdentifier(e.category) + ")";
        }

        [[nodiscard]] bool ValidateTemplate(const std::string& tmpl, const char* field,
                                            size_t index, const RuleEntry& e, RuleTableError* err) {
            if (tmpl.empty()) {
                SetError(err, RowLabel(index, e) + ": " + field + " template is empty", index);
                return false;
            }

            std::vector<std::string> names;
            std::string syntaxError;
            if (!ExtractPlaceholders(tmpl, names, syntaxError)) {
                SetError(err, RowLabel(index, e) + ": " + field + " template " + syntaxError, index);
                return false;
            }

            const auto allowed = AllowedPlaceholders(e.role);
            for (const auto& name : names) {
                if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
                    SetError(err, RowLabel(index, e) + ": " + field + " template uses placeholder '{" +
                                  name + "}' which is not available for role " + Model::ToString(e.role),
                             index);
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] bool ReadString(const Json& row, const char* key, std::string& out,
                                      size_t index, RuleTableError* err) {
            const auto it = row.find(key);
            if (it == row.end() || !it->is_string()) {
                SetError(err, "rule #" + std::to_string(index) + ": missing string field '" + key + "'", index);
                return false;
            }
            out = it->get<std::string>();
            return true;
        }

    }  // namespace

    std::string RuleTableError::ToString() const {
        std::string s;
        if (!path.empty()) {
            s += path.string() + ": ";
        }
        s += message;
        return s;
    }

    std::optional<RuleTable> RuleTable::FromEntries(
        std::string version,
        std::vector<RuleEntry> entries,
        RuleTableError* err
    ) {
        if (version.empty()) {
            SetError(err, "rule table version must not be empty");
            return std::nullopt;
        }

        RuleTable table;
        for (size_t i = 0; i < entries.size(); ++i) {
            const RuleEntry& e = entries[i];
            if (!ValidateTemplate(e.descriptionTemplate, "description", i, e, err) ||
                !ValidateTemplate(e.countermeasureTemplate, "countermeasure", i, e, err)) {
                return std::nullopt;
            }
            table.m_index[SlotOf(e.componentType, e.role)].push_back(i);
        }

        // Completeness: every component type must be analyzable as a node
        for (const auto type : Model::kAllComponentTypes) {
            if (table.m_index[SlotOf(type, Model::RuleRole::Node)].empty()) {
                SetError(err, std::string("rule table is incomplete: component type ") +
                              Model::ToString(type) + " has no Node rules");
                return std::nullopt;
            }
        }

        table.m_version = std::move(version);
        table.m_entries = std::move(entries);
        return table;
    }

    std::optional<RuleTable> RuleTable::FromJson(const Json& j, RuleTableError* err) noexcept {
        try {
            if (!j.is_object()) {
                SetError(err, "rule table root must be a JSON object");
                return std::nullopt;
            }

            const auto versionIt = j.find("version");
            if (versionIt == j.end() || !versionIt->is_string()) {
                SetError(err, "rule table requires a string 'version'");
                return std::nullopt;
            }

            const auto rulesIt = j.find("rules");
            if (rulesIt == j.end() || !rulesIt->is_array()) {
                SetError(err, "rule table requires a 'rules' array");
                return std::nullopt;
            }

            std::vector<RuleEntry> entries;
            entries.reserve(rulesIt->size());

            size_t index = 0;
            for (const Json& row : *rulesIt) {
                if (!row.is_object()) {
                    SetError(err, "rule #" + std::to_string(index) + " must be an object", index);
                    return std::nullopt;
                }

                std::string typeName, roleName, categoryName;
                RuleEntry entry;
                if (!ReadString(row, "componentType", typeName, index, err) ||
                    !ReadString(row, "role", roleName, index, err) ||
                    !ReadString(row, "category", categoryName, index, err) ||
                    !ReadString(row, "description", entry.descriptionTemplate, index, err) ||
                    !ReadString(row, "countermeasure", entry.countermeasureTemplate, index, err)) {
                    return std::nullopt;
                }

                const auto type = Model::ParseComponentType(typeName);
                const auto role = Model::ParseRuleRole(roleName);
                const auto category = Model::ParseStrideCategory(categoryName);
                if (!type) {
                    SetError(err, "rule #" + std::to_string(index) + ": unknown component type '" + typeName + "'", index);
                    return std::nullopt;
                }
                if (!role) {
                    SetError(err, "rule #" + std::to_string(index) + ": unknown role '" + roleName + "'", index);
                    return std::nullopt;
                }
                if (!category) {
                    SetError(err, "rule #" + std::to_string(index) + ": unknown STRIDE category '" + categoryName + "'", index);
                    return std::nullopt;
                }

                entry.componentType = *type;
                entry.role = *role;
                entry.category = *category;
                entries.push_back(std::move(entry));
                ++index;
            }

            return FromEntries(versionIt->get<std::string>(), std::move(entries), err);
        }
        catch (const std::exception& e) {
            SetError(err, std::string("rule table: ") + e.what());
            return std::nullopt;
        }
    }

    std::optional<RuleTable> RuleTable::LoadFromFile(const std::filesystem::path& path, RuleTableError* err) noexcept {
        Json j;
        Utils::JSON::Error jsonErr;
        if (!Utils::JSON::LoadFromFile(path, j, &jsonErr)) {
            if (err) {
                err->message = "cannot load rule table: " + jsonErr.message;
                err->path = path;
                err->ruleIndex.reset();
            }
            SG_LOG_ERROR("Rules", "Failed to load rule table %s: %s", path.string().c_str(), jsonErr.message.c_str());
            return std::nullopt;
        }

        RuleTableError localErr;
        auto table = FromJson(j, &localErr);
        if (!table) {
            localErr.path = path;
            SG_LOG_ERROR("Rules", "Rejected rule table %s: %s", path.string().c_str(), localErr.message.c_str());
            if (err) {
                *err = std::move(localErr);
            }
            return std::nullopt;
        }

        SG_LOG_INFO("Rules", "Loaded rule table '%s' (%zu rules) from %s",
                    table->Version().c_str(), table->Size(), path.string().c_str());
        return table;
    }

    const RuleTable& RuleTable::BuiltIn() {
        static const RuleTable table = [] {
            std::vector<RuleEntry> entries;
            const auto records = BuiltinRuleRecords();
            entries.reserve(records.size());
            for (const auto& r : records) {
                entries.push_back({ r.componentType, r.role, r.category, r.description, r.countermeasure });
            }

            RuleTableError err;
            auto built = FromEntries(BUILTIN_RULES_VERSION, std::move(entries), &err);
            if (!built) {
                throw std::logic_error("built-in rule table is invalid: " + err.message);
            }
            return std::move(*built);
        }();
        return table;
    }

    std::vector<const RuleEntry*> RuleTable::Find(Model::ComponentType type, Model::RuleRole role) const {
        const auto& slot = m_index[SlotOf(type, role)];
        std::vector<const RuleEntry*> rows;
        rows.reserve(slot.size());
        for (const size_t i : slot) {
            rows.push_back(&m_entries[i]);
        }
        return rows;
    }

    Json RuleTable::ToJson() const {
        Json rules = Json::array();
        for (const auto& e : m_entries) {
            Json row = Json::object();
            row["componentType"] = Model::ToString(e.componentType);
            row["role"] = Model::ToString(e.role);
            row["category"] = Model::CategoryIdentifier(e.category);
            row["description"] = e.descriptionTemplate;
            row["countermeasure"] = e.countermeasureTemplate;
            rules.push_back(std::move(row));
        }

        Json j = Json::object();
        j["version"] = m_version;
        j["rules"] = std::move(rules);
        return j;
    }

} // namespace StrideGraph::Rules
