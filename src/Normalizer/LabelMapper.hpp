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
 * @file LabelMapper.hpp
 * @brief Total mapping from free-form detector labels to ComponentType.
 */

#pragma once

#include <string_view>

#include "../Model/ThreatModelTypes.hpp"

namespace StrideGraph::Normalizer {

    /**
     * @brief Map a detector label to a component type.
     *
     * The label is folded (lower-cased, non-alphanumerics removed) and looked
     * up in a fixed alias table. Never fails: unmatched labels, including
     * the empty string, map to ComponentType::Unknown.
     */
    [[nodiscard]] Model::ComponentType MapLabel(std::string_view label);

} // namespace StrideGraph::Normalizer
