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
/*
 * ============================================================================
 * StrideGraph - PRECOMPILED HEADER
 * ============================================================================
 * Target: Fast compilation of the engine, CLI and test targets.
 * Includes: Stable STL and the JSON library shared by every module.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

// C++20 Standard Library - Core & Containers
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <map>
#include <span>
#include <optional>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <thread>
#include <future>
#include <chrono>

// Numerics
#include <cmath>
#include <limits>

// Third-party
#include <nlohmann/json.hpp>

#endif // PCH_H
