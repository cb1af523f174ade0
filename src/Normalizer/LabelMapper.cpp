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
#include "LabelMapper.hpp"

#include "../Utils/StringUtils.hpp"

#include <unordered_map>

namespace StrideGraph::Normalizer {

    using Model::ComponentType;

    namespace {

        struct LabelAlias {
            std::string_view key;          ///< Already folded
            ComponentType type;
        };

        // ============================================================================
        // KNOWN LABEL ALIASES
        // ============================================================================

        constexpr std::array<LabelAlias, 58> kLabelAliases = {{
            // Server
            { "server", ComponentType::Server },
            { "servers", ComponentType::Server },
            { "webserver", ComponentType::Server },
            { "appserver", ComponentType::Server },
            { "applicationserver", ComponentType::Server },
            { "host", ComponentType::Server },
            { "vm", ComponentType::Server },
            { "virtualmachine", ComponentType::Server },
            { "instance", ComponentType::Server },
            { "ec2", ComponentType::Server },
            { "compute", ComponentType::Server },
            { "backend", ComponentType::Server },
            { "container", ComponentType::Server },
            { "microservice", ComponentType::Server },

            // Database
            { "database", ComponentType::Database },
            { "databases", ComponentType::Database },
            { "db", ComponentType::Database },
            { "datastore", ComponentType::Database },
            { "sql", ComponentType::Database },
            { "postgres", ComponentType::Database },
            { "postgresql", ComponentType::Database },
            { "mysql", ComponentType::Database },
            { "rds", ComponentType::Database },
            { "mongodb", ComponentType::Database },
            { "dynamodb", ComponentType::Database },
            { "redis", ComponentType::Database },
            { "cache", ComponentType::Database },

            // User
            { "user", ComponentType::User },
            { "users", ComponentType::User },
            { "client", ComponentType::User },
            { "actor", ComponentType::User },
            { "person", ComponentType::User },
            { "enduser", ComponentType::User },
            { "browser", ComponentType::User },
            { "customer", ComponentType::User },
            { "mobileclient", ComponentType::User },

            // Load balancer
            { "loadbalancer", ComponentType::LoadBalancer },
            { "loadbalancers", ComponentType::LoadBalancer },
            { "lb", ComponentType::LoadBalancer },
            { "elb", ComponentType::LoadBalancer },
            { "alb", ComponentType::LoadBalancer },
            { "nlb", ComponentType::LoadBalancer },
            { "applicationloadbalancer", ComponentType::LoadBalancer },
            { "networkloadbalancer", ComponentType::LoadBalancer },
            { "reverseproxy", ComponentType::LoadBalancer },

            // API
            { "api", ComponentType::API },
            { "apis", ComponentType::API },
            { "apigateway", ComponentType::API },
            { "gateway", ComponentType::API },
            { "restapi", ComponentType::API },
            { "endpoint", ComponentType::API },
            { "graphql", ComponentType::API },
            { "webapi", ComponentType::API },
            { "httpapi", ComponentType::API },

            // Explicit catch-all classes
            { "unknown", ComponentType::Unknown },
            { "other", ComponentType::Unknown },
            { "component", ComponentType::Unknown },
            { "box", ComponentType::Unknown },
        }};

        const std::unordered_map<std::string_view, ComponentType>& AliasIndex() {
            static const std::unordered_map<std::string_view, ComponentType> index = [] {
                std::unordered_map<std::string_view, ComponentType> m;
                m.reserve(kLabelAliases.size());
                for (const auto& alias : kLabelAliases) {
                    m.emplace(alias.key, alias.type);
                }
                return m;
            }();
            return index;
        }

    }  // namespace

    ComponentType MapLabel(std::string_view label) {
        const std::string key = Utils::StringUtils::FoldKey(label);
        if (key.empty()) {
            return ComponentType::Unknown;
        }

        const auto& index = AliasIndex();
        const auto it = index.find(key);
        return it != index.end() ? it->second : ComponentType::Unknown;
    }

} // namespace StrideGraph::Normalizer
