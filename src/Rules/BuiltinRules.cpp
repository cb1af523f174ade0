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
#include "BuiltinRules.hpp"

namespace StrideGraph::Rules {

    using Model::ComponentType;
    using Model::RuleRole;
    using Model::StrideCategory;

    namespace {

        // ============================================================================
        // BUILT-IN STRIDE RULES
        // Order matters: it is the order findings of one subject are generated in,
        // and the first edge row of a category supplies that edge's templates.
        // ============================================================================

        constexpr RuleRecord kRules[] = {
            // ---------------------------------------------------------------- Server
            { ComponentType::Server, RuleRole::Node, StrideCategory::Spoofing,
              "An attacker could impersonate server {name} ({id}) to clients or peer services.",
              "Use mutual TLS with managed certificates and verify service identity on every connection." },
            { ComponentType::Server, RuleRole::Node, StrideCategory::Tampering,
              "Code, configuration or data on server {name} ({id}) could be modified by an attacker.",
              "Harden the host baseline, enable file integrity monitoring and deploy only signed artifacts." },
            { ComponentType::Server, RuleRole::Node, StrideCategory::Repudiation,
              "Actions performed on server {name} ({id}) may not be attributable without audit records.",
              "Forward security-relevant events to centralized, append-only audit logging." },
            { ComponentType::Server, RuleRole::Node, StrideCategory::InformationDisclosure,
              "Server {name} ({id}) could leak sensitive data through error messages, memory or local storage.",
              "Encrypt data at rest, suppress verbose errors and restrict access to secrets with a vault." },
            { ComponentType::Server, RuleRole::Node, StrideCategory::DenialOfService,
              "Server {name} ({id}) could be exhausted by request floods or expensive operations.",
              "Apply rate limiting, resource quotas and horizontal autoscaling behind health checks." },
            { ComponentType::Server, RuleRole::Node, StrideCategory::ElevationOfPrivilege,
              "A compromised process on server {name} ({id}) could escalate to administrative control of the host.",
              "Run services with least privilege, patch promptly and isolate workloads in sandboxes." },

            // -------------------------------------------------------------- Database
            { ComponentType::Database, RuleRole::Node, StrideCategory::Tampering,
              "Records stored in database {name} ({id}) could be altered or deleted without authorization.",
              "Enforce parameterized queries, row-level permissions and point-in-time backups." },
            { ComponentType::Database, RuleRole::Node, StrideCategory::Repudiation,
              "Changes to database {name} ({id}) may not be traceable to the identity that made them.",
              "Enable database audit logging and keep it outside the administrators' control." },
            { ComponentType::Database, RuleRole::Node, StrideCategory::InformationDisclosure,
              "Sensitive data in database {name} ({id}) could be exposed through stolen credentials, backups or injection.",
              "Encrypt storage and backups, rotate credentials and mask sensitive columns." },
            { ComponentType::Database, RuleRole::Node, StrideCategory::DenialOfService,
              "Database {name} ({id}) could be saturated by unbounded queries or connection exhaustion.",
              "Use connection pooling, query timeouts and read replicas for heavy workloads." },
            { ComponentType::Database, RuleRole::Node, StrideCategory::ElevationOfPrivilege,
              "Over-privileged accounts on database {name} ({id}) could grant schema or system-level control.",
              "Separate administrative and application roles and grant only the required privileges." },

            // ------------------------------------------------------------------ User
            { ComponentType::User, RuleRole::Node, StrideCategory::Spoofing,
              "The identity of user {name} ({id}) could be stolen through phishing or credential stuffing.",
              "Require multi-factor authentication and detect anomalous sign-ins." },
            { ComponentType::User, RuleRole::Node, StrideCategory::Repudiation,
              "User {name} ({id}) could deny having performed sensitive operations.",
              "Record signed, timestamped audit trails for user-initiated transactions." },

            // ---------------------------------------------------------- LoadBalancer
            { ComponentType::LoadBalancer, RuleRole::Node, StrideCategory::Spoofing,
              "A rogue endpoint could impersonate load balancer {name} ({id}) through DNS or certificate abuse.",
              "Protect DNS records, pin certificates and monitor certificate transparency logs." },
            { ComponentType::LoadBalancer, RuleRole::Node, StrideCategory::Tampering,
              "Routing rules or TLS settings of load balancer {name} ({id}) could be changed to divert traffic.",
              "Manage load balancer configuration as reviewed code and alert on manual changes." },
            { ComponentType::LoadBalancer, RuleRole::Node, StrideCategory::DenialOfService,
              "Load balancer {name} ({id}) is a single entry point that volumetric attacks can overwhelm.",
              "Place the load balancer behind DDoS protection and configure connection limits." },

            // ------------------------------------------------------------------- API
            { ComponentType::API, RuleRole::Node, StrideCategory::Spoofing,
              "Callers of API {name} ({id}) could present forged or replayed tokens.",
              "Validate token signature, audience and expiry on every request." },
            { ComponentType::API, RuleRole::Node, StrideCategory::Tampering,
              "Request parameters accepted by API {name} ({id}) could be manipulated to alter server-side state.",
              "Validate input against a strict schema and reject unexpected fields." },
            { ComponentType::API, RuleRole::Node, StrideCategory::Repudiation,
              "Calls to API {name} ({id}) may not be attributable to a caller identity.",
              "Log caller identity, request id and outcome for every state-changing call." },
            { ComponentType::API, RuleRole::Node, StrideCategory::InformationDisclosure,
              "API {name} ({id}) could return more data than the caller is entitled to see.",
              "Apply object-level authorization and filter response fields per caller." },
            { ComponentType::API, RuleRole::Node, StrideCategory::DenialOfService,
              "API {name} ({id}) could be abused with high request volumes or oversized payloads.",
              "Enforce per-client quotas, payload size limits and request timeouts." },
            { ComponentType::API, RuleRole::Node, StrideCategory::ElevationOfPrivilege,
              "Missing function-level checks in API {name} ({id}) could expose administrative operations.",
              "Deny by default and authorize every operation against the caller's role." },

            // --------------------------------------------------------------- Unknown
            { ComponentType::Unknown, RuleRole::Node, StrideCategory::Spoofing,
              "Component {name} ({id}) has insufficient classification; its identity and authentication model cannot be verified.",
              "Classify the component manually and document how it authenticates to its peers." },
            { ComponentType::Unknown, RuleRole::Node, StrideCategory::Tampering,
              "Component {name} ({id}) has insufficient classification; integrity controls for it cannot be assessed.",
              "Identify the component and confirm its integrity protections before deployment." },
            { ComponentType::Unknown, RuleRole::Node, StrideCategory::InformationDisclosure,
              "Component {name} ({id}) has insufficient classification; the data it handles is unknown.",
              "Inventory the data processed by the component and apply the matching protection level." },

            // ============================================================ Edge rules
            { ComponentType::User, RuleRole::EdgeSource, StrideCategory::Spoofing,
              "Requests from {source} to {target} could be sent by an attacker impersonating the user.",
              "Authenticate the user on {target} with strong, phishing-resistant credentials." },
            { ComponentType::User, RuleRole::EdgeSource, StrideCategory::Repudiation,
              "Actions that {source} triggers on {target} could later be denied.",
              "Log each request from {source} with identity and timestamp on {target}." },
            { ComponentType::User, RuleRole::EdgeTarget, StrideCategory::InformationDisclosure,
              "Responses delivered from {source} to {target} could expose data to the wrong user.",
              "Scope responses from {source} to the authenticated session." },

            { ComponentType::API, RuleRole::EdgeSource, StrideCategory::Tampering,
              "Calls from {source} to {target} could be modified in transit.",
              "Protect the {source} to {target} channel with TLS and sign critical payloads." },
            { ComponentType::API, RuleRole::EdgeSource, StrideCategory::InformationDisclosure,
              "Data forwarded by {source} to {target} could include fields the downstream does not need.",
              "Minimize the payload {source} sends to {target}." },
            { ComponentType::API, RuleRole::EdgeTarget, StrideCategory::InformationDisclosure,
              "Traffic between {source} and {target} could expose credentials or personal data if intercepted.",
              "Enforce TLS 1.2+ between {source} and {target} and never place secrets in URLs." },
            { ComponentType::API, RuleRole::EdgeTarget, StrideCategory::Tampering,
              "Requests that {source} sends to {target} could be altered or replayed.",
              "Use request signing or nonces and validate every request on {target}." },
            { ComponentType::API, RuleRole::EdgeTarget, StrideCategory::DenialOfService,
              "{source} could flood {target} with requests.",
              "Rate limit {source} at {target} and shed load gracefully." },

            { ComponentType::Server, RuleRole::EdgeSource, StrideCategory::InformationDisclosure,
              "Data flowing from {source} to {target} could be captured on the internal network.",
              "Encrypt internal traffic from {source} and segment the network." },
            { ComponentType::Server, RuleRole::EdgeSource, StrideCategory::ElevationOfPrivilege,
              "A compromised {source} could use its trusted link to gain privileges on {target}.",
              "Give {source} a dedicated least-privilege identity on {target}." },
            { ComponentType::Server, RuleRole::EdgeTarget, StrideCategory::Tampering,
              "Messages from {source} could inject malicious input into {target}.",
              "Validate and sanitize all input {target} receives from {source}." },
            { ComponentType::Server, RuleRole::EdgeTarget, StrideCategory::DenialOfService,
              "{source} could forward more traffic than {target} can absorb.",
              "Configure back-pressure and circuit breakers between {source} and {target}." },
            { ComponentType::Server, RuleRole::EdgeTarget, StrideCategory::ElevationOfPrivilege,
              "Trust placed by {target} in requests from {source} could be abused to run privileged operations.",
              "Authorize each request from {source} on {target} instead of trusting the network path." },

            { ComponentType::Database, RuleRole::EdgeSource, StrideCategory::InformationDisclosure,
              "Query results returned from {source} to {target} could expose more records than needed.",
              "Restrict the views and columns {target} can read from {source}." },
            { ComponentType::Database, RuleRole::EdgeTarget, StrideCategory::Tampering,
              "{source} could issue injected or unauthorized writes to {target}.",
              "Use parameterized queries from {source} and a write-restricted database role." },
            { ComponentType::Database, RuleRole::EdgeTarget, StrideCategory::InformationDisclosure,
              "Database credentials used by {source} to reach {target} could be stolen and reused.",
              "Store the credentials of {source} in a secrets manager and rotate them automatically." },
            { ComponentType::Database, RuleRole::EdgeTarget, StrideCategory::ElevationOfPrivilege,
              "The account {source} uses on {target} could hold administrative rights.",
              "Grant {source} only the statements it needs on {target}." },

            { ComponentType::LoadBalancer, RuleRole::EdgeSource, StrideCategory::Tampering,
              "TLS terminated at {source} leaves traffic to {target} open to modification.",
              "Re-encrypt traffic from {source} to {target}." },
            { ComponentType::LoadBalancer, RuleRole::EdgeSource, StrideCategory::InformationDisclosure,
              "Headers added by {source} could leak client details to {target} or its logs.",
              "Strip or normalize forwarded headers at {source}." },
            { ComponentType::LoadBalancer, RuleRole::EdgeTarget, StrideCategory::DenialOfService,
              "{source} could exhaust the connection capacity of {target}.",
              "Set per-client connection limits and timeouts on {target}." },
            { ComponentType::LoadBalancer, RuleRole::EdgeTarget, StrideCategory::Spoofing,
              "{source} could spoof client addresses presented to {target}.",
              "Trust forwarded client addresses only from known proxies in front of {target}." },

            { ComponentType::Unknown, RuleRole::EdgeSource, StrideCategory::Spoofing,
              "The unclassified component {source} may reach {target} without a known authentication mechanism.",
              "Identify {source} and require it to authenticate to {target}." },
            { ComponentType::Unknown, RuleRole::EdgeTarget, StrideCategory::InformationDisclosure,
              "Data sent from {source} to the unclassified component {target} has no known protection requirements.",
              "Classify {target} and confirm the data {source} may send to it." },
        };

    }  // namespace

    std::span<const RuleRecord> BuiltinRuleRecords() noexcept {
        return kRules;
    }

} // namespace StrideGraph::Rules
