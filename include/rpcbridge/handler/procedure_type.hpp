#pragma once

#include "rpcbridge/http/http_types.hpp"

#include <string_view>

namespace rpcbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Procedure Type
// ─────────────────────────────────────────────────────────────────────────────
// GET -> Query, POST -> Mutation, PATCH -> Subscription, anything else is
// Unknown. Only queries and mutations are served over plain HTTP.

enum class ProcedureType {
    Query,
    Mutation,
    Subscription,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ProcedureType type) noexcept {
    switch (type) {
        case ProcedureType::Query:        return "query";
        case ProcedureType::Mutation:     return "mutation";
        case ProcedureType::Subscription: return "subscription";
        case ProcedureType::Unknown:      return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr ProcedureType procedure_type_from_method(std::string_view method) noexcept {
    if (method == "GET") {
        return ProcedureType::Query;
    }
    if (method == "POST") {
        return ProcedureType::Mutation;
    }
    if (method == "PATCH") {
        return ProcedureType::Subscription;
    }
    return ProcedureType::Unknown;
}

[[nodiscard]] constexpr bool is_servable_over_http(ProcedureType type) noexcept {
    return (type == ProcedureType::Query) || (type == ProcedureType::Mutation);
}

/// Liveness probe; answered with an empty 204 before classification
[[nodiscard]] constexpr bool is_probe_request(std::string_view method) noexcept {
    return method == "HEAD";
}

/// Batch mode is requested with ?batch=1, independently of the method
[[nodiscard]] inline bool is_batch_call(const QueryParams& query) {
    const auto flag = query.get("batch");
    return flag.has_value() && (*flag == "1");
}

}  // namespace rpcbridge
