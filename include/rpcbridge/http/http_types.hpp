#pragma once

#include <ada.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace rpcbridge {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Header Map
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230). The map keeps the casing it
// was given; use find_header/get_header for lookups.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/// Insert or replace, matching existing names case-insensitively
inline void set_header(
    HeaderMap& headers,
    const std::string& name,
    const std::string& value
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
    headers[name] = value;
}

// ─────────────────────────────────────────────────────────────────────────────
// Query Parameters
// ─────────────────────────────────────────────────────────────────────────────
// application/x-www-form-urlencoded query string, decoded by ada-url the same
// way URLSearchParams does ('+' is a space, percent escapes are decoded).

class QueryParams {
public:
    QueryParams() = default;

    /// Accepts "a=1&b=2" as well as "?a=1&b=2"
    explicit QueryParams(std::string_view query);

    [[nodiscard]] bool has(std::string_view name) const;

    /// First value for name
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

private:
    // ada's accessors are not const-qualified in every release.
    mutable ada::url_search_params params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// An incoming request as seen by the handler. Built once by the outer adapter
// and read-only afterwards.

/// Absent, raw text, or a value the hosting framework already decoded
using RequestBody = std::variant<std::monostate, std::string, Json>;

struct HttpRequest {
    std::string method{"GET"};
    HeaderMap headers;
    QueryParams query;
    RequestBody body;

    /// Build from a request target such as "/greet?batch=1&input=..."; only the
    /// query part of the target is kept.
    [[nodiscard]] static HttpRequest from_target(
        std::string method,
        std::string_view target,
        HeaderMap headers = {},
        RequestBody body = {}
    );
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────────────────────────────────────

struct HttpResponse {
    int status{200};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> get_header(std::string_view name) const {
        return rpcbridge::get_header(headers, name);
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header("Content-Type");
        if (content_type.has_value() == false) {
            return false;
        }
        return content_type->find("application/json") != std::string::npos;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Request Target
// ─────────────────────────────────────────────────────────────────────────────
// Origin-form target split with ada-url. Targets are resolved against a
// placeholder origin since servers only see the path and query.

struct RequestTarget {
    std::string pathname;  // "/trpc/post.byId,user.list" (always starts with '/')
    std::string search;    // "?batch=1" (empty when there is no query)
};

[[nodiscard]] std::optional<RequestTarget> parse_request_target(std::string_view target);

}  // namespace rpcbridge
