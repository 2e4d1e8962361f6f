#include "rpcbridge/http/http_types.hpp"

namespace rpcbridge {

namespace {

constexpr std::string_view kPlaceholderOrigin{"http://localhost"};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// QueryParams
// ─────────────────────────────────────────────────────────────────────────────

QueryParams::QueryParams(std::string_view query)
    : params_(query)
{}

bool QueryParams::has(std::string_view name) const {
    return params_.has(name);
}

std::optional<std::string> QueryParams::get(std::string_view name) const {
    const auto value = params_.get(name);
    if (value.has_value() == false) {
        return std::nullopt;
    }
    return std::string(*value);
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Target
// ─────────────────────────────────────────────────────────────────────────────
// ada-url handles percent-encoding normalization, dot segments and the
// absolute-form targets some proxies send.

std::optional<RequestTarget> parse_request_target(std::string_view target) {
    const bool origin_form = (target.empty() == false) && (target.front() == '/');

    std::string absolute;
    if (origin_form) {
        absolute.reserve(kPlaceholderOrigin.size() + target.size());
        absolute.append(kPlaceholderOrigin);
        absolute.append(target);
    } else {
        absolute.assign(target);
    }

    auto parsed = ada::parse<ada::url_aggregator>(absolute);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    RequestTarget result;
    result.pathname = std::string(parsed->get_pathname());
    result.search = std::string(parsed->get_search());
    if (result.pathname.empty()) {
        result.pathname = "/";
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────

HttpRequest HttpRequest::from_target(
    std::string method,
    std::string_view target,
    HeaderMap headers,
    RequestBody body
) {
    HttpRequest request;
    request.method = std::move(method);
    request.headers = std::move(headers);
    request.body = std::move(body);

    const auto parsed = parse_request_target(target);
    if (parsed.has_value()) {
        request.query = QueryParams(parsed->search);
    }
    return request;
}

}  // namespace rpcbridge
