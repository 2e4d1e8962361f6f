#ifndef RPCBRIDGE_HANDLER_HANDLER_CONFIG_HPP
#define RPCBRIDGE_HANDLER_HANDLER_CONFIG_HPP

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/input.hpp"
#include "rpcbridge/handler/procedure_type.hpp"
#include "rpcbridge/handler/router.hpp"
#include "rpcbridge/handler/transformer.hpp"
#include "rpcbridge/http/http_types.hpp"
#include "rpcbridge/protocol/envelope.hpp"

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace rpcbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Hook Parameters
// ─────────────────────────────────────────────────────────────────────────────
// Views into handler state, valid only for the duration of the hook call.
// `ctx` is null when the request failed before the context was built, and
// `path` is empty for request-level errors.

struct ErrorShapeParams {
    const RpcError& error;
    ProcedureType type;
    std::optional<std::string_view> path;
    const Input& input;
    const Context* ctx;
};

struct ErrorDetails {
    const RpcError& error;
    ProcedureType type;
    std::optional<std::string_view> path;
    const Input& input;
    const Context* ctx;
    const HttpRequest& request;
};

struct ResponseMetaParams {
    const Context* ctx;
    std::span<const std::string> paths;
    ProcedureType type;
    std::span<const ResponseEnvelope> data;
    std::span<const RpcError> errors;
};

struct ResponseMeta {
    HeaderMap headers;
    std::optional<int> status;
};

using ContextResult = RpcResult<Context>;

/// Builds the per-request context; may suspend, may throw or return an error
using ContextFactory = std::function<asio::awaitable<ContextResult>(const HttpRequest&)>;

using ErrorShaper = std::function<Json(const ErrorShapeParams&)>;
using ErrorObserver = std::function<void(const ErrorDetails&)>;
using ResponseMetaFn = std::function<ResponseMeta(const ResponseMetaParams&)>;

/// {"message", "code": <JSON-RPC code>, "data": {"code", "httpStatus", "path"}}
[[nodiscard]] Json default_error_shape(const ErrorShapeParams& params);

// ─────────────────────────────────────────────────────────────────────────────
// Handler Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HandlerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Request Handling
    // ─────────────────────────────────────────────────────────────────────────

    // Accept ?batch=1 requests. When false a batch request is answered with a
    // single INTERNAL_SERVER_ERROR envelope and no procedure runs.
    bool batching_enabled{true};

    // Largest accepted raw body in bytes. 0 = no limit.
    std::size_t max_body_size{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Collaborators
    // ─────────────────────────────────────────────────────────────────────────

    // Unset: every request gets a null context.
    ContextFactory create_context;

    // Unset: default_error_shape.
    ErrorShaper error_shaper;

    // Defaults to identity in both directions.
    ValueTransformer transformer{ValueTransformer::identity()};

    // ─────────────────────────────────────────────────────────────────────────
    // Observability
    // ─────────────────────────────────────────────────────────────────────────

    // Told about every failure, request-level or per call. Exceptions thrown
    // here are logged and otherwise ignored.
    ErrorObserver on_error;

    // Extra headers and an optional status override for each response.
    ResponseMetaFn response_meta;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    HandlerConfig& with_batching(bool enabled);
    HandlerConfig& with_max_body_size(std::size_t bytes);
    HandlerConfig& with_context_factory(ContextFactory factory);
    HandlerConfig& with_static_context(Context ctx);
    HandlerConfig& with_error_shaper(ErrorShaper shaper);
    HandlerConfig& with_transformer(ValueTransformer value_transformer);
    HandlerConfig& with_error_observer(ErrorObserver observer);
    HandlerConfig& with_response_meta(ResponseMetaFn meta);
};

}  // namespace rpcbridge

#endif  // RPCBRIDGE_HANDLER_HANDLER_CONFIG_HPP
