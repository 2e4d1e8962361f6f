#pragma once

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/handler_config.hpp"
#include "rpcbridge/handler/procedure_type.hpp"
#include "rpcbridge/handler/router.hpp"
#include "rpcbridge/http/http_types.hpp"
#include "rpcbridge/protocol/envelope.hpp"

#include <asio/awaitable.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rpcbridge {

// ═══════════════════════════════════════════════════════════════════════════
// Request Handler
// ═══════════════════════════════════════════════════════════════════════════
// Adapts one HTTP request onto the procedure router:
//
//   1. HEAD is answered with an empty 204.
//   2. The method picks the procedure type, ?batch=1 picks batch mode.
//   3. Request-level checks run in order: batching enabled, method servable,
//      body within max_body_size, input well-formed, context built, inputs
//      decoded. The first failure becomes a single error envelope and no
//      procedure runs.
//   4. Every call runs concurrently on the caller's executor; the response
//      lists the outcomes in path order regardless of completion order.
//
// handle() always produces a response. Procedure failures, hook failures and
// exceptions are all converted into error envelopes.

class RequestHandler {
public:
    explicit RequestHandler(
        std::shared_ptr<IProcedureRouter> router,
        HandlerConfig config = {}
    );

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /// `route` is the procedure part of the URL with the endpoint prefix and
    /// the leading '/' removed, e.g. "post.byId" or "post.byId,user.list".
    /// `request` must stay alive until the returned awaitable completes.
    [[nodiscard]] asio::awaitable<HttpResponse> handle(const HttpRequest& request, std::string route);

    [[nodiscard]] const HandlerConfig& config() const noexcept {
        return config_;
    }

private:
    /// What is known about the request so far; error responses report it.
    struct RequestState {
        ProcedureType type{ProcedureType::Unknown};
        bool batch{false};
        std::vector<std::string> paths;
        std::optional<Context> ctx;
    };

    asio::awaitable<RpcResult<std::vector<CallOutcome>>> dispatch(
        const HttpRequest& request,
        const std::string& route,
        RequestState& state
    );

    asio::awaitable<ContextResult> build_context(const HttpRequest& request);

    asio::awaitable<void> execute_all(
        const HttpRequest& request,
        const Context& ctx,
        ProcedureType type,
        std::vector<CallOutcome>& outcomes
    );

    asio::awaitable<void> execute_call(
        const HttpRequest& request,
        const Context& ctx,
        ProcedureType type,
        CallOutcome& outcome
    );

    [[nodiscard]] HttpResponse respond_with_outcomes(
        const std::vector<CallOutcome>& outcomes,
        const RequestState& state
    ) const;

    [[nodiscard]] HttpResponse respond_with_error(
        const HttpRequest& request,
        const RpcError& error,
        const RequestState& state
    ) const;

    [[nodiscard]] Json shape_error(const ErrorShapeParams& params) const;

    void report_error(const ErrorDetails& details) const;

    std::shared_ptr<IProcedureRouter> router_;
    HandlerConfig config_;
};

}  // namespace rpcbridge
