#include "rpcbridge/handler/request_handler.hpp"
#include "rpcbridge/handler/input.hpp"
#include "rpcbridge/handler/responder.hpp"
#include "rpcbridge/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/deferred.hpp>
#include <asio/experimental/parallel_group.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <stdexcept>
#include <utility>

namespace rpcbridge {

namespace {

/// Bytes of a raw text body; bodies the framework already decoded are not
/// counted against the limit.
std::size_t raw_body_size(const HttpRequest& request) noexcept {
    if (const auto* text = std::get_if<std::string>(&request.body)) {
        return text->size();
    }
    return 0;
}

const Context* context_of(const std::optional<Context>& ctx) noexcept {
    return ctx.has_value() ? &*ctx : nullptr;
}

}  // namespace

RequestHandler::RequestHandler(
    std::shared_ptr<IProcedureRouter> router,
    HandlerConfig config
)
    : router_(std::move(router))
    , config_(std::move(config))
{
    if (router_ == nullptr) {
        throw std::invalid_argument("RequestHandler requires a procedure router");
    }
}

asio::awaitable<HttpResponse> RequestHandler::handle(const HttpRequest& request, std::string route) {
    if (is_probe_request(request.method)) {
        co_return HttpResponse{204, {}, {}};
    }

    RequestState state;
    state.type = procedure_type_from_method(request.method);
    state.batch = is_batch_call(request.query);

    get_logger().debug_fmt("{} /{} ({}{})",
        request.method, route, to_string(state.type), state.batch ? ", batch" : "");

    std::optional<RpcResult<std::vector<CallOutcome>>> outcomes;
    std::exception_ptr failure;
    try {
        outcomes = co_await dispatch(request, route, state);
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure) {
        co_return respond_with_error(request, error_from_exception(failure), state);
    }
    if (outcomes->has_value() == false) {
        co_return respond_with_error(request, outcomes->error(), state);
    }
    co_return respond_with_outcomes(**outcomes, state);
}

// ─────────────────────────────────────────────────────────────────────────────
// Request-Level Checks
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<RpcResult<std::vector<CallOutcome>>> RequestHandler::dispatch(
    const HttpRequest& request,
    const std::string& route,
    RequestState& state
) {
    if (state.batch && (config_.batching_enabled == false)) {
        co_return tl::unexpected(RpcError::internal("Batching is not enabled on the server"));
    }

    if (is_servable_over_http(state.type) == false) {
        co_return tl::unexpected(RpcError::method_not_supported(request.method));
    }

    const std::size_t body_size = raw_body_size(request);
    if ((config_.max_body_size > 0) && (body_size > config_.max_body_size)) {
        co_return tl::unexpected(RpcError::payload_too_large(body_size, config_.max_body_size));
    }

    auto raw_input = extract_raw_input(request);
    if (raw_input.has_value() == false) {
        co_return tl::unexpected(std::move(raw_input.error()));
    }

    state.paths = split_paths(route, state.batch);

    auto ctx = co_await build_context(request);
    if (ctx.has_value() == false) {
        co_return tl::unexpected(std::move(ctx.error()));
    }
    state.ctx = std::move(*ctx);

    auto inputs = decode_inputs(*raw_input, state.paths.size(), state.batch, config_.transformer);
    if (inputs.has_value() == false) {
        co_return tl::unexpected(std::move(inputs.error()));
    }

    // Sized once: calls write into their own slot while running concurrently.
    std::vector<CallOutcome> outcomes(state.paths.size());
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        outcomes[i].path = state.paths[i];
        outcomes[i].input = std::move((*inputs)[i]);
    }

    co_await execute_all(request, *state.ctx, state.type, outcomes);
    co_return outcomes;
}

asio::awaitable<ContextResult> RequestHandler::build_context(const HttpRequest& request) {
    if (!config_.create_context) {
        co_return Context{};
    }

    std::exception_ptr failure;
    try {
        auto result = co_await config_.create_context(request);
        if (result.has_value()) {
            co_return std::move(*result);
        }
        get_logger().debug_fmt("Context factory rejected request: {}", result.error().message);
        co_return tl::unexpected(std::move(result.error()));
    } catch (...) {
        failure = std::current_exception();
    }

    const RpcError error = error_from_exception(failure);
    get_logger().error_fmt("Context factory threw: {}", error.cause.value_or(error.message));
    co_return tl::unexpected(error);
}

// ─────────────────────────────────────────────────────────────────────────────
// Call Execution
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> RequestHandler::execute_all(
    const HttpRequest& request,
    const Context& ctx,
    ProcedureType type,
    std::vector<CallOutcome>& outcomes
) {
    auto executor = co_await asio::this_coro::executor;

    using CallOperation = decltype(asio::co_spawn(
        executor, std::declval<asio::awaitable<void>>(), asio::deferred));

    std::vector<CallOperation> operations;
    operations.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        operations.push_back(asio::co_spawn(
            executor, execute_call(request, ctx, type, outcome), asio::deferred));
    }

    auto [completion_order, exceptions] =
        co_await asio::experimental::make_parallel_group(std::move(operations))
            .async_wait(asio::experimental::wait_for_all(), asio::use_awaitable);

    get_logger().debug_fmt("{} call(s) completed", completion_order.size());

    // execute_call catches everything itself; this covers frame allocation
    // failures and the like.
    for (std::size_t i = 0; i < exceptions.size(); ++i) {
        if (exceptions[i]) {
            outcomes[i].data.reset();
            outcomes[i].error = error_from_exception(exceptions[i]);
        }
    }
}

asio::awaitable<void> RequestHandler::execute_call(
    const HttpRequest& request,
    const Context& ctx,
    ProcedureType type,
    CallOutcome& outcome
) {
    std::optional<RpcError> failure;
    try {
        auto result = co_await router_->call_procedure(ProcedureCall{ctx, outcome.path, outcome.input, type});
        if (result.has_value()) {
            outcome.data = std::move(*result);
        } else {
            failure = std::move(result.error());
        }
    } catch (...) {
        failure = error_from_exception(std::current_exception());
    }

    if (failure.has_value() == false) {
        co_return;
    }

    outcome.error = std::move(*failure);
    const RpcError& error = *outcome.error;
    if (error.is_client_error()) {
        get_logger().warn_fmt("{} {} failed: {} ({})",
            to_string(type), outcome.path, error.message, to_string(error.code));
    } else {
        get_logger().error_fmt("{} {} failed: {} ({})",
            to_string(type), outcome.path, error.cause.value_or(error.message), to_string(error.code));
    }

    report_error(ErrorDetails{error, type, outcome.path, outcome.input, &ctx, request});
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse RequestHandler::respond_with_outcomes(
    const std::vector<CallOutcome>& outcomes,
    const RequestState& state
) const {
    const Context* ctx = context_of(state.ctx);

    std::vector<ResponseEnvelope> envelopes;
    std::vector<RpcError> errors;
    envelopes.reserve(outcomes.size());

    for (const auto& outcome : outcomes) {
        if (outcome.failed()) {
            errors.push_back(*outcome.error);
            envelopes.push_back(ResponseEnvelope::error(shape_error(ErrorShapeParams{
                *outcome.error,
                state.type,
                outcome.path,
                outcome.input,
                ctx
            })));
        } else {
            envelopes.push_back(ResponseEnvelope::result(outcome.data.value_or(Json())));
        }
    }

    return build_response(envelopes, errors, ResponseInfo{ctx, state.paths, state.type, state.batch}, config_);
}

HttpResponse RequestHandler::respond_with_error(
    const HttpRequest& request,
    const RpcError& error,
    const RequestState& state
) const {
    static const Input kNoInput;
    const Context* ctx = context_of(state.ctx);

    if (error.is_client_error()) {
        get_logger().warn_fmt("Rejected {} request: {} ({})",
            request.method, error.message, to_string(error.code));
    } else {
        get_logger().error_fmt("{} request failed: {} ({})",
            request.method, error.cause.value_or(error.message), to_string(error.code));
    }

    report_error(ErrorDetails{error, state.type, std::nullopt, kNoInput, ctx, request});

    // A request-level failure is one envelope even when batch mode was asked for.
    const std::vector<ResponseEnvelope> envelopes{
        ResponseEnvelope::error(shape_error(ErrorShapeParams{error, state.type, std::nullopt, kNoInput, ctx}))
    };
    const std::vector<RpcError> errors{error};

    return build_response(envelopes, errors, ResponseInfo{ctx, state.paths, state.type, false}, config_);
}

Json RequestHandler::shape_error(const ErrorShapeParams& params) const {
    if (config_.error_shaper) {
        try {
            return config_.error_shaper(params);
        } catch (const std::exception& e) {
            get_logger().error_fmt("Error shaper threw, using default shape: {}", e.what());
        } catch (...) {
            get_logger().write(LogLevel::Error, "Error shaper threw a non-standard exception, using default shape");
        }
    }
    return default_error_shape(params);
}

void RequestHandler::report_error(const ErrorDetails& details) const {
    if (!config_.on_error) {
        return;
    }
    try {
        config_.on_error(details);
    } catch (const std::exception& e) {
        get_logger().error_fmt("on_error hook threw: {}", e.what());
    } catch (...) {
        get_logger().write(LogLevel::Error, "on_error hook threw a non-standard exception");
    }
}

}  // namespace rpcbridge
