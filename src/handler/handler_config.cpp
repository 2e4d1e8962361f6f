#include "rpcbridge/handler/handler_config.hpp"

namespace rpcbridge {

Json default_error_shape(const ErrorShapeParams& params) {
    const RpcError& error = params.error;

    Json data = Json::object();
    data["code"] = to_string(error.code);
    data["httpStatus"] = error.status();
    if (params.path.has_value()) {
        data["path"] = *params.path;
    }

    return Json{
        {"message", error.message},
        {"code", json_rpc_code(error.code)},
        {"data", std::move(data)}
    };
}

HandlerConfig& HandlerConfig::with_batching(bool enabled) {
    batching_enabled = enabled;
    return *this;
}

HandlerConfig& HandlerConfig::with_max_body_size(std::size_t bytes) {
    max_body_size = bytes;
    return *this;
}

HandlerConfig& HandlerConfig::with_context_factory(ContextFactory factory) {
    create_context = std::move(factory);
    return *this;
}

HandlerConfig& HandlerConfig::with_static_context(Context ctx) {
    // The coroutine reads the capture through the stored std::function, which
    // outlives every request served with this configuration.
    create_context = [ctx = std::move(ctx)](const HttpRequest&) -> asio::awaitable<ContextResult> {
        co_return ctx;
    };
    return *this;
}

HandlerConfig& HandlerConfig::with_error_shaper(ErrorShaper shaper) {
    error_shaper = std::move(shaper);
    return *this;
}

HandlerConfig& HandlerConfig::with_transformer(ValueTransformer value_transformer) {
    transformer = std::move(value_transformer);
    return *this;
}

HandlerConfig& HandlerConfig::with_error_observer(ErrorObserver observer) {
    on_error = std::move(observer);
    return *this;
}

HandlerConfig& HandlerConfig::with_response_meta(ResponseMetaFn meta) {
    response_meta = std::move(meta);
    return *this;
}

}  // namespace rpcbridge
