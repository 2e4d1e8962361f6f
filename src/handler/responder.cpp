#include "rpcbridge/handler/responder.hpp"
#include "rpcbridge/log/logger.hpp"

#include <vector>

namespace rpcbridge {

namespace {

constexpr const char* kContentType = "Content-Type";
constexpr const char* kJsonContentType = "application/json";

std::string serialize_body(const Json& body) {
    // Invalid UTF-8 in procedure output must not abort the response.
    return body.dump(-1, ' ', false, Json::error_handler_t::replace);
}

HttpResponse render(
    std::span<const ResponseEnvelope> envelopes,
    std::span<const RpcError> errors,
    const ResponseInfo& info,
    const HandlerConfig& config
) {
    HttpResponse response;
    response.status = derive_status(errors);
    response.headers[kContentType] = kJsonContentType;

    if (config.response_meta) {
        const ResponseMeta meta = config.response_meta(ResponseMetaParams{
            info.ctx,
            info.paths,
            info.type,
            envelopes,
            errors
        });
        for (const auto& [name, value] : meta.headers) {
            set_header(response.headers, name, value);
        }
        if (meta.status.has_value()) {
            response.status = *meta.status;
        }
    }

    std::vector<ResponseEnvelope> serialized;
    serialized.reserve(envelopes.size());
    for (const auto& envelope : envelopes) {
        serialized.push_back(envelope.serialized(config.transformer));
    }

    response.body = serialize_body(envelopes_to_json(serialized, info.batch));
    return response;
}

}  // namespace

int derive_status(std::span<const RpcError> errors) noexcept {
    if (errors.empty()) {
        return 200;
    }
    // Mixed batches report their first failure; the body still carries every
    // per-call outcome.
    return errors.front().status();
}

HttpResponse build_response(
    std::span<const ResponseEnvelope> envelopes,
    std::span<const RpcError> errors,
    const ResponseInfo& info,
    const HandlerConfig& config
) {
    try {
        return render(envelopes, errors, info, config);
    } catch (...) {
        const RpcError cause = error_from_exception(std::current_exception());
        get_logger().error_fmt("Failed to render response: {}", cause.message);
        return plain_error_response(RpcError::internal("Failed to render response", cause.message));
    }
}

HttpResponse plain_error_response(const RpcError& error) {
    static const Input kNoInput;

    const Json shaped = default_error_shape(ErrorShapeParams{
        error,
        ProcedureType::Unknown,
        std::nullopt,
        kNoInput,
        nullptr
    });

    HttpResponse response;
    response.status = error.status();
    response.headers[kContentType] = kJsonContentType;
    response.body = serialize_body(ResponseEnvelope::error(shaped).to_json());
    return response;
}

}  // namespace rpcbridge
