#pragma once

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/handler_config.hpp"
#include "rpcbridge/handler/procedure_type.hpp"
#include "rpcbridge/handler/router.hpp"
#include "rpcbridge/http/http_types.hpp"
#include "rpcbridge/protocol/envelope.hpp"

#include <span>
#include <string>

namespace rpcbridge {

// ═══════════════════════════════════════════════════════════════════════════
// Responder
// ═══════════════════════════════════════════════════════════════════════════
// Turns the envelopes of one request into the HTTP response:
//   status   200 when nothing failed, else the status of the first error;
//            HandlerConfig::response_meta may override it
//   headers  Content-Type: application/json, then response_meta headers
//   body     one envelope, or the envelope array for batch responses, with
//            every payload passed through the output serializer

struct ResponseInfo {
    const Context* ctx{nullptr};
    std::span<const std::string> paths;
    ProcedureType type{ProcedureType::Unknown};
    bool batch{false};
};

[[nodiscard]] int derive_status(std::span<const RpcError> errors) noexcept;

/// Never throws past its own boundary: a failing response_meta hook or output
/// serializer yields a plain INTERNAL_SERVER_ERROR response instead.
[[nodiscard]] HttpResponse build_response(
    std::span<const ResponseEnvelope> envelopes,
    std::span<const RpcError> errors,
    const ResponseInfo& info,
    const HandlerConfig& config
);

/// Envelope shaped with default_error_shape, no transformer, no meta
[[nodiscard]] HttpResponse plain_error_response(const RpcError& error);

}  // namespace rpcbridge
