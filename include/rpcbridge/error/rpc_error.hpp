#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// RPC Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════
// Every failure the handler reports, whether raised by the transport itself
// (malformed input, unsupported method) or by a procedure, is normalized into
// an RpcError before it is shaped onto the wire.

#include <tl/expected.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rpcbridge {

enum class ErrorCode {
    ParseError,           ///< Malformed JSON in the query string or body
    BadRequest,           ///< Structurally invalid request (e.g. batch input not an object)
    InternalServerError,  ///< Default for anything not otherwise tagged
    Unauthorized,
    Forbidden,
    NotFound,             ///< No procedure registered under the path
    MethodNotSupported,   ///< HTTP method cannot be served by this transport
    Timeout,
    Conflict,
    PreconditionFailed,
    PayloadTooLarge,      ///< Body exceeds HandlerConfig::max_body_size
    ClientClosedRequest
};

/// Wire name, e.g. "PARSE_ERROR"
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:          return "PARSE_ERROR";
        case ErrorCode::BadRequest:          return "BAD_REQUEST";
        case ErrorCode::InternalServerError: return "INTERNAL_SERVER_ERROR";
        case ErrorCode::Unauthorized:        return "UNAUTHORIZED";
        case ErrorCode::Forbidden:           return "FORBIDDEN";
        case ErrorCode::NotFound:            return "NOT_FOUND";
        case ErrorCode::MethodNotSupported:  return "METHOD_NOT_SUPPORTED";
        case ErrorCode::Timeout:             return "TIMEOUT";
        case ErrorCode::Conflict:            return "CONFLICT";
        case ErrorCode::PreconditionFailed:  return "PRECONDITION_FAILED";
        case ErrorCode::PayloadTooLarge:     return "PAYLOAD_TOO_LARGE";
        case ErrorCode::ClientClosedRequest: return "CLIENT_CLOSED_REQUEST";
    }
    return "INTERNAL_SERVER_ERROR";
}

/// Inverse of to_string(ErrorCode); nullopt for unrecognized names
[[nodiscard]] std::optional<ErrorCode> error_code_from_string(std::string_view name) noexcept;

/// Numeric code carried in the shaped error (JSON-RPC 2.0 ranges)
[[nodiscard]] constexpr int json_rpc_code(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:          return -32700;
        case ErrorCode::BadRequest:          return -32600;
        case ErrorCode::InternalServerError: return -32603;
        case ErrorCode::Unauthorized:        return -32001;
        case ErrorCode::Forbidden:           return -32003;
        case ErrorCode::NotFound:            return -32004;
        case ErrorCode::MethodNotSupported:  return -32005;
        case ErrorCode::Timeout:             return -32008;
        case ErrorCode::Conflict:            return -32009;
        case ErrorCode::PreconditionFailed:  return -32012;
        case ErrorCode::PayloadTooLarge:     return -32013;
        case ErrorCode::ClientClosedRequest: return -32099;
    }
    return -32603;
}

[[nodiscard]] constexpr int http_status(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:          return 400;
        case ErrorCode::BadRequest:          return 400;
        case ErrorCode::InternalServerError: return 500;
        case ErrorCode::Unauthorized:        return 401;
        case ErrorCode::Forbidden:           return 403;
        case ErrorCode::NotFound:            return 404;
        case ErrorCode::MethodNotSupported:  return 405;
        case ErrorCode::Timeout:             return 408;
        case ErrorCode::Conflict:            return 409;
        case ErrorCode::PreconditionFailed:  return 412;
        case ErrorCode::PayloadTooLarge:     return 413;
        case ErrorCode::ClientClosedRequest: return 499;
    }
    return 500;
}

// ─────────────────────────────────────────────────────────────────────────────
// RpcError
// ─────────────────────────────────────────────────────────────────────────────

struct RpcError {
    ErrorCode code{ErrorCode::InternalServerError};
    std::string message;
    std::optional<std::string> cause;  ///< Message of the wrapped original error

    /// Message falls back to the cause, then to the wire name.
    [[nodiscard]] static RpcError make(
        ErrorCode code,
        std::string message = {},
        std::optional<std::string> cause = std::nullopt
    );

    [[nodiscard]] static RpcError parse_error(std::string cause) {
        return make(ErrorCode::ParseError, {}, std::move(cause));
    }

    [[nodiscard]] static RpcError bad_request(std::string msg) {
        return make(ErrorCode::BadRequest, std::move(msg));
    }

    [[nodiscard]] static RpcError method_not_supported(std::string_view method);

    [[nodiscard]] static RpcError not_found(std::string msg) {
        return make(ErrorCode::NotFound, std::move(msg));
    }

    [[nodiscard]] static RpcError payload_too_large(std::size_t size, std::size_t limit);

    [[nodiscard]] static RpcError internal(std::string msg, std::optional<std::string> cause = std::nullopt) {
        return make(ErrorCode::InternalServerError, std::move(msg), std::move(cause));
    }

    [[nodiscard]] int status() const noexcept {
        return http_status(code);
    }

    [[nodiscard]] bool is_client_error() const noexcept {
        return (status() >= 400) && (status() < 500);
    }
};

template <typename T>
using RpcResult = tl::expected<T, RpcError>;

// ─────────────────────────────────────────────────────────────────────────────
// RpcException
// ─────────────────────────────────────────────────────────────────────────────
// For procedures and hooks that prefer throwing over returning tl::unexpected.
// The carried code survives normalization.

class RpcException : public std::runtime_error {
public:
    explicit RpcException(RpcError error)
        : std::runtime_error(error.message)
        , error_(std::move(error))
    {}

    RpcException(ErrorCode code, std::string message)
        : RpcException(RpcError::make(code, std::move(message)))
    {}

    [[nodiscard]] const RpcError& error() const noexcept {
        return error_;
    }

private:
    RpcError error_;
};

/// Normalize anything thrown into an RpcError. RpcException keeps its error,
/// other std::exception types become INTERNAL_SERVER_ERROR with what() as the
/// cause, and non-standard exceptions become INTERNAL_SERVER_ERROR too.
[[nodiscard]] RpcError error_from_exception(std::exception_ptr error) noexcept;

}  // namespace rpcbridge
