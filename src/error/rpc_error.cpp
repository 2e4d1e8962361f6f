#include "rpcbridge/error/rpc_error.hpp"

#include <array>
#include <format>
#include <new>

namespace rpcbridge {

namespace {

constexpr std::array kAllCodes{
    ErrorCode::ParseError,
    ErrorCode::BadRequest,
    ErrorCode::InternalServerError,
    ErrorCode::Unauthorized,
    ErrorCode::Forbidden,
    ErrorCode::NotFound,
    ErrorCode::MethodNotSupported,
    ErrorCode::Timeout,
    ErrorCode::Conflict,
    ErrorCode::PreconditionFailed,
    ErrorCode::PayloadTooLarge,
    ErrorCode::ClientClosedRequest
};

}  // namespace

std::optional<ErrorCode> error_code_from_string(std::string_view name) noexcept {
    for (const auto code : kAllCodes) {
        if (to_string(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

RpcError RpcError::make(
    ErrorCode code,
    std::string message,
    std::optional<std::string> cause
) {
    if (message.empty()) {
        const bool has_cause = cause.has_value() && (cause->empty() == false);
        message = has_cause ? *cause : std::string(to_string(code));
    }
    return RpcError{code, std::move(message), std::move(cause)};
}

RpcError RpcError::method_not_supported(std::string_view method) {
    return make(
        ErrorCode::MethodNotSupported,
        std::format("Unexpected request method {}", method));
}

RpcError RpcError::payload_too_large(std::size_t size, std::size_t limit) {
    return make(
        ErrorCode::PayloadTooLarge,
        std::format("Request body of {} bytes exceeds the limit of {} bytes", size, limit));
}

RpcError error_from_exception(std::exception_ptr error) noexcept {
    try {
        if (error == nullptr) {
            return RpcError::internal("Unknown error");
        }
        try {
            std::rethrow_exception(error);
        } catch (const RpcException& e) {
            return e.error();
        } catch (const std::exception& e) {
            return RpcError::make(ErrorCode::InternalServerError, {}, std::string(e.what()));
        } catch (...) {
            return RpcError::internal("Unknown error", "non-standard exception");
        }
    } catch (const std::bad_alloc&) {
        // Copying messages failed; the code alone is still meaningful.
        return RpcError{ErrorCode::InternalServerError, {}, std::nullopt};
    }
}

}  // namespace rpcbridge
