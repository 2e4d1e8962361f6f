#pragma once

#include "rpcbridge/handler/request_handler.hpp"
#include "rpcbridge/http/http_types.hpp"

#include <asio/awaitable.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rpcbridge {

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Server Adapter
// ═══════════════════════════════════════════════════════════════════════════
// Glue between an HTTP server and RequestHandler. The server hands over the
// request line, headers and body; the adapter extracts the route and query,
// runs the handler and writes the response through IResponseWriter.

/// Request as received by the server, before any interpretation
struct RawHttpRequest {
    std::string method{"GET"};
    std::string target{"/"};   ///< Origin-form "/trpc/a,b?batch=1" or absolute-form
    HeaderMap headers;
    RequestBody body;
};

/// Response side of the hosting server
class IResponseWriter {
public:
    virtual ~IResponseWriter() = default;

    /// Status already set by earlier middleware, if any
    [[nodiscard]] virtual std::optional<int> status() const = 0;

    virtual void set_status(int status) = 0;
    virtual void set_header(const std::string& name, const std::string& value) = 0;

    /// Sends the body and completes the response
    virtual void end(std::string body) = 0;
};

using TeardownFn = std::function<asio::awaitable<void>()>;

struct AdapterOptions {
    // Mount point of the handler, e.g. "/trpc". Empty when mounted at the root.
    std::string endpoint_prefix;

    // Runs after the response has been ended.
    TeardownFn teardown;

    AdapterOptions& with_endpoint_prefix(std::string prefix) {
        endpoint_prefix = std::move(prefix);
        return *this;
    }

    AdapterOptions& with_teardown(TeardownFn fn) {
        teardown = std::move(fn);
        return *this;
    }
};

/// Route for a path name: "/trpc/a,b" with prefix "/trpc" -> "a,b"
[[nodiscard]] std::string route_from_pathname(std::string_view pathname, std::string_view endpoint_prefix);

/// Serve one request. Status is written only when the writer has none yet or
/// still has the default 200; headers with empty values are skipped.
asio::awaitable<void> serve_http_request(
    RequestHandler& handler,
    RawHttpRequest raw,
    IResponseWriter& writer,
    const AdapterOptions& options = {}
);

}  // namespace rpcbridge
