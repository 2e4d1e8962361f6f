#include "rpcbridge/http/adapter.hpp"
#include "rpcbridge/log/logger.hpp"

namespace rpcbridge {

std::string route_from_pathname(std::string_view pathname, std::string_view endpoint_prefix) {
    if ((endpoint_prefix.empty() == false) && pathname.starts_with(endpoint_prefix)) {
        const auto rest = pathname.substr(endpoint_prefix.size());
        // "/trpcx" is not under "/trpc"
        if (rest.empty() || rest.front() == '/' || endpoint_prefix.ends_with('/')) {
            pathname = rest;
        }
    }
    if (pathname.starts_with('/')) {
        pathname.remove_prefix(1);
    }
    return std::string(pathname);
}

asio::awaitable<void> serve_http_request(
    RequestHandler& handler,
    RawHttpRequest raw,
    IResponseWriter& writer,
    const AdapterOptions& options
) {
    HttpRequest request;
    request.method = std::move(raw.method);
    request.headers = std::move(raw.headers);
    request.body = std::move(raw.body);

    std::string route;
    const auto target = parse_request_target(raw.target);
    if (target.has_value()) {
        route = route_from_pathname(target->pathname, options.endpoint_prefix);
        request.query = QueryParams(target->search);
    } else {
        get_logger().warn_fmt("Unparseable request target '{}', serving with an empty route", raw.target);
    }

    const HttpResponse response = co_await handler.handle(request, std::move(route));

    const auto current = writer.status();
    if ((current.has_value() == false) || (*current == 200)) {
        writer.set_status(response.status);
    }

    for (const auto& [name, value] : response.headers) {
        if (value.empty()) {
            continue;
        }
        writer.set_header(name, value);
    }

    writer.end(response.body);

    if (options.teardown) {
        co_await options.teardown();
    }
}

}  // namespace rpcbridge
