#include <catch2/catch_test_macros.hpp>

#include "rpcbridge/http/adapter.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_router.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace rpcbridge;
using rpcbridge::testing::MockRouter;
using rpcbridge::testing::ScopedCapturingLogger;
using rpcbridge::testing::run_sync;
using Json = nlohmann::json;

namespace {

class RecordingWriter final : public IResponseWriter {
public:
    std::optional<int> status() const override {
        return status_;
    }

    void set_status(int status) override {
        status_ = status;
        events.push_back("status");
    }

    void set_header(const std::string& name, const std::string& value) override {
        headers.emplace_back(name, value);
    }

    void end(std::string response_body) override {
        body = std::move(response_body);
        events.push_back("end");
    }

    void preset_status(int status) {
        status_ = status;
    }

    [[nodiscard]] bool has_header(const std::string& name) const {
        for (const auto& [header_name, value] : headers) {
            if (header_name == name) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::vector<std::string> events;

private:
    std::optional<int> status_;
};

RawHttpRequest raw_request(std::string method, std::string target, RequestBody body = {}) {
    RawHttpRequest raw;
    raw.method = std::move(method);
    raw.target = std::move(target);
    raw.body = std::move(body);
    return raw;
}

void serve(RequestHandler& handler, RawHttpRequest raw, IResponseWriter& writer, const AdapterOptions& options = {}) {
    asio::io_context io;
    run_sync(io, serve_http_request(handler, std::move(raw), writer, options));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Route Extraction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("route_from_pathname strips the endpoint prefix", "[adapter][route]") {
    SECTION("mounted under a prefix") {
        REQUIRE(route_from_pathname("/trpc/post.byId", "/trpc") == "post.byId");
        REQUIRE(route_from_pathname("/trpc/a,b", "/trpc") == "a,b");
        REQUIRE(route_from_pathname("/trpc/a", "/trpc/") == "a");
        REQUIRE(route_from_pathname("/trpc", "/trpc").empty());
    }

    SECTION("prefix must end at a segment boundary") {
        REQUIRE(route_from_pathname("/trpcx/a", "/trpc") == "trpcx/a");
    }

    SECTION("mounted at the root") {
        REQUIRE(route_from_pathname("/greet", "") == "greet");
        REQUIRE(route_from_pathname("/", "").empty());
    }

    SECTION("path outside the prefix is kept") {
        REQUIRE(route_from_pathname("/other/a", "/trpc") == "other/a");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Serving
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("serve_http_request writes the handler response", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    router->on_echo("echo");
    RequestHandler handler(router);

    RecordingWriter writer;
    serve(handler, raw_request("GET", "/trpc/echo?input=%7B%22a%22%3A1%7D"), writer,
          AdapterOptions{}.with_endpoint_prefix("/trpc"));

    REQUIRE(writer.status() == 200);
    REQUIRE(writer.has_header("Content-Type"));
    REQUIRE(Json::parse(writer.body)["result"]["data"] == Json{{"a", 1}});
    REQUIRE(router->last_call()->path == "echo");
    REQUIRE(writer.events == std::vector<std::string>{"status", "end"});
}

TEST_CASE("serve_http_request routes batches and bodies", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    router->on_echo("a");
    router->on_echo("b");
    RequestHandler handler(router);

    RecordingWriter writer;
    serve(handler, raw_request("POST", "/api/a,b?batch=1", std::string{R"({"1":"second"})"}), writer,
          AdapterOptions{}.with_endpoint_prefix("/api"));

    const Json body = Json::parse(writer.body);
    REQUIRE(body.is_array());
    REQUIRE(body.size() == 2);
    REQUIRE(body[1]["result"]["data"] == "second");
}

TEST_CASE("A status set by earlier middleware is kept", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    RequestHandler handler(router);

    SECTION("non-default status wins") {
        RecordingWriter writer;
        writer.preset_status(202);
        serve(handler, raw_request("GET", "/missing"), writer);

        REQUIRE(writer.status() == 202);
        REQUIRE(Json::parse(writer.body)["error"]["data"]["httpStatus"] == 404);
    }

    SECTION("default 200 is overwritten") {
        RecordingWriter writer;
        writer.preset_status(200);
        serve(handler, raw_request("GET", "/missing"), writer);

        REQUIRE(writer.status() == 404);
    }
}

TEST_CASE("Headers with empty values are not written", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    router->on_value("a", 1);

    HandlerConfig config;
    config.with_response_meta([](const ResponseMetaParams&) {
        ResponseMeta meta;
        meta.headers["X-Empty"] = "";
        meta.headers["X-Request-Kind"] = "query";
        return meta;
    });
    RequestHandler handler(router, std::move(config));

    RecordingWriter writer;
    serve(handler, raw_request("GET", "/a"), writer);

    REQUIRE(writer.has_header("X-Request-Kind"));
    REQUIRE_FALSE(writer.has_header("X-Empty"));
}

TEST_CASE("HEAD probes end with an empty body", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    RequestHandler handler(router);

    RecordingWriter writer;
    serve(handler, raw_request("HEAD", "/anything"), writer);

    REQUIRE(writer.status() == 204);
    REQUIRE(writer.body.empty());
    REQUIRE(writer.events.back() == "end");
    REQUIRE(router->call_count() == 0);
}

TEST_CASE("Teardown runs after the response has ended", "[adapter]") {
    auto router = std::make_shared<MockRouter>();
    router->on_value("a", 1);
    RequestHandler handler(router);

    RecordingWriter writer;
    bool ended_before_teardown = false;
    int teardowns = 0;

    AdapterOptions options;
    options.with_teardown([&]() -> asio::awaitable<void> {
        ended_before_teardown = (writer.events.empty() == false) && (writer.events.back() == "end");
        ++teardowns;
        co_return;
    });

    serve(handler, raw_request("GET", "/a"), writer, options);

    REQUIRE(teardowns == 1);
    REQUIRE(ended_before_teardown);
}

TEST_CASE("An unparseable target is served with an empty route", "[adapter]") {
    ScopedCapturingLogger logger;

    auto router = std::make_shared<MockRouter>();
    RequestHandler handler(router);

    RecordingWriter writer;
    serve(handler, raw_request("GET", "not a target"), writer);

    REQUIRE(writer.status() == 404);
    REQUIRE(router->last_call()->path.empty());
    REQUIRE(logger->contains("Unparseable request target"));
}
