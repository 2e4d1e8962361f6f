#include <catch2/catch_test_macros.hpp>

#include "rpcbridge/handler/handler_config.hpp"
#include "test_helpers.hpp"

using namespace rpcbridge;
using rpcbridge::testing::run_sync;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Defaults
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("HandlerConfig defaults", "[config]") {
    HandlerConfig config;

    REQUIRE(config.batching_enabled);
    REQUIRE(config.max_body_size == 0);
    REQUIRE(!config.create_context);
    REQUIRE(!config.error_shaper);
    REQUIRE(!config.on_error);
    REQUIRE(!config.response_meta);
    REQUIRE(config.transformer.serialize(Json{{"a", 1}}) == Json{{"a", 1}});
    REQUIRE(config.transformer.deserialize(Json(3)) == Json(3));
}

TEST_CASE("HandlerConfig builder helpers chain", "[config]") {
    HandlerConfig config;
    config.with_batching(false)
          .with_max_body_size(1024)
          .with_error_shaper([](const ErrorShapeParams&) { return Json("shaped"); })
          .with_error_observer([](const ErrorDetails&) {})
          .with_response_meta([](const ResponseMetaParams&) { return ResponseMeta{}; });

    REQUIRE_FALSE(config.batching_enabled);
    REQUIRE(config.max_body_size == 1024);
    REQUIRE(static_cast<bool>(config.error_shaper));
    REQUIRE(static_cast<bool>(config.on_error));
    REQUIRE(static_cast<bool>(config.response_meta));
}

TEST_CASE("with_static_context hands out the same context", "[config]") {
    HandlerConfig config;
    config.with_static_context(Json{{"user", "ada"}});
    REQUIRE(static_cast<bool>(config.create_context));

    asio::io_context io;
    const HttpRequest request;

    const auto first = run_sync(io, config.create_context(request));
    const auto second = run_sync(io, config.create_context(request));

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE((*first)["user"] == "ada");
    REQUIRE(*first == *second);
}

TEST_CASE("with_transformer replaces both directions", "[config]") {
    HandlerConfig config;
    config.with_transformer(ValueTransformer{
        [](const Json& value) { return value.at("json"); },
        [](const Json& value) { return Json{{"json", value}}; }
    });

    REQUIRE(config.transformer.serialize(1) == Json{{"json", 1}});
    REQUIRE(config.transformer.deserialize(Json{{"json", 1}}) == 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Default Error Shape
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("default_error_shape for a call error", "[config][errors]") {
    const RpcError error = RpcError::not_found("No procedure on path \"x\"");
    const Input input = Json(1);

    const Json shape = default_error_shape(ErrorShapeParams{
        error, ProcedureType::Query, std::string_view("x"), input, nullptr});

    REQUIRE(shape["message"] == "No procedure on path \"x\"");
    REQUIRE(shape["code"] == -32004);
    REQUIRE(shape["data"]["code"] == "NOT_FOUND");
    REQUIRE(shape["data"]["httpStatus"] == 404);
    REQUIRE(shape["data"]["path"] == "x");
}

TEST_CASE("default_error_shape omits the path for request errors", "[config][errors]") {
    const RpcError error = RpcError::parse_error("Unexpected token");
    const Input input;

    const Json shape = default_error_shape(ErrorShapeParams{
        error, ProcedureType::Query, std::nullopt, input, nullptr});

    REQUIRE(shape["code"] == -32700);
    REQUIRE(shape["data"]["httpStatus"] == 400);
    REQUIRE_FALSE(shape["data"].contains("path"));
}
