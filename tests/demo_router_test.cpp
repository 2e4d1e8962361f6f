#include <catch2/catch_test_macros.hpp>

#include "demo_router.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace rpcbridge;
using rpcbridge::testing::run_sync;
using Json = nlohmann::json;

namespace {

ProcedureResult call(ProcedureTable& table, const std::string& path, ProcedureType type, Input input = std::nullopt) {
    static const Context kNoContext;
    asio::io_context io;
    return run_sync(io, table.call_procedure(ProcedureCall{kNoContext, path, input, type}));
}

}  // namespace

TEST_CASE("Demo router registers the CLI procedures", "[cli]") {
    auto router = cli::make_demo_router();

    REQUIRE(router->paths() == std::vector<std::string>{"add", "echo", "fail", "health", "slow"});
}

TEST_CASE("Demo add keeps integers integral", "[cli]") {
    auto router = cli::make_demo_router();

    SECTION("two integers") {
        const auto result = call(*router, "add", ProcedureType::Mutation, Json{{"a", 1}, {"b", 2}});

        REQUIRE(result.has_value());
        REQUIRE(result->is_number_integer());
        REQUIRE(result->dump() == "3");
    }

    SECTION("large integers do not lose precision") {
        const auto result = call(*router, "add", ProcedureType::Mutation,
                                 Json{{"a", 9007199254740993LL}, {"b", 1}});

        REQUIRE(result.has_value());
        REQUIRE(result->get<std::int64_t>() == 9007199254740994LL);
    }

    SECTION("any float makes a float sum") {
        const auto result = call(*router, "add", ProcedureType::Mutation, Json{{"a", 1.5}, {"b", 2}});

        REQUIRE(result.has_value());
        REQUIRE(result->is_number_float());
        REQUIRE(result->get<double>() == 3.5);
    }

    SECTION("missing operand") {
        const auto result = call(*router, "add", ProcedureType::Mutation, Json{{"a", 1}});

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::BadRequest);
    }
}

TEST_CASE("Demo echo and health", "[cli]") {
    auto router = cli::make_demo_router();

    REQUIRE(*call(*router, "health", ProcedureType::Query) == Json{{"status", "ok"}});
    REQUIRE(call(*router, "echo", ProcedureType::Query)->is_null());
    REQUIRE(*call(*router, "echo", ProcedureType::Query, Json("hi")) == "hi");
}
