#include <catch2/catch_test_macros.hpp>

#include "rpcbridge/handler/procedure_type.hpp"

using namespace rpcbridge;

TEST_CASE("HTTP methods map to procedure types", "[classifier]") {
    REQUIRE(procedure_type_from_method("GET") == ProcedureType::Query);
    REQUIRE(procedure_type_from_method("POST") == ProcedureType::Mutation);
    REQUIRE(procedure_type_from_method("PATCH") == ProcedureType::Subscription);
    REQUIRE(procedure_type_from_method("PUT") == ProcedureType::Unknown);
    REQUIRE(procedure_type_from_method("DELETE") == ProcedureType::Unknown);
    REQUIRE(procedure_type_from_method("get") == ProcedureType::Unknown);

    static_assert(procedure_type_from_method("GET") == ProcedureType::Query);
}

TEST_CASE("Only queries and mutations are served over HTTP", "[classifier]") {
    REQUIRE(is_servable_over_http(ProcedureType::Query));
    REQUIRE(is_servable_over_http(ProcedureType::Mutation));
    REQUIRE_FALSE(is_servable_over_http(ProcedureType::Subscription));
    REQUIRE_FALSE(is_servable_over_http(ProcedureType::Unknown));
}

TEST_CASE("HEAD is a probe request", "[classifier]") {
    REQUIRE(is_probe_request("HEAD"));
    REQUIRE_FALSE(is_probe_request("GET"));
}

TEST_CASE("ProcedureType names", "[classifier]") {
    REQUIRE(to_string(ProcedureType::Query) == "query");
    REQUIRE(to_string(ProcedureType::Mutation) == "mutation");
    REQUIRE(to_string(ProcedureType::Subscription) == "subscription");
    REQUIRE(to_string(ProcedureType::Unknown) == "unknown");
}

TEST_CASE("Batch mode requires batch=1 exactly", "[classifier]") {
    REQUIRE(is_batch_call(QueryParams("batch=1")));
    REQUIRE(is_batch_call(QueryParams("input=%7B%7D&batch=1")));
    REQUIRE_FALSE(is_batch_call(QueryParams("batch=true")));
    REQUIRE_FALSE(is_batch_call(QueryParams("batch=01")));
    REQUIRE_FALSE(is_batch_call(QueryParams("batch=")));
    REQUIRE_FALSE(is_batch_call(QueryParams("")));
}
