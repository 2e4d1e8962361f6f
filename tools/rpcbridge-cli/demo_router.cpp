#include "demo_router.hpp"

#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace rpcbridge::cli {

std::shared_ptr<ProcedureTable> make_demo_router() {
    auto table = std::make_shared<ProcedureTable>();

    table->query("health", [](const ProcedureCall&) -> asio::awaitable<ProcedureResult> {
        co_return Json{{"status", "ok"}};
    });

    table->query("echo", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        co_return call.input.value_or(Json());
    });

    table->mutation("add", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        const bool valid = call.input.has_value() &&
                           call.input->is_object() &&
                           call.input->contains("a") && call.input->at("a").is_number() &&
                           call.input->contains("b") && call.input->at("b").is_number();
        if (valid == false) {
            co_return tl::unexpected(RpcError::bad_request("add expects {\"a\": number, \"b\": number}"));
        }
        const Json& a = call.input->at("a");
        const Json& b = call.input->at("b");
        if (a.is_number_integer() && b.is_number_integer()) {
            co_return Json(a.get<std::int64_t>() + b.get<std::int64_t>());
        }
        co_return Json(a.get<double>() + b.get<double>());
    });

    table->query("fail", [](const ProcedureCall&) -> asio::awaitable<ProcedureResult> {
        throw std::runtime_error("Intentional failure");
        co_return Json();
    });

    table->query("slow", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        std::int64_t delay_ms = 50;
        if (call.input.has_value() && call.input->is_number_integer()) {
            delay_ms = call.input->get<std::int64_t>();
        }
        asio::steady_timer timer(co_await asio::this_coro::executor);
        timer.expires_after(std::chrono::milliseconds(delay_ms));
        co_await timer.async_wait(asio::use_awaitable);
        co_return Json{{"waited_ms", delay_ms}};
    });

    return table;
}

}  // namespace rpcbridge::cli
