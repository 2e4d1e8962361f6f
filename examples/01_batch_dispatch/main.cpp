// Example 01: Batch Dispatch
//
// Serves a few requests straight through RequestHandler: a single query, a
// mixed batch, a malformed input and a HEAD probe. Shows the context factory,
// the error observer and response metadata hooks.

#include <rpcbridge/handler/procedure_table.hpp>
#include <rpcbridge/handler/request_handler.hpp>
#include <rpcbridge/log/spdlog_logger.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace rpcbridge;
using Json = nlohmann::json;

namespace {

void print_response(const std::string& title, const HttpResponse& response) {
    std::cout << "=== " << title << " ===\n";
    std::cout << "Status: " << response.status << "\n";
    for (const auto& [name, value] : response.headers) {
        std::cout << name << ": " << value << "\n";
    }
    if (response.is_json()) {
        std::cout << Json::parse(response.body).dump(2) << "\n";
    } else if (response.body.empty() == false) {
        std::cout << response.body << "\n";
    }
    std::cout << "\n";
}

}  // namespace

asio::awaitable<void> run_examples(RequestHandler& handler) {
    // 1. Single query, input in the query string
    {
        const auto request = HttpRequest::from_target("GET", "/greet?input=%7B%22name%22%3A%22ada%22%7D");
        print_response("GET greet", co_await handler.handle(request, "greet"));
    }

    // 2. Batch of three; the middle call fails, the others still answer
    {
        const auto request = HttpRequest::from_target(
            "GET",
            "/greet,missing,whoami?batch=1&input=%7B%220%22%3A%7B%22name%22%3A%22bob%22%7D%7D");
        print_response("GET greet,missing,whoami (batch)", co_await handler.handle(request, "greet,missing,whoami"));
    }

    // 3. Batch mutation with a JSON body
    {
        auto request = HttpRequest::from_target("POST", "/store?batch=1");
        request.body = std::string{R"({"0":{"name":"carol"}})"};
        print_response("POST store (batch)", co_await handler.handle(request, "store"));
    }

    // 4. Malformed input is rejected before any procedure runs
    {
        const auto request = HttpRequest::from_target("GET", "/greet?input=not-json");
        print_response("GET greet (malformed input)", co_await handler.handle(request, "greet"));
    }

    // 5. Probe
    {
        const auto request = HttpRequest::from_target("HEAD", "/greet");
        print_response("HEAD greet", co_await handler.handle(request, "greet"));
    }
}

int main() {
    set_logger(make_spdlog_console_logger(LogLevel::Warn));

    auto router = std::make_shared<ProcedureTable>();
    router->query("greet", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        std::string name = "world";
        if (call.input.has_value() && call.input->contains("name")) {
            name = call.input->at("name").get<std::string>();
        }
        co_return Json{{"greeting", "Hello, " + name + "!"}};
    });
    router->mutation("store", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        co_return Json{{"stored", call.input.value_or(Json())}};
    });
    router->query("whoami", [](const ProcedureCall& call) -> asio::awaitable<ProcedureResult> {
        if (call.ctx.contains("user")) {
            co_return call.ctx.at("user");
        }
        co_return Json();
    });

    HandlerConfig config;
    config.with_context_factory([](const HttpRequest& request) -> asio::awaitable<ContextResult> {
              const auto user = get_header(request.headers, "X-User");
              co_return Json{{"user", user.value_or("anonymous")}};
          })
          .with_error_observer([](const ErrorDetails& details) {
              std::cout << "[on_error] " << to_string(details.error.code) << " at "
                        << details.path.value_or("<request>") << ": " << details.error.message << "\n";
          })
          .with_response_meta([](const ResponseMetaParams& params) {
              ResponseMeta meta;
              if (params.errors.empty() && params.type == ProcedureType::Query) {
                  meta.headers["Cache-Control"] = "max-age=60";
              }
              return meta;
          });

    RequestHandler handler(router, std::move(config));

    asio::io_context io;
    asio::co_spawn(io, run_examples(handler), asio::detached);
    io.run();

    return 0;
}
