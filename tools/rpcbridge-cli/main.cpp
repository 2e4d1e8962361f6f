// ─────────────────────────────────────────────────────────────────────────────
// rpcbridge-cli - Request Replay Tool
// ─────────────────────────────────────────────────────────────────────────────
// Replays one HTTP request through the rpcbridge adapter against a built-in
// demo router and prints the response the server would send.
//
// Usage:
//   rpcbridge-cli --target "/trpc/health"
//   rpcbridge-cli --target '/trpc/echo?input=%7B%22a%22%3A1%7D'
//   rpcbridge-cli -X POST --target "/trpc/add" --body '{"a":1,"b":2}'
//   rpcbridge-cli -X POST --target "/trpc/add,add?batch=1" \
//                 --body '{"0":{"a":1,"b":2},"1":{"a":3,"b":4}}'
//   rpcbridge-cli --target "/trpc/health,fail?batch=1" --no-batching
//
// Demo procedures are listed in demo_router.hpp.

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "rpcbridge/handler/request_handler.hpp"
#include "rpcbridge/http/adapter.hpp"
#include "rpcbridge/log/logger.hpp"
#include "rpcbridge/log/spdlog_logger.hpp"
#include "rpcbridge/protocol/envelope.hpp"

#include "demo_router.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace rpcbridge;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Call Summary
// ═══════════════════════════════════════════════════════════════════════════

// One line per envelope: "[i] ok" or "[i] CODE (status) path: message"
void print_call_summary(const Json& body) {
    const Json envelopes = body.is_array() ? body : Json::array({body});

    std::cout << color::c(color::bold) << "Calls:" << color::c(color::reset) << "\n";
    for (std::size_t i = 0; i < envelopes.size(); ++i) {
        std::cout << "  [" << i << "] ";

        const auto envelope = ResponseEnvelope::from_json(envelopes[i]);
        if (envelope.has_value() == false) {
            std::cout << color::c(color::red) << "unreadable envelope: "
                      << envelope.error().message << color::c(color::reset) << "\n";
            continue;
        }
        if (envelope->is_error() == false) {
            std::cout << color::c(color::green) << "ok" << color::c(color::reset) << "\n";
            continue;
        }

        const Json& error = envelope->payload();
        const Json data = error.contains("data") ? error.at("data") : Json::object();
        const std::string name = (data.contains("code") && data.at("code").is_string())
            ? data.at("code").get<std::string>()
            : std::string("UNKNOWN");

        std::cout << color::c(color::red) << name;
        if (const auto code = error_code_from_string(name)) {
            std::cout << " (" << http_status(*code) << ")";
        }
        std::cout << color::c(color::reset);
        if (data.contains("path") && data.at("path").is_string()) {
            std::cout << " " << data.at("path").get<std::string>();
        }
        if (error.contains("message") && error.at("message").is_string()) {
            std::cout << ": " << error.at("message").get<std::string>();
        }
        std::cout << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Response Capture
// ═══════════════════════════════════════════════════════════════════════════

class CapturingWriter final : public IResponseWriter {
public:
    std::optional<int> status() const override {
        return status_;
    }

    void set_status(int status) override {
        status_ = status;
    }

    void set_header(const std::string& name, const std::string& value) override {
        headers_.emplace_back(name, value);
    }

    void end(std::string body) override {
        body_ = std::move(body);
        ended_ = true;
    }

    void print(bool json_only) const {
        if (json_only) {
            std::cout << body_ << "\n";
            return;
        }

        const int code = status_.value_or(200);
        const char* status_color = (code < 400) ? color::green : (code < 500 ? color::yellow : color::red);
        std::cout << color::c(color::bold) << color::c(status_color)
                  << "HTTP " << code << color::c(color::reset) << "\n";
        for (const auto& [name, value] : headers_) {
            std::cout << color::c(color::cyan) << name << color::c(color::reset) << ": " << value << "\n";
        }
        std::cout << "\n";

        const Json parsed = Json::parse(body_, nullptr, false);
        if (parsed.is_discarded()) {
            std::cout << body_ << "\n";
            return;
        }
        std::cout << parsed.dump(2) << "\n\n";
        print_call_summary(parsed);
    }

    [[nodiscard]] bool ended() const noexcept {
        return ended_;
    }

    [[nodiscard]] bool succeeded() const noexcept {
        return status_.value_or(200) < 400;
    }

private:
    std::optional<int> status_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
    bool ended_ = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    auto start = value.find_first_not_of(" \t");
    value = (start != std::string::npos) ? value.substr(start) : "";
    return {name, value};
}

void configure_logging(const std::string& level_name, const std::optional<std::string>& log_file) {
    const LogLevel level = log_level_from_string(level_name);
    if (level == LogLevel::Off) {
        set_logger(nullptr);
        return;
    }
    if (log_file.has_value()) {
        set_logger(make_spdlog_console_file_logger(*log_file, level));
    } else {
        set_logger(make_spdlog_console_logger(level));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("rpcbridge-cli", "Replay an HTTP request through the rpcbridge adapter");

    options.add_options()
        // Request
        ("X,method", "HTTP method", cxxopts::value<std::string>()->default_value("GET"))
        ("t,target", "Request target, e.g. /trpc/a,b?batch=1", cxxopts::value<std::string>()->default_value("/trpc/health"))
        ("d,body", "Raw request body", cxxopts::value<std::string>())
        ("H,header", "HTTP header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))

        // Handler configuration
        ("endpoint", "Endpoint prefix the handler is mounted at", cxxopts::value<std::string>()->default_value("/trpc"))
        ("no-batching", "Reject ?batch=1 requests")
        ("max-body-size", "Largest accepted body in bytes (0 = unlimited)", cxxopts::value<std::size_t>()->default_value("0"))

        // Output
        ("list", "List the demo procedures")
        ("log-level", "trace, debug, info, warn, error, fatal or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("j,json", "Print only the response body")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    rpcbridge-cli --target /trpc/health\n";
            std::cout << "    rpcbridge-cli -X POST --target /trpc/add --body '{\"a\":1,\"b\":2}'\n";
            std::cout << "    rpcbridge-cli -X POST --target '/trpc/add,fail?batch=1' --body '{\"0\":{\"a\":1,\"b\":2}}'\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        std::optional<std::string> log_file;
        if (result.count("log-file")) {
            log_file = result["log-file"].as<std::string>();
        }
        configure_logging(result["log-level"].as<std::string>(), log_file);

        auto router = cli::make_demo_router();

        if (result.count("list")) {
            for (const auto& path : router->paths()) {
                std::cout << path << "\n";
            }
            return 0;
        }

        HandlerConfig config;
        config.with_batching(result.count("no-batching") == 0)
              .with_max_body_size(result["max-body-size"].as<std::size_t>());

        RequestHandler handler(router, std::move(config));

        RawHttpRequest raw;
        raw.method = result["method"].as<std::string>();
        raw.target = result["target"].as<std::string>();
        if (result.count("body")) {
            raw.body = result["body"].as<std::string>();
        }
        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (!header.empty()) {
                auto [name, value] = parse_header(header);
                raw.headers[name] = value;
            }
        }

        get_logger().info_fmt("Replaying {} {} ({} byte body)", raw.method, raw.target,
            std::holds_alternative<std::string>(raw.body) ? std::get<std::string>(raw.body).size() : 0);

        AdapterOptions adapter_options;
        adapter_options.with_endpoint_prefix(result["endpoint"].as<std::string>());

        if (!json_output) {
            std::cout << color::c(color::dim) << raw.method << " " << raw.target
                      << color::c(color::reset) << "\n";
        }

        CapturingWriter writer;
        std::exception_ptr failure;

        asio::io_context io;
        asio::co_spawn(io,
            serve_http_request(handler, std::move(raw), writer, adapter_options),
            [&failure](std::exception_ptr e) { failure = e; });
        io.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (writer.ended() == false) {
            print_error("Handler finished without sending a response");
            return 1;
        }

        writer.print(json_output);
        return writer.succeeded() ? 0 : 1;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
}
