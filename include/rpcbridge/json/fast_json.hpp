#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parsing
// ─────────────────────────────────────────────────────────────────────────────
// Request payloads (query-string input, POST bodies) are validated and parsed
// with simdjson's DOM parser, then converted to nlohmann::json, which the rest
// of the library uses for manipulation and serialization.
//
// The DOM parser validates the whole document, so scalar documents ("42",
// "null") are accepted and trailing garbage ("null x") is rejected.
//
// USAGE:
//   auto parsed = rpcbridge::fast_parse(body);
//   if (parsed.has_value() == false) {
//       // parsed.error().message holds simdjson's diagnostic
//   }
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace rpcbridge {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    /// Nesting limit applied while converting to nlohmann::json
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Not thread-safe; the parser reuses its internal buffers between calls.
    [[nodiscard]] JsonParseResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::dom::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonParseResult convert(simdjson::dom::element element, std::size_t depth) const;
};

/// Parse with a thread-local FastJsonParser using the default configuration
[[nodiscard]] JsonParseResult fast_parse(std::string_view text);

}  // namespace rpcbridge
