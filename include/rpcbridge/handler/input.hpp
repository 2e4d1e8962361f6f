#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Procedure Input
// ═══════════════════════════════════════════════════════════════════════════
// Extraction of the still-encoded input from a request, and its per-call
// decoding once the call paths are known.
//
//   single call:  GET /greet?input={"name":"ada"}
//                 POST /greet            body {"name":"ada"}
//   batch call:   GET /a,b?batch=1&input={"0":{...},"1":{...}}
//                 POST /a,b?batch=1      body {"0":{...},"1":{...}}

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/transformer.hpp"
#include "rpcbridge/http/http_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rpcbridge {

using Json = nlohmann::json;

/// std::nullopt = no input was sent; Json(nullptr) = input was JSON null
using Input = std::optional<Json>;

/// Raw input of the request: the `input` query parameter for GET, the body
/// otherwise. Malformed JSON yields PARSE_ERROR with the parser message as cause.
[[nodiscard]] RpcResult<Input> extract_raw_input(const HttpRequest& request);

/// One path for single calls; the comma-separated list for batch calls
[[nodiscard]] std::vector<std::string> split_paths(std::string_view route, bool batch);

/// Batch input keys must be canonical decimal indices: "0", "1", "12".
/// Signs, whitespace, leading zeros and non-digits are rejected.
[[nodiscard]] std::optional<std::size_t> parse_batch_index(std::string_view key) noexcept;

/// Decoded input for each of call_count calls, by position. Absent input stays
/// absent and is never handed to the transformer. Batch raw input must be a JSON
/// object keyed by index; anything else is BAD_REQUEST. Transformer failures are
/// normalized with error_from_exception.
[[nodiscard]] RpcResult<std::vector<Input>> decode_inputs(
    const Input& raw,
    std::size_t call_count,
    bool batch,
    const ValueTransformer& transformer
);

}  // namespace rpcbridge
