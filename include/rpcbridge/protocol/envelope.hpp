#pragma once

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/input.hpp"
#include "rpcbridge/handler/transformer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rpcbridge {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Call Outcome
// ─────────────────────────────────────────────────────────────────────────────
// What happened to one call of a request. Exactly one of data/error is set
// once the call has run.

struct CallOutcome {
    std::string path;
    Input input;
    std::optional<Json> data;
    std::optional<RpcError> error;

    [[nodiscard]] bool failed() const noexcept {
        return error.has_value();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Response Envelope
// ─────────────────────────────────────────────────────────────────────────────

struct EnvelopeError {
    std::string message;
};

// Wire form of one outcome:
//   {"id": null, "result": {"type": "data", "data": <data>}}
//   {"id": null, "error": <shaped error>}

class ResponseEnvelope {
public:
    [[nodiscard]] static ResponseEnvelope result(Json data);
    [[nodiscard]] static ResponseEnvelope error(Json shaped_error);

    [[nodiscard]] bool is_error() const noexcept;

    /// Result data, or the shaped error
    [[nodiscard]] const Json& payload() const noexcept;

    /// Same envelope with its payload passed through the output serializer
    [[nodiscard]] ResponseEnvelope serialized(const ValueTransformer& transformer) const;

    [[nodiscard]] Json to_json() const;

    /// Read back an envelope produced by to_json; rpcbridge-cli uses it to
    /// summarize each call of a response
    [[nodiscard]] static tl::expected<ResponseEnvelope, EnvelopeError> from_json(const Json& payload);

private:
    enum class Kind { Result, Error };

    ResponseEnvelope(Kind kind, Json payload);

    Kind kind_;
    Json payload_;
};

/// Single envelope as an object, batches as an array in path order
[[nodiscard]] Json envelopes_to_json(std::span<const ResponseEnvelope> envelopes, bool as_batch);

}  // namespace rpcbridge
