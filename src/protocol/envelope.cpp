#include "rpcbridge/protocol/envelope.hpp"

namespace rpcbridge {

namespace {
constexpr std::string_view kResultTypeData{"data"};
}  // namespace

ResponseEnvelope::ResponseEnvelope(Kind kind, Json payload)
    : kind_(kind),
      payload_(std::move(payload)) {}

ResponseEnvelope ResponseEnvelope::result(Json data) {
    return ResponseEnvelope(Kind::Result, std::move(data));
}

ResponseEnvelope ResponseEnvelope::error(Json shaped_error) {
    return ResponseEnvelope(Kind::Error, std::move(shaped_error));
}

bool ResponseEnvelope::is_error() const noexcept {
    return kind_ == Kind::Error;
}

const Json& ResponseEnvelope::payload() const noexcept {
    return payload_;
}

ResponseEnvelope ResponseEnvelope::serialized(const ValueTransformer& transformer) const {
    return ResponseEnvelope(kind_, transformer.serialize(payload_));
}

Json ResponseEnvelope::to_json() const {
    Json envelope = Json::object();
    envelope["id"] = nullptr;
    if (kind_ == Kind::Error) {
        envelope["error"] = payload_;
    } else {
        envelope["result"] = Json{
            {"type", kResultTypeData},
            {"data", payload_}
        };
    }
    return envelope;
}

tl::expected<ResponseEnvelope, EnvelopeError> ResponseEnvelope::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(EnvelopeError{"envelope must be a JSON object"});
    }

    if (payload.contains("error")) {
        return ResponseEnvelope::error(payload.at("error"));
    }

    const bool has_result = payload.contains("result") && payload.at("result").is_object();
    if (has_result == false) {
        return tl::unexpected(EnvelopeError{"envelope carries neither result nor error"});
    }

    const Json& result_node = payload.at("result");
    const bool is_data_result = result_node.contains("type") && (result_node.at("type") == kResultTypeData);
    if (is_data_result == false) {
        return tl::unexpected(EnvelopeError{"result type must be \"data\""});
    }

    if (result_node.contains("data") == false) {
        return ResponseEnvelope::result(Json());
    }
    return ResponseEnvelope::result(result_node.at("data"));
}

Json envelopes_to_json(std::span<const ResponseEnvelope> envelopes, bool as_batch) {
    if (as_batch) {
        Json batch = Json::array();
        for (const auto& envelope : envelopes) {
            batch.push_back(envelope.to_json());
        }
        return batch;
    }
    if (envelopes.empty()) {
        return Json();
    }
    return envelopes.front().to_json();
}

}  // namespace rpcbridge
