#pragma once

#include <nlohmann/json.hpp>

#include <functional>

namespace rpcbridge {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Value Transformer
// ─────────────────────────────────────────────────────────────────────────────
// Symmetric pair applied at the wire boundary: deserialize_input runs on every
// present call input before dispatch, serialize_output on every envelope
// payload (result data or shaped error) before the body is written. Both must
// be pure. Either may throw; the handler normalizes the exception.

using InputDeserializer = std::function<Json(const Json&)>;
using OutputSerializer = std::function<Json(const Json&)>;

struct ValueTransformer {
    InputDeserializer deserialize_input;
    OutputSerializer serialize_output;

    [[nodiscard]] static ValueTransformer identity() {
        return ValueTransformer{
            [](const Json& value) { return value; },
            [](const Json& value) { return value; }
        };
    }

    /// Unset members behave as identity
    [[nodiscard]] Json deserialize(const Json& value) const {
        return deserialize_input ? deserialize_input(value) : value;
    }

    [[nodiscard]] Json serialize(const Json& value) const {
        return serialize_output ? serialize_output(value) : value;
    }
};

}  // namespace rpcbridge
