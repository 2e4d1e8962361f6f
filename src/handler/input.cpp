#include "rpcbridge/handler/input.hpp"
#include "rpcbridge/json/fast_json.hpp"
#include "rpcbridge/log/logger.hpp"

#include <charconv>
#include <format>

namespace rpcbridge {

namespace {

constexpr std::string_view kInputParam{"input"};

RpcResult<Input> parse_payload(std::string_view text) {
    auto parsed = fast_parse(text);
    if (parsed.has_value() == false) {
        get_logger().debug_fmt("Rejecting malformed JSON input: {}", parsed.error().message);
        return tl::unexpected(RpcError::parse_error(parsed.error().message));
    }
    return Input{std::move(*parsed)};
}

struct BodyInputVisitor {
    RpcResult<Input> operator()(std::monostate) const {
        return Input{};
    }

    RpcResult<Input> operator()(const std::string& text) const {
        if (text.empty()) {
            return Input{};
        }
        return parse_payload(text);
    }

    RpcResult<Input> operator()(const Json& value) const {
        return Input{value};
    }
};

}  // namespace

RpcResult<Input> extract_raw_input(const HttpRequest& request) {
    if (request.method == "GET") {
        const auto raw = request.query.get(kInputParam);
        if (raw.has_value() == false) {
            return Input{};
        }
        return parse_payload(*raw);
    }
    return std::visit(BodyInputVisitor{}, request.body);
}

std::vector<std::string> split_paths(std::string_view route, bool batch) {
    std::vector<std::string> paths;
    if (batch == false) {
        paths.emplace_back(route);
        return paths;
    }

    std::size_t start = 0;
    while (true) {
        const auto comma = route.find(',', start);
        if (comma == std::string_view::npos) {
            paths.emplace_back(route.substr(start));
            break;
        }
        paths.emplace_back(route.substr(start, comma - start));
        start = comma + 1;
    }
    return paths;
}

std::optional<std::size_t> parse_batch_index(std::string_view key) noexcept {
    if (key.empty()) {
        return std::nullopt;
    }
    const bool leading_zero = (key.size() > 1) && (key.front() == '0');
    if (leading_zero) {
        return std::nullopt;
    }

    std::size_t index = 0;
    const auto* end = key.data() + key.size();
    const auto [ptr, ec] = std::from_chars(key.data(), end, index);
    const bool consumed_all = (ec == std::errc{}) && (ptr == end);
    if (consumed_all == false) {
        return std::nullopt;
    }
    return index;
}

RpcResult<std::vector<Input>> decode_inputs(
    const Input& raw,
    std::size_t call_count,
    bool batch,
    const ValueTransformer& transformer
) {
    std::vector<Input> decoded(call_count);
    if (decoded.empty()) {
        return decoded;
    }

    try {
        if (batch == false) {
            if (raw.has_value()) {
                decoded.front() = transformer.deserialize(*raw);
            }
            return decoded;
        }

        const bool is_object = raw.has_value() && raw->is_object();
        if (is_object == false) {
            return tl::unexpected(RpcError::bad_request(
                "\"input\" needs to be an object when doing a batch call"));
        }

        for (const auto& [key, value] : raw->items()) {
            const auto index = parse_batch_index(key);
            if (index.has_value() == false) {
                return tl::unexpected(RpcError::bad_request(
                    std::format("Batch input key \"{}\" is not a call index", key)));
            }

            Json deserialized = transformer.deserialize(value);
            if (*index < call_count) {
                decoded[*index] = std::move(deserialized);
            } else {
                get_logger().debug_fmt("Ignoring batch input {} beyond {} calls", *index, call_count);
            }
        }
    } catch (...) {
        return tl::unexpected(error_from_exception(std::current_exception()));
    }

    return decoded;
}

}  // namespace rpcbridge
