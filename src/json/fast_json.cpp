#include "rpcbridge/json/fast_json.hpp"

#include <format>

namespace rpcbridge {

namespace {

JsonParseResult simdjson_failure(simdjson::error_code error) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(error))));
}

}  // namespace

JsonParseResult FastJsonParser::parse(std::string_view text) {
    const simdjson::padded_string padded(text);

    simdjson::dom::element root;
    const auto error = parser_.parse(padded).get(root);
    if (error != simdjson::SUCCESS) {
        return simdjson_failure(error);
    }
    return convert(root, 0);
}

JsonParseResult FastJsonParser::convert(simdjson::dom::element element, std::size_t depth) const {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            std::format("Maximum nesting depth exceeded ({})", config_.max_depth)));
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object;
            const auto error = element.get_object().get(object);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }

            nlohmann::json result = nlohmann::json::object();
            for (const auto field : object) {
                auto converted = convert(field.value, depth + 1);
                if (converted.has_value() == false) {
                    return converted;
                }
                result[std::string(field.key)] = std::move(*converted);
            }
            return result;
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array array;
            const auto error = element.get_array().get(array);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }

            nlohmann::json result = nlohmann::json::array();
            for (const auto child : array) {
                auto converted = convert(child, depth + 1);
                if (converted.has_value() == false) {
                    return converted;
                }
                result.push_back(std::move(*converted));
            }
            return result;
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view value;
            const auto error = element.get_string().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return nlohmann::json(std::string(value));
        }

        case simdjson::dom::element_type::INT64: {
            std::int64_t value = 0;
            const auto error = element.get_int64().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return nlohmann::json(value);
        }

        case simdjson::dom::element_type::UINT64: {
            std::uint64_t value = 0;
            const auto error = element.get_uint64().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return nlohmann::json(value);
        }

        case simdjson::dom::element_type::DOUBLE: {
            double value = 0.0;
            const auto error = element.get_double().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return nlohmann::json(value);
        }

        case simdjson::dom::element_type::BOOL: {
            bool value = false;
            const auto error = element.get_bool().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return nlohmann::json(value);
        }

        case simdjson::dom::element_type::NULL_VALUE:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

JsonParseResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

}  // namespace rpcbridge
