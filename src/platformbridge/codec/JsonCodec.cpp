#include "codec/JsonCodec.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

namespace PB {
namespace {

[[nodiscard]] auto malformed(std::string message) -> Error {
    return Error{Error::Code::Malformed, std::move(message)};
}

[[nodiscard]] auto serialize(Json const& json) -> Bytes {
    // Invalid UTF-8 in strings is replaced rather than thrown on.
    auto text = json.dump(-1, ' ', false, Json::error_handler_t::replace);
    return Bytes(text.begin(), text.end());
}

[[nodiscard]] auto parse(BytesView bytes) -> Expected<Json> {
    auto json = Json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(malformed("invalid JSON payload"));
    }
    return json;
}

template <typename T>
[[nodiscard]] auto list_to_json(std::vector<T> const& items) -> Json {
    auto array = Json::array();
    for (auto const& item : items) {
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(item)) {
                array.push_back(nullptr);
                continue;
            }
        }
        array.push_back(item);
    }
    return array;
}

} // namespace

auto valueToJson(Value const& value) -> Expected<Json> {
    return std::visit(
            [](auto const& v) -> Expected<Json> {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return Json(nullptr);
                } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int32_t>
                                     || std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::string>) {
                    return Json(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    if (!std::isfinite(v)) {
                        return Json(nullptr);
                    }
                    return Json(v);
                } else if constexpr (std::is_same_v<T, BigInt>) {
                    return Json(v.digits);
                } else if constexpr (std::is_same_v<T, ValueList>) {
                    auto array = Json::array();
                    for (auto const& item : v) {
                        auto converted = valueToJson(item);
                        if (!converted) {
                            return converted;
                        }
                        array.push_back(std::move(*converted));
                    }
                    return array;
                } else if constexpr (std::is_same_v<T, ValueMap>) {
                    auto object = Json::object();
                    for (auto const& [key, item] : v) {
                        auto const* name = key.template get_if<std::string>();
                        if (name == nullptr) {
                            return std::unexpected(Error{Error::Code::UnsupportedType,
                                                         "JSON object keys must be strings, got "
                                                                 + std::string(valueTypeToString(key.type()))});
                        }
                        auto converted = valueToJson(item);
                        if (!converted) {
                            return converted;
                        }
                        object[*name] = std::move(*converted);
                    }
                    return object;
                } else {
                    return list_to_json(v);
                }
            },
            value.storage);
}

auto jsonToValue(Json const& json) -> Value {
    switch (json.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return Value{};
    case Json::value_t::boolean:
        return Value{json.get<bool>()};
    case Json::value_t::number_unsigned: {
        auto raw = json.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value{BigInt{std::to_string(raw)}};
        }
        auto wide = static_cast<std::int64_t>(raw);
        if (wide <= std::numeric_limits<std::int32_t>::max()) {
            return Value{static_cast<std::int32_t>(wide)};
        }
        return Value{wide};
    }
    case Json::value_t::number_integer: {
        auto wide = json.get<std::int64_t>();
        if (wide >= std::numeric_limits<std::int32_t>::min() && wide <= std::numeric_limits<std::int32_t>::max()) {
            return Value{static_cast<std::int32_t>(wide)};
        }
        return Value{wide};
    }
    case Json::value_t::number_float:
        return Value{json.get<double>()};
    case Json::value_t::string:
        return Value{json.get<std::string>()};
    case Json::value_t::binary:
        return Value{std::vector<std::uint8_t>(json.get_binary().begin(), json.get_binary().end())};
    case Json::value_t::array: {
        ValueList items;
        items.reserve(json.size());
        for (auto const& item : json) {
            items.push_back(jsonToValue(item));
        }
        return Value{std::move(items)};
    }
    case Json::value_t::object: {
        ValueMap entries;
        entries.reserve(json.size());
        for (auto it = json.begin(); it != json.end(); ++it) {
            entries.emplace_back(Value{it.key()}, jsonToValue(it.value()));
        }
        return Value{std::move(entries)};
    }
    }
    return Value{};
}

auto JsonMessageCodec::instance() -> JsonMessageCodec const& {
    static JsonMessageCodec codec;
    return codec;
}

auto JsonMessageCodec::encodeMessage(Value const& message) const -> Expected<Bytes> {
    if (message.isNull()) {
        return Bytes{};
    }
    auto json = valueToJson(message);
    if (!json) {
        return std::unexpected(json.error());
    }
    return serialize(*json);
}

auto JsonMessageCodec::decodeMessage(BytesView bytes) const -> Expected<Value> {
    if (bytes.empty()) {
        return Value{};
    }
    auto json = parse(bytes);
    if (!json) {
        return std::unexpected(json.error());
    }
    return jsonToValue(*json);
}

auto JsonMethodCodec::instance() -> JsonMethodCodec const& {
    static JsonMethodCodec codec;
    return codec;
}

auto JsonMethodCodec::encodeMethodCall(MethodCall const& call) const -> Expected<Bytes> {
    auto arguments = valueToJson(call.arguments);
    if (!arguments) {
        return std::unexpected(arguments.error());
    }
    Json json;
    json["method"] = call.method;
    json["args"]   = std::move(*arguments);
    return serialize(json);
}

auto JsonMethodCodec::decodeMethodCall(BytesView bytes) const -> Expected<MethodCall> {
    auto json = parse(bytes);
    if (!json) {
        return std::unexpected(json.error());
    }
    if (!json->is_object()) {
        return std::unexpected(malformed("method call must be a JSON object"));
    }
    auto method = json->find("method");
    if (method == json->end() || !method->is_string()) {
        return std::unexpected(malformed("method: must be a string"));
    }
    MethodCall call{method->get<std::string>(), Value{}};
    if (auto args = json->find("args"); args != json->end()) {
        call.arguments = jsonToValue(*args);
    }
    return call;
}

auto JsonMethodCodec::encodeSuccessEnvelope(Value const& result) const -> Expected<Bytes> {
    auto json = valueToJson(result);
    if (!json) {
        return std::unexpected(json.error());
    }
    return serialize(Json::array({std::move(*json)}));
}

auto JsonMethodCodec::encodeErrorEnvelope(std::string const&                code,
                                          std::optional<std::string> const& message,
                                          Value const&                      details) const -> Expected<Bytes> {
    auto json = valueToJson(details);
    if (!json) {
        return std::unexpected(json.error());
    }
    auto envelope = Json::array();
    envelope.push_back(code);
    envelope.push_back(message ? Json(*message) : Json(nullptr));
    envelope.push_back(std::move(*json));
    return serialize(envelope);
}

auto JsonMethodCodec::decodeEnvelope(BytesView bytes) const -> Expected<MethodResult> {
    if (bytes.empty()) {
        return MethodResult{MethodNotImplemented{}};
    }
    auto json = parse(bytes);
    if (!json) {
        return std::unexpected(json.error());
    }
    if (!json->is_array()) {
        return std::unexpected(malformed("reply envelope must be a JSON array"));
    }
    if (json->size() == 1) {
        return MethodResult{MethodSuccess{jsonToValue((*json)[0])}};
    }
    if (json->size() != 3 && json->size() != 4) {
        return std::unexpected(malformed("reply envelope has " + std::to_string(json->size()) + " elements"));
    }
    auto const& code    = (*json)[0];
    auto const& message = (*json)[1];
    if (!code.is_string()) {
        return std::unexpected(malformed("error code must be a string"));
    }
    if (!message.is_string() && !message.is_null()) {
        return std::unexpected(malformed("error message must be a string or null"));
    }
    MethodError error{code.get<std::string>(), std::nullopt, jsonToValue((*json)[2])};
    if (message.is_string()) {
        error.message = message.get<std::string>();
    }
    return MethodResult{std::move(error)};
}

} // namespace PB
