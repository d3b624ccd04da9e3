#pragma once
#include "codec/MessageCodec.hpp"

#include "nlohmann/json.hpp"

namespace PB {

using Json = nlohmann::json;

// Value <-> JSON mapping shared by the JSON codecs. Maps need String keys;
// typed lists become arrays. Integers come back as Int32 when they fit.
[[nodiscard]] auto valueToJson(Value const& value) -> Expected<Json>;
[[nodiscard]] auto jsonToValue(Json const& json) -> Value;

class JsonMessageCodec final : public MessageCodec {
public:
    static auto instance() -> JsonMessageCodec const&;

    [[nodiscard]] auto encodeMessage(Value const& message) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeMessage(BytesView bytes) const -> Expected<Value> override;
};

// Calls are {"method": name, "args": arguments}; success replies are [value];
// error replies are [code, message, details].
class JsonMethodCodec final : public MethodCodec {
public:
    static auto instance() -> JsonMethodCodec const&;

    [[nodiscard]] auto encodeMethodCall(MethodCall const& call) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeMethodCall(BytesView bytes) const -> Expected<MethodCall> override;

    [[nodiscard]] auto encodeSuccessEnvelope(Value const& result) const -> Expected<Bytes> override;
    [[nodiscard]] auto encodeErrorEnvelope(std::string const&                code,
                                           std::optional<std::string> const& message,
                                           Value const&                      details) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeEnvelope(BytesView bytes) const -> Expected<MethodResult> override;
};

} // namespace PB
