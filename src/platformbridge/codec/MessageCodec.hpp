#pragma once
#include "codec/MethodCall.hpp"
#include "codec/Value.hpp"
#include "core/Error.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace PB {

using Bytes     = std::vector<std::uint8_t>;
using BytesView = std::span<std::uint8_t const>;

// Encodes bare values for basic message channels.
class MessageCodec {
public:
    virtual ~MessageCodec() = default;

    [[nodiscard]] virtual auto encodeMessage(Value const& message) const -> Expected<Bytes> = 0;
    [[nodiscard]] virtual auto decodeMessage(BytesView bytes) const -> Expected<Value>       = 0;
};

// Encodes method calls and their reply envelopes for method and event channels.
// An empty reply buffer always means "not implemented".
class MethodCodec {
public:
    virtual ~MethodCodec() = default;

    [[nodiscard]] virtual auto encodeMethodCall(MethodCall const& call) const -> Expected<Bytes> = 0;
    [[nodiscard]] virtual auto decodeMethodCall(BytesView bytes) const -> Expected<MethodCall>   = 0;

    [[nodiscard]] virtual auto encodeSuccessEnvelope(Value const& result) const -> Expected<Bytes> = 0;
    [[nodiscard]] virtual auto encodeErrorEnvelope(std::string const&                code,
                                                   std::optional<std::string> const& message,
                                                   Value const&                      details) const -> Expected<Bytes> = 0;
    [[nodiscard]] virtual auto decodeEnvelope(BytesView bytes) const -> Expected<MethodResult> = 0;

    [[nodiscard]] auto encodeResult(MethodResult const& result) const -> Expected<Bytes>;
};

inline auto MethodCodec::encodeResult(MethodResult const& result) const -> Expected<Bytes> {
    if (auto const* success = std::get_if<MethodSuccess>(&result)) {
        return this->encodeSuccessEnvelope(success->value);
    }
    if (auto const* error = std::get_if<MethodError>(&result)) {
        return this->encodeErrorEnvelope(error->code, error->message, error->details);
    }
    return Bytes{};
}

} // namespace PB
