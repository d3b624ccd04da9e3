#pragma once
#include "codec/MessageCodec.hpp"

namespace PB {

// Raw UTF-8 text with no framing. Null encodes to an empty buffer.
class StringCodec final : public MessageCodec {
public:
    static auto instance() -> StringCodec const&;

    [[nodiscard]] auto encodeMessage(Value const& message) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeMessage(BytesView bytes) const -> Expected<Value> override;
};

} // namespace PB
