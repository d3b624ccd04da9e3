#pragma once
#include "codec/ByteStreams.hpp"
#include "codec/MessageCodec.hpp"

#include <cstdint>

namespace PB {

// Type tags of the standard message codec. The numbering is the wire format
// shared with the remote runtime and must not change.
enum class StandardField : std::uint8_t {
    Null        = 0,
    True        = 1,
    False       = 2,
    Int32       = 3,
    Int64       = 4,
    BigInt      = 5,
    Float64     = 6,
    String      = 7,
    UInt8List   = 8,
    Int32List   = 9,
    Int64List   = 10,
    Float64List = 11,
    List        = 12,
    Map         = 13,
    Float32List = 14,
};

class StandardMessageCodec final : public MessageCodec {
public:
    static auto instance() -> StandardMessageCodec const&;

    [[nodiscard]] auto encodeMessage(Value const& message) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeMessage(BytesView bytes) const -> Expected<Value> override;

    // Infallible encoder; the whole buffer must be one value when decoding.
    [[nodiscard]] auto encode(Value const& value) const -> Bytes;
    [[nodiscard]] auto decode(BytesView bytes) const -> Expected<Value>;

    auto writeValue(ByteWriter& writer, Value const& value) const -> void;
    [[nodiscard]] auto readValue(ByteReader& reader) const -> Expected<Value>;

    static auto writeSize(ByteWriter& writer, std::size_t size) -> void;
    [[nodiscard]] static auto readSize(ByteReader& reader) -> Expected<std::size_t>;

private:
    [[nodiscard]] auto readValueOfType(ByteReader& reader, std::uint8_t tag, std::size_t depth) const
            -> Expected<Value>;
    [[nodiscard]] auto readValueAtDepth(ByteReader& reader, std::size_t depth) const -> Expected<Value>;
};

class StandardMethodCodec final : public MethodCodec {
public:
    static auto instance() -> StandardMethodCodec const&;

    [[nodiscard]] auto encodeMethodCall(MethodCall const& call) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeMethodCall(BytesView bytes) const -> Expected<MethodCall> override;

    [[nodiscard]] auto encodeSuccessEnvelope(Value const& result) const -> Expected<Bytes> override;
    [[nodiscard]] auto encodeErrorEnvelope(std::string const&                code,
                                           std::optional<std::string> const& message,
                                           Value const&                      details) const -> Expected<Bytes> override;
    [[nodiscard]] auto decodeEnvelope(BytesView bytes) const -> Expected<MethodResult> override;

private:
    StandardMessageCodec const& values_ = StandardMessageCodec::instance();
};

} // namespace PB
