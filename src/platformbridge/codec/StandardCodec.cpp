#include "codec/StandardCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <limits>
#include <string>
#include <type_traits>

namespace PB {
namespace {

// Nesting beyond this is rejected instead of recursing further.
constexpr std::size_t kMaxNestingDepth = 256;

constexpr std::uint8_t kSize16Marker = 254;
constexpr std::uint8_t kSize32Marker = 255;

constexpr std::uint8_t kEnvelopeSuccess = 0;
constexpr std::uint8_t kEnvelopeError   = 1;

[[nodiscard]] auto malformed(std::string message) -> Error {
    return Error{Error::Code::Malformed, std::move(message)};
}

[[nodiscard]] auto tag(StandardField field) -> std::uint8_t {
    return static_cast<std::uint8_t>(field);
}

[[nodiscard]] auto to_string(std::span<std::uint8_t const> bytes) -> std::string {
    return std::string(reinterpret_cast<char const*>(bytes.data()), bytes.size());
}

[[nodiscard]] auto as_bytes(std::string const& text) -> std::span<std::uint8_t const> {
    return {reinterpret_cast<std::uint8_t const*>(text.data()), text.size()};
}

// Rejects element counts that cannot fit in what is left of the buffer before
// anything is allocated for them.
[[nodiscard]] auto ensure_fits(ByteReader const& reader, std::size_t count, std::size_t elementWidth)
        -> Expected<void> {
    if (elementWidth != 0 && count > reader.remaining() / elementWidth) {
        return std::unexpected(malformed("declared length " + std::to_string(count)
                                         + " exceeds remaining " + std::to_string(reader.remaining()) + " bytes"));
    }
    return {};
}

template <typename T, typename ReadFn>
[[nodiscard]] auto read_typed_list(ByteReader& reader, ReadFn read) -> Expected<Value> {
    auto count = StandardMessageCodec::readSize(reader);
    if (!count) {
        return std::unexpected(count.error());
    }
    if (auto aligned = reader.readAlignment(sizeof(T)); !aligned) {
        return std::unexpected(aligned.error());
    }
    if (auto fits = ensure_fits(reader, *count, sizeof(T)); !fits) {
        return std::unexpected(fits.error());
    }
    std::vector<T> items;
    items.reserve(*count);
    for (std::size_t i = 0; i < *count; ++i) {
        auto item = read(reader);
        if (!item) {
            return std::unexpected(item.error());
        }
        items.push_back(*item);
    }
    return Value{std::move(items)};
}

} // namespace

auto StandardMessageCodec::instance() -> StandardMessageCodec const& {
    static StandardMessageCodec codec;
    return codec;
}

auto StandardMessageCodec::encodeMessage(Value const& message) const -> Expected<Bytes> {
    return this->encode(message);
}

auto StandardMessageCodec::decodeMessage(BytesView bytes) const -> Expected<Value> {
    // An absent message is a null message.
    if (bytes.empty()) {
        return Value{};
    }
    return this->decode(bytes);
}

auto StandardMessageCodec::encode(Value const& value) const -> Bytes {
    ByteWriter writer;
    this->writeValue(writer, value);
    return writer.take();
}

auto StandardMessageCodec::decode(BytesView bytes) const -> Expected<Value> {
    ByteReader reader(bytes);
    auto       value = this->readValue(reader);
    if (!value) {
        return value;
    }
    if (!reader.atEnd()) {
        return std::unexpected(malformed(std::to_string(reader.remaining()) + " trailing bytes after value"));
    }
    return value;
}

auto StandardMessageCodec::writeSize(ByteWriter& writer, std::size_t size) -> void {
    if (size < kSize16Marker) {
        writer.writeByte(static_cast<std::uint8_t>(size));
    } else if (size <= std::numeric_limits<std::uint16_t>::max()) {
        writer.writeByte(kSize16Marker);
        writer.writeUint16(static_cast<std::uint16_t>(size));
    } else {
        writer.writeByte(kSize32Marker);
        writer.writeUint32(static_cast<std::uint32_t>(size));
    }
}

auto StandardMessageCodec::readSize(ByteReader& reader) -> Expected<std::size_t> {
    auto first = reader.readByte();
    if (!first) {
        return std::unexpected(first.error());
    }
    if (*first < kSize16Marker) {
        return static_cast<std::size_t>(*first);
    }
    if (*first == kSize16Marker) {
        auto size = reader.readUint16();
        if (!size) {
            return std::unexpected(size.error());
        }
        return static_cast<std::size_t>(*size);
    }
    auto size = reader.readUint32();
    if (!size) {
        return std::unexpected(size.error());
    }
    return static_cast<std::size_t>(*size);
}

auto StandardMessageCodec::writeValue(ByteWriter& writer, Value const& value) const -> void {
    std::visit(
            [&](auto const& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    writer.writeByte(tag(StandardField::Null));
                } else if constexpr (std::is_same_v<T, bool>) {
                    writer.writeByte(tag(v ? StandardField::True : StandardField::False));
                } else if constexpr (std::is_same_v<T, std::int32_t>) {
                    writer.writeByte(tag(StandardField::Int32));
                    writer.writeInt32(v);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    writer.writeByte(tag(StandardField::Int64));
                    writer.writeInt64(v);
                } else if constexpr (std::is_same_v<T, BigInt>) {
                    writer.writeByte(tag(StandardField::BigInt));
                    writeSize(writer, v.digits.size());
                    writer.writeBytes(as_bytes(v.digits));
                } else if constexpr (std::is_same_v<T, double>) {
                    writer.writeByte(tag(StandardField::Float64));
                    writer.writeAlignment(8);
                    writer.writeFloat64(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    writer.writeByte(tag(StandardField::String));
                    writeSize(writer, v.size());
                    writer.writeBytes(as_bytes(v));
                } else if constexpr (std::is_same_v<T, std::vector<std::uint8_t>>) {
                    writer.writeByte(tag(StandardField::UInt8List));
                    writeSize(writer, v.size());
                    writer.writeBytes(v);
                } else if constexpr (std::is_same_v<T, std::vector<std::int32_t>>) {
                    writer.writeByte(tag(StandardField::Int32List));
                    writeSize(writer, v.size());
                    writer.writeAlignment(4);
                    for (auto item : v)
                        writer.writeInt32(item);
                } else if constexpr (std::is_same_v<T, std::vector<std::int64_t>>) {
                    writer.writeByte(tag(StandardField::Int64List));
                    writeSize(writer, v.size());
                    writer.writeAlignment(8);
                    for (auto item : v)
                        writer.writeInt64(item);
                } else if constexpr (std::is_same_v<T, std::vector<float>>) {
                    writer.writeByte(tag(StandardField::Float32List));
                    writeSize(writer, v.size());
                    writer.writeAlignment(4);
                    for (auto item : v)
                        writer.writeFloat32(item);
                } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                    writer.writeByte(tag(StandardField::Float64List));
                    writeSize(writer, v.size());
                    writer.writeAlignment(8);
                    for (auto item : v)
                        writer.writeFloat64(item);
                } else if constexpr (std::is_same_v<T, ValueList>) {
                    writer.writeByte(tag(StandardField::List));
                    writeSize(writer, v.size());
                    for (auto const& item : v)
                        this->writeValue(writer, item);
                } else if constexpr (std::is_same_v<T, ValueMap>) {
                    writer.writeByte(tag(StandardField::Map));
                    writeSize(writer, v.size());
                    for (auto const& [key, item] : v) {
                        this->writeValue(writer, key);
                        this->writeValue(writer, item);
                    }
                }
            },
            value.storage);
}

auto StandardMessageCodec::readValue(ByteReader& reader) const -> Expected<Value> {
    return this->readValueAtDepth(reader, 0);
}

auto StandardMessageCodec::readValueAtDepth(ByteReader& reader, std::size_t depth) const -> Expected<Value> {
    if (depth > kMaxNestingDepth) {
        return std::unexpected(malformed("value nesting exceeds " + std::to_string(kMaxNestingDepth)));
    }
    auto type = reader.readByte();
    if (!type) {
        return std::unexpected(type.error());
    }
    return this->readValueOfType(reader, *type, depth);
}

auto StandardMessageCodec::readValueOfType(ByteReader& reader, std::uint8_t type, std::size_t depth) const
        -> Expected<Value> {
    switch (static_cast<StandardField>(type)) {
    case StandardField::Null:
        return Value{};
    case StandardField::True:
        return Value{true};
    case StandardField::False:
        return Value{false};
    case StandardField::Int32: {
        auto v = reader.readInt32();
        if (!v)
            return std::unexpected(v.error());
        return Value{*v};
    }
    case StandardField::Int64: {
        auto v = reader.readInt64();
        if (!v)
            return std::unexpected(v.error());
        return Value{*v};
    }
    case StandardField::Float64: {
        if (auto aligned = reader.readAlignment(8); !aligned)
            return std::unexpected(aligned.error());
        auto v = reader.readFloat64();
        if (!v)
            return std::unexpected(v.error());
        return Value{*v};
    }
    case StandardField::BigInt:
    case StandardField::String: {
        auto size = readSize(reader);
        if (!size)
            return std::unexpected(size.error());
        auto bytes = reader.readBytes(*size);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (type == tag(StandardField::BigInt))
            return Value{BigInt{to_string(*bytes)}};
        return Value{to_string(*bytes)};
    }
    case StandardField::UInt8List: {
        auto size = readSize(reader);
        if (!size)
            return std::unexpected(size.error());
        auto bytes = reader.readBytes(*size);
        if (!bytes)
            return std::unexpected(bytes.error());
        return Value{std::vector<std::uint8_t>(bytes->begin(), bytes->end())};
    }
    case StandardField::Int32List:
        return read_typed_list<std::int32_t>(reader, [](ByteReader& r) { return r.readInt32(); });
    case StandardField::Int64List:
        return read_typed_list<std::int64_t>(reader, [](ByteReader& r) { return r.readInt64(); });
    case StandardField::Float32List:
        return read_typed_list<float>(reader, [](ByteReader& r) { return r.readFloat32(); });
    case StandardField::Float64List:
        return read_typed_list<double>(reader, [](ByteReader& r) { return r.readFloat64(); });
    case StandardField::List: {
        auto count = readSize(reader);
        if (!count)
            return std::unexpected(count.error());
        if (auto fits = ensure_fits(reader, *count, 1); !fits)
            return std::unexpected(fits.error());
        ValueList items;
        items.reserve(*count);
        for (std::size_t i = 0; i < *count; ++i) {
            auto item = this->readValueAtDepth(reader, depth + 1);
            if (!item)
                return std::unexpected(item.error());
            items.push_back(std::move(*item));
        }
        return Value{std::move(items)};
    }
    case StandardField::Map: {
        auto count = readSize(reader);
        if (!count)
            return std::unexpected(count.error());
        if (auto fits = ensure_fits(reader, *count, 2); !fits)
            return std::unexpected(fits.error());
        ValueMap entries;
        entries.reserve(*count);
        for (std::size_t i = 0; i < *count; ++i) {
            auto key = this->readValueAtDepth(reader, depth + 1);
            if (!key)
                return std::unexpected(key.error());
            auto item = this->readValueAtDepth(reader, depth + 1);
            if (!item)
                return std::unexpected(item.error());
            entries.emplace_back(std::move(*key), std::move(*item));
        }
        return Value{std::move(entries)};
    }
    }
    pb_log("StandardMessageCodec rejected type tag " + std::to_string(type), "StandardCodec", "ERROR");
    return std::unexpected(Error{Error::Code::UnsupportedType, "unknown type tag " + std::to_string(type)});
}

auto StandardMethodCodec::instance() -> StandardMethodCodec const& {
    static StandardMethodCodec codec;
    return codec;
}

auto StandardMethodCodec::encodeMethodCall(MethodCall const& call) const -> Expected<Bytes> {
    ByteWriter writer;
    this->values_.writeValue(writer, Value{call.method});
    this->values_.writeValue(writer, call.arguments);
    return writer.take();
}

auto StandardMethodCodec::decodeMethodCall(BytesView bytes) const -> Expected<MethodCall> {
    ByteReader reader(bytes);
    auto       name = this->values_.readValue(reader);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto const* method = name->get_if<std::string>();
    if (method == nullptr) {
        return std::unexpected(malformed("method name must be a string, got "
                                         + std::string(valueTypeToString(name->type()))));
    }
    if (reader.atEnd()) {
        return std::unexpected(malformed("method call is missing its arguments"));
    }
    auto arguments = this->values_.readValue(reader);
    if (!arguments) {
        return std::unexpected(arguments.error());
    }
    if (!reader.atEnd()) {
        return std::unexpected(malformed(std::to_string(reader.remaining()) + " trailing bytes after method call"));
    }
    return MethodCall{std::string(*method), std::move(*arguments)};
}

auto StandardMethodCodec::encodeSuccessEnvelope(Value const& result) const -> Expected<Bytes> {
    ByteWriter writer;
    writer.writeByte(kEnvelopeSuccess);
    this->values_.writeValue(writer, result);
    return writer.take();
}

auto StandardMethodCodec::encodeErrorEnvelope(std::string const&                code,
                                              std::optional<std::string> const& message,
                                              Value const&                      details) const -> Expected<Bytes> {
    ByteWriter writer;
    writer.writeByte(kEnvelopeError);
    this->values_.writeValue(writer, Value{code});
    this->values_.writeValue(writer, message ? Value{*message} : Value{});
    this->values_.writeValue(writer, details);
    return writer.take();
}

auto StandardMethodCodec::decodeEnvelope(BytesView bytes) const -> Expected<MethodResult> {
    if (bytes.empty()) {
        return MethodResult{MethodNotImplemented{}};
    }
    ByteReader reader(bytes);
    auto       flag = reader.readByte();
    if (!flag) {
        return std::unexpected(flag.error());
    }
    if (*flag == kEnvelopeSuccess) {
        auto value = this->values_.readValue(reader);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (!reader.atEnd()) {
            return std::unexpected(malformed("trailing bytes after success envelope"));
        }
        return MethodResult{MethodSuccess{std::move(*value)}};
    }
    if (*flag != kEnvelopeError) {
        return std::unexpected(malformed("unknown envelope flag " + std::to_string(*flag)));
    }

    auto code = this->values_.readValue(reader);
    if (!code) {
        return std::unexpected(code.error());
    }
    auto message = this->values_.readValue(reader);
    if (!message) {
        return std::unexpected(message.error());
    }
    auto details = this->values_.readValue(reader);
    if (!details) {
        return std::unexpected(details.error());
    }
    auto const* codeText = code->get_if<std::string>();
    if (codeText == nullptr) {
        return std::unexpected(malformed("error code must be a string"));
    }
    MethodError error{*codeText, std::nullopt, std::move(*details)};
    if (auto const* messageText = message->get_if<std::string>()) {
        error.message = *messageText;
    } else if (!message->isNull()) {
        return std::unexpected(malformed("error message must be a string or null"));
    }
    // Newer remotes append a stack trace string; it carries nothing we forward.
    if (!reader.atEnd()) {
        auto stackTrace = this->values_.readValue(reader);
        if (!stackTrace) {
            return std::unexpected(stackTrace.error());
        }
        if (!stackTrace->isNull() && !stackTrace->holds<std::string>()) {
            return std::unexpected(malformed("error stack trace must be a string or null"));
        }
        if (!reader.atEnd()) {
            return std::unexpected(malformed("trailing bytes after error envelope"));
        }
    }
    return MethodResult{std::move(error)};
}

} // namespace PB
