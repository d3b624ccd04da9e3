#include "codec/StringCodec.hpp"

#include <string>

namespace PB {

auto StringCodec::instance() -> StringCodec const& {
    static StringCodec codec;
    return codec;
}

auto StringCodec::encodeMessage(Value const& message) const -> Expected<Bytes> {
    if (message.isNull()) {
        return Bytes{};
    }
    auto const* text = message.get_if<std::string>();
    if (text == nullptr) {
        return std::unexpected(Error{Error::Code::UnsupportedType,
                                     "string codec cannot encode " + std::string(valueTypeToString(message.type()))});
    }
    return Bytes(text->begin(), text->end());
}

auto StringCodec::decodeMessage(BytesView bytes) const -> Expected<Value> {
    return Value{std::string(reinterpret_cast<char const*>(bytes.data()), bytes.size())};
}

} // namespace PB
