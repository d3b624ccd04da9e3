#include "channel/BasicMessageChannel.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {
namespace {

class ValueDispatchHandler final : public BinaryMessageHandler {
public:
    ValueDispatchHandler(MessageHandler handler, MessageCodec const& codec)
        : handler(std::move(handler)), codec(codec) {}

    auto handleMessage(PlatformMessage const& message) -> void override {
        ResponseHandle response = message.response;
        auto           value    = this->codec.decodeMessage(message.payload);
        if (!value) {
            pb_log("Undecodable message on " + std::string(message.channel) + ": " + describeError(value.error()),
                   "BasicMessageChannel",
                   "ERROR");
            if (auto sent = response.respondNotImplemented(); !sent) {
                pb_log("Reply failed: " + describeError(sent.error()), "BasicMessageChannel", "ERROR");
            }
            return;
        }
        this->handler(*value, MessageReplier{std::move(response), this->codec});
    }

private:
    MessageHandler      handler;
    MessageCodec const& codec;
};

} // namespace

auto MessageReplier::reply(Value const& value) -> Expected<void> {
    if (this->response.hasResponded()) {
        return std::unexpected(Error{Error::Code::AlreadyResponded, "Response already sent"});
    }
    auto bytes = this->codec->encodeMessage(value);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return this->response.respond(BytesView{*bytes});
}

BasicMessageChannel::BasicMessageChannel(BinaryMessenger& messenger, std::string name, MessageCodec const& codec)
    : messenger(&messenger), channelName(std::move(name)), codec(&codec) {}

auto BasicMessageChannel::send(Value const& message, MessageReplyCallback reply) -> Expected<void> {
    auto bytes = this->codec->encodeMessage(message);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    BinaryReply binaryReply;
    if (reply) {
        binaryReply = [codec = this->codec, reply = std::move(reply)](Expected<BytesView> data) {
            if (!data) {
                reply(std::unexpected(data.error()));
                return;
            }
            reply(codec->decodeMessage(*data));
        };
    }
    return this->messenger->send(this->channelName, *bytes, std::move(binaryReply));
}

auto BasicMessageChannel::setMessageHandler(MessageHandler handler) -> Expected<void> {
    if (!handler) {
        return this->messenger->setMessageHandler(this->channelName, nullptr);
    }
    return this->messenger->setMessageHandler(this->channelName,
                                              std::make_shared<ValueDispatchHandler>(std::move(handler), *this->codec));
}

} // namespace PB
