#pragma once
#include "channel/BinaryMessenger.hpp"
#include "channel/ResponseHandle.hpp"
#include "codec/MessageCodec.hpp"

#include <functional>
#include <memory>
#include <string>

namespace PB {

// Answers one inbound message with a bare value.
class MessageReplier {
public:
    MessageReplier(ResponseHandle response, MessageCodec const& codec)
        : response(std::move(response)), codec(&codec) {}

    auto reply(Value const& value) -> Expected<void>;

    [[nodiscard]] auto hasReplied() const -> bool { return this->response.hasResponded(); }

private:
    ResponseHandle      response;
    MessageCodec const* codec;
};

using MessageHandler = std::function<void(Value const& message, MessageReplier replier)>;
using MessageReplyCallback = std::function<void(Expected<Value>)>;

// Bare codec values in both directions, without method-call framing.
class BasicMessageChannel {
public:
    BasicMessageChannel(BinaryMessenger& messenger, std::string name, MessageCodec const& codec);

    [[nodiscard]] auto name() const -> std::string const& { return this->channelName; }

    auto send(Value const& message, MessageReplyCallback reply = {}) -> Expected<void>;
    // An empty handler unregisters the channel.
    auto setMessageHandler(MessageHandler handler) -> Expected<void>;

private:
    BinaryMessenger*    messenger;
    std::string         channelName;
    MessageCodec const* codec;
};

} // namespace PB
