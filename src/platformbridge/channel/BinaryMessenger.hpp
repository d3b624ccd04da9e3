#pragma once
#include "channel/PlatformMessage.hpp"
#include "codec/MessageCodec.hpp"
#include "core/Error.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace PB {

class BinaryMessageHandler {
public:
    virtual ~BinaryMessageHandler() = default;

    virtual auto handleMessage(PlatformMessage const& message) -> void = 0;
};

// Reply to a native-initiated message. The bytes are borrowed for the call.
// ChannelClosed when the engine went away before answering.
using BinaryReply = std::function<void(Expected<BytesView>)>;

// Raw send / handler registration seam shared by all channel kinds.
class BinaryMessenger {
public:
    virtual ~BinaryMessenger() = default;

    virtual auto send(std::string_view channel, BytesView message, BinaryReply reply = {}) -> Expected<void> = 0;
    // A null handler removes the registration for channel.
    virtual auto setMessageHandler(std::string const& channel, std::shared_ptr<BinaryMessageHandler> handler)
            -> Expected<void> = 0;
};

} // namespace PB
