#pragma once
#include "channel/ResponseHandle.hpp"
#include "codec/MessageCodec.hpp"

#include <string_view>

namespace PB {

// Inbound message as handed to a BinaryMessageHandler. channel and payload
// borrow the engine's buffers and are valid only during the call; copy the
// bytes and the response handle to answer later.
struct PlatformMessage {
    std::string_view channel;
    BytesView        payload;
    ResponseHandle   response;
};

} // namespace PB
