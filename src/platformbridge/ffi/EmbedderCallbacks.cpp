#include "ffi/EmbedderApi.h"
#include "PlatformBridge.hpp"
#include "log/TaggedLogger.hpp"

#include <string_view>

using PB::BytesView;
using PB::PlatformBridge;

namespace {

auto borrow(uint8_t const* data, size_t size) -> BytesView {
    if (data == nullptr) {
        return BytesView{};
    }
    return BytesView{data, size};
}

} // namespace

extern "C" void PBPlatformMessageCallback(char const*            channel,
                                          size_t                 channel_size,
                                          uint8_t const*         message,
                                          size_t                 message_size,
                                          PBResponseToken const* token,
                                          void*                  user_data) {
    auto* bridge = static_cast<PlatformBridge*>(user_data);
    if (bridge == nullptr || channel == nullptr) {
        pb_log("PBPlatformMessageCallback without bridge or channel", "PlatformBridge", "ERROR");
        return;
    }
    bridge->handlePlatformMessage(std::string_view{channel, channel_size}, borrow(message, message_size), token);
}

extern "C" void PBPlatformMessageReplyCallback(uint64_t       correlation_id,
                                               uint8_t const* data,
                                               size_t         size,
                                               void*          user_data) {
    auto* bridge = static_cast<PlatformBridge*>(user_data);
    if (bridge == nullptr) {
        pb_log("PBPlatformMessageReplyCallback without bridge", "PlatformBridge", "ERROR");
        return;
    }
    bridge->deliverReply(correlation_id, borrow(data, size));
}
