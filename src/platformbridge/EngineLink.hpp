#pragma once
#include "channel/BinaryMessenger.hpp"
#include "channel/ResponseHandle.hpp"
#include "ffi/EmbedderApi.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace PB {

// Outbound half of an engine instance: forwards replies and native-initiated
// messages to the engine and correlates the engine's answers. Response
// handles reference it weakly so they fail with ChannelClosed after teardown.
class EngineLink final : public ResponseSink {
public:
    EngineLink(PBEngineOutbound outbound, bool replyOnDroppedResponse);

    EngineLink(EngineLink const&)            = delete;
    EngineLink& operator=(EngineLink const&) = delete;

    auto sendResponse(PBResponseToken const* token, BytesView bytes) -> Expected<void> override;
    auto responseDropped(PBResponseToken const* token) noexcept -> void override;

    auto sendMessage(std::string_view channel, BytesView message, BinaryReply reply) -> Expected<void>;
    // False when no pending send carries correlationId.
    auto deliverReply(std::uint64_t correlationId, BytesView data) -> bool;

    // Rejects further traffic and fails every pending reply with ChannelClosed.
    auto close() -> void;

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto droppedResponses() const -> size_t;
    [[nodiscard]] auto pendingReplies() const -> size_t;

private:
    PBEngineOutbound const outbound;
    bool const             replyOnDrop;

    // No lock is held while calling into the engine; it may re-enter the bridge.
    std::atomic<bool> closed{false};

    mutable std::mutex                               pendingMutex;
    std::unordered_map<std::uint64_t, BinaryReply>   pending;
    std::atomic<std::uint64_t>                       nextCorrelationId{1};
    std::atomic<size_t>                              dropped{0};
};

} // namespace PB
