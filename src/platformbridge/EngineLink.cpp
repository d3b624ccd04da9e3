#include "EngineLink.hpp"
#include "log/TaggedLogger.hpp"

#include <string>
#include <vector>

namespace PB {

EngineLink::EngineLink(PBEngineOutbound outbound, bool replyOnDroppedResponse)
    : outbound(outbound), replyOnDrop(replyOnDroppedResponse) {}

auto EngineLink::sendResponse(PBResponseToken const* token, BytesView bytes) -> Expected<void> {
    if (this->closed.load()) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Engine link closed"});
    }
    if (this->outbound.send_response == nullptr) {
        return std::unexpected(Error{Error::Code::EngineRejected, "Engine accepts no responses"});
    }
    this->outbound.send_response(this->outbound.engine_user_data, token, bytes.data(), bytes.size());
    return {};
}

auto EngineLink::responseDropped(PBResponseToken const* token) noexcept -> void {
    ++this->dropped;
    pb_log("Response handle dropped without an answer", "ResponseHandle", "ERROR");
    if (!this->replyOnDrop) {
        return;
    }
    if (auto sent = this->sendResponse(token, BytesView{}); !sent) {
        pb_log("Dropped response not answered: " + describeError(sent.error()), "ResponseHandle");
    }
}

auto EngineLink::sendMessage(std::string_view channel, BytesView message, BinaryReply reply) -> Expected<void> {
    if (this->closed.load()) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Engine link closed"});
    }
    if (this->outbound.send_message == nullptr) {
        return std::unexpected(Error{Error::Code::EngineRejected, "Engine accepts no messages"});
    }

    std::uint64_t correlationId = 0;
    if (reply) {
        correlationId = this->nextCorrelationId.fetch_add(1);
        std::lock_guard<std::mutex> pendingLock(this->pendingMutex);
        // close() sets the flag under this lock, so nothing is added after it drained the table.
        if (this->closed.load()) {
            return std::unexpected(Error{Error::Code::ChannelClosed, "Engine link closed"});
        }
        this->pending.emplace(correlationId, std::move(reply));
    }

    // The engine may answer before send_message returns.
    auto status = this->outbound.send_message(this->outbound.engine_user_data,
                                              channel.data(),
                                              channel.size(),
                                              message.data(),
                                              message.size(),
                                              correlationId);
    if (status != 0) {
        if (correlationId != 0) {
            std::lock_guard<std::mutex> pendingLock(this->pendingMutex);
            this->pending.erase(correlationId);
        }
        pb_log("Engine rejected message on " + std::string(channel) + " status=" + std::to_string(status),
               "PlatformBridge",
               "ERROR");
        return std::unexpected(Error{Error::Code::EngineRejected,
                                     "send_message returned " + std::to_string(status) + " for "
                                             + std::string(channel)});
    }
    return {};
}

auto EngineLink::deliverReply(std::uint64_t correlationId, BytesView data) -> bool {
    BinaryReply reply;
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        auto it = this->pending.find(correlationId);
        if (it == this->pending.end()) {
            return false;
        }
        reply = std::move(it->second);
        this->pending.erase(it);
    }
    reply(Expected<BytesView>{data});
    return true;
}

auto EngineLink::close() -> void {
    std::unordered_map<std::uint64_t, BinaryReply> abandoned;
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        if (this->closed.exchange(true)) {
            return;
        }
        abandoned.swap(this->pending);
    }
    pb_log("EngineLink::close failing " + std::to_string(abandoned.size()) + " pending replies", "PlatformBridge");
    for (auto& [id, reply] : abandoned) {
        reply(std::unexpected(Error{Error::Code::ChannelClosed, "Engine torn down before replying"}));
    }
}

auto EngineLink::isClosed() const -> bool {
    return this->closed.load();
}

auto EngineLink::droppedResponses() const -> size_t {
    return this->dropped.load();
}

auto EngineLink::pendingReplies() const -> size_t {
    std::lock_guard<std::mutex> lock(this->pendingMutex);
    return this->pending.size();
}

} // namespace PB
