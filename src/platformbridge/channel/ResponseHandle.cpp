#include "channel/ResponseHandle.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {

ResponseHandle::State::~State() {
    if (this->consumed.load() || this->token == nullptr) {
        return;
    }
    if (auto target = this->sink.lock()) {
        target->responseDropped(this->token);
    }
}

ResponseHandle::ResponseHandle()
    : state(std::make_shared<State>(nullptr, std::weak_ptr<ResponseSink>{})) {}

ResponseHandle::ResponseHandle(PBResponseToken const* token, std::weak_ptr<ResponseSink> sink)
    : state(std::make_shared<State>(token, std::move(sink))) {}

auto ResponseHandle::respond(BytesView bytes) -> Expected<void> {
    if (this->state->consumed.exchange(true)) {
        pb_log("ResponseHandle::respond called on an answered handle", "ResponseHandle", "ERROR");
        return std::unexpected(Error{Error::Code::AlreadyResponded, "Response already sent"});
    }
    if (this->state->token == nullptr) {
        return {};
    }
    auto target = this->state->sink.lock();
    if (!target) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Engine is gone"});
    }
    return target->sendResponse(this->state->token, bytes);
}

auto ResponseHandle::respond(MethodResult const& result, MethodCodec const& codec) -> Expected<void> {
    if (this->state->consumed.load()) {
        return std::unexpected(Error{Error::Code::AlreadyResponded, "Response already sent"});
    }
    auto bytes = codec.encodeResult(result);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return this->respond(BytesView{*bytes});
}

auto ResponseHandle::respondNotImplemented() -> Expected<void> {
    return this->respond(BytesView{});
}

auto ResponseHandle::hasResponded() const -> bool {
    return this->state->consumed.load();
}

auto ResponseHandle::hasToken() const -> bool {
    return this->state->token != nullptr;
}

} // namespace PB
