#include "channel/EventChannel.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {

auto EventSink::emit(Bytes const& bytes) -> Expected<void> {
    if (!this->state->open.load()) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Event stream is closed on " + this->state->channel});
    }
    return this->state->messenger->send(this->state->channel, bytes);
}

auto EventSink::success(Value const& event) -> Expected<void> {
    auto bytes = this->state->codec->encodeSuccessEnvelope(event);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return this->emit(*bytes);
}

auto EventSink::error(std::string const& code, std::optional<std::string> message, Value const& details)
        -> Expected<void> {
    auto bytes = this->state->codec->encodeErrorEnvelope(code, message, details);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return this->emit(*bytes);
}

auto EventSink::endOfStream() -> Expected<void> {
    if (!this->state->open.exchange(false)) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Event stream is closed on " + this->state->channel});
    }
    return this->state->messenger->send(this->state->channel, BytesView{});
}

auto EventSink::isOpen() const -> bool {
    return this->state->open.load();
}

// Producer registration: answers listen/cancel and owns the active sink.
class StreamDispatchHandler final : public BinaryMessageHandler {
public:
    StreamDispatchHandler(BinaryMessenger& messenger, std::string channel, MethodCodec const& codec,
                          std::shared_ptr<StreamHandler> handler)
        : messenger(messenger), channel(std::move(channel)), codec(codec), handler(std::move(handler)) {}

    auto handleMessage(PlatformMessage const& message) -> void override {
        ResponseHandle response = message.response;
        auto           call     = this->codec.decodeMethodCall(message.payload);
        if (!call) {
            pb_log("Undecodable stream call on " + this->channel + ": " + describeError(call.error()), "EventChannel", "ERROR");
            this->reply(response, MethodResult{MethodNotImplemented{}});
            return;
        }
        if (call->method == "listen") {
            this->reply(response, this->onListen(call->arguments));
        } else if (call->method == "cancel") {
            this->reply(response, this->onCancel(call->arguments));
        } else {
            this->reply(response, MethodResult{MethodNotImplemented{}});
        }
    }

private:
    auto onListen(Value const& arguments) -> MethodResult {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->active) {
            pb_log("Restarting stream on " + this->channel, "EventChannel");
            this->active->open.store(false);
            this->active.reset();
            if (auto failed = this->handler->onCancel(Value{})) {
                pb_log("Implicit cancel failed on " + this->channel + ": " + failed->code, "EventChannel", "ERROR");
            }
        }
        auto state       = std::make_shared<EventSink::State>();
        state->messenger = &this->messenger;
        state->channel   = this->channel;
        state->codec     = &this->codec;
        if (auto failed = this->handler->onListen(arguments, EventSink{state})) {
            state->open.store(false);
            return MethodResult{std::move(*failed)};
        }
        this->active = std::move(state);
        return MethodResult{MethodSuccess{}};
    }

    auto onCancel(Value const& arguments) -> MethodResult {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->active) {
            return MethodResult{MethodSuccess{}};
        }
        this->active->open.store(false);
        this->active.reset();
        if (auto failed = this->handler->onCancel(arguments)) {
            return MethodResult{std::move(*failed)};
        }
        return MethodResult{MethodSuccess{}};
    }

    auto reply(ResponseHandle& response, MethodResult const& result) -> void {
        if (auto sent = response.respond(result, this->codec); !sent) {
            pb_log("Stream reply failed on " + this->channel + ": " + describeError(sent.error()), "EventChannel", "ERROR");
        }
    }

    BinaryMessenger&               messenger;
    std::string const              channel;
    MethodCodec const&             codec;
    std::shared_ptr<StreamHandler> handler;

    std::mutex                        mutex;
    std::shared_ptr<EventSink::State> active;
};

namespace {

// Consumer registration: turns incoming envelopes into listener callbacks.
template <typename Subscription>
class EventReceiver final : public BinaryMessageHandler {
public:
    EventReceiver(std::shared_ptr<Subscription> subscription, MethodCodec const& codec)
        : subscription(std::move(subscription)), codec(codec) {}

    auto handleMessage(PlatformMessage const& message) -> void override {
        ResponseHandle response = message.response;
        this->deliver(message);
        if (auto sent = response.respond(BytesView{}); !sent) {
            pb_log("Event acknowledgement failed: " + describeError(sent.error()), "EventChannel", "ERROR");
        }
    }

private:
    auto deliver(PlatformMessage const& message) -> void {
        std::lock_guard<std::mutex> lock(this->subscription->mutex);
        if (!this->subscription->active.load()) {
            return;
        }
        auto& listener = this->subscription->listener;
        if (message.payload.empty()) {
            this->subscription->active.store(false);
            if (listener.onDone) {
                listener.onDone();
            }
            return;
        }
        auto envelope = this->codec.decodeEnvelope(message.payload);
        if (!envelope) {
            pb_log("Undecodable event on " + std::string(message.channel) + ": " + describeError(envelope.error()),
                   "EventChannel",
                   "ERROR");
            return;
        }
        if (auto const* success = std::get_if<MethodSuccess>(&*envelope)) {
            if (listener.onEvent) {
                listener.onEvent(success->value);
            }
        } else if (auto const* error = std::get_if<MethodError>(&*envelope)) {
            if (listener.onError) {
                listener.onError(*error);
            }
        }
    }

    std::shared_ptr<Subscription> subscription;
    MethodCodec const&            codec;
};

auto transport_error(Error const& error) -> MethodError {
    return MethodError{std::string(errorCodeToString(error.code)), error.message, Value{}};
}

} // namespace

EventChannel::EventChannel(BinaryMessenger& messenger, std::string name, MethodCodec const& codec)
    : messenger(&messenger), channelName(std::move(name)), codec(&codec) {}

auto EventChannel::setStreamHandler(std::shared_ptr<StreamHandler> handler) -> Expected<void> {
    if (!handler) {
        return this->messenger->setMessageHandler(this->channelName, nullptr);
    }
    return this->messenger->setMessageHandler(
            this->channelName,
            std::make_shared<StreamDispatchHandler>(*this->messenger, this->channelName, *this->codec, std::move(handler)));
}

auto EventChannel::listen(Value const& arguments, EventListener listener) -> Expected<void> {
    if (this->isListening()) {
        if (auto cancelled = this->cancel(); !cancelled) {
            pb_log("Cancelling previous stream failed: " + describeError(cancelled.error()), "EventChannel", "ERROR");
        }
    }
    auto bytes = this->codec->encodeMethodCall(MethodCall{"listen", arguments});
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    auto subscription      = std::make_shared<Subscription>();
    subscription->listener = std::move(listener);
    if (auto registered = this->messenger->setMessageHandler(
                this->channelName, std::make_shared<EventReceiver<Subscription>>(subscription, *this->codec));
        !registered) {
        return registered;
    }
    this->subscription = subscription;

    std::weak_ptr<Subscription> weak = subscription;
    auto sent = this->messenger->send(
            this->channelName, *bytes, [weak, codec = this->codec](Expected<BytesView> reply) {
                auto subscription = weak.lock();
                if (!subscription) {
                    return;
                }
                std::optional<MethodError> failure;
                if (!reply) {
                    failure = transport_error(reply.error());
                } else if (auto envelope = codec->decodeEnvelope(*reply); !envelope) {
                    failure = transport_error(envelope.error());
                } else if (auto const* error = std::get_if<MethodError>(&*envelope)) {
                    failure = *error;
                }
                if (!failure) {
                    return;
                }
                std::lock_guard<std::mutex> lock(subscription->mutex);
                if (subscription->active.exchange(false) && subscription->listener.onError) {
                    subscription->listener.onError(*failure);
                }
            });
    if (!sent) {
        subscription->active.store(false);
        this->subscription.reset();
        if (auto removed = this->messenger->setMessageHandler(this->channelName, nullptr); !removed) {
            pb_log("Removing receiver failed: " + describeError(removed.error()), "EventChannel", "ERROR");
        }
    }
    return sent;
}

auto EventChannel::cancel() -> Expected<void> {
    auto subscription = std::move(this->subscription);
    if (!subscription) {
        return {};
    }
    // The receiver stays registered after the stream ended or listen failed.
    bool const wasActive = subscription->active.exchange(false);
    if (auto removed = this->messenger->setMessageHandler(this->channelName, nullptr); !removed) {
        return removed;
    }
    if (!wasActive) {
        return {};
    }
    auto bytes = this->codec->encodeMethodCall(MethodCall{"cancel", Value{}});
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    std::string channel = this->channelName;
    return this->messenger->send(this->channelName, *bytes, [channel](Expected<BytesView> reply) {
        if (!reply) {
            pb_log("Cancel on " + channel + " failed: " + describeError(reply.error()), "EventChannel");
        }
    });
}

auto EventChannel::isListening() const -> bool {
    return this->subscription && this->subscription->active.load();
}

} // namespace PB
