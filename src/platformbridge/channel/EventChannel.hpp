#pragma once
#include "channel/BinaryMessenger.hpp"
#include "codec/MessageCodec.hpp"
#include "codec/MethodCall.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace PB {

// Producer side handle for one active stream. Copies share the stream; once
// the stream ends or is cancelled every copy fails with ChannelClosed.
class EventSink {
public:
    auto success(Value const& event) -> Expected<void>;
    auto error(std::string const&         code,
               std::optional<std::string> message = std::nullopt,
               Value const&               details = Value{}) -> Expected<void>;
    auto endOfStream() -> Expected<void>;

    [[nodiscard]] auto isOpen() const -> bool;

private:
    friend class StreamDispatchHandler;

    struct State {
        BinaryMessenger*   messenger;
        std::string        channel;
        MethodCodec const* codec;
        std::atomic<bool>  open{true};
    };

    explicit EventSink(std::shared_ptr<State> state)
        : state(std::move(state)) {}

    auto emit(Bytes const& bytes) -> Expected<void>;

    std::shared_ptr<State> state;
};

class StreamHandler {
public:
    virtual ~StreamHandler() = default;

    // A returned error is sent back as the listen reply and no stream starts.
    virtual auto onListen(Value const& arguments, EventSink sink) -> std::optional<MethodError> = 0;
    virtual auto onCancel(Value const& arguments) -> std::optional<MethodError>                 = 0;
};

// Consumer side callbacks. Any of them may be empty.
struct EventListener {
    std::function<void(Value const&)>       onEvent;
    std::function<void(MethodError const&)> onError;
    std::function<void()>                   onDone;
};

/*
 * Stream protocol on one channel name: the consumer sends "listen" and
 * "cancel" method calls, the producer answers them and then sends events as
 * success envelopes, errors as error envelopes and an empty message for the
 * end of the stream.
 *
 * setStreamHandler makes this side the producer, listen makes it the
 * consumer; both register under the same channel name, so use one per object.
 */
class EventChannel {
public:
    EventChannel(BinaryMessenger& messenger, std::string name, MethodCodec const& codec);

    [[nodiscard]] auto name() const -> std::string const& { return this->channelName; }

    auto setStreamHandler(std::shared_ptr<StreamHandler> handler) -> Expected<void>;

    // Starts a stream, cancelling the one already listened to.
    auto listen(Value const& arguments, EventListener listener) -> Expected<void>;
    // Removes the local receiver. Sends "cancel" only while a stream is active.
    auto cancel() -> Expected<void>;
    [[nodiscard]] auto isListening() const -> bool;

private:
    struct Subscription {
        std::mutex        mutex;
        EventListener     listener;
        std::atomic<bool> active{true};
    };

    BinaryMessenger*              messenger;
    std::string                   channelName;
    MethodCodec const*            codec;
    std::shared_ptr<Subscription> subscription;
};

} // namespace PB
