#pragma once
#include "channel/BinaryMessenger.hpp"
#include "channel/ResponseHandle.hpp"
#include "codec/MessageCodec.hpp"
#include "codec/MethodCall.hpp"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace PB {

// Answers one method call. Copies share the underlying response handle.
class MethodResponder {
public:
    MethodResponder(ResponseHandle response, MethodCodec const& codec)
        : response(std::move(response)), codec(&codec) {}

    auto success(Value const& result = Value{}) -> Expected<void>;
    auto error(std::string const&         code,
               std::optional<std::string> message = std::nullopt,
               Value const&               details = Value{}) -> Expected<void>;
    auto notImplemented() -> Expected<void>;
    auto respond(MethodResult const& result) -> Expected<void>;

    [[nodiscard]] auto hasResponded() const -> bool { return this->response.hasResponded(); }

private:
    ResponseHandle     response;
    MethodCodec const* codec;
};

class MethodCallHandler {
public:
    virtual ~MethodCallHandler() = default;

    virtual auto handle(MethodCall const& call, MethodResponder responder) -> void = 0;
};

using MethodCallFunction = std::function<void(MethodCall const&, MethodResponder)>;
using MethodResultCallback = std::function<void(Expected<MethodResult>)>;

/*
 * Request/response method calls on one channel name.
 *
 * The registered handler holds the codec and the user handler only, so the
 * channel object itself may be destroyed while the registration stays. The
 * codec and messenger must outlive the channel and its registration.
 */
class MethodChannel {
public:
    MethodChannel(BinaryMessenger& messenger, std::string name, MethodCodec const& codec);

    [[nodiscard]] auto name() const -> std::string const& { return this->channelName; }
    [[nodiscard]] auto codec() const -> MethodCodec const& { return *this->methodCodec; }

    // callback receives the decoded reply, or the transport error. Without a
    // callback the engine is told not to reply.
    auto invokeMethod(std::string const& method, Value const& arguments = Value{}, MethodResultCallback callback = {})
            -> Expected<void>;
    auto invokeMethodAsync(std::string const& method, Value const& arguments = Value{})
            -> std::future<Expected<MethodResult>>;

    auto setMethodCallHandler(std::shared_ptr<MethodCallHandler> handler) -> Expected<void>;
    auto setMethodCallHandler(MethodCallFunction handler) -> Expected<void>;
    auto setMethodCallHandler(std::nullptr_t) -> Expected<void>;

private:
    BinaryMessenger*   messenger;
    std::string        channelName;
    MethodCodec const* methodCodec;
};

} // namespace PB
