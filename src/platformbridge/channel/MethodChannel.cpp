#include "channel/MethodChannel.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {
namespace {

class FunctionMethodCallHandler final : public MethodCallHandler {
public:
    explicit FunctionMethodCallHandler(MethodCallFunction fn)
        : fn(std::move(fn)) {}

    auto handle(MethodCall const& call, MethodResponder responder) -> void override {
        this->fn(call, std::move(responder));
    }

private:
    MethodCallFunction fn;
};

// Registry entry: decodes the call and hands it to the user handler.
class MethodDispatchHandler final : public BinaryMessageHandler {
public:
    MethodDispatchHandler(std::shared_ptr<MethodCallHandler> handler, MethodCodec const& codec)
        : handler(std::move(handler)), codec(codec) {}

    auto handleMessage(PlatformMessage const& message) -> void override {
        auto call = this->codec.decodeMethodCall(message.payload);
        ResponseHandle response = message.response;
        if (!call) {
            pb_log("Undecodable method call on " + std::string(message.channel) + ": " + describeError(call.error()),
                   "MethodChannel",
                   "ERROR");
            // Detached handles swallow this reply, so fire-and-forget calls are dropped.
            if (auto sent = response.respondNotImplemented(); !sent) {
                pb_log("Reply failed: " + describeError(sent.error()), "MethodChannel", "ERROR");
            }
            return;
        }
        this->handler->handle(*call, MethodResponder{std::move(response), this->codec});
    }

private:
    std::shared_ptr<MethodCallHandler> handler;
    MethodCodec const&                 codec;
};

} // namespace

auto MethodResponder::success(Value const& result) -> Expected<void> {
    return this->response.respond(MethodResult{MethodSuccess{result}}, *this->codec);
}

auto MethodResponder::error(std::string const& code, std::optional<std::string> message, Value const& details)
        -> Expected<void> {
    return this->response.respond(MethodResult{MethodError{code, std::move(message), details}}, *this->codec);
}

auto MethodResponder::notImplemented() -> Expected<void> {
    return this->response.respondNotImplemented();
}

auto MethodResponder::respond(MethodResult const& result) -> Expected<void> {
    return this->response.respond(result, *this->codec);
}

MethodChannel::MethodChannel(BinaryMessenger& messenger, std::string name, MethodCodec const& codec)
    : messenger(&messenger), channelName(std::move(name)), methodCodec(&codec) {}

auto MethodChannel::invokeMethod(std::string const& method, Value const& arguments, MethodResultCallback callback)
        -> Expected<void> {
    auto bytes = this->methodCodec->encodeMethodCall(MethodCall{method, arguments});
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    BinaryReply reply;
    if (callback) {
        reply = [codec = this->methodCodec, callback = std::move(callback)](Expected<BytesView> data) {
            if (!data) {
                callback(std::unexpected(data.error()));
                return;
            }
            callback(codec->decodeEnvelope(*data));
        };
    }
    pb_log("MethodChannel::invokeMethod " + this->channelName + "/" + method, "MethodChannel");
    return this->messenger->send(this->channelName, *bytes, std::move(reply));
}

auto MethodChannel::invokeMethodAsync(std::string const& method, Value const& arguments)
        -> std::future<Expected<MethodResult>> {
    auto promise = std::make_shared<std::promise<Expected<MethodResult>>>();
    auto future  = promise->get_future();
    auto sent    = this->invokeMethod(method, arguments, [promise](Expected<MethodResult> result) {
        promise->set_value(std::move(result));
    });
    if (!sent) {
        promise->set_value(std::unexpected(sent.error()));
    }
    return future;
}

auto MethodChannel::setMethodCallHandler(std::shared_ptr<MethodCallHandler> handler) -> Expected<void> {
    if (!handler) {
        return this->messenger->setMessageHandler(this->channelName, nullptr);
    }
    return this->messenger->setMessageHandler(
            this->channelName, std::make_shared<MethodDispatchHandler>(std::move(handler), *this->methodCodec));
}

auto MethodChannel::setMethodCallHandler(MethodCallFunction handler) -> Expected<void> {
    if (!handler) {
        return this->messenger->setMessageHandler(this->channelName, nullptr);
    }
    return this->setMethodCallHandler(
            std::shared_ptr<MethodCallHandler>(std::make_shared<FunctionMethodCallHandler>(std::move(handler))));
}

auto MethodChannel::setMethodCallHandler(std::nullptr_t) -> Expected<void> {
    return this->messenger->setMessageHandler(this->channelName, nullptr);
}

} // namespace PB
