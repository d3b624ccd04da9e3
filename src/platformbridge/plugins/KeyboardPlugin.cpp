#include "plugins/KeyboardPlugin.hpp"
#include "codec/StandardCodec.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {

KeyboardPlugin::KeyboardPlugin(std::shared_ptr<KeyboardStateProvider> provider)
    : provider(std::move(provider)), providerMutex(std::make_shared<std::mutex>()) {}

auto KeyboardPlugin::attach(BinaryMessenger& messenger) -> Expected<void> {
    if (!this->provider) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Keyboard plugin needs a state provider"});
    }
    this->channel.emplace(messenger, std::string(kChannelName), StandardMethodCodec::instance());
    auto provider = this->provider;
    auto mutex    = this->providerMutex;
    return this->channel->setMethodCallHandler([provider, mutex](MethodCall const& call, MethodResponder responder) {
        pb_log("keyboard method call " + call.method, "keyboard");
        Expected<void> sent{};
        if (call.method == "getKeyboardState") {
            Expected<KeyboardState> state = [&] {
                std::lock_guard<std::mutex> lock(*mutex);
                return provider->getKeyboardState();
            }();
            if (!state) {
                sent = responder.error("Get keyboard state failure", describeError(state.error()));
            } else {
                ValueMap pressed;
                pressed.reserve(state->size());
                for (auto const& [physical, logical] : *state) {
                    pressed.emplace_back(Value{static_cast<std::int64_t>(physical)},
                                         Value{static_cast<std::int64_t>(logical)});
                }
                sent = responder.success(Value{std::move(pressed)});
            }
        } else {
            sent = responder.notImplemented();
        }
        if (!sent) {
            pb_log("keyboard reply failed: " + describeError(sent.error()), "keyboard", "ERROR");
        }
    });
}

auto KeyboardPlugin::detach() -> void {
    if (!this->channel) {
        return;
    }
    if (auto removed = this->channel->setMethodCallHandler(nullptr); !removed) {
        pb_log("keyboard detach failed: " + describeError(removed.error()), "keyboard", "ERROR");
    }
    this->channel.reset();
}

} // namespace PB
