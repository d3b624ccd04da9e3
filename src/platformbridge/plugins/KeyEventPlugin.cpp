#include "plugins/KeyEventPlugin.hpp"
#include "codec/JsonCodec.hpp"
#include "log/TaggedLogger.hpp"

namespace PB {

auto keyActionToValue(KeyAction const& action) -> Value {
    return Value{ValueMap{
            {Value{"toolkit"}, Value{action.toolkit}},
            {Value{"keyCode"}, Value{action.keyCode}},
            {Value{"scanCode"}, Value{action.scanCode}},
            {Value{"modifiers"}, Value{action.modifiers}},
            {Value{"specifiedLogicalKey"}, Value{action.specifiedLogicalKey}},
            {Value{"unicodeScalarValues"}, Value{action.unicodeScalarValues}},
            {Value{"keymap"}, Value{action.keymap}},
            {Value{"type"}, Value{action.type == KeyActionType::KeyDown ? "keydown" : "keyup"}},
    }};
}

auto KeyEventPlugin::attach(BinaryMessenger& messenger) -> Expected<void> {
    this->channel.emplace(messenger, std::string(kChannelName), JsonMessageCodec::instance());
    return this->channel->setMessageHandler([](Value const& message, MessageReplier replier) {
        pb_log("keyevent message " + message.toDebugString(), "keyevent");
        if (auto sent = replier.reply(Value{}); !sent) {
            pb_log("keyevent reply failed: " + describeError(sent.error()), "keyevent", "ERROR");
        }
    });
}

auto KeyEventPlugin::detach() -> void {
    if (!this->channel) {
        return;
    }
    if (auto removed = this->channel->setMessageHandler(nullptr); !removed) {
        pb_log("keyevent detach failed: " + describeError(removed.error()), "keyevent", "ERROR");
    }
    this->channel.reset();
}

auto KeyEventPlugin::sendKeyAction(KeyAction const& action, HandledCallback callback) -> Expected<void> {
    if (!this->channel) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Key event plugin is not attached"});
    }
    MessageReplyCallback reply;
    if (callback) {
        reply = [callback = std::move(callback)](Expected<Value> response) {
            if (!response) {
                callback(std::unexpected(response.error()));
                return;
            }
            // No answer or no flag counts as unhandled.
            auto const* handled = response->lookup("handled");
            auto const* flag    = handled != nullptr ? handled->get_if<bool>() : nullptr;
            callback(flag != nullptr && *flag);
        };
    }
    return this->channel->send(keyActionToValue(action), std::move(reply));
}

} // namespace PB
