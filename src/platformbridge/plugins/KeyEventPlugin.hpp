#pragma once
#include "channel/BasicMessageChannel.hpp"
#include "plugins/Plugin.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace PB {

enum class KeyActionType { KeyDown, KeyUp };

// Raw key event in the framework's RawKeyEvent map layout.
struct KeyAction {
    std::string   toolkit{"glfw"};
    std::int32_t  keyCode{0};
    std::int32_t  scanCode{0};
    std::int32_t  modifiers{0};
    std::int64_t  specifiedLogicalKey{0};
    std::int64_t  unicodeScalarValues{0};
    std::string   keymap{"linux"};
    KeyActionType type{KeyActionType::KeyDown};
};

[[nodiscard]] auto keyActionToValue(KeyAction const& action) -> Value;

// flutter/keyevent (JSON message codec).
class KeyEventPlugin final : public Plugin {
public:
    static constexpr std::string_view kChannelName = "flutter/keyevent";

    // Receives whether the framework handled the key.
    using HandledCallback = std::function<void(Expected<bool>)>;

    [[nodiscard]] auto pluginName() const -> std::string_view override { return "keyevent"; }
    auto attach(BinaryMessenger& messenger) -> Expected<void> override;
    auto detach() -> void override;

    auto sendKeyAction(KeyAction const& action, HandledCallback callback = {}) -> Expected<void>;

private:
    std::optional<BasicMessageChannel> channel;
};

} // namespace PB
