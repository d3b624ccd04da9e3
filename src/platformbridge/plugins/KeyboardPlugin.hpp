#pragma once
#include "channel/MethodChannel.hpp"
#include "plugins/Plugin.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace PB {

// Currently pressed keys, physical key id to logical key id.
using KeyboardState = std::map<std::uint64_t, std::uint64_t>;

class KeyboardStateProvider {
public:
    virtual ~KeyboardStateProvider() = default;

    virtual auto getKeyboardState() -> Expected<KeyboardState> = 0;
};

// flutter/keyboard: answers getKeyboardState so the framework can sync its
// pressed-key set on startup.
class KeyboardPlugin final : public Plugin {
public:
    static constexpr std::string_view kChannelName = "flutter/keyboard";

    explicit KeyboardPlugin(std::shared_ptr<KeyboardStateProvider> provider);

    [[nodiscard]] auto pluginName() const -> std::string_view override { return "keyboard"; }
    auto attach(BinaryMessenger& messenger) -> Expected<void> override;
    auto detach() -> void override;

private:
    std::shared_ptr<KeyboardStateProvider> provider;
    std::shared_ptr<std::mutex>            providerMutex;
    std::optional<MethodChannel>           channel;
};

} // namespace PB
