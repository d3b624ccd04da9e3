#pragma once
#include "channel/BinaryMessenger.hpp"
#include "core/Error.hpp"

#include <string_view>

namespace PB {

// Desktop integration unit owned by a PlatformBridge. attach creates the
// plugin's channels on the messenger; detach unregisters them. The messenger
// outlives the plugin's attachment.
class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto pluginName() const -> std::string_view = 0;
    virtual auto attach(BinaryMessenger& messenger) -> Expected<void> = 0;
    virtual auto detach() -> void                                     = 0;
};

} // namespace PB
