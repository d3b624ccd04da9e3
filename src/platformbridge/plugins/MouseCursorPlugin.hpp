#pragma once
#include "channel/MethodChannel.hpp"
#include "plugins/Plugin.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace PB {

// Kept in sync with the framework's SystemMouseCursors constants.
enum class SystemMouseCursor {
    Alias,
    AllScroll,
    Basic,
    Cell,
    Click,
    ContextMenu,
    Copy,
    Disappearing,
    Forbidden,
    Grab,
    Grabbing,
    Help,
    Move,
    NoDrop,
    None,
    Precise,
    Progress,
    ResizeColumn,
    ResizeDown,
    ResizeDownLeft,
    ResizeDownRight,
    ResizeLeft,
    ResizeLeftRight,
    ResizeRight,
    ResizeRow,
    ResizeUp,
    ResizeUpDown,
    ResizeUpLeft,
    ResizeUpLeftDownRight,
    ResizeUpRight,
    ResizeUpRightDownLeft,
    Text,
    VerticalText,
    Wait,
    ZoomIn,
    ZoomOut
};

// camelCase name as sent by the framework, e.g. "resizeUpLeft".
[[nodiscard]] auto systemMouseCursorName(SystemMouseCursor cursor) -> std::string_view;
[[nodiscard]] auto parseSystemMouseCursor(std::string_view name) -> std::optional<SystemMouseCursor>;

class MouseCursorHandler {
public:
    virtual ~MouseCursorHandler() = default;

    virtual auto activateSystemCursor(SystemMouseCursor cursor) -> Expected<void> = 0;
};

// flutter/mousecursor: activateSystemCursor {kind: String}.
class MouseCursorPlugin final : public Plugin {
public:
    static constexpr std::string_view kChannelName = "flutter/mousecursor";

    explicit MouseCursorPlugin(std::shared_ptr<MouseCursorHandler> handler);

    [[nodiscard]] auto pluginName() const -> std::string_view override { return "mousecursor"; }
    auto attach(BinaryMessenger& messenger) -> Expected<void> override;
    auto detach() -> void override;

private:
    std::shared_ptr<MouseCursorHandler> handler;
    std::shared_ptr<std::mutex>         handlerMutex;
    std::optional<MethodChannel>        channel;
};

} // namespace PB
