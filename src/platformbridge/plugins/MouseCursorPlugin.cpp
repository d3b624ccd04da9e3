#include "plugins/MouseCursorPlugin.hpp"
#include "codec/StandardCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <array>
#include <utility>

namespace PB {
namespace {

constexpr std::array<std::pair<SystemMouseCursor, std::string_view>, 36> kCursorNames{{
        {SystemMouseCursor::Alias, "alias"},
        {SystemMouseCursor::AllScroll, "allScroll"},
        {SystemMouseCursor::Basic, "basic"},
        {SystemMouseCursor::Cell, "cell"},
        {SystemMouseCursor::Click, "click"},
        {SystemMouseCursor::ContextMenu, "contextMenu"},
        {SystemMouseCursor::Copy, "copy"},
        {SystemMouseCursor::Disappearing, "disappearing"},
        {SystemMouseCursor::Forbidden, "forbidden"},
        {SystemMouseCursor::Grab, "grab"},
        {SystemMouseCursor::Grabbing, "grabbing"},
        {SystemMouseCursor::Help, "help"},
        {SystemMouseCursor::Move, "move"},
        {SystemMouseCursor::NoDrop, "noDrop"},
        {SystemMouseCursor::None, "none"},
        {SystemMouseCursor::Precise, "precise"},
        {SystemMouseCursor::Progress, "progress"},
        {SystemMouseCursor::ResizeColumn, "resizeColumn"},
        {SystemMouseCursor::ResizeDown, "resizeDown"},
        {SystemMouseCursor::ResizeDownLeft, "resizeDownLeft"},
        {SystemMouseCursor::ResizeDownRight, "resizeDownRight"},
        {SystemMouseCursor::ResizeLeft, "resizeLeft"},
        {SystemMouseCursor::ResizeLeftRight, "resizeLeftRight"},
        {SystemMouseCursor::ResizeRight, "resizeRight"},
        {SystemMouseCursor::ResizeRow, "resizeRow"},
        {SystemMouseCursor::ResizeUp, "resizeUp"},
        {SystemMouseCursor::ResizeUpDown, "resizeUpDown"},
        {SystemMouseCursor::ResizeUpLeft, "resizeUpLeft"},
        {SystemMouseCursor::ResizeUpLeftDownRight, "resizeUpLeftDownRight"},
        {SystemMouseCursor::ResizeUpRight, "resizeUpRight"},
        {SystemMouseCursor::ResizeUpRightDownLeft, "resizeUpRightDownLeft"},
        {SystemMouseCursor::Text, "text"},
        {SystemMouseCursor::VerticalText, "verticalText"},
        {SystemMouseCursor::Wait, "wait"},
        {SystemMouseCursor::ZoomIn, "zoomIn"},
        {SystemMouseCursor::ZoomOut, "zoomOut"},
}};

auto requested_cursor(Value const& arguments) -> std::optional<SystemMouseCursor> {
    auto const* kind = arguments.lookup("kind");
    if (kind == nullptr) {
        return std::nullopt;
    }
    auto const* name = kind->get_if<std::string>();
    if (name == nullptr) {
        return std::nullopt;
    }
    return parseSystemMouseCursor(*name);
}

} // namespace

auto systemMouseCursorName(SystemMouseCursor cursor) -> std::string_view {
    for (auto const& [value, name] : kCursorNames) {
        if (value == cursor) {
            return name;
        }
    }
    return "basic";
}

auto parseSystemMouseCursor(std::string_view name) -> std::optional<SystemMouseCursor> {
    for (auto const& [value, cursorName] : kCursorNames) {
        if (cursorName == name) {
            return value;
        }
    }
    return std::nullopt;
}

MouseCursorPlugin::MouseCursorPlugin(std::shared_ptr<MouseCursorHandler> handler)
    : handler(std::move(handler)), handlerMutex(std::make_shared<std::mutex>()) {}

auto MouseCursorPlugin::attach(BinaryMessenger& messenger) -> Expected<void> {
    if (!this->handler) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Mouse cursor plugin needs a handler"});
    }
    this->channel.emplace(messenger, std::string(kChannelName), StandardMethodCodec::instance());
    auto handler = this->handler;
    auto mutex   = this->handlerMutex;
    return this->channel->setMethodCallHandler([handler, mutex](MethodCall const& call, MethodResponder responder) {
        pb_log("mousecursor method call " + call.method, "mousecursor");
        Expected<void> sent{};
        if (call.method == "activateSystemCursor") {
            auto cursor = requested_cursor(call.arguments);
            if (!cursor) {
                sent = responder.error("unknown-data", "Unknown data type");
            } else {
                Expected<void> activated = [&] {
                    std::lock_guard<std::mutex> lock(*mutex);
                    return handler->activateSystemCursor(*cursor);
                }();
                sent = activated ? responder.success() : responder.error("unknown-data", "Unknown data type");
            }
        } else {
            sent = responder.notImplemented();
        }
        if (!sent) {
            pb_log("mousecursor reply failed: " + describeError(sent.error()), "mousecursor", "ERROR");
        }
    });
}

auto MouseCursorPlugin::detach() -> void {
    if (!this->channel) {
        return;
    }
    if (auto removed = this->channel->setMethodCallHandler(nullptr); !removed) {
        pb_log("mousecursor detach failed: " + describeError(removed.error()), "mousecursor", "ERROR");
    }
    this->channel.reset();
}

} // namespace PB
