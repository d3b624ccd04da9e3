#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace PB {

struct BridgeOptions {
    // Threads in the engine instance's worker pool. Handlers that block hand
    // their work to this pool and answer from there.
    std::size_t workerThreads{2};
    // Send NotImplemented when the last copy of an unanswered response handle
    // is destroyed. Off by default: the engine may already be shutting down.
    bool replyOnDroppedResponse{false};
    bool logging{false};
};

// Parses 1/true/yes/on and 0/false/no/off, ignoring case and whitespace.
[[nodiscard]] auto parseFlag(std::string_view raw) -> std::optional<bool>;

// Defaults overridden by PLATFORMBRIDGE_WORKERS, PLATFORMBRIDGE_REPLY_ON_DROP
// and PLATFORMBRIDGE_LOG.
[[nodiscard]] auto loadBridgeOptions(BridgeOptions defaults = {}) -> BridgeOptions;

} // namespace PB
