#pragma once
#include "channel/BinaryMessenger.hpp"
#include "core/Error.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace PB {

// Channel name to handler table of one engine instance. Names are a flat key
// space. Lookups share the lock; registration takes it exclusively.
class ChannelRegistry {
public:
    ChannelRegistry() = default;

    ChannelRegistry(ChannelRegistry const&)            = delete;
    ChannelRegistry& operator=(ChannelRegistry const&) = delete;

    // Inserts or replaces. Dispatches already in flight keep the handler they found.
    auto addPlugin(std::string const& name, std::shared_ptr<BinaryMessageHandler> handler) -> Expected<void>;
    // False when nothing was registered under name.
    auto removePlugin(std::string const& name) -> bool;

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<BinaryMessageHandler>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> size_t;

    auto clear() -> void;

private:
    struct NameHash {
        using is_transparent = void;
        auto operator()(std::string_view name) const noexcept -> size_t {
            return std::hash<std::string_view>{}(name);
        }
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<BinaryMessageHandler>, NameHash, std::equal_to<>> handlers_;
};

} // namespace PB
