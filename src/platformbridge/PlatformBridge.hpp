#pragma once
#include "EngineLink.hpp"
#include "channel/BinaryMessenger.hpp"
#include "core/BridgeOptions.hpp"
#include "core/Error.hpp"
#include "ffi/EmbedderApi.h"
#include "plugins/Plugin.hpp"
#include "registry/ChannelRegistry.hpp"
#include "task/TaskPool.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace PB {

/*
 * One engine instance as seen from native code.
 *
 * Inbound platform messages arrive through handlePlatformMessage (usually via
 * PBPlatformMessageCallback with this object as user_data), are routed by
 * channel name through the registry and answered through a ResponseHandle.
 * As a BinaryMessenger it also sends native-initiated messages and routes the
 * engine's replies back by correlation id.
 *
 * Destruction drains the worker pool, detaches plugins in reverse order and
 * fails every pending reply with ChannelClosed.
 */
class PlatformBridge final : public BinaryMessenger {
public:
    explicit PlatformBridge(PBEngineOutbound outbound, BridgeOptions options = {});
    ~PlatformBridge() override;

    PlatformBridge(PlatformBridge const&)            = delete;
    PlatformBridge& operator=(PlatformBridge const&) = delete;

    // Never throws; handler exceptions are turned into a NotImplemented reply.
    auto handlePlatformMessage(std::string_view channel, BytesView payload, PBResponseToken const* token) noexcept
            -> void;
    // False when the id is unknown or already answered.
    auto deliverReply(std::uint64_t correlationId, BytesView data) noexcept -> bool;

    auto send(std::string_view channel, BytesView message, BinaryReply reply = {}) -> Expected<void> override;
    auto setMessageHandler(std::string const& channel, std::shared_ptr<BinaryMessageHandler> handler)
            -> Expected<void> override;

    auto addPlugin(std::string const& name, std::shared_ptr<BinaryMessageHandler> handler) -> Expected<void>;
    auto removePlugin(std::string const& name) -> bool;
    // Attaches plugin and takes ownership. Nothing is kept when attach fails.
    auto registerPlugin(std::unique_ptr<Plugin> plugin) -> Expected<void>;

    // Idempotent; also run by the destructor.
    auto shutdown() -> void;

    [[nodiscard]] auto registry() -> ChannelRegistry& { return this->channels; }
    [[nodiscard]] auto workers() -> TaskPool& { return this->pool; }
    [[nodiscard]] auto options() const -> BridgeOptions const& { return this->bridgeOptions; }
    [[nodiscard]] auto droppedResponseCount() const -> size_t;
    [[nodiscard]] auto pendingReplyCount() const -> size_t;
    [[nodiscard]] auto pluginCount() const -> size_t;

private:
    BridgeOptions const         bridgeOptions;
    std::shared_ptr<EngineLink> link;
    ChannelRegistry             channels;
    TaskPool                    pool;

    mutable std::mutex                   pluginsMutex;
    std::vector<std::unique_ptr<Plugin>> plugins;
    bool                                 stopped{false};
};

} // namespace PB
