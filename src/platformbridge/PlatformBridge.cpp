#include "PlatformBridge.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>

namespace PB {
namespace {

auto answer_unhandled(ResponseHandle& response) -> void {
    if (response.hasResponded()) {
        return;
    }
    if (auto sent = response.respondNotImplemented(); !sent) {
        pb_log("NotImplemented reply failed: " + describeError(sent.error()), "PlatformBridge", "ERROR");
    }
}

} // namespace

PlatformBridge::PlatformBridge(PBEngineOutbound outbound, BridgeOptions options)
    : bridgeOptions(options),
      link(std::make_shared<EngineLink>(outbound, options.replyOnDroppedResponse)),
      pool(options.workerThreads) {
#ifdef PB_LOG_DEBUG
    if (options.logging) {
        set_logging_enabled(true);
    }
#endif
    pb_log("PlatformBridge created with workers=" + std::to_string(this->pool.size()), "PlatformBridge");
}

PlatformBridge::~PlatformBridge() {
    this->shutdown();
}

auto PlatformBridge::handlePlatformMessage(std::string_view channel,
                                           BytesView        payload,
                                           PBResponseToken const* token) noexcept -> void {
    try {
        ResponseHandle response = token != nullptr ? ResponseHandle{token, this->link} : ResponseHandle{};

        auto handler = this->channels.find(channel);
        if (!handler) {
            pb_log("No handler for channel " + std::string(channel), "PlatformBridge");
            answer_unhandled(response);
            return;
        }

        try {
            handler->handleMessage(PlatformMessage{channel, payload, response});
        } catch (std::exception const& error) {
            pb_log("Handler for " + std::string(channel) + " threw: " + error.what(), "PlatformBridge", "ERROR");
            answer_unhandled(response);
        } catch (...) {
            pb_log("Handler for " + std::string(channel) + " threw a non-standard exception", "PlatformBridge", "ERROR");
            answer_unhandled(response);
        }
    } catch (std::exception const& error) {
        // Only allocation failures get here; nothing may unwind into the engine.
        pb_log(std::string("PlatformBridge::handlePlatformMessage failed: ") + error.what(), "PlatformBridge", "ERROR");
    }
}

auto PlatformBridge::deliverReply(std::uint64_t correlationId, BytesView data) noexcept -> bool {
    try {
        auto delivered = this->link->deliverReply(correlationId, data);
        if (!delivered) {
            pb_log("Reply for unknown correlation id " + std::to_string(correlationId), "PlatformBridge");
        }
        return delivered;
    } catch (std::exception const& error) {
        pb_log(std::string("Reply continuation threw: ") + error.what(), "PlatformBridge", "ERROR");
        return true;
    }
}

auto PlatformBridge::send(std::string_view channel, BytesView message, BinaryReply reply) -> Expected<void> {
    if (channel.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Channel name must not be empty"});
    }
    return this->link->sendMessage(channel, message, std::move(reply));
}

auto PlatformBridge::setMessageHandler(std::string const& channel, std::shared_ptr<BinaryMessageHandler> handler)
        -> Expected<void> {
    if (!handler) {
        this->channels.removePlugin(channel);
        return {};
    }
    return this->channels.addPlugin(channel, std::move(handler));
}

auto PlatformBridge::addPlugin(std::string const& name, std::shared_ptr<BinaryMessageHandler> handler)
        -> Expected<void> {
    return this->channels.addPlugin(name, std::move(handler));
}

auto PlatformBridge::removePlugin(std::string const& name) -> bool {
    return this->channels.removePlugin(name);
}

auto PlatformBridge::registerPlugin(std::unique_ptr<Plugin> plugin) -> Expected<void> {
    if (!plugin) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Plugin must not be null"});
    }
    {
        std::lock_guard<std::mutex> lock(this->pluginsMutex);
        if (this->stopped) {
            return std::unexpected(Error{Error::Code::ChannelClosed, "Bridge is shut down"});
        }
    }
    if (auto attached = plugin->attach(*this); !attached) {
        pb_log("Plugin " + std::string(plugin->pluginName()) + " failed to attach: " + describeError(attached.error()),
               "PlatformBridge",
               "ERROR");
        return attached;
    }
    {
        std::lock_guard<std::mutex> lock(this->pluginsMutex);
        if (!this->stopped) {
            pb_log("Plugin attached: " + std::string(plugin->pluginName()), "PlatformBridge");
            this->plugins.push_back(std::move(plugin));
            return {};
        }
    }
    // shutdown() ran during attach; the plugin's channels must not outlive it.
    pb_log("Plugin " + std::string(plugin->pluginName()) + " attached during shutdown", "PlatformBridge", "ERROR");
    plugin->detach();
    return std::unexpected(Error{Error::Code::ChannelClosed, "Bridge shut down during attach"});
}

auto PlatformBridge::shutdown() -> void {
    std::vector<std::unique_ptr<Plugin>> detaching;
    {
        std::lock_guard<std::mutex> lock(this->pluginsMutex);
        if (this->stopped) {
            return;
        }
        this->stopped = true;
        detaching.swap(this->plugins);
    }
    pb_log("PlatformBridge::shutdown", "PlatformBridge");

    // Queued work may still answer the engine.
    this->pool.shutdown();
    for (auto it = detaching.rbegin(); it != detaching.rend(); ++it) {
        (*it)->detach();
    }
    this->link->close();
    this->channels.clear();
    while (!detaching.empty()) {
        detaching.pop_back();
    }
}

auto PlatformBridge::droppedResponseCount() const -> size_t {
    return this->link->droppedResponses();
}

auto PlatformBridge::pendingReplyCount() const -> size_t {
    return this->link->pendingReplies();
}

auto PlatformBridge::pluginCount() const -> size_t {
    std::lock_guard<std::mutex> lock(this->pluginsMutex);
    return this->plugins.size();
}

} // namespace PB
