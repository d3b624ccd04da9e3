#include "registry/ChannelRegistry.hpp"
#include "log/TaggedLogger.hpp"

#include <mutex>

namespace PB {

auto ChannelRegistry::addPlugin(std::string const& name, std::shared_ptr<BinaryMessageHandler> handler)
        -> Expected<void> {
    if (name.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Channel name must not be empty"});
    }
    if (!handler) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Handler must not be null for " + name});
    }
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex_);
        auto [it, inserted] = this->handlers_.try_emplace(name, handler);
        if (!inserted) {
            // The previous handler is released with the parameter, after unlocking.
            it->second.swap(handler);
            replaced = true;
        }
    }
    if (replaced) {
        pb_log("ChannelRegistry::addPlugin replaced handler for " + name, "ChannelRegistry");
    } else {
        pb_log("ChannelRegistry::addPlugin registered " + name, "ChannelRegistry");
    }
    return {};
}

auto ChannelRegistry::removePlugin(std::string const& name) -> bool {
    std::shared_ptr<BinaryMessageHandler> removed;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex_);
        auto it = this->handlers_.find(name);
        if (it == this->handlers_.end()) {
            return false;
        }
        // Released outside the lock; a handler destructor may call back into the registry.
        removed = std::move(it->second);
        this->handlers_.erase(it);
    }
    pb_log("ChannelRegistry::removePlugin " + name, "ChannelRegistry");
    return true;
}

auto ChannelRegistry::find(std::string_view name) const -> std::shared_ptr<BinaryMessageHandler> {
    std::shared_lock<std::shared_mutex> lock(this->mutex_);
    auto it = this->handlers_.find(name);
    if (it == this->handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

auto ChannelRegistry::contains(std::string_view name) const -> bool {
    std::shared_lock<std::shared_mutex> lock(this->mutex_);
    return this->handlers_.find(name) != this->handlers_.end();
}

auto ChannelRegistry::names() const -> std::vector<std::string> {
    std::shared_lock<std::shared_mutex> lock(this->mutex_);
    std::vector<std::string> result;
    result.reserve(this->handlers_.size());
    for (auto const& [name, handler] : this->handlers_) {
        result.push_back(name);
    }
    return result;
}

auto ChannelRegistry::size() const -> size_t {
    std::shared_lock<std::shared_mutex> lock(this->mutex_);
    return this->handlers_.size();
}

auto ChannelRegistry::clear() -> void {
    std::unordered_map<std::string, std::shared_ptr<BinaryMessageHandler>, NameHash, std::equal_to<>> removed;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex_);
        removed.swap(this->handlers_);
    }
    pb_log("ChannelRegistry::clear removed " + std::to_string(removed.size()) + " handlers", "ChannelRegistry");
}

} // namespace PB
