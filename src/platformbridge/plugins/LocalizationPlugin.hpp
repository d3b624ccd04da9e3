#pragma once
#include "channel/MethodChannel.hpp"
#include "plugins/Plugin.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace PB {

// Parts of a BCP 47 language tag. Absent parts are empty.
struct LocaleParts {
    std::string language;
    std::string script;
    std::string region;
    std::string variant;

    bool operator==(LocaleParts const&) const = default;
};

// Accepts "-" or "_" separators, e.g. "en-Latn-US" or "de_DE".
[[nodiscard]] auto parseLocale(std::string_view tag) -> Expected<LocaleParts>;

// flutter/localization (JSON method codec). Pushes the host locale to the
// framework; inbound calls are not implemented.
class LocalizationPlugin final : public Plugin {
public:
    static constexpr std::string_view kChannelName = "flutter/localization";

    [[nodiscard]] auto pluginName() const -> std::string_view override { return "localization"; }
    auto attach(BinaryMessenger& messenger) -> Expected<void> override;
    auto detach() -> void override;

    // Invokes setLocale with [language, country, script, variant], or with an
    // empty list when the tag has no region or no script.
    auto sendLocale(std::string_view tag) -> Expected<void>;

private:
    std::optional<MethodChannel> channel;
};

} // namespace PB
