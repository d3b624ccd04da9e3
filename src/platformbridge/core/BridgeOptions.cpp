#include "core/BridgeOptions.hpp"
#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace PB {
namespace {

constexpr std::size_t kMaxWorkerThreads = 64;

[[nodiscard]] auto normalize_flag(std::string_view raw) -> std::string {
    std::string normalized;
    normalized.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

[[nodiscard]] auto parse_count(std::string_view raw) -> std::optional<std::size_t> {
    auto normalized = normalize_flag(raw);
    if (normalized.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    auto const* first = normalized.data();
    auto const* last  = normalized.data() + normalized.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto parseFlag(std::string_view raw) -> std::optional<bool> {
    auto normalized = normalize_flag(raw);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

auto loadBridgeOptions(BridgeOptions defaults) -> BridgeOptions {
    BridgeOptions options = defaults;
    if (auto* raw = std::getenv("PLATFORMBRIDGE_WORKERS")) {
        if (auto count = parse_count(raw); count.has_value() && *count <= kMaxWorkerThreads) {
            options.workerThreads = *count;
        } else {
            pb_log("Ignoring invalid PLATFORMBRIDGE_WORKERS value: " + std::string(raw), "BridgeOptions", "ERROR");
        }
    }
    if (auto* raw = std::getenv("PLATFORMBRIDGE_REPLY_ON_DROP")) {
        if (auto flag = parseFlag(raw)) {
            options.replyOnDroppedResponse = *flag;
        }
    }
    if (auto* raw = std::getenv("PLATFORMBRIDGE_LOG")) {
        if (auto flag = parseFlag(raw)) {
            options.logging = *flag;
        }
    }
    return options;
}

} // namespace PB
