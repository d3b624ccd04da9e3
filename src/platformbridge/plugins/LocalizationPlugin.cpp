#include "plugins/LocalizationPlugin.hpp"
#include "codec/JsonCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace PB {
namespace {

template <typename Predicate>
auto all_of_chars(std::string_view text, Predicate predicate) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [&](char c) {
               return predicate(static_cast<unsigned char>(c)) != 0;
           });
}

auto alpha(unsigned char c) -> int {
    return std::isalpha(c);
}

auto digit(unsigned char c) -> int {
    return std::isdigit(c);
}

auto alnum(unsigned char c) -> int {
    return std::isalnum(c);
}

auto is_language(std::string_view part) -> bool {
    auto const size = part.size();
    return ((size >= 2 && size <= 3) || (size >= 5 && size <= 8)) && all_of_chars(part, alpha);
}

auto is_script(std::string_view part) -> bool {
    return part.size() == 4 && all_of_chars(part, alpha);
}

auto is_region(std::string_view part) -> bool {
    return (part.size() == 2 && all_of_chars(part, alpha)) || (part.size() == 3 && all_of_chars(part, digit));
}

auto is_variant(std::string_view part) -> bool {
    if (!all_of_chars(part, alnum)) {
        return false;
    }
    return (part.size() >= 5 && part.size() <= 8) || (part.size() == 4 && digit(static_cast<unsigned char>(part.front())) != 0);
}

auto lower(std::string_view part) -> std::string {
    std::string out(part);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto upper(std::string_view part) -> std::string {
    std::string out(part);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto title(std::string_view part) -> std::string {
    auto out = lower(part);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    }
    return out;
}

auto split_tag(std::string_view tag) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    size_t                        start = 0;
    while (start <= tag.size()) {
        auto end = tag.find_first_of("-_", start);
        if (end == std::string_view::npos) {
            end = tag.size();
        }
        parts.push_back(tag.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

} // namespace

auto parseLocale(std::string_view tag) -> Expected<LocaleParts> {
    auto const parts = split_tag(tag);
    size_t     index = 0;
    if (parts.empty() || !is_language(parts[0])) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Invalid locale: " + std::string(tag)});
    }
    LocaleParts locale;
    locale.language = lower(parts[index++]);
    if (index < parts.size() && is_script(parts[index])) {
        locale.script = title(parts[index++]);
    }
    if (index < parts.size() && is_region(parts[index])) {
        locale.region = upper(parts[index++]);
    }
    if (index < parts.size() && is_variant(parts[index])) {
        locale.variant = lower(parts[index++]);
    }
    // Further variants and extensions are not forwarded.
    while (index < parts.size()) {
        if (parts[index].empty()) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "Invalid locale: " + std::string(tag)});
        }
        ++index;
    }
    return locale;
}

auto LocalizationPlugin::attach(BinaryMessenger& messenger) -> Expected<void> {
    this->channel.emplace(messenger, std::string(kChannelName), JsonMethodCodec::instance());
    return this->channel->setMethodCallHandler([](MethodCall const& call, MethodResponder responder) {
        pb_log("localization method call " + call.method, "localization");
        if (auto sent = responder.notImplemented(); !sent) {
            pb_log("localization reply failed: " + describeError(sent.error()), "localization", "ERROR");
        }
    });
}

auto LocalizationPlugin::detach() -> void {
    if (!this->channel) {
        return;
    }
    if (auto removed = this->channel->setMethodCallHandler(nullptr); !removed) {
        pb_log("localization detach failed: " + describeError(removed.error()), "localization", "ERROR");
    }
    this->channel.reset();
}

auto LocalizationPlugin::sendLocale(std::string_view tag) -> Expected<void> {
    if (!this->channel) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Localization plugin is not attached"});
    }
    auto locale = parseLocale(tag);
    if (!locale) {
        pb_log("Failed to parse locale " + std::string(tag), "localization", "ERROR");
        return std::unexpected(locale.error());
    }
    ValueList languages;
    if (locale->region.empty() || locale->script.empty()) {
        pb_log("Locale " + std::string(tag) + " lacks a region or script, sending no languages", "localization");
    } else {
        pb_log("Sending locale " + std::string(tag), "localization");
        languages = {Value{locale->language}, Value{locale->region}, Value{locale->script}, Value{locale->variant}};
    }
    return this->channel->invokeMethod("setLocale", Value{std::move(languages)});
}

} // namespace PB
