#include "FakeEngine.hpp"
#include "PlatformBridge.hpp"
#include "codec/JsonCodec.hpp"
#include "plugins/LocalizationPlugin.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>

using namespace PB;
using PB::Test::FakeEngine;
using PB::Test::toBytes;

namespace {

auto parsed(std::string_view tag) -> LocaleParts {
    auto locale = parseLocale(tag);
    REQUIRE(locale.has_value());
    return *locale;
}

} // namespace

TEST_SUITE("plugins.localization") {
    TEST_CASE("parseLocale") {
        CHECK(parsed("en") == LocaleParts{"en", "", "", ""});
        CHECK(parsed("en-US") == LocaleParts{"en", "", "US", ""});
        CHECK(parsed("de_DE") == LocaleParts{"de", "", "DE", ""});
        CHECK(parsed("en-Latn-US") == LocaleParts{"en", "Latn", "US", ""});
        CHECK(parsed("ZH_hant_tw") == LocaleParts{"zh", "Hant", "TW", ""});
        CHECK(parsed("es-419") == LocaleParts{"es", "", "419", ""});
        CHECK(parsed("sl-IT-nedis") == LocaleParts{"sl", "", "IT", "nedis"});
        CHECK(parsed("de-DE-1996") == LocaleParts{"de", "", "DE", "1996"});
        CHECK(parsed("en-US-x-private") == LocaleParts{"en", "", "US", ""});

        for (auto bad : {"", "e", "en-", "-US", "12-US", "en--US", "toolonglanguage"}) {
            CAPTURE(bad);
            auto locale = parseLocale(bad);
            REQUIRE_FALSE(locale.has_value());
            CHECK(locale.error().code == Error::Code::InvalidArgument);
        }
    }

    TEST_CASE("sendLocale invokes setLocale") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           owned  = std::make_unique<LocalizationPlugin>();
        auto*          plugin = owned.get();
        REQUIRE(bridge.registerPlugin(std::move(owned)).has_value());

        REQUIRE(plugin->sendLocale("en_US").has_value());
        auto message = engine.lastMessage();
        REQUIRE(message.has_value());
        CHECK(message->channel == LocalizationPlugin::kChannelName);
        CHECK(message->correlationId == 0);
        // No script: the framework gets no languages at all.
        CHECK(message->bytes == toBytes(R"({"args":[],"method":"setLocale"})"));

        REQUIRE(plugin->sendLocale("sr-Latn-RS").has_value());
        CHECK(engine.lastMessage()->bytes == toBytes(R"({"args":["sr","RS","Latn",""],"method":"setLocale"})"));

        REQUIRE(plugin->sendLocale("zh-Hant").has_value());
        CHECK(engine.lastMessage()->bytes == toBytes(R"({"args":[],"method":"setLocale"})"));

        REQUIRE(plugin->sendLocale("de-Latn-DE-1996").has_value());
        CHECK(engine.lastMessage()->bytes == toBytes(R"({"args":["de","DE","Latn","1996"],"method":"setLocale"})"));

        auto bad = plugin->sendLocale("not a locale");
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::InvalidArgument);
        CHECK(engine.messages().size() == 4);
    }

    TEST_CASE("Inbound calls are not implemented") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(bridge.registerPlugin(std::make_unique<LocalizationPlugin>()).has_value());

        auto request = toBytes(R"({"method":"getLocale","args":null})");
        bridge.handlePlatformMessage(LocalizationPlugin::kChannelName, request, engine.token(0));
        REQUIRE(engine.responseCount() == 1);
        CHECK(engine.responses()[0].bytes.empty());
    }

    TEST_CASE("sendLocale needs an attached plugin") {
        LocalizationPlugin plugin;
        auto               sent = plugin.sendLocale("en-US");
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code == Error::Code::ChannelClosed);

        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(plugin.attach(bridge).has_value());
        plugin.detach();
        auto after = plugin.sendLocale("en-US");
        REQUIRE_FALSE(after.has_value());
        CHECK(after.error().code == Error::Code::ChannelClosed);
    }
}
