#include "FakeEngine.hpp"
#include "PlatformBridge.hpp"
#include "codec/StandardCodec.hpp"
#include "plugins/KeyboardPlugin.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>

using namespace PB;
using PB::Test::FakeEngine;

namespace {

struct FixedKeyboard final : KeyboardStateProvider {
    auto getKeyboardState() -> Expected<KeyboardState> override {
        ++calls;
        if (fail) {
            return std::unexpected(Error{Error::Code::UnknownError, "no seat"});
        }
        return state;
    }

    KeyboardState state;
    bool          fail  = false;
    int           calls = 0;
};

auto call(std::string const& method) -> Bytes {
    auto bytes = StandardMethodCodec::instance().encodeMethodCall(MethodCall{method, Value{}});
    REQUIRE(bytes.has_value());
    return *bytes;
}

auto only_reply(FakeEngine& engine) -> Expected<MethodResult> {
    auto responses = engine.responses();
    REQUIRE(responses.size() == 1);
    return StandardMethodCodec::instance().decodeEnvelope(responses[0].bytes);
}

} // namespace

TEST_SUITE("plugins.keyboard") {
    TEST_CASE("getKeyboardState reports pressed keys") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           keyboard = std::make_shared<FixedKeyboard>();
        keyboard->state         = {{0x70004, 0x61}, {0x700e1, 0x200000102}};
        REQUIRE(bridge.registerPlugin(std::make_unique<KeyboardPlugin>(keyboard)).has_value());
        CHECK(bridge.registry().contains(KeyboardPlugin::kChannelName));

        auto request = call("getKeyboardState");
        bridge.handlePlatformMessage(KeyboardPlugin::kChannelName, request, engine.token(0));

        auto result = only_reply(engine);
        REQUIRE(result.has_value());
        auto const* success = std::get_if<MethodSuccess>(&*result);
        REQUIRE(success != nullptr);
        ValueMap expected{{Value{std::int64_t{0x70004}}, Value{std::int64_t{0x61}}},
                          {Value{std::int64_t{0x700e1}}, Value{std::int64_t{0x200000102}}}};
        CHECK(success->value == Value{expected});
        CHECK(keyboard->calls == 1);
    }

    TEST_CASE("Provider failure becomes an error reply") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           keyboard = std::make_shared<FixedKeyboard>();
        keyboard->fail          = true;
        REQUIRE(bridge.registerPlugin(std::make_unique<KeyboardPlugin>(keyboard)).has_value());

        auto request = call("getKeyboardState");
        bridge.handlePlatformMessage(KeyboardPlugin::kChannelName, request, engine.token(0));

        auto result = only_reply(engine);
        REQUIRE(result.has_value());
        auto const* error = std::get_if<MethodError>(&*result);
        REQUIRE(error != nullptr);
        CHECK(error->code == "Get keyboard state failure");
        CHECK(error->message == std::optional<std::string>{"unknown_error:no seat"});
    }

    TEST_CASE("Other methods are not implemented") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(bridge.registerPlugin(std::make_unique<KeyboardPlugin>(std::make_shared<FixedKeyboard>())).has_value());

        auto request = call("setKeyboardState");
        bridge.handlePlatformMessage(KeyboardPlugin::kChannelName, request, engine.token(0));
        REQUIRE(engine.responseCount() == 1);
        CHECK(engine.responses()[0].bytes.empty());
    }

    TEST_CASE("Attach needs a provider and detach unregisters") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};

        KeyboardPlugin orphan{nullptr};
        auto           attached = orphan.attach(bridge);
        REQUIRE_FALSE(attached.has_value());
        CHECK(attached.error().code == Error::Code::InvalidArgument);
        CHECK_FALSE(bridge.registry().contains(KeyboardPlugin::kChannelName));

        KeyboardPlugin plugin{std::make_shared<FixedKeyboard>()};
        REQUIRE(plugin.attach(bridge).has_value());
        CHECK(bridge.registry().contains(KeyboardPlugin::kChannelName));
        plugin.detach();
        CHECK_FALSE(bridge.registry().contains(KeyboardPlugin::kChannelName));
        plugin.detach();
    }
}
