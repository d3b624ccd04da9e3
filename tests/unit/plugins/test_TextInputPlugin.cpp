#include "FakeEngine.hpp"
#include "PlatformBridge.hpp"
#include "codec/JsonCodec.hpp"
#include "plugins/TextInputPlugin.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>

using namespace PB;
using PB::Test::FakeEngine;
using PB::Test::toBytes;

namespace {

// U+1F600, two UTF-16 code units.
constexpr char const* kGrin = "\xF0\x9F\x98\x80";

struct RecordingKeyboard final : TextInputHandler {
    auto show() -> void override { ++shown; }
    auto hide() -> void override { ++hidden; }

    int shown  = 0;
    int hidden = 0;
};

auto state_from(std::string const& json) -> Expected<TextEditingState> {
    return TextEditingState::fromValue(jsonToValue(Json::parse(json)));
}

auto set_client_call(std::string const& inputType, std::string const& inputAction) -> std::string {
    return R"({"method":"TextInput.setClient","args":[7,{"autocorrect":true,"inputAction":")" + inputAction
           + R"(","obscureText":false,"keyboardAppearance":"Brightness.light",)"
           + R"("textCapitalization":"TextCapitalization.none","inputType":{"name":")" + inputType
           + R"(","signed":null,"decimal":null}}]})";
}

// Sends one call on the text input channel and returns the reply bytes.
auto dispatch(PlatformBridge& bridge, FakeEngine& engine, std::string const& json) -> Bytes {
    auto const slot    = engine.responseCount();
    auto       request = toBytes(json);
    bridge.handlePlatformMessage(TextInputPlugin::kChannelName, request, engine.token(slot));
    auto responses = engine.responses();
    REQUIRE(responses.size() == slot + 1);
    return responses.back().bytes;
}

} // namespace

TEST_SUITE("plugins.textinput") {
    TEST_CASE("UTF-16 offsets over UTF-8 text") {
        std::string const text = std::string("a") + kGrin + "b";
        CHECK(utf16Length("") == 0);
        CHECK(utf16Length("h\xC3\xA9llo") == 5);
        CHECK(utf16Length(text) == 4);

        CHECK(utf8OffsetOfUtf16(text, 0) == 0);
        CHECK(utf8OffsetOfUtf16(text, 1) == 1);
        CHECK(utf8OffsetOfUtf16(text, 2) == 5);
        CHECK(utf8OffsetOfUtf16(text, 3) == 5);
        CHECK(utf8OffsetOfUtf16(text, 4) == 6);
        CHECK(utf8OffsetOfUtf16(text, 40) == 6);
        CHECK(utf8OffsetOfUtf16(text, -1) == 0);
    }

    TEST_CASE("Editing state from framework values") {
        auto state = state_from(R"({"text":"hello","selectionBase":1,"selectionExtent":3,)"
                                R"("selectionAffinity":"TextAffinity.upstream","selectionIsDirectional":true,)"
                                R"("composingBase":-1,"composingExtent":-1})");
        REQUIRE(state.has_value());
        CHECK(state->text == "hello");
        CHECK(state->selectionBase == 1);
        CHECK(state->selectionExtent == 3);
        CHECK(state->selectionAffinity == "TextAffinity.upstream");
        CHECK(state->selectionIsDirectional);
        CHECK(TextEditingState::fromValue(state->toValue()) == *state);

        auto sparse = state_from(R"({"text":"x"})");
        REQUIRE(sparse.has_value());
        CHECK(sparse->selectionBase == -1);
        CHECK(sparse->selectionAffinity == "TextAffinity.downstream");

        for (auto bad : {R"({"selectionBase":0})", R"({"text":"x","selectionBase":"0"})", R"(["x"])"}) {
            CAPTURE(bad);
            auto parsed = state_from(bad);
            REQUIRE_FALSE(parsed.has_value());
            CHECK(parsed.error().code == Error::Code::InvalidArgument);
        }
    }

    TEST_CASE("addCharacters replaces the selection") {
        TextEditingState state;
        state.text            = "hello";
        state.selectionBase   = 3;
        state.selectionExtent = 1;
        state.composingBase   = 0;
        state.composingExtent = 5;
        state.addCharacters("EY");
        CHECK(state.text == "hEYlo");
        CHECK(state.selectionBase == 3);
        CHECK(state.selectionExtent == 3);
        CHECK(state.composingBase == -1);
        CHECK(state.composingExtent == -1);

        SUBCASE("After a surrogate pair") {
            state.text          = std::string("a") + kGrin + "b";
            state.selectionBase = state.selectionExtent = 3;
            state.addCharacters("\n");
            CHECK(state.text == std::string("a") + kGrin + "\nb");
            CHECK(state.selectionBase == 4);
        }

        SUBCASE("Without a selection") {
            state.selectionBase = state.selectionExtent = -1;
            state.addCharacters("!");
            CHECK(state.text == "hEYlo!");
            CHECK(state.selectionBase == 6);
        }
    }

    TEST_CASE("Client configuration") {
        auto config = TextInputClientConfig::fromValue(jsonToValue(Json::parse(
                R"({"inputAction":"TextInputAction.newline","actionLabel":"Go",)"
                R"("inputType":{"name":"TextInputType.multiline","signed":true}})")));
        REQUIRE(config.has_value());
        CHECK(config->isMultilineNewline());
        CHECK(config->autocorrect);
        CHECK(config->actionLabel == std::optional<std::string>{"Go"});
        CHECK(config->inputTypeSigned == std::optional<bool>{true});
        CHECK_FALSE(config->inputTypeDecimal.has_value());

        auto missing = TextInputClientConfig::fromValue(jsonToValue(Json::parse(R"({"inputAction":"TextInputAction.done"})")));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Inbound calls") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           keyboard = std::make_shared<RecordingKeyboard>();
        auto           owned    = std::make_unique<TextInputPlugin>(keyboard);
        auto*          plugin   = owned.get();
        REQUIRE(bridge.registerPlugin(std::move(owned)).has_value());

        CHECK(dispatch(bridge, engine, set_client_call("TextInputType.text", "TextInputAction.done")) == toBytes("[null]"));
        CHECK(plugin->clientId() == std::optional<std::int64_t>{7});

        CHECK(dispatch(bridge, engine, R"({"method":"TextInput.setEditingState","args":{"text":"hi","selectionBase":2,"selectionExtent":2}})")
              == toBytes("[null]"));
        REQUIRE(plugin->editingState().has_value());
        CHECK(plugin->editingState()->text == "hi");

        CHECK(dispatch(bridge, engine, R"({"method":"TextInput.show","args":null})") == toBytes("[null]"));
        CHECK(dispatch(bridge, engine, R"({"method":"TextInput.hide","args":null})") == toBytes("[null]"));
        CHECK(keyboard->shown == 1);
        CHECK(keyboard->hidden == 1);

        CHECK(dispatch(bridge, engine, R"({"method":"TextInput.requestAutofill","args":null})").empty());

        CHECK(dispatch(bridge, engine, R"({"method":"TextInput.clearClient","args":null})") == toBytes("[null]"));
        CHECK_FALSE(plugin->clientId().has_value());
        CHECK_FALSE(plugin->editingState().has_value());
        CHECK(engine.messages().empty());
    }

    TEST_CASE("Malformed arguments get an error reply") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           owned  = std::make_unique<TextInputPlugin>(std::make_shared<RecordingKeyboard>());
        auto*          plugin = owned.get();
        REQUIRE(bridge.registerPlugin(std::move(owned)).has_value());

        for (auto bad : {R"({"method":"TextInput.setClient","args":[7]})",
                         R"({"method":"TextInput.setClient","args":["7",{}]})",
                         R"({"method":"TextInput.setEditingState","args":{"selectionBase":1}})"}) {
            CAPTURE(bad);
            auto reply = JsonMethodCodec::instance().decodeEnvelope(dispatch(bridge, engine, bad));
            REQUIRE(reply.has_value());
            auto const* error = std::get_if<MethodError>(&*reply);
            REQUIRE(error != nullptr);
            CHECK(error->code == "Bad Arguments");
        }
        CHECK_FALSE(plugin->clientId().has_value());
        CHECK_FALSE(plugin->editingState().has_value());
    }

    TEST_CASE("Outbound updates and actions") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        auto           owned  = std::make_unique<TextInputPlugin>(std::make_shared<RecordingKeyboard>());
        auto*          plugin = owned.get();
        REQUIRE(bridge.registerPlugin(std::move(owned)).has_value());

        SUBCASE("No client yet") {
            CHECK_FALSE(plugin->withState([](TextEditingState&) {}));
            CHECK(plugin->notifyChanges().has_value());
            auto action = plugin->performAction("done");
            REQUIRE_FALSE(action.has_value());
            CHECK(action.error().code == Error::Code::InvalidArgument);
            CHECK(engine.messages().empty());
        }

        SUBCASE("Single line") {
            dispatch(bridge, engine, set_client_call("TextInputType.text", "TextInputAction.done"));
            dispatch(bridge, engine, R"({"method":"TextInput.setEditingState","args":{"text":"hi","selectionBase":2,"selectionExtent":2}})");

            REQUIRE(plugin->performAction("search").has_value());
            auto message = engine.lastMessage();
            REQUIRE(message.has_value());
            CHECK(message->channel == TextInputPlugin::kChannelName);
            CHECK(message->correlationId == 0);
            CHECK(message->bytes == toBytes(R"({"args":[7,"TextInputAction.search"],"method":"TextInputClient.performAction"})"));

            CHECK(plugin->withState([](TextEditingState& state) { state.addCharacters("!"); }));
            REQUIRE(plugin->notifyChanges().has_value());
            CHECK(engine.lastMessage()->bytes
                  == toBytes(R"({"args":[7,{"composingBase":-1,"composingExtent":-1,)"
                             R"("selectionAffinity":"TextAffinity.downstream","selectionBase":3,"selectionExtent":3,)"
                             R"("selectionIsDirectional":false,"text":"hi!"}],"method":"TextInputClient.updateEditingState"})"));

            // Enter on a single line field only performs the configured action.
            REQUIRE(plugin->enterPressed().has_value());
            CHECK(engine.messages().size() == 3);
            CHECK(engine.lastMessage()->bytes == toBytes(R"({"args":[7,"TextInputAction.done"],"method":"TextInputClient.performAction"})"));
            CHECK(plugin->editingState()->text == "hi!");
        }

        SUBCASE("Multiline newline") {
            dispatch(bridge, engine, set_client_call("TextInputType.multiline", "TextInputAction.newline"));
            dispatch(bridge, engine, R"({"method":"TextInput.setEditingState","args":{"text":"ab","selectionBase":1,"selectionExtent":1}})");

            REQUIRE(plugin->enterPressed().has_value());
            auto messages = engine.messages();
            REQUIRE(messages.size() == 2);
            CHECK(messages[0].bytes
                  == toBytes(R"({"args":[7,{"composingBase":-1,"composingExtent":-1,)"
                             R"("selectionAffinity":"TextAffinity.downstream","selectionBase":2,"selectionExtent":2,)"
                             R"("selectionIsDirectional":false,"text":"a\nb"}],"method":"TextInputClient.updateEditingState"})"));
            CHECK(messages[1].bytes == toBytes(R"({"args":[7,"TextInputAction.newline"],"method":"TextInputClient.performAction"})"));
            CHECK(plugin->editingState()->text == "a\nb");
        }
    }

    TEST_CASE("Detached plugin refuses outbound calls") {
        TextInputPlugin plugin{std::make_shared<RecordingKeyboard>()};
        for (auto result : {plugin.performAction("done"), plugin.notifyChanges(), plugin.enterPressed()}) {
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::ChannelClosed);
        }

        FakeEngine      engine;
        PlatformBridge  bridge{engine.outbound()};
        TextInputPlugin unattachable{nullptr};
        auto            attached = unattachable.attach(bridge);
        REQUIRE_FALSE(attached.has_value());
        CHECK(attached.error().code == Error::Code::InvalidArgument);
    }
}
