#include "FakeEngine.hpp"
#include "PlatformBridge.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PB;
using PB::Test::FakeEngine;
using PB::Test::toBytes;

namespace {

struct LambdaHandler final : BinaryMessageHandler {
    explicit LambdaHandler(std::function<void(PlatformMessage const&)> fn) : fn(std::move(fn)) {}
    auto handleMessage(PlatformMessage const& message) -> void override { this->fn(message); }
    std::function<void(PlatformMessage const&)> fn;
};

auto handler(std::function<void(PlatformMessage const&)> fn) -> std::shared_ptr<BinaryMessageHandler> {
    return std::make_shared<LambdaHandler>(std::move(fn));
}

auto echo() -> std::shared_ptr<BinaryMessageHandler> {
    return handler([](PlatformMessage const& message) {
        ResponseHandle response = message.response;
        CHECK(response.respond(message.payload).has_value());
    });
}

struct RecordingPlugin final : Plugin {
    RecordingPlugin(std::string name, std::vector<std::string>& events, bool failAttach = false)
        : name(std::move(name)), events(events), failAttach(failAttach) {}

    ~RecordingPlugin() override { this->events.push_back("destroy " + this->name); }

    auto pluginName() const -> std::string_view override { return this->name; }

    auto attach(BinaryMessenger& messenger) -> Expected<void> override {
        if (this->failAttach) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "missing delegate"});
        }
        this->events.push_back("attach " + this->name);
        this->messenger = &messenger;
        if (this->duringAttach) {
            this->duringAttach();
        }
        return messenger.setMessageHandler(this->name, echo());
    }

    auto detach() -> void override {
        this->events.push_back("detach " + this->name);
        if (this->messenger != nullptr) {
            CHECK(this->messenger->setMessageHandler(this->name, nullptr).has_value());
        }
    }

    std::string               name;
    std::vector<std::string>& events;
    bool                      failAttach;
    BinaryMessenger*          messenger = nullptr;
    std::function<void()>     duringAttach;
};

} // namespace

TEST_SUITE("bridge") {
    TEST_CASE("Routing by channel name") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(bridge.addPlugin("echo", echo()).has_value());

        auto payload = toBytes("ping");
        bridge.handlePlatformMessage("echo", payload, engine.token(0));
        auto responses = engine.responses();
        REQUIRE(responses.size() == 1);
        CHECK(responses[0].token == engine.token(0));
        CHECK(responses[0].bytes == payload);
        CHECK(bridge.droppedResponseCount() == 0);
    }

    TEST_CASE("Unknown channels are answered with an empty reply") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};

        auto payload = toBytes("anyone?");
        bridge.handlePlatformMessage("ghost", payload, engine.token(0));
        REQUIRE(engine.responseCount() == 1);
        CHECK(engine.responses()[0].token == engine.token(0));
        CHECK(engine.responses()[0].bytes.empty());

        SUBCASE("Fire-and-forget messages are not answered") {
            bridge.handlePlatformMessage("ghost", payload, nullptr);
            CHECK(engine.responseCount() == 1);
            CHECK(bridge.droppedResponseCount() == 0);
        }
    }

    TEST_CASE("Handler exceptions become NotImplemented") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(bridge.addPlugin("throws", handler([](PlatformMessage const&) {
                                     throw std::runtime_error("handler failed");
                                 }))
                        .has_value());
        REQUIRE(bridge.addPlugin("throws/int", handler([](PlatformMessage const&) { throw 42; })).has_value());

        // A handler that answered before throwing keeps its answer.
        REQUIRE(bridge.addPlugin("throws/late", handler([](PlatformMessage const& message) {
                                     ResponseHandle response = message.response;
                                     CHECK(response.respond(toBytes("partial")).has_value());
                                     throw std::logic_error("after reply");
                                 }))
                        .has_value());

        bridge.handlePlatformMessage("throws", BytesView{}, engine.token(0));
        bridge.handlePlatformMessage("throws/int", BytesView{}, engine.token(1));
        bridge.handlePlatformMessage("throws/late", BytesView{}, engine.token(2));

        auto responses = engine.responses();
        REQUIRE(responses.size() == 3);
        CHECK(responses[0].bytes.empty());
        CHECK(responses[1].bytes.empty());
        CHECK(responses[2].bytes == toBytes("partial"));
        CHECK(bridge.droppedResponseCount() == 0);
    }

    TEST_CASE("Unanswered messages are counted as dropped") {
        FakeEngine engine;

        SUBCASE("Logged only") {
            PlatformBridge bridge{engine.outbound()};
            REQUIRE(bridge.addPlugin("silent", handler([](PlatformMessage const&) {})).has_value());
            bridge.handlePlatformMessage("silent", BytesView{}, engine.token(0));
            CHECK(bridge.droppedResponseCount() == 1);
            CHECK(engine.responseCount() == 0);
        }

        SUBCASE("Answered with NotImplemented") {
            BridgeOptions options;
            options.replyOnDroppedResponse = true;
            PlatformBridge bridge{engine.outbound(), options};
            REQUIRE(bridge.addPlugin("silent", handler([](PlatformMessage const&) {})).has_value());
            bridge.handlePlatformMessage("silent", BytesView{}, engine.token(0));
            CHECK(bridge.droppedResponseCount() == 1);
            REQUIRE(engine.responseCount() == 1);
            CHECK(engine.responses()[0].bytes.empty());
        }
    }

    TEST_CASE("Responding after teardown fails with ChannelClosed") {
        FakeEngine                    engine;
        std::optional<ResponseHandle> kept;
        {
            PlatformBridge bridge{engine.outbound()};
            REQUIRE(bridge.addPlugin("later", handler([&](PlatformMessage const& message) {
                                         kept = message.response;
                                     }))
                            .has_value());
            bridge.handlePlatformMessage("later", BytesView{}, engine.token(0));
            REQUIRE(kept.has_value());

            SUBCASE("Bridge shut down") {
                bridge.shutdown();
                auto sent = kept->respond(toBytes("too late"));
                REQUIRE_FALSE(sent.has_value());
                CHECK(sent.error().code == Error::Code::ChannelClosed);
            }
        }

        SUBCASE("Bridge destroyed") {
            auto sent = kept->respond(toBytes("too late"));
            REQUIRE_FALSE(sent.has_value());
            CHECK(sent.error().code == Error::Code::ChannelClosed);
        }
        CHECK(engine.responseCount() == 0);
    }

    TEST_CASE("Native-initiated messages") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};

        SUBCASE("Empty channel names are refused") {
            auto sent = bridge.send("", BytesView{});
            REQUIRE_FALSE(sent.has_value());
            CHECK(sent.error().code == Error::Code::InvalidArgument);
        }

        SUBCASE("Replies are routed by correlation id") {
            std::vector<std::string> replies;
            auto record = [&](Expected<BytesView> reply) {
                CHECK(reply.has_value());
                if (reply) {
                    replies.emplace_back(reply->begin(), reply->end());
                }
            };
            REQUIRE(bridge.send("a", toBytes("1"), record).has_value());
            REQUIRE(bridge.send("b", toBytes("2"), record).has_value());
            auto messages = engine.messages();
            REQUIRE(messages.size() == 2);
            CHECK(messages[0].correlationId != messages[1].correlationId);
            CHECK(bridge.pendingReplyCount() == 2);

            CHECK(bridge.deliverReply(messages[1].correlationId, toBytes("second")));
            CHECK(bridge.deliverReply(messages[0].correlationId, toBytes("first")));
            CHECK_FALSE(bridge.deliverReply(messages[0].correlationId, toBytes("again")));
            CHECK_FALSE(bridge.deliverReply(9999, BytesView{}));
            CHECK(replies == std::vector<std::string>{"second", "first"});
            CHECK(bridge.pendingReplyCount() == 0);
        }

        SUBCASE("Rejected sends leave nothing pending") {
            engine.sendStatus = 3;
            bool called       = false;
            auto sent         = bridge.send("a", toBytes("1"), [&](Expected<BytesView>) { called = true; });
            REQUIRE_FALSE(sent.has_value());
            CHECK(sent.error().code == Error::Code::EngineRejected);
            CHECK(bridge.pendingReplyCount() == 0);
            CHECK_FALSE(called);
        }

        SUBCASE("Pending replies fail on shutdown") {
            std::optional<Error> failure;
            REQUIRE(bridge.send("a", toBytes("1"), [&](Expected<BytesView> reply) {
                              if (!reply) {
                                  failure = reply.error();
                              }
                          })
                            .has_value());
            bridge.shutdown();
            REQUIRE(failure.has_value());
            CHECK(failure->code == Error::Code::ChannelClosed);

            auto sent = bridge.send("a", toBytes("1"));
            REQUIRE_FALSE(sent.has_value());
            CHECK(sent.error().code == Error::Code::ChannelClosed);
        }
    }

    TEST_CASE("Handlers may re-enter the bridge") {
        FakeEngine     engine;
        PlatformBridge bridge{engine.outbound()};
        REQUIRE(bridge.addPlugin("relay", handler([&](PlatformMessage const& message) {
                                     ResponseHandle response = message.response;
                                     CHECK(bridge.send("relay/out", message.payload).has_value());
                                     CHECK(bridge.setMessageHandler("relay/extra", echo()).has_value());
                                     CHECK(response.respond(BytesView{}).has_value());
                                 }))
                        .has_value());
        auto payload = toBytes("x");
        bridge.handlePlatformMessage("relay", payload, engine.token(0));
        CHECK(engine.messages().size() == 1);
        CHECK(bridge.registry().contains("relay/extra"));
        CHECK(engine.responseCount() == 1);
    }

    TEST_CASE("Plugin lifecycle") {
        FakeEngine               engine;
        std::vector<std::string> events;
        {
            PlatformBridge bridge{engine.outbound()};

            auto none = bridge.registerPlugin(nullptr);
            REQUIRE_FALSE(none.has_value());
            CHECK(none.error().code == Error::Code::InvalidArgument);

            REQUIRE(bridge.registerPlugin(std::make_unique<RecordingPlugin>("first", events)).has_value());
            REQUIRE(bridge.registerPlugin(std::make_unique<RecordingPlugin>("second", events)).has_value());

            auto broken = bridge.registerPlugin(std::make_unique<RecordingPlugin>("broken", events, true));
            REQUIRE_FALSE(broken.has_value());
            CHECK(broken.error().code == Error::Code::InvalidArgument);
            CHECK(bridge.pluginCount() == 2);
            CHECK(bridge.registry().contains("first"));
            CHECK(bridge.registry().contains("second"));

            bridge.shutdown();
            CHECK(bridge.pluginCount() == 0);
            CHECK(bridge.registry().size() == 0);

            auto late = bridge.registerPlugin(std::make_unique<RecordingPlugin>("late", events));
            REQUIRE_FALSE(late.has_value());
            CHECK(late.error().code == Error::Code::ChannelClosed);
        }
        CHECK(events
              == std::vector<std::string>{"attach first",
                                          "attach second",
                                          "destroy broken",
                                          "detach second",
                                          "detach first",
                                          "destroy second",
                                          "destroy first",
                                          "destroy late"});
    }

    TEST_CASE("Shutdown racing an attach leaves nothing registered") {
        FakeEngine               engine;
        std::vector<std::string> events;
        PlatformBridge           bridge{engine.outbound()};
        REQUIRE(bridge.registerPlugin(std::make_unique<RecordingPlugin>("early", events)).has_value());

        auto plugin          = std::make_unique<RecordingPlugin>("racing", events);
        plugin->duringAttach = [&] { bridge.shutdown(); };

        auto registered = bridge.registerPlugin(std::move(plugin));
        REQUIRE_FALSE(registered.has_value());
        CHECK(registered.error().code == Error::Code::ChannelClosed);
        CHECK(bridge.pluginCount() == 0);
        CHECK_FALSE(bridge.registry().contains("racing"));
        CHECK(bridge.registry().size() == 0);
        CHECK(events
              == std::vector<std::string>{"attach early",
                                          "attach racing",
                                          "detach early",
                                          "destroy early",
                                          "detach racing",
                                          "destroy racing"});
    }
}
