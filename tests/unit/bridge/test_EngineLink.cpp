#include "EngineLink.hpp"
#include "FakeEngine.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <memory>
#include <thread>

using namespace PB;
using PB::Test::FakeEngine;

TEST_SUITE("bridge.link") {
    TEST_CASE("Close resolves every reply it accepted") {
        for (int round = 0; round < 20; ++round) {
            CAPTURE(round);
            FakeEngine engine;
            auto       link = std::make_shared<EngineLink>(engine.outbound(), false);

            std::atomic<int> accepted{0};
            std::atomic<int> refused{0};
            std::atomic<int> closedReplies{0};

            std::thread sender([&] {
                for (int i = 0; i < 2000; ++i) {
                    auto sent = link->sendMessage("race", BytesView{}, [&](Expected<BytesView> reply) {
                        if (!reply && reply.error().code == Error::Code::ChannelClosed) {
                            ++closedReplies;
                        }
                    });
                    if (sent) {
                        ++accepted;
                    } else {
                        CHECK(sent.error().code == Error::Code::ChannelClosed);
                        ++refused;
                    }
                }
            });

            while (accepted.load() < 50 && refused.load() == 0) {
                std::this_thread::yield();
            }
            link->close();
            sender.join();

            CHECK(link->isClosed());
            CHECK(link->pendingReplies() == 0);
            CHECK(closedReplies.load() == accepted.load());
            CHECK(accepted.load() + refused.load() == 2000);
        }
    }

    TEST_CASE("Close is idempotent and refuses later traffic") {
        FakeEngine engine;
        EngineLink link{engine.outbound(), false};

        int failures = 0;
        REQUIRE(link.sendMessage("a", BytesView{}, [&](Expected<BytesView> reply) {
                        if (!reply) {
                            ++failures;
                        }
                    })
                        .has_value());
        link.close();
        link.close();
        CHECK(failures == 1);

        auto late = link.sendMessage("a", BytesView{}, [](Expected<BytesView>) {});
        REQUIRE_FALSE(late.has_value());
        CHECK(late.error().code == Error::Code::ChannelClosed);
        CHECK(link.pendingReplies() == 0);
        CHECK_FALSE(link.deliverReply(1, BytesView{}));
    }
}
