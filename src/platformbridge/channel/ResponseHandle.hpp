#pragma once
#include "codec/MessageCodec.hpp"
#include "core/Error.hpp"
#include "ffi/EmbedderApi.h"

#include <atomic>
#include <memory>

namespace PB {

// Receiver of replies produced through ResponseHandle. Implemented by the
// engine link of a PlatformBridge.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual auto sendResponse(PBResponseToken const* token, BytesView bytes) -> Expected<void> = 0;
    // The last handle for token went away without an answer.
    virtual auto responseDropped(PBResponseToken const* token) noexcept -> void = 0;
};

/*
 * One-shot capability to answer a single inbound platform message.
 *
 * Copies share one state, so at most one reply reaches the engine whichever
 * copy answers first. A handle without a token (fire-and-forget message) is
 * detached: respond succeeds once but nothing is forwarded. Handles may be
 * kept past the inbound callback and answered from any thread.
 */
class ResponseHandle {
public:
    ResponseHandle();
    ResponseHandle(PBResponseToken const* token, std::weak_ptr<ResponseSink> sink);

    auto respond(BytesView bytes) -> Expected<void>;
    auto respond(MethodResult const& result, MethodCodec const& codec) -> Expected<void>;
    auto respondNotImplemented() -> Expected<void>;

    [[nodiscard]] auto hasResponded() const -> bool;
    [[nodiscard]] auto hasToken() const -> bool;

private:
    struct State {
        State(PBResponseToken const* t, std::weak_ptr<ResponseSink> s)
            : token(t), sink(std::move(s)) {}
        ~State();

        PBResponseToken const*      token;
        std::weak_ptr<ResponseSink> sink;
        std::atomic<bool>           consumed{false};
    };

    std::shared_ptr<State> state;
};

} // namespace PB
