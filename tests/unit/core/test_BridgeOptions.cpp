#include "core/BridgeOptions.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <optional>
#include <string>

using namespace PB;

namespace {

// Sets an environment variable for the current scope and restores it afterwards.
struct ScopedEnv {
    ScopedEnv(char const* name, char const* value)
        : name(name) {
        if (char const* current = std::getenv(name)) {
            previous = std::string(current);
        }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (previous) {
            ::setenv(name, previous->c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }

    char const*                name;
    std::optional<std::string> previous;
};

} // namespace

TEST_SUITE("core.options") {
    TEST_CASE("parseFlag accepts the usual spellings") {
        CHECK(parseFlag("1") == std::optional<bool>{true});
        CHECK(parseFlag(" TRUE ") == std::optional<bool>{true});
        CHECK(parseFlag("yes") == std::optional<bool>{true});
        CHECK(parseFlag("On") == std::optional<bool>{true});
        CHECK(parseFlag("0") == std::optional<bool>{false});
        CHECK(parseFlag("false") == std::optional<bool>{false});
        CHECK(parseFlag("\tno\n") == std::optional<bool>{false});
        CHECK(parseFlag("OFF") == std::optional<bool>{false});
        CHECK_FALSE(parseFlag("maybe").has_value());
        CHECK_FALSE(parseFlag("").has_value());
    }

    TEST_CASE("loadBridgeOptions reads the environment") {
        SUBCASE("defaults survive without variables") {
            ::unsetenv("PLATFORMBRIDGE_WORKERS");
            ::unsetenv("PLATFORMBRIDGE_REPLY_ON_DROP");
            BridgeOptions defaults;
            defaults.workerThreads = 3;
            auto options           = loadBridgeOptions(defaults);
            CHECK(options.workerThreads == 3);
            CHECK_FALSE(options.replyOnDroppedResponse);
        }
        SUBCASE("valid overrides apply") {
            ScopedEnv workers{"PLATFORMBRIDGE_WORKERS", " 6 "};
            ScopedEnv drop{"PLATFORMBRIDGE_REPLY_ON_DROP", "yes"};
            ScopedEnv log{"PLATFORMBRIDGE_LOG", "off"};
            auto      options = loadBridgeOptions();
            CHECK(options.workerThreads == 6);
            CHECK(options.replyOnDroppedResponse);
            CHECK_FALSE(options.logging);
        }
        SUBCASE("invalid values are ignored") {
            ScopedEnv workers{"PLATFORMBRIDGE_WORKERS", "many"};
            ScopedEnv drop{"PLATFORMBRIDGE_REPLY_ON_DROP", "sometimes"};
            auto      options = loadBridgeOptions();
            CHECK(options.workerThreads == BridgeOptions{}.workerThreads);
            CHECK_FALSE(options.replyOnDroppedResponse);
        }
        SUBCASE("worker count is capped") {
            ScopedEnv workers{"PLATFORMBRIDGE_WORKERS", "100000"};
            CHECK(loadBridgeOptions().workerThreads == BridgeOptions{}.workerThreads);
        }
    }
}
