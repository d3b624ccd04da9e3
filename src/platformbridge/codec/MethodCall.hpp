#pragma once
#include "codec/Value.hpp"

#include <optional>
#include <string>
#include <variant>

namespace PB {

struct MethodCall {
    std::string method;
    Value       arguments;

    bool operator==(MethodCall const&) const = default;
};

struct MethodSuccess {
    Value value;

    bool operator==(MethodSuccess const&) const = default;
};

struct MethodError {
    std::string                code;
    std::optional<std::string> message;
    Value                      details;

    bool operator==(MethodError const&) const = default;
};

// Empty reply: nothing on the remote side handled the call.
struct MethodNotImplemented {
    bool operator==(MethodNotImplemented const&) const = default;
};

using MethodResult = std::variant<MethodSuccess, MethodError, MethodNotImplemented>;

[[nodiscard]] inline auto isNotImplemented(MethodResult const& result) -> bool {
    return std::holds_alternative<MethodNotImplemented>(result);
}

} // namespace PB
