#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace PB {

struct Value;

using ValueList = std::vector<Value>;
// Insertion ordered; keys may be any Value.
using ValueMap = std::vector<std::pair<Value, Value>>;

// Integer too wide for 64 bits, carried as its textual digits.
struct BigInt {
    std::string digits;

    bool operator==(BigInt const&) const = default;
};

enum class ValueType {
    Null = 0,
    Bool,
    Int32,
    Int64,
    BigInt,
    Float64,
    String,
    ByteList,
    Int32List,
    Int64List,
    Float32List,
    Float64List,
    List,
    Map
};

struct Value {
    // Alternative order matches ValueType.
    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int32_t,
                                 std::int64_t,
                                 BigInt,
                                 double,
                                 std::string,
                                 std::vector<std::uint8_t>,
                                 std::vector<std::int32_t>,
                                 std::vector<std::int64_t>,
                                 std::vector<float>,
                                 std::vector<double>,
                                 ValueList,
                                 ValueMap>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : storage(v) {}
    Value(std::int32_t v) : storage(v) {}
    Value(std::int64_t v) : storage(v) {}
    Value(double v) : storage(v) {}
    Value(char const* v) : storage(std::string(v)) {}
    Value(std::string v) : storage(std::move(v)) {}
    Value(std::string_view v) : storage(std::string(v)) {}
    Value(BigInt v) : storage(std::move(v)) {}
    Value(std::vector<std::uint8_t> v) : storage(std::move(v)) {}
    Value(std::vector<std::int32_t> v) : storage(std::move(v)) {}
    Value(std::vector<std::int64_t> v) : storage(std::move(v)) {}
    Value(std::vector<float> v) : storage(std::move(v)) {}
    Value(std::vector<double> v) : storage(std::move(v)) {}
    Value(ValueList v) : storage(std::move(v)) {}
    Value(ValueMap v) : storage(std::move(v)) {}

    [[nodiscard]] auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(storage.index());
    }

    [[nodiscard]] auto isNull() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(storage);
    }

    template <typename T>
    [[nodiscard]] auto holds() const noexcept -> bool {
        return std::holds_alternative<T>(storage);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> T const* {
        return std::get_if<T>(&storage);
    }

    template <typename T>
    [[nodiscard]] auto get_if() noexcept -> T* {
        return std::get_if<T>(&storage);
    }

    // Int32 or Int64 widened to 64 bits. False for every other type.
    [[nodiscard]] auto asInt64(std::int64_t& out) const noexcept -> bool;

    // Map entry whose key is the given String, or nullptr.
    [[nodiscard]] auto lookup(std::string_view key) const -> Value const*;

    // Human readable rendering for logs and test failure messages.
    [[nodiscard]] auto toDebugString() const -> std::string;

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool;

    Storage storage;
};

[[nodiscard]] auto valueTypeToString(ValueType type) -> std::string_view;

auto operator<<(std::ostream& os, Value const& value) -> std::ostream&;

} // namespace PB
