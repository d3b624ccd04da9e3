#include "codec/Value.hpp"

#include <ostream>
#include <sstream>
#include <type_traits>

namespace PB {
namespace {

template <typename T>
auto append_list(std::ostringstream& oss, std::vector<T> const& items) -> void {
    oss << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0)
            oss << ", ";
        if constexpr (std::is_same_v<T, std::uint8_t>) {
            oss << static_cast<unsigned>(items[i]);
        } else {
            oss << items[i];
        }
    }
    oss << ']';
}

// Maps compare as unordered collections of entries; every entry of lhs must
// pair up with a distinct equal entry of rhs.
auto maps_equal(ValueMap const& lhs, ValueMap const& rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::vector<bool> used(rhs.size(), false);
    for (auto const& entry : lhs) {
        bool matched = false;
        for (std::size_t i = 0; i < rhs.size(); ++i) {
            if (!used[i] && rhs[i].first == entry.first && rhs[i].second == entry.second) {
                used[i] = true;
                matched = true;
                break;
            }
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

} // namespace

auto Value::asInt64(std::int64_t& out) const noexcept -> bool {
    if (auto const* v = std::get_if<std::int32_t>(&storage)) {
        out = *v;
        return true;
    }
    if (auto const* v = std::get_if<std::int64_t>(&storage)) {
        out = *v;
        return true;
    }
    return false;
}

auto Value::lookup(std::string_view key) const -> Value const* {
    auto const* map = std::get_if<ValueMap>(&storage);
    if (map == nullptr) {
        return nullptr;
    }
    for (auto const& [k, v] : *map) {
        if (auto const* text = k.get_if<std::string>(); text != nullptr && *text == key) {
            return &v;
        }
    }
    return nullptr;
}

auto Value::toDebugString() const -> std::string {
    std::ostringstream oss;
    std::visit(
            [&oss](auto const& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    oss << "null";
                } else if constexpr (std::is_same_v<T, bool>) {
                    oss << (v ? "true" : "false");
                } else if constexpr (std::is_same_v<T, BigInt>) {
                    oss << v.digits << 'n';
                } else if constexpr (std::is_same_v<T, std::string>) {
                    oss << '"' << v << '"';
                } else if constexpr (std::is_same_v<T, ValueList>) {
                    oss << '[';
                    for (std::size_t i = 0; i < v.size(); ++i) {
                        if (i > 0)
                            oss << ", ";
                        oss << v[i].toDebugString();
                    }
                    oss << ']';
                } else if constexpr (std::is_same_v<T, ValueMap>) {
                    oss << '{';
                    for (std::size_t i = 0; i < v.size(); ++i) {
                        if (i > 0)
                            oss << ", ";
                        oss << v[i].first.toDebugString() << ": " << v[i].second.toDebugString();
                    }
                    oss << '}';
                } else if constexpr (std::is_arithmetic_v<T>) {
                    oss << v;
                } else {
                    append_list(oss, v);
                }
            },
            storage);
    return oss.str();
}

auto operator==(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.storage.index() != rhs.storage.index()) {
        return false;
    }
    if (auto const* map = std::get_if<ValueMap>(&lhs.storage)) {
        return maps_equal(*map, std::get<ValueMap>(rhs.storage));
    }
    return lhs.storage == rhs.storage;
}

auto valueTypeToString(ValueType type) -> std::string_view {
    switch (type) {
    case ValueType::Null:
        return "null";
    case ValueType::Bool:
        return "bool";
    case ValueType::Int32:
        return "int32";
    case ValueType::Int64:
        return "int64";
    case ValueType::BigInt:
        return "big_int";
    case ValueType::Float64:
        return "float64";
    case ValueType::String:
        return "string";
    case ValueType::ByteList:
        return "byte_list";
    case ValueType::Int32List:
        return "int32_list";
    case ValueType::Int64List:
        return "int64_list";
    case ValueType::Float32List:
        return "float32_list";
    case ValueType::Float64List:
        return "float64_list";
    case ValueType::List:
        return "list";
    case ValueType::Map:
        return "map";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, Value const& value) -> std::ostream& {
    return os << value.toDebugString();
}

} // namespace PB
