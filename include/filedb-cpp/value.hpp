/// @file value.hpp
/// @brief The document tree: Value, Object, Array, Null and helpers.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace filedb_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

struct Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A mapping from string key to value. The root of every document is one.
using Object = std::map<std::string, Value, std::less<>>;

/// The alternatives a Value can hold, in variant index order.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    integer,
    unsigned_integer,
    floating,
    string,
    array,
    object,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:             return "null";
        case ValueType::boolean:          return "boolean";
        case ValueType::integer:          return "integer";
        case ValueType::unsigned_integer: return "unsigned_integer";
        case ValueType::floating:         return "floating";
        case ValueType::string:           return "string";
        case ValueType::array:            return "array";
        case ValueType::object:           return "object";
    }
    return "unknown";
}

/// A node in the document tree.
///
/// Scalars, arrays and objects are alternatives of one variant, so every
/// step of a path walk matches on the alternative explicitly.
///
/// @code
/// auto v = Value{Object{{"name", "Alice"}, {"age", 30}}};
/// if (auto* obj = v.as_object()) { ... }
/// @endcode
struct Value {
    using Variant = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Variant inner;

    Value() = default;
    Value(Null) {}
    Value(bool b) : inner{b} {}
    Value(int i) : inner{static_cast<std::int64_t>(i)} {}
    Value(std::int64_t i) : inner{i} {}
    Value(std::uint64_t u) : inner{u} {}
    Value(double d) : inner{d} {}
    Value(std::string s) : inner{std::move(s)} {}
    Value(std::string_view s) : inner{std::string{s}} {}
    Value(const char* s) : inner{std::string{s}} {}
    Value(Array a) : inner{std::move(a)} {}
    Value(Object o) : inner{std::move(o)} {}

    /// The alternative currently held.
    auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(inner.index());
    }

    auto is_null() const noexcept -> bool { return std::holds_alternative<Null>(inner); }
    auto is_object() const noexcept -> bool { return std::holds_alternative<Object>(inner); }
    auto is_array() const noexcept -> bool { return std::holds_alternative<Array>(inner); }

    /// The held Object, or nullptr if this value is not an object.
    auto as_object() noexcept -> Object* { return std::get_if<Object>(&inner); }
    auto as_object() const noexcept -> const Object* { return std::get_if<Object>(&inner); }

    friend auto operator==(const Value& a, const Value& b) -> bool;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.inner);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed alternative from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_as<std::string>(value);
/// @endcode
template <typename T>
auto get_as(const Value& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v.inner)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed alternative from an optional<Value>.
template <typename T>
auto get_as(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_as<T>(*v);
}

}  // namespace filedb_cpp
