#include <filedb-cpp/json.hpp>
#include <filedb-cpp/error.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <variant>

namespace filedb_cpp {

namespace {

// Containers count one level each; the root object is depth 1.

void value_to_json(nlohmann::json& j, const Value& v, std::size_t depth) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) {
            if (!std::isfinite(d)) {
                throw Exception{ErrorKind::invalid_value,
                                "cannot encode " + std::to_string(d) + " as JSON"};
            }
            j = d;
        },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            if (depth > max_nesting_depth) {
                throw Exception{ErrorKind::invalid_value, "value nesting exceeds " +
                                std::to_string(max_nesting_depth) + " levels"};
            }
            j = nlohmann::json::array();
            for (const auto& elem : arr) {
                auto child = nlohmann::json{};
                value_to_json(child, elem, depth + 1);
                j.push_back(std::move(child));
            }
        },
        [&](const Object& obj) {
            if (depth > max_nesting_depth) {
                throw Exception{ErrorKind::invalid_value, "value nesting exceeds " +
                                std::to_string(max_nesting_depth) + " levels"};
            }
            j = nlohmann::json::object();
            for (const auto& [key, elem] : obj) {
                value_to_json(j[key], elem, depth + 1);
            }
        },
    }, v.inner);
}

void value_from_json(const nlohmann::json& j, Value& v, std::size_t depth) {
    if ((j.is_array() || j.is_object()) && depth > max_nesting_depth) {
        throw Exception{ErrorKind::parse_error, "JSON nesting exceeds " +
                        std::to_string(max_nesting_depth) + " levels"};
    }
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        // If it fits in int64, prefer int64 for consistency
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            v = static_cast<std::int64_t>(val);
        } else {
            v = val;
        }
    } else if (j.is_number_integer()) {
        v = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else if (j.is_array()) {
        auto arr = Array{};
        arr.reserve(j.size());
        for (const auto& elem : j) {
            auto child = Value{};
            value_from_json(elem, child, depth + 1);
            arr.push_back(std::move(child));
        }
        v = std::move(arr);
    } else if (j.is_object()) {
        auto obj = Object{};
        for (auto it = j.begin(); it != j.end(); ++it) {
            value_from_json(it.value(), obj[it.key()], depth + 1);
        }
        v = std::move(obj);
    } else {
        throw Exception{ErrorKind::parse_error, "cannot convert JSON to Value"};
    }
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    value_to_json(j, v, 1);
}

void from_json(const nlohmann::json& j, Value& v) {
    value_from_json(j, v, 1);
}

// =============================================================================
// Document text codec
// =============================================================================

auto parse_object(std::string_view text) -> Object {
    // The parser reports the depth of the enclosing container, 0 for the root.
    auto limit_depth = [](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
        if ((event == nlohmann::json::parse_event_t::object_start ||
             event == nlohmann::json::parse_event_t::array_start) &&
            static_cast<std::size_t>(depth) >= max_nesting_depth) {
            throw Exception{ErrorKind::parse_error, "JSON nesting exceeds " +
                            std::to_string(max_nesting_depth) + " levels"};
        }
        return true;
    };
    auto j = nlohmann::json::parse(text, limit_depth, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::parse_error, "malformed JSON document"};
    }
    if (!j.is_object()) {
        throw Exception{ErrorKind::parse_error,
                        std::string{"top-level value is "} + j.type_name() + ", not object"};
    }
    auto root = Value{};
    from_json(j, root);
    return std::move(*root.as_object());
}

auto dump_object(const Object& root, int indent) -> std::string {
    auto j = nlohmann::json::object();
    for (const auto& [key, elem] : root) {
        value_to_json(j[key], elem, 2);
    }
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace filedb_cpp
