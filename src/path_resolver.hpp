#pragma once

// Internal header -- not installed.
// Walks a key path through an Object tree, optionally creating missing
// intermediate objects on the way.

#include <filedb-cpp/error.hpp>
#include <filedb-cpp/path.hpp>
#include <filedb-cpp/value.hpp>

#include <span>
#include <string>
#include <variant>

namespace filedb_cpp::detail {

/// Where a resolution ended: the root object itself (empty path) or the
/// value stored under the final key.
using Node = std::variant<Object*, Value*>;

/// The object a Node refers to, or nullptr if it holds a non-object value.
inline auto node_object(Node node) -> Object* {
    return std::visit(overload{
        [](Object* obj) -> Object* { return obj; },
        [](Value* val) -> Object* { return val->as_object(); },
    }, node);
}

/// Copy of the value a Node refers to.
inline auto node_value(Node node) -> Value {
    return std::visit(overload{
        [](Object* obj) -> Value { return Value{*obj}; },
        [](Value* val) -> Value { return *val; },
    }, node);
}

inline auto type_mismatch(std::span<const std::string> path,
                          std::span<const std::string> at,
                          const Value& found) -> Exception {
    auto full = join_path(path);
    auto where = join_path(at);
    return Exception{Error{
        ErrorKind::type_mismatch,
        "access of '" + full + "': value at '" + where + "' is " +
            std::string{to_string_view(found.type())} + ", not object",
        full, where}};
}

inline auto not_found(std::span<const std::string> path) -> Exception {
    auto full = join_path(path);
    return Exception{Error{ErrorKind::not_found,
                           "key does not exist: '" + full + "'", full, full}};
}

/// Resolve `path` inside `root`, naming `requested` in any error.
/// `path` is a prefix of `requested` when a caller walks only part of it.
///
/// With `auto_vivify`, every missing key (the last one included) is
/// created as an empty Object; write paths only ever resolve the parent
/// of the key they assign, so the assigned key itself is never created
/// here. Without it, a missing key throws ErrorKind::not_found.
/// A non-object value before the last key throws ErrorKind::type_mismatch.
inline auto resolve(Object& root, std::span<const std::string> path,
                    std::span<const std::string> requested, bool auto_vivify) -> Node {
    if (path.empty()) return Node{&root};

    auto* current = &root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        auto it = current->find(path[i]);
        if (it == current->end()) {
            if (!auto_vivify) throw not_found(requested);
            it = current->emplace(path[i], Object{}).first;
        }
        if (i == path.size() - 1) {
            return Node{&it->second};
        }
        current = it->second.as_object();
        if (!current) {
            throw type_mismatch(requested, path.first(i + 1), it->second);
        }
    }
    return Node{&root};  // unreachable: the loop returns on the last key
}

inline auto resolve(Object& root, std::span<const std::string> path,
                    bool auto_vivify) -> Node {
    return resolve(root, path, path, auto_vivify);
}

}  // namespace filedb_cpp::detail
