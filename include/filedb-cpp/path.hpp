/// @file path.hpp
/// @brief Key paths into the document tree.

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filedb_cpp {

/// An ordered sequence of object keys, starting at the document root.
/// An empty Path addresses the root itself.
using Path = std::vector<std::string>;

/// Join keys with '.' for display, e.g. {"a", "b"} -> "a.b".
auto join_path(std::span<const std::string> keys) -> std::string;

/// Split a dotted path into keys. "" is the root path; "a..b" keeps
/// the empty key between the dots.
auto split_path(std::string_view dotted) -> Path;

}  // namespace filedb_cpp
