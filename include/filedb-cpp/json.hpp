/// @file json.hpp
/// @brief nlohmann/json interoperability for filedb-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value, plus the
/// whole-document text codec used by Document::load() and store().

#pragma once

#include <filedb-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace filedb_cpp {

/// Deepest array/object nesting accepted in either direction. Deeper
/// input is rejected before conversion recurses into it.
inline constexpr std::size_t max_nesting_depth = 1000;

// -- ADL serialization --------------------------------------------------------

/// @throws Exception with ErrorKind::invalid_value for a non-finite
///   double or nesting deeper than max_nesting_depth.
void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);

/// @throws Exception with ErrorKind::parse_error for nesting deeper
///   than max_nesting_depth.
void from_json(const nlohmann::json& j, Value& v);

// -- Document text codec ------------------------------------------------------

/// Parse JSON text whose top-level value must be an object.
/// @throws Exception with ErrorKind::parse_error on malformed text,
///   a non-object top-level value or nesting deeper than max_nesting_depth.
auto parse_object(std::string_view text) -> Object;

/// Serialize a root object to JSON text.
/// @param indent Pretty-print indentation; negative means compact.
/// @throws Exception with ErrorKind::invalid_value if a value cannot be
///   represented as JSON.
auto dump_object(const Object& root, int indent = -1) -> std::string;

}  // namespace filedb_cpp
