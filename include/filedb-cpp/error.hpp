/// @file error.hpp
/// @brief Error types for the filedb-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace filedb_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_found,            ///< A key on a read path does not exist.
    type_mismatch,        ///< A path segment holds a non-object value.
    invalid_composition,  ///< combine() got no transactions or mixed documents.
    invalid_path,         ///< A path cannot be used for the requested operation.
    io_error,             ///< The backing file could not be read or written.
    parse_error,          ///< The backing file does not hold a JSON object.
    invalid_value,        ///< A value has no JSON representation.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:           return "not_found";
        case ErrorKind::type_mismatch:       return "type_mismatch";
        case ErrorKind::invalid_composition: return "invalid_composition";
        case ErrorKind::invalid_path:        return "invalid_path";
        case ErrorKind::io_error:            return "io_error";
        case ErrorKind::parse_error:         return "parse_error";
        case ErrorKind::invalid_value:       return "invalid_value";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// For path errors `path` holds the full dotted path that was requested
/// and `at` the dotted sub-path where resolution stopped.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.
    std::string path;    ///< The requested path, if any.
    std::string at;      ///< The offending sub-path, if any.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct a path Error.
    Error(ErrorKind k, std::string msg, std::string p, std::string a)
        : kind{k}, message{std::move(msg)}, path{std::move(p)}, at{std::move(a)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown by every fallible operation in the library.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace filedb_cpp
