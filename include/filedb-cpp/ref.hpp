/// @file ref.hpp
/// @brief Ref -- an addressing handle: a Document plus a key path.

#pragma once

#include <filedb-cpp/document.hpp>
#include <filedb-cpp/path.hpp>
#include <filedb-cpp/transaction.hpp>
#include <filedb-cpp/value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace filedb_cpp {

/// A position in a Document's tree.
///
/// A Ref is an immutable value: child() returns a new Ref with one more
/// key and leaves this one unchanged. Building Refs and Transactions
/// never touches storage; only get() reads the file.
///
/// @code
/// auto port = doc.ref("server").child("port");
/// execute(port.set(8080));
/// auto value = port.get<std::int64_t>();  // 8080
/// @endcode
class Ref {
public:
    Ref(Document doc, Path path);

    /// The document this Ref addresses.
    auto document() const -> const Document& { return doc_; }

    /// The keys from the root to this position.
    auto path() const -> const Path& { return path_; }

    /// The path joined with '.', e.g. "server.port".
    auto dotted() const -> std::string { return join_path(path_); }

    // -- Navigation -----------------------------------------------------------

    /// A Ref one level deeper.
    auto child(std::string_view key) const -> Ref;

    /// Same as child().
    auto operator[](std::string_view key) const -> Ref { return child(key); }

    // -- Reading --------------------------------------------------------------

    /// Load the document and return the value at this path.
    ///
    /// A document that cannot be loaded is reported as not found; the real
    /// cause is logged.
    /// @throws Exception with ErrorKind::not_found or ErrorKind::type_mismatch.
    auto get() const -> Value;

    /// Like get(), but returns nullopt instead of throwing not_found.
    auto try_get() const -> std::optional<Value>;

    /// Typed read. Returns nullopt if the value is absent or of another type.
    /// @code
    /// auto name = doc.ref("name").get<std::string>();
    /// @endcode
    template <typename T>
    auto get() const -> std::optional<T> {
        return get_as<T>(try_get());
    }

    // -- Transactions ---------------------------------------------------------

    /// Replace the value at this path.
    auto set(Value value) const -> Transaction;

    /// Delete the key at this path. Deleting an absent key is a no-op.
    auto remove() const -> Transaction;

    /// Replace the value at this path with `fn(current)`.
    auto update(Updater fn) const -> Transaction;

private:
    Document doc_;
    Path path_;
};

}  // namespace filedb_cpp
