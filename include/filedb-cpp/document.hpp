/// @file document.hpp
/// @brief The Document class -- a JSON object persisted as one whole file.

#pragma once

#include <filedb-cpp/value.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string_view>

namespace filedb_cpp {

class Ref;

namespace detail {
struct DocumentState;
}  // namespace detail

/// What execute() does when the document cannot be loaded.
enum class LoadFailurePolicy : std::uint8_t {
    treat_as_empty,  ///< Log the cause and start from an empty object.
    propagate,       ///< Throw the load error; nothing is written.
};

/// What execute() does when the document cannot be stored.
enum class StoreFailurePolicy : std::uint8_t {
    propagate,  ///< Throw the store error.
    ignore,     ///< Log the cause and return normally.
};

/// Per-document configuration, fixed at construction.
struct DocumentOptions {
    /// Treating an unreadable or corrupt file as empty means the next
    /// successful execute() replaces its previous contents.
    LoadFailurePolicy on_load_failure = LoadFailurePolicy::treat_as_empty;
    StoreFailurePolicy on_store_failure = StoreFailurePolicy::propagate;
    /// Write to a sibling temporary file and rename it over the target.
    bool atomic_write = true;
    /// JSON indentation for stored files; negative writes compact JSON.
    int indent = -1;
};

/// A handle to a JSON document stored as a single file.
///
/// A Document never caches the parsed tree: every load() reads the whole
/// file and every store() replaces it. Copies of a Document share one
/// identity, and equality is identity: two Documents constructed over the
/// same path are different documents.
///
/// @code
/// auto doc = Document{"settings.json"};
/// execute(doc.ref("ui").child("theme").set("dark"));
/// auto theme = doc.ref("ui").child("theme").get<std::string>();
/// @endcode
class Document {
public:
    /// Construct a handle for the file at `path`. Does not touch storage.
    explicit Document(std::filesystem::path path, DocumentOptions options = {});

    /// The backing file.
    auto path() const -> const std::filesystem::path&;

    /// The options this document was created with.
    auto options() const -> const DocumentOptions&;

    // -- Addressing -----------------------------------------------------------

    /// A Ref to a key of the root object.
    auto ref(std::string_view key) const -> Ref;

    /// A Ref to the root object itself.
    auto root() const -> Ref;

    /// A Ref to a dotted path, e.g. "server.http.port".
    auto at(std::string_view dotted) const -> Ref;

    // -- Storage --------------------------------------------------------------

    /// Read and parse the whole file.
    /// @throws Exception with ErrorKind::io_error or ErrorKind::parse_error.
    auto load() const -> Object;

    /// Serialize `root` and replace the whole file with it.
    /// @throws Exception with ErrorKind::io_error.
    void store(const Object& root) const;

    // -- Identity -------------------------------------------------------------

    /// True if both handles refer to the same document.
    auto operator==(const Document& other) const noexcept -> bool {
        return state_ == other.state_;
    }

private:
    std::shared_ptr<const detail::DocumentState> state_;
};

/// Print the document's path.
auto operator<<(std::ostream& os, const Document& doc) -> std::ostream&;

}  // namespace filedb_cpp
