#pragma once

// Internal header -- not installed.

#include <filedb-cpp/document.hpp>

#include <filesystem>

namespace filedb_cpp::detail {

/// The shared state behind a Document handle. Its address is the
/// document's identity.
struct DocumentState {
    std::filesystem::path path;
    DocumentOptions options;
};

}  // namespace filedb_cpp::detail
