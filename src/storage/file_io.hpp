#pragma once

// Internal header -- not installed.
// Whole-file read and replace. Every call opens, transfers and closes;
// no handle outlives the call.

#include <filedb-cpp/error.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace filedb_cpp::detail {

/// Read the whole file into memory.
inline auto read_file(const std::filesystem::path& path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw Exception{ErrorKind::io_error, "cannot open '" + path.string() + "' for reading"};
    }
    auto contents = std::string{std::istreambuf_iterator<char>{in},
                                std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw Exception{ErrorKind::io_error, "error reading '" + path.string() + "'"};
    }
    return contents;
}

/// Truncate `path` and write `contents` into it.
inline void overwrite_file(const std::filesystem::path& path, std::string_view contents) {
    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw Exception{ErrorKind::io_error, "cannot open '" + path.string() + "' for writing"};
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
        throw Exception{ErrorKind::io_error, "error writing '" + path.string() + "'"};
    }
}

/// Write `contents` to a sibling temporary file, then rename it over
/// `path`. Readers see either the old file or the new one.
inline void replace_file(const std::filesystem::path& path, std::string_view contents) {
    auto tmp = path;
    tmp += ".tmp";
    auto ec = std::error_code{};
    try {
        overwrite_file(tmp, contents);
    } catch (const Exception&) {
        std::filesystem::remove(tmp, ec);
        throw;
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw Exception{ErrorKind::io_error,
                        "cannot replace '" + path.string() + "': " + reason};
    }
}

}  // namespace filedb_cpp::detail
