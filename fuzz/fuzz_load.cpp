// Fuzz target for Document::load() -- exercises the file read and the JSON
// codec. Any document that loads is stored again and must load back equal.

#include <filedb-cpp/filedb.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto file = std::filesystem::temp_directory_path() / "filedb_fuzz_load.json";
    {
        auto out = std::ofstream{file, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }

    const auto doc = filedb_cpp::Document{file};
    try {
        auto root = doc.load();
        doc.store(root);
        if (doc.load() != root) std::abort();
    } catch (const filedb_cpp::Exception&) {
        // Rejected input is fine; only crashes and mismatches are findings.
    }
    return 0;
}
