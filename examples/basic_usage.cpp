// basic_usage -- demonstrates core filedb-cpp API
//
// Shows Refs, child paths, set/remove/update transactions, combine(),
// typed get<T>() and the error kinds callers can expect.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage [file]

#include <filedb-cpp/filedb.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace fdb = filedb_cpp;

int main(int argc, char** argv) {
    auto file = argc > 1 ? std::filesystem::path{argv[1]}
                         : std::filesystem::temp_directory_path() / "filedb_basic_usage.json";
    std::filesystem::remove(file);

    auto options = fdb::DocumentOptions{};
    options.indent = 2;
    auto doc = fdb::Document{file, options};

    // -- set: missing parents are created -------------------------------------
    fdb::execute(doc.ref("profile").child("name").set("Alice"));
    fdb::execute(doc.at("profile.address.city").set("Oslo"));

    // -- combine: one load, one store ----------------------------------------
    fdb::execute(fdb::combine(
        doc.ref("visits").set(0),
        doc.ref("tags").set(fdb::Array{"new", "trial"}),
        doc.ref("profile").child("email").set("alice@example.com")));

    // -- update: read-modify-write inside one execute() -----------------------
    auto bump = [](const std::optional<fdb::Value>& current) {
        return fdb::Value{fdb::get_as<std::int64_t>(current).value_or(0) + 1};
    };
    for (int i = 0; i < 3; ++i) {
        fdb::execute(doc.ref("visits").update(bump));
    }

    // -- remove ---------------------------------------------------------------
    fdb::execute(doc.ref("tags").remove());

    // -- typed reads ----------------------------------------------------------
    if (auto name = doc.at("profile.name").get<std::string>()) {
        std::printf("Name:   %s\n", name->c_str());
    }
    if (auto city = doc.ref("profile")["address"]["city"].get<std::string>()) {
        std::printf("City:   %s\n", city->c_str());
    }
    if (auto visits = doc.ref("visits").get<std::int64_t>()) {
        std::printf("Visits: %lld\n", static_cast<long long>(*visits));
    }

    // -- errors ---------------------------------------------------------------
    try {
        doc.ref("tags").get();
    } catch (const fdb::Exception& e) {
        std::printf("tags:   %s (%s)\n",
                    std::string{fdb::to_string_view(e.kind())}.c_str(), e.what());
    }
    try {
        fdb::execute(doc.at("visits.count").set(1));
    } catch (const fdb::Exception& e) {
        std::printf("visits.count: %s, offending path '%s'\n",
                    std::string{fdb::to_string_view(e.kind())}.c_str(),
                    e.error().at.c_str());
    }

    std::printf("Stored in %s\n", file.string().c_str());
    return 0;
}
