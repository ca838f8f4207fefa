// Fuzz target for Transaction::apply() -- decodes the input into a sequence
// of set/remove/update operations over short key paths and applies them to
// one in-memory tree. Failures must surface as filedb_cpp::Exception.

#include <filedb-cpp/filedb.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fdb = filedb_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto doc = fdb::Document{"fuzz_apply.json"};
    static const char* const keys[] = {"a", "b", "c", "d"};

    auto transactions = std::vector<fdb::Transaction>{};
    std::size_t pos = 0;
    while (pos + 2 <= size && transactions.size() < 64) {
        const auto op = data[pos] % 3;
        const auto depth = data[pos + 1] % 4;
        pos += 2;

        auto path = fdb::Path{};
        for (std::size_t i = 0; i <= depth && pos < size; ++i, ++pos) {
            path.emplace_back(keys[data[pos] % 4]);
        }
        auto ref = fdb::Ref{doc, std::move(path)};

        switch (op) {
            case 0:
                transactions.push_back(ref.set(static_cast<std::int64_t>(pos)));
                break;
            case 1:
                transactions.push_back(ref.remove());
                break;
            default:
                transactions.push_back(ref.update([](const std::optional<fdb::Value>& v) {
                    return v ? fdb::Value{fdb::Array{*v}} : fdb::Value{};
                }));
                break;
        }
    }
    if (transactions.empty()) return 0;

    auto root = fdb::Object{};
    try {
        fdb::combine(std::move(transactions)).apply(root);
    } catch (const fdb::Exception&) {
        // Type mismatches are expected for random paths.
    }
    return 0;
}
