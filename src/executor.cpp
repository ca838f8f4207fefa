#include <filedb-cpp/executor.hpp>
#include <filedb-cpp/error.hpp>

#include <easylogging++.h>

#include <utility>

namespace filedb_cpp {

void execute(const Transaction& tx) {
    const auto& doc = tx.document();
    const auto& options = doc.options();

    auto root = Object{};
    try {
        root = doc.load();
    } catch (const Exception& e) {
        if (options.on_load_failure == LoadFailurePolicy::propagate) throw;
        LOG(WARNING) << "starting from an empty document: " << e.what();
    }

    tx.apply(root);

    try {
        doc.store(root);
    } catch (const Exception& e) {
        if (options.on_store_failure == StoreFailurePolicy::propagate) throw;
        LOG(ERROR) << "changes to " << doc.path().string() << " were not stored: " << e.what();
    }
}

}  // namespace filedb_cpp
