#include <filedb-cpp/ref.hpp>
#include <filedb-cpp/error.hpp>

#include "path_resolver.hpp"

#include <easylogging++.h>

#include <utility>

namespace filedb_cpp {

Ref::Ref(Document doc, Path path)
    : doc_{std::move(doc)}, path_{std::move(path)} {}

auto Ref::child(std::string_view key) const -> Ref {
    auto keys = Path{};
    keys.reserve(path_.size() + 1);
    keys.insert(keys.end(), path_.begin(), path_.end());
    keys.emplace_back(key);
    return Ref{doc_, std::move(keys)};
}

auto Ref::get() const -> Value {
    auto root = Object{};
    try {
        root = doc_.load();
    } catch (const Exception& e) {
        LOG(WARNING) << "reading '" << dotted() << "': " << e.what();
        throw detail::not_found(path_);
    }
    return detail::node_value(detail::resolve(root, path_, false));
}

auto Ref::try_get() const -> std::optional<Value> {
    try {
        return get();
    } catch (const Exception& e) {
        if (e.kind() == ErrorKind::not_found) return std::nullopt;
        throw;
    }
}

auto Ref::set(Value value) const -> Transaction {
    return Transaction{doc_, Transaction::Set{path_, std::move(value)}};
}

auto Ref::remove() const -> Transaction {
    return Transaction{doc_, Transaction::Remove{path_}};
}

auto Ref::update(Updater fn) const -> Transaction {
    return Transaction{doc_, Transaction::Update{path_, std::move(fn)}};
}

}  // namespace filedb_cpp
