#include <filedb-cpp/transaction.hpp>
#include <filedb-cpp/error.hpp>

#include "path_resolver.hpp"

#include <easylogging++.h>

#include <cstdlib>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace filedb_cpp {

namespace {

/// Resolve the object that holds the last key of `path`, creating
/// missing parents on the way.
auto resolve_parent(Object& root, const Path& path, std::string_view op) -> Object& {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_path,
                        "cannot " + std::string{op} + " the document root"};
    }
    auto parent_path = std::span<const std::string>{path}.first(path.size() - 1);
    auto node = detail::resolve(root, parent_path, path, true);
    auto* parent = detail::node_object(node);
    if (!parent) {
        throw detail::type_mismatch(path, parent_path, *std::get<Value*>(node));
    }
    return *parent;
}

}  // anonymous namespace

Transaction::Transaction(Document doc, Op op)
    : doc_{std::move(doc)}, op_{std::move(op)} {}

void Transaction::apply(Object& root) const {
    std::visit(overload{
        [&](const Set& tx) {
            auto& parent = resolve_parent(root, tx.path, "set");
            parent.insert_or_assign(tx.path.back(), tx.value);
        },
        [&](const Remove& tx) {
            auto& parent = resolve_parent(root, tx.path, "remove");
            if (auto it = parent.find(tx.path.back()); it != parent.end()) {
                parent.erase(it);
            }
        },
        [&](const Update& tx) {
            auto& parent = resolve_parent(root, tx.path, "update");
            auto current = std::optional<Value>{};
            if (auto it = parent.find(tx.path.back()); it != parent.end()) {
                current = it->second;
            }
            parent.insert_or_assign(tx.path.back(), tx.fn(current));
        },
        [&](const Combine& tx) {
            for (const auto& member : tx.members) {
                member.apply(root);
            }
        },
    }, op_);
}

auto combine(std::vector<Transaction> transactions) -> Transaction {
    if (transactions.empty()) {
        throw Exception{ErrorKind::invalid_composition, "no transactions supplied"};
    }
    const auto& doc = transactions.front().document();
    for (const auto& tx : transactions) {
        if (tx.document() != doc) {
            throw Exception{ErrorKind::invalid_composition,
                            "all transactions must be from the same document"};
        }
    }
    auto bound = doc;
    return Transaction{std::move(bound), Transaction::Combine{std::move(transactions)}};
}

auto combine_or_abort(std::vector<Transaction> transactions) -> Transaction {
    try {
        return combine(std::move(transactions));
    } catch (const Exception& e) {
        LOG(FATAL) << "combine: " << e.what();
        std::abort();
    }
}

}  // namespace filedb_cpp
