/// @file transaction.hpp
/// @brief Deferred, composable mutations of a Document.

#pragma once

#include <filedb-cpp/document.hpp>
#include <filedb-cpp/path.hpp>
#include <filedb-cpp/value.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace filedb_cpp {

/// Computes a new value from the current one (nullopt if the key is unset).
using Updater = std::function<Value(const std::optional<Value>&)>;

/// A description of one or more mutations to a single Document.
///
/// Transactions are created by Ref::set(), Ref::remove(), Ref::update()
/// and combine(). They are immutable, hold no file resources, and do
/// nothing until passed to execute().
///
/// @code
/// auto tx = combine(doc.ref("a").set(1), doc.ref("b").remove());
/// execute(tx);
/// @endcode
class Transaction {
    friend class Ref;
    friend auto combine(std::vector<Transaction> transactions) -> Transaction;

public:
    /// The document this transaction is bound to.
    auto document() const -> const Document& { return doc_; }

    /// Apply the mutations to an in-memory root object.
    ///
    /// Leaf mutations auto-vivify missing parent objects. A combined
    /// transaction stops at its first failing member; members already
    /// applied stay applied to `root`.
    /// @throws Exception with ErrorKind::type_mismatch or ErrorKind::invalid_path.
    void apply(Object& root) const;

private:
    struct Set {
        Path path;
        Value value;
    };
    struct Remove {
        Path path;
    };
    struct Update {
        Path path;
        Updater fn;
    };
    struct Combine {
        std::vector<Transaction> members;
    };
    using Op = std::variant<Set, Remove, Update, Combine>;

    Transaction(Document doc, Op op);

    Document doc_;
    Op op_;
};

// -- Composition --------------------------------------------------------------

/// Combine transactions of one document into a single transaction,
/// applied in order by one execute() call.
/// @throws Exception with ErrorKind::invalid_composition if `transactions`
///   is empty or its members are bound to different documents.
auto combine(std::vector<Transaction> transactions) -> Transaction;

/// Variadic form of combine().
/// @code
/// execute(combine(doc.ref("a").set(1), doc.ref("b").remove()));
/// @endcode
template <std::same_as<Transaction>... Ts>
auto combine(const Ts&... transactions) -> Transaction {
    return combine(std::vector<Transaction>{transactions...});
}

/// Like combine(), but misuse is a programming error: it is logged as
/// FATAL and the process is aborted.
auto combine_or_abort(std::vector<Transaction> transactions) -> Transaction;

/// Variadic form of combine_or_abort().
template <std::same_as<Transaction>... Ts>
auto combine_or_abort(const Ts&... transactions) -> Transaction {
    return combine_or_abort(std::vector<Transaction>{transactions...});
}

}  // namespace filedb_cpp
