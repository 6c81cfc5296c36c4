#pragma once

#include "storage/cancellation.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docdb::storage {

// ── Storage contract ─────────────────────────────────────────────────────────
//
// Every backend implements the four interfaces below.  A conforming backend
// is a drop-in replacement for the query layer.  Rules shared by all of them:
//
//   - Keys are ordered bytewise (memcmp, shorter prefix first).
//   - Every operation first checks the transaction's CancellationToken and
//     returns errc::cancelled / errc::deadline_exceeded without doing any
//     work once it has fired.
//   - Mutations on a read-only transaction fail with errc::read_only.
//   - Stores and iterators must not outlive their transaction; once it is
//     committed or rolled back their operations fail with
//     errc::transaction_closed.
//   - None of these objects are thread-safe; one logical thread of control
//     per transaction.

struct IteratorOptions {
    bool reverse = false;
};

// ── Iterator ─────────────────────────────────────────────────────────────────
//
// Ordered cursor over a Store.  Three states: positioned on an item,
// exhausted, or errored.  An iterator is not positioned until seek() is
// called.
//
//   forward seek(pivot): first key >= pivot ("" = first key)
//   reverse seek(pivot): first key <= pivot ("" = last key)
//
// Once errored the iterator stays invalid and error() reports why.

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual void seek(std::string_view pivot) = 0;

    // Moves to the next item in iteration order.  No-op unless valid().
    virtual void next() = 0;

    [[nodiscard]] virtual bool valid() const = 0;

    [[nodiscard]] virtual std::error_code error() const = 0;

    // Key of the current item.  Only meaningful while valid().
    [[nodiscard]] virtual std::string_view key() const = 0;

    // Copies the value of the current item into `out`.
    [[nodiscard]] virtual std::error_code value_copy(std::string& out) const = 0;

    // Releases backend resources.  Idempotent; does not affect the Store.
    virtual void close() = 0;
};

// ── Store ────────────────────────────────────────────────────────────────────
//
// Transaction-scoped ordered key-value namespace.

class Store {
public:
    virtual ~Store() = default;

    // Inserts or overwrites `key`.
    [[nodiscard]] virtual std::error_code put(std::string_view key, std::string_view value) = 0;

    // errc::key_not_found when absent.
    [[nodiscard]] virtual std::error_code get(std::string_view key, std::string& out) = 0;

    // errc::key_not_found when absent.
    [[nodiscard]] virtual std::error_code del(std::string_view key) = 0;

    // Removes every key by dropping and recreating the namespace.
    [[nodiscard]] virtual std::error_code truncate() = 0;

    // Strictly increasing, starting at 1, unique for this store for the
    // lifetime of the backend.  Truncation does not reset it.
    [[nodiscard]] virtual std::error_code next_sequence(uint64_t& out) = 0;

    [[nodiscard]] virtual std::unique_ptr<Iterator> iterator(IteratorOptions opts = {}) = 0;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

// ── Transaction ──────────────────────────────────────────────────────────────
//
// Destroying a transaction that was neither committed nor rolled back rolls
// it back.

class Transaction {
public:
    virtual ~Transaction() = default;

    [[nodiscard]] virtual bool writable() const noexcept = 0;

    [[nodiscard]] virtual const CancellationToken& token() const noexcept = 0;

    // Publishes every mutation.  On a read-only transaction it only ends it.
    [[nodiscard]] virtual std::error_code commit() = 0;

    // Discards every mutation.  A no-op once the transaction has ended.
    virtual void rollback() = 0;

    // errc::store_not_found when absent.
    [[nodiscard]] virtual std::error_code get_store(std::string_view name,
                                                    std::unique_ptr<Store>& out) = 0;

    // errc::store_already_exists when present.
    [[nodiscard]] virtual std::error_code create_store(std::string_view name) = 0;

    // errc::store_not_found when absent.
    [[nodiscard]] virtual std::error_code drop_store(std::string_view name) = 0;

    // Names of every store, in key order.
    [[nodiscard]] virtual std::error_code list_stores(std::vector<std::string>& out) = 0;
};

// ── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    virtual ~Engine() = default;

    // Starts a transaction observing `token`.  Writable transactions may be
    // serialised by the backend (begin() then blocks until the previous
    // writer has ended).
    [[nodiscard]] virtual std::error_code begin(const CancellationToken& token,
                                                bool writable,
                                                std::unique_ptr<Transaction>& out) = 0;

    // Short backend name for logs and tools ("memory", "rocksdb").
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace docdb::storage
