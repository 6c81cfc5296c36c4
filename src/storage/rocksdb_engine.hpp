#pragma once

#include "storage/engine.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace rocksdb {
class TransactionDB;
} // namespace rocksdb

namespace docdb::storage {

// ── RocksDBEngine ────────────────────────────────────────────────────────────
//
// Persistent backend on top of rocksdb::TransactionDB.
//
// Key layout (single column family):
//
//   0x00 's' <name>        → be64 namespace id of store <name>
//   0x00 'q' <name>        → be64 last sequence handed out for <name>
//   0x00 'n'               → be64 next free namespace id
//   0x01 <be64 ns> <key>   → value of <key> in the store owning <ns>
//
// truncate() and drop_store() only rewrite the meta keys; the keys of the
// abandoned namespace are reclaimed after a successful commit.
//
// Writable transactions are serialised by the engine and read their own
// writes through a rocksdb::Transaction.  Read-only transactions read through
// a snapshot taken at begin().
//
// Transactions (and the stores / iterators they hand out) must be destroyed
// before the engine.

class RocksDBEngine final : public Engine {
public:
    // Opens (or creates, when `create_if_missing`) the database at `db_path`.
    // Throws std::runtime_error if the database cannot be opened.
    explicit RocksDBEngine(const std::filesystem::path& db_path,
                           bool create_if_missing = true);

    ~RocksDBEngine() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBEngine(const RocksDBEngine&)            = delete;
    RocksDBEngine& operator=(const RocksDBEngine&) = delete;
    RocksDBEngine(RocksDBEngine&&)                 = delete;
    RocksDBEngine& operator=(RocksDBEngine&&)      = delete;

    [[nodiscard]] std::error_code begin(const CancellationToken& token,
                                        bool writable,
                                        std::unique_ptr<Transaction>& out) override;

    [[nodiscard]] const char* name() const noexcept override { return "rocksdb"; }

private:
    std::unique_ptr<rocksdb::TransactionDB> db_;
    std::mutex writer_mutex_;
};

} // namespace docdb::storage
