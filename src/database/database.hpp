#pragma once

#include "common/config.hpp"
#include "storage/engine.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <system_error>

namespace docdb {

// ── Database ─────────────────────────────────────────────────────────────────
//
// Owns a storage engine and hands out transactions on it.  view() and
// update() run a callback inside a transaction and own its end:
//
//   db.update([&](storage::Transaction& tx) -> std::error_code {
//       Catalog catalog(tx);
//       return catalog.create_table({.name = "users"});
//   });
//
// When a query timeout is configured, transactions begun without an explicit
// token get one carrying that deadline.

class Database {
public:
    using TxFunc = std::function<std::error_code(storage::Transaction&)>;

    explicit Database(std::unique_ptr<storage::Engine> engine,
                      std::chrono::milliseconds query_timeout = std::chrono::milliseconds{0});

    [[nodiscard]] storage::Engine& engine() noexcept { return *engine_; }

    [[nodiscard]] std::error_code begin(bool writable, std::unique_ptr<storage::Transaction>& out);

    [[nodiscard]] std::error_code begin(const storage::CancellationToken& token,
                                        bool writable,
                                        std::unique_ptr<storage::Transaction>& out);

    // Runs `fn` in a read-only transaction.
    [[nodiscard]] std::error_code view(const TxFunc& fn);
    [[nodiscard]] std::error_code view(const storage::CancellationToken& token, const TxFunc& fn);

    // Runs `fn` in a writable transaction, committed when `fn` succeeds and
    // rolled back otherwise.
    [[nodiscard]] std::error_code update(const TxFunc& fn);
    [[nodiscard]] std::error_code update(const storage::CancellationToken& token, const TxFunc& fn);

    // Token used when the caller supplies none: carries the query timeout
    // when one is configured.
    [[nodiscard]] storage::CancellationToken default_token() const;

private:
    [[nodiscard]] std::error_code run(const storage::CancellationToken& token,
                                      bool writable,
                                      const TxFunc& fn);

    std::unique_ptr<storage::Engine> engine_;
    std::chrono::milliseconds query_timeout_;
};

// Builds the engine named by `cfg` and wraps it in a Database.
// Throws std::runtime_error when the configuration is invalid or the engine
// cannot be opened.
[[nodiscard]] std::unique_ptr<Database> open_database(const DatabaseConfig& cfg);

} // namespace docdb
