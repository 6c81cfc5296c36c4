#include "database/database.hpp"

#include "storage/memory_engine.hpp"
#include "storage/rocksdb_engine.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace docdb {

Database::Database(std::unique_ptr<storage::Engine> engine,
                   std::chrono::milliseconds query_timeout)
    : engine_(std::move(engine))
    , query_timeout_(query_timeout)
{
    if (!engine_) {
        throw std::invalid_argument("Database requires a storage engine");
    }
}

storage::CancellationToken Database::default_token() const {
    if (query_timeout_.count() <= 0) {
        return {};
    }
    return storage::CancellationSource::with_timeout(query_timeout_).token();
}

std::error_code Database::begin(bool writable, std::unique_ptr<storage::Transaction>& out) {
    return engine_->begin(default_token(), writable, out);
}

std::error_code Database::begin(const storage::CancellationToken& token,
                                bool writable,
                                std::unique_ptr<storage::Transaction>& out) {
    return engine_->begin(token, writable, out);
}

std::error_code Database::run(const storage::CancellationToken& token,
                              bool writable,
                              const TxFunc& fn) {
    std::unique_ptr<storage::Transaction> tx;
    if (auto ec = engine_->begin(token, writable, tx)) {
        return ec;
    }

    if (auto ec = fn(*tx)) {
        tx->rollback();
        return ec;
    }
    if (!writable) {
        tx->rollback();
        return {};
    }
    return tx->commit();
}

std::error_code Database::view(const TxFunc& fn) {
    return run(default_token(), false, fn);
}

std::error_code Database::view(const storage::CancellationToken& token, const TxFunc& fn) {
    return run(token, false, fn);
}

std::error_code Database::update(const TxFunc& fn) {
    return run(default_token(), true, fn);
}

std::error_code Database::update(const storage::CancellationToken& token, const TxFunc& fn) {
    return run(token, true, fn);
}

// ── open_database ────────────────────────────────────────────────────────────

std::unique_ptr<Database> open_database(const DatabaseConfig& cfg) {
    validate(cfg);

    std::unique_ptr<storage::Engine> engine;
    if (cfg.engine == "rocksdb") {
        const std::filesystem::path dir(cfg.data_dir);
        if (cfg.create_if_missing) {
            std::filesystem::create_directories(dir);
        }
        engine = std::make_unique<storage::RocksDBEngine>(dir, cfg.create_if_missing);
    } else {
        engine = std::make_unique<storage::MemoryEngine>();
    }

    spdlog::info("Opened database (engine={}, query_timeout_ms={})",
                 engine->name(), cfg.query_timeout_ms);
    return std::make_unique<Database>(std::move(engine),
                                      std::chrono::milliseconds{cfg.query_timeout_ms});
}

} // namespace docdb
