#include "storage/rocksdb_engine.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"
#include "document/key_encoding.hpp"

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>

#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace docdb::storage {

namespace {

constexpr char kMetaPrefix = '\x00';
constexpr char kDataPrefix = '\x01';
constexpr char kStoreTag   = 's';
constexpr char kSeqTag     = 'q';
constexpr char kNextNsTag  = 'n';

std::shared_ptr<spdlog::logger> engine_log() {
    static auto logger = make_component_logger("engine");
    return logger;
}

std::string meta_key(char tag, std::string_view name = {}) {
    std::string key;
    key.reserve(2 + name.size());
    key += kMetaPrefix;
    key += tag;
    key.append(name);
    return key;
}

std::string ns_prefix(uint64_t ns) {
    std::string prefix(1, kDataPrefix);
    keys::append_u64(prefix, ns);
    return prefix;
}

std::string encode_u64(uint64_t v) {
    std::string out;
    keys::append_u64(out, v);
    return out;
}

rocksdb::Slice to_slice(std::string_view s) {
    return rocksdb::Slice{s.data(), s.size()};
}

std::string_view to_view(const rocksdb::Slice& s) {
    return std::string_view{s.data(), s.size()};
}

bool starts_with(const rocksdb::Slice& key, std::string_view prefix) {
    return key.size() >= prefix.size() &&
           to_view(key).substr(0, prefix.size()) == prefix;
}

std::error_code storage_failure(const char* op, const rocksdb::Status& status) {
    engine_log()->error("RocksDB {} failed: {}", op, status.ToString());
    return make_error_code(errc::storage_error);
}

// ── TxState ──────────────────────────────────────────────────────────────────
// Shared by a transaction and its store / iterator handles.  Owns the
// rocksdb::Transaction (or the snapshot) until the last handle is gone, so
// that iterators created from it can always be destroyed safely.

struct TxState {
    TxState(rocksdb::TransactionDB& db, const CancellationToken& token, bool writable)
        : db(db)
        , token(token)
        , writable(writable)
    {}

    ~TxState() {
        if (snapshot) {
            db.ReleaseSnapshot(snapshot);
        }
    }

    TxState(const TxState&)            = delete;
    TxState& operator=(const TxState&) = delete;

    rocksdb::TransactionDB& db;
    std::unique_ptr<rocksdb::Transaction> txn;  // writable transactions only
    const rocksdb::Snapshot* snapshot = nullptr;  // read-only transactions only
    CancellationToken token;
    bool writable;
    bool closed = false;

    // name → namespace id as seen by this transaction; nullopt = absent.
    std::map<std::string, std::optional<uint64_t>, std::less<>> ns_cache;
    // Namespaces abandoned by truncate / drop, reclaimed after commit.
    std::vector<uint64_t> abandoned;

    [[nodiscard]] std::error_code check() const {
        if (closed) {
            return make_error_code(errc::transaction_closed);
        }
        return token.check();
    }

    [[nodiscard]] rocksdb::ReadOptions read_options() const {
        rocksdb::ReadOptions ro;
        ro.snapshot = snapshot;
        return ro;
    }

    [[nodiscard]] rocksdb::Status read(std::string_view key, std::string* out) const {
        if (txn) {
            return txn->Get(read_options(), to_slice(key), out);
        }
        return db.Get(read_options(), to_slice(key), out);
    }

    [[nodiscard]] std::unique_ptr<rocksdb::Iterator> new_iterator() const {
        if (txn) {
            return std::unique_ptr<rocksdb::Iterator>(txn->GetIterator(read_options()));
        }
        return std::unique_ptr<rocksdb::Iterator>(db.NewIterator(read_options()));
    }

    // Resolves the namespace of `name`; sets `out` to nullopt when absent.
    [[nodiscard]] std::error_code lookup(std::string_view name, std::optional<uint64_t>& out) {
        if (auto it = ns_cache.find(name); it != ns_cache.end()) {
            out = it->second;
            return {};
        }
        std::string raw;
        auto status = read(meta_key(kStoreTag, name), &raw);
        if (status.IsNotFound()) {
            out.reset();
        } else if (!status.ok()) {
            return storage_failure("Get", status);
        } else if (raw.size() != 8) {
            return make_error_code(errc::corrupted);
        } else {
            out = keys::read_u64(raw);
        }
        ns_cache.emplace(std::string(name), out);
        return {};
    }

    // Hands out a fresh namespace id and maps `name` to it.
    [[nodiscard]] std::error_code assign_namespace(std::string_view name, uint64_t& ns) {
        std::string raw;
        auto status = read(meta_key(kNextNsTag), &raw);
        if (status.IsNotFound()) {
            ns = 1;
        } else if (!status.ok()) {
            return storage_failure("Get", status);
        } else {
            ns = keys::read_u64(raw);
        }
        if (status = txn->Put(to_slice(meta_key(kNextNsTag)), encode_u64(ns + 1)); !status.ok()) {
            return storage_failure("Put", status);
        }
        if (status = txn->Put(to_slice(meta_key(kStoreTag, name)), encode_u64(ns)); !status.ok()) {
            return storage_failure("Put", status);
        }
        ns_cache.insert_or_assign(std::string(name), ns);
        return {};
    }
};

// ── RocksDBIterator ──────────────────────────────────────────────────────────

class RocksDBIterator final : public Iterator {
public:
    RocksDBIterator(std::shared_ptr<TxState> tx, std::optional<uint64_t> ns, bool reverse)
        : tx_(std::move(tx))
        , reverse_(reverse)
    {
        if (ns) {
            prefix_ = ns_prefix(*ns);
            upper_ = ns_prefix(*ns + 1);
            it_ = tx_->new_iterator();
        }
    }

    void seek(std::string_view pivot) override {
        if (closed_ || err_ || !check()) return;
        if (!it_) {
            // The store does not exist in this transaction: nothing to yield.
            positioned_ = false;
            return;
        }

        if (!reverse_) {
            it_->Seek(to_slice(prefix_ + std::string(pivot)));
        } else if (pivot.empty()) {
            it_->SeekForPrev(to_slice(upper_));
            // The first key of the following namespace may equal upper_.
            while (it_->Valid() && to_view(it_->key()) >= upper_) {
                it_->Prev();
            }
        } else {
            // First key >= pivot, then back while above it.  Nothing at or
            // after the pivot in this store leaves the iterator exhausted.
            const std::string target = prefix_ + std::string(pivot);
            it_->Seek(to_slice(target));
            if (it_->Valid() && !starts_with(it_->key(), prefix_)) {
                positioned_ = false;
                return;
            }
            while (it_->Valid() && to_view(it_->key()) > target) {
                it_->Prev();
            }
        }
        settle();
    }

    void next() override {
        if (!valid() || !check()) return;
        if (reverse_) {
            it_->Prev();
        } else {
            it_->Next();
        }
        settle();
    }

    [[nodiscard]] bool valid() const override {
        return positioned_ && !err_ && !closed_;
    }

    [[nodiscard]] std::error_code error() const override { return err_; }

    [[nodiscard]] std::string_view key() const override {
        if (!valid()) return {};
        return to_view(it_->key()).substr(prefix_.size());
    }

    [[nodiscard]] std::error_code value_copy(std::string& out) const override {
        if (!valid()) {
            return err_ ? err_ : make_error_code(errc::key_not_found);
        }
        out.assign(it_->value().data(), it_->value().size());
        return {};
    }

    void close() override {
        closed_ = true;
        positioned_ = false;
        it_.reset();
    }

private:
    [[nodiscard]] bool check() {
        if (auto ec = tx_->check()) {
            err_ = ec;
            positioned_ = false;
            return false;
        }
        return true;
    }

    void settle() {
        if (!it_->Valid()) {
            positioned_ = false;
            if (auto status = it_->status(); !status.ok()) {
                err_ = storage_failure("Iterator", status);
            }
            return;
        }
        positioned_ = starts_with(it_->key(), prefix_);
    }

    // tx_ is declared first so that it_ is destroyed before the transaction.
    std::shared_ptr<TxState> tx_;
    std::unique_ptr<rocksdb::Iterator> it_;
    std::string prefix_;
    std::string upper_;
    bool reverse_;
    bool positioned_ = false;
    bool closed_ = false;
    std::error_code err_;
};

// ── RocksDBStore ─────────────────────────────────────────────────────────────

class RocksDBStore final : public Store {
public:
    RocksDBStore(std::shared_ptr<TxState> tx, std::string name)
        : tx_(std::move(tx))
        , name_(std::move(name))
    {}

    std::error_code put(std::string_view key, std::string_view value) override {
        uint64_t ns = 0;
        if (auto ec = resolve(true, ns)) return ec;
        auto status = tx_->txn->Put(to_slice(data_key(ns, key)), to_slice(value));
        if (!status.ok()) {
            return storage_failure("Put", status);
        }
        return {};
    }

    std::error_code get(std::string_view key, std::string& out) override {
        uint64_t ns = 0;
        if (auto ec = resolve(false, ns)) return ec;
        auto status = tx_->read(data_key(ns, key), &out);
        if (status.IsNotFound()) {
            return make_error_code(errc::key_not_found);
        }
        if (!status.ok()) {
            return storage_failure("Get", status);
        }
        return {};
    }

    std::error_code del(std::string_view key) override {
        uint64_t ns = 0;
        if (auto ec = resolve(true, ns)) return ec;

        // RocksDB Delete succeeds even if the key is missing.
        const auto k = data_key(ns, key);
        std::string existing;
        auto status = tx_->read(k, &existing);
        if (status.IsNotFound()) {
            return make_error_code(errc::key_not_found);
        }
        if (!status.ok()) {
            return storage_failure("Get", status);
        }
        if (status = tx_->txn->Delete(to_slice(k)); !status.ok()) {
            return storage_failure("Delete", status);
        }
        return {};
    }

    std::error_code truncate() override {
        uint64_t old_ns = 0;
        if (auto ec = resolve(true, old_ns)) return ec;
        uint64_t fresh = 0;
        if (auto ec = tx_->assign_namespace(name_, fresh)) return ec;
        tx_->abandoned.push_back(old_ns);
        return {};
    }

    std::error_code next_sequence(uint64_t& out) override {
        uint64_t ns = 0;
        if (auto ec = resolve(true, ns)) return ec;

        const auto k = meta_key(kSeqTag, name_);
        std::string raw;
        auto status = tx_->read(k, &raw);
        uint64_t last = 0;
        if (status.ok()) {
            last = keys::read_u64(raw);
        } else if (!status.IsNotFound()) {
            return storage_failure("Get", status);
        }
        if (status = tx_->txn->Put(to_slice(k), encode_u64(last + 1)); !status.ok()) {
            return storage_failure("Put", status);
        }
        out = last + 1;
        return {};
    }

    std::unique_ptr<Iterator> iterator(IteratorOptions opts) override {
        std::optional<uint64_t> ns;
        if (!tx_->closed) {
            if (auto ec = tx_->lookup(name_, ns)) {
                ns.reset();
            }
        }
        return std::make_unique<RocksDBIterator>(tx_, ns, opts.reverse);
    }

    const std::string& name() const noexcept override { return name_; }

private:
    static std::string data_key(uint64_t ns, std::string_view key) {
        auto k = ns_prefix(ns);
        k.append(key);
        return k;
    }

    [[nodiscard]] std::error_code resolve(bool mutating, uint64_t& ns) {
        if (auto ec = tx_->check()) return ec;
        if (mutating && !tx_->writable) {
            return make_error_code(errc::read_only);
        }
        std::optional<uint64_t> found;
        if (auto ec = tx_->lookup(name_, found)) return ec;
        if (!found) {
            return make_error_code(errc::store_not_found);
        }
        ns = *found;
        return {};
    }

    std::shared_ptr<TxState> tx_;
    std::string name_;
};

// ── RocksDBTransaction ───────────────────────────────────────────────────────

class RocksDBTransaction final : public Transaction {
public:
    RocksDBTransaction(std::shared_ptr<TxState> state, std::unique_lock<std::mutex> writer_lock)
        : state_(std::move(state))
        , writer_lock_(std::move(writer_lock))
    {}

    ~RocksDBTransaction() override {
        rollback();
    }

    bool writable() const noexcept override { return state_->writable; }

    const CancellationToken& token() const noexcept override { return state_->token; }

    std::error_code commit() override {
        if (state_->closed) {
            return make_error_code(errc::transaction_closed);
        }
        if (auto ec = state_->token.check()) {
            rollback();
            return ec;
        }
        if (!state_->writable) {
            end();
            return {};
        }

        if (auto status = state_->txn->Commit(); !status.ok()) {
            auto ec = storage_failure("Commit", status);
            rollback();
            return ec;
        }
        reclaim();
        end();
        return {};
    }

    void rollback() override {
        if (state_->closed) return;
        if (state_->txn) {
            if (auto status = state_->txn->Rollback(); !status.ok()) {
                engine_log()->error("RocksDB Rollback failed: {}", status.ToString());
            }
        }
        end();
    }

    std::error_code get_store(std::string_view name, std::unique_ptr<Store>& out) override {
        if (auto ec = state_->check()) return ec;
        std::optional<uint64_t> ns;
        if (auto ec = state_->lookup(name, ns)) return ec;
        if (!ns) {
            return make_error_code(errc::store_not_found);
        }
        out = std::make_unique<RocksDBStore>(state_, std::string(name));
        return {};
    }

    std::error_code create_store(std::string_view name) override {
        if (auto ec = check_writable()) return ec;
        std::optional<uint64_t> ns;
        if (auto ec = state_->lookup(name, ns)) return ec;
        if (ns) {
            return make_error_code(errc::store_already_exists);
        }
        uint64_t fresh = 0;
        return state_->assign_namespace(name, fresh);
    }

    std::error_code drop_store(std::string_view name) override {
        if (auto ec = check_writable()) return ec;
        std::optional<uint64_t> ns;
        if (auto ec = state_->lookup(name, ns)) return ec;
        if (!ns) {
            return make_error_code(errc::store_not_found);
        }
        if (auto status = state_->txn->Delete(to_slice(meta_key(kStoreTag, name))); !status.ok()) {
            return storage_failure("Delete", status);
        }
        state_->ns_cache.insert_or_assign(std::string(name), std::nullopt);
        state_->abandoned.push_back(*ns);
        return {};
    }

    std::error_code list_stores(std::vector<std::string>& out) override {
        if (auto ec = state_->check()) return ec;
        out.clear();
        const auto prefix = meta_key(kStoreTag);
        auto it = state_->new_iterator();
        for (it->Seek(to_slice(prefix)); it->Valid() && starts_with(it->key(), prefix); it->Next()) {
            out.emplace_back(to_view(it->key()).substr(prefix.size()));
        }
        if (auto status = it->status(); !status.ok()) {
            return storage_failure("Iterator", status);
        }
        return {};
    }

private:
    [[nodiscard]] std::error_code check_writable() const {
        if (auto ec = state_->check()) return ec;
        if (!state_->writable) {
            return make_error_code(errc::read_only);
        }
        return {};
    }

    // Deletes the keys of namespaces abandoned by this transaction.  They are
    // unreachable once the commit is visible, so failures only leak space.
    void reclaim() {
        for (uint64_t ns : state_->abandoned) {
            rocksdb::WriteBatch batch;
            const auto prefix = ns_prefix(ns);
            std::unique_ptr<rocksdb::Iterator> it(state_->db.NewIterator(rocksdb::ReadOptions{}));
            for (it->Seek(to_slice(prefix)); it->Valid() && starts_with(it->key(), prefix); it->Next()) {
                batch.Delete(it->key());
            }
            if (batch.Count() == 0) continue;
            if (auto status = state_->db.Write(rocksdb::WriteOptions{}, &batch); !status.ok()) {
                engine_log()->warn("Failed to reclaim namespace {}: {}", ns, status.ToString());
            }
        }
        state_->abandoned.clear();
    }

    void end() {
        state_->closed = true;
        state_->ns_cache.clear();
        if (writer_lock_.owns_lock()) {
            writer_lock_.unlock();
        }
    }

    std::shared_ptr<TxState> state_;
    std::unique_lock<std::mutex> writer_lock_;
};

} // anonymous namespace

// ── RocksDBEngine ────────────────────────────────────────────────────────────

RocksDBEngine::RocksDBEngine(const std::filesystem::path& db_path, bool create_if_missing) {
    rocksdb::Options options;
    options.create_if_missing = create_if_missing;
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::TransactionDBOptions txn_db_options;

    rocksdb::TransactionDB* raw_db = nullptr;
    auto status = rocksdb::TransactionDB::Open(options, txn_db_options, db_path.string(), &raw_db);
    if (!status.ok()) {
        throw std::runtime_error(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    engine_log()->info("RocksDB opened at {}", db_path.string());
}

RocksDBEngine::~RocksDBEngine() {
    if (db_) {
        engine_log()->info("Closing RocksDB");
    }
}

std::error_code RocksDBEngine::begin(const CancellationToken& token,
                                     bool writable,
                                     std::unique_ptr<Transaction>& out) {
    if (auto ec = token.check()) {
        return ec;
    }

    auto state = std::make_shared<TxState>(*db_, token, writable);
    std::unique_lock<std::mutex> writer_lock;
    if (writable) {
        writer_lock = std::unique_lock<std::mutex>(writer_mutex_);
        state->txn.reset(db_->BeginTransaction(rocksdb::WriteOptions{}));
    } else {
        state->snapshot = db_->GetSnapshot();
    }

    out = std::make_unique<RocksDBTransaction>(std::move(state), std::move(writer_lock));
    return {};
}

} // namespace docdb::storage
