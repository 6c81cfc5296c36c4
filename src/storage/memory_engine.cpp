#include "storage/memory_engine.hpp"

#include "common/error.hpp"

#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace docdb::storage {

namespace {

using StoreData = MemoryEngine::StoreData;
using State     = MemoryEngine::State;

// ── TxState ──────────────────────────────────────────────────────────────────
// Shared by a transaction and every store / iterator handle it hands out, so
// that handles can detect the end of the transaction.

struct TxState {
    State working;
    std::set<std::string, std::less<>> owned;  // stores already cloned by this tx
    CancellationToken token;
    bool writable = false;
    bool closed = false;

    [[nodiscard]] std::error_code check() const {
        if (closed) {
            return make_error_code(errc::transaction_closed);
        }
        return token.check();
    }

    [[nodiscard]] std::shared_ptr<StoreData> find(std::string_view name) const {
        auto it = working.stores.find(name);
        return it == working.stores.end() ? nullptr : it->second;
    }

    // Returns a store this transaction may mutate, cloning it on first use.
    [[nodiscard]] StoreData& own(const std::string& name) {
        auto& slot = working.stores[name];
        if (!owned.contains(name)) {
            slot = slot ? std::make_shared<StoreData>(*slot) : std::make_shared<StoreData>();
            owned.insert(name);
        }
        return *slot;
    }
};

// ── MemoryIterator ───────────────────────────────────────────────────────────
// Keeps a copy of the current key and repositions with lower/upper_bound on
// every step, so mutations made by the owning transaction never invalidate it.

class MemoryIterator final : public Iterator {
public:
    MemoryIterator(std::shared_ptr<TxState> tx, std::shared_ptr<StoreData> data, bool reverse)
        : tx_(std::move(tx))
        , data_(std::move(data))
        , reverse_(reverse)
    {}

    void seek(std::string_view pivot) override {
        if (closed_ || err_ || !check()) return;

        const auto& m = data_->entries;
        auto it = m.end();
        if (!reverse_) {
            it = m.lower_bound(pivot);
        } else if (pivot.empty()) {
            it = last();
        } else {
            // No key at or after the pivot leaves the iterator exhausted.
            it = m.lower_bound(pivot);
            if (it != m.end()) {
                while (it->first > pivot) {
                    if (it == m.begin()) {
                        it = m.end();
                        break;
                    }
                    --it;
                }
            }
        }
        load(it);
    }

    void next() override {
        if (!valid() || !check()) return;

        const auto& m = data_->entries;
        auto it = m.end();
        if (!reverse_) {
            it = m.upper_bound(key_);
        } else {
            it = m.lower_bound(key_);
            it = (it == m.begin()) ? m.end() : std::prev(it);
        }
        load(it);
    }

    [[nodiscard]] bool valid() const override {
        return positioned_ && !err_ && !closed_;
    }

    [[nodiscard]] std::error_code error() const override { return err_; }

    [[nodiscard]] std::string_view key() const override { return key_; }

    [[nodiscard]] std::error_code value_copy(std::string& out) const override {
        if (!valid()) {
            return err_ ? err_ : make_error_code(errc::key_not_found);
        }
        out = value_;
        return {};
    }

    void close() override {
        closed_ = true;
        positioned_ = false;
        data_.reset();
    }

private:
    using MapIt = std::map<std::string, std::string, std::less<>>::const_iterator;

    // Records the error and drops the position; returns false on error.
    [[nodiscard]] bool check() {
        if (auto ec = tx_->check()) {
            err_ = ec;
            positioned_ = false;
            return false;
        }
        return true;
    }

    [[nodiscard]] MapIt last() const {
        const auto& m = data_->entries;
        return m.empty() ? m.end() : std::prev(m.end());
    }

    void load(MapIt it) {
        if (it == data_->entries.end()) {
            positioned_ = false;
            key_.clear();
            value_.clear();
            return;
        }
        key_ = it->first;
        value_ = it->second;
        positioned_ = true;
    }

    std::shared_ptr<TxState> tx_;
    std::shared_ptr<StoreData> data_;
    bool reverse_;
    bool positioned_ = false;
    bool closed_ = false;
    std::error_code err_;
    std::string key_;
    std::string value_;
};

// ── MemoryStore ──────────────────────────────────────────────────────────────

class MemoryStore final : public Store {
public:
    MemoryStore(std::shared_ptr<TxState> tx, std::string name)
        : tx_(std::move(tx))
        , name_(std::move(name))
    {}

    std::error_code put(std::string_view key, std::string_view value) override {
        if (auto ec = check_writable()) return ec;
        tx_->own(name_).entries.insert_or_assign(std::string(key), std::string(value));
        return {};
    }

    std::error_code get(std::string_view key, std::string& out) override {
        if (auto ec = check()) return ec;
        const auto data = tx_->find(name_);
        auto it = data->entries.find(key);
        if (it == data->entries.end()) {
            return make_error_code(errc::key_not_found);
        }
        out = it->second;
        return {};
    }

    std::error_code del(std::string_view key) override {
        if (auto ec = check_writable()) return ec;
        if (!tx_->find(name_)->entries.contains(key)) {
            return make_error_code(errc::key_not_found);
        }
        auto& entries = tx_->own(name_).entries;
        entries.erase(entries.find(key));
        return {};
    }

    std::error_code truncate() override {
        if (auto ec = check_writable()) return ec;
        tx_->working.stores[name_] = std::make_shared<StoreData>();
        tx_->owned.insert(name_);
        return {};
    }

    std::error_code next_sequence(uint64_t& out) override {
        if (auto ec = check_writable()) return ec;
        out = ++tx_->working.sequences[name_];
        return {};
    }

    std::unique_ptr<Iterator> iterator(IteratorOptions opts) override {
        auto data = tx_->find(name_);
        if (!data) {
            // Dropped store: iterate an empty snapshot; seek() reports closure
            // or cancellation like any other iterator.
            data = std::make_shared<StoreData>();
        }
        return std::make_unique<MemoryIterator>(tx_, std::move(data), opts.reverse);
    }

    const std::string& name() const noexcept override { return name_; }

private:
    [[nodiscard]] std::error_code check() const {
        if (auto ec = tx_->check()) return ec;
        if (!tx_->find(name_)) {
            return make_error_code(errc::store_not_found);
        }
        return {};
    }

    [[nodiscard]] std::error_code check_writable() const {
        if (auto ec = tx_->check()) return ec;
        if (!tx_->writable) {
            return make_error_code(errc::read_only);
        }
        if (!tx_->find(name_)) {
            return make_error_code(errc::store_not_found);
        }
        return {};
    }

    std::shared_ptr<TxState> tx_;
    std::string name_;
};

} // anonymous namespace

// ── MemoryTransaction ────────────────────────────────────────────────────────

class MemoryTransaction final : public Transaction {
public:
    MemoryTransaction(MemoryEngine& engine,
                      const CancellationToken& token,
                      bool writable,
                      std::unique_lock<std::mutex> writer_lock)
        : engine_(engine)
        , state_(std::make_shared<TxState>())
        , writer_lock_(std::move(writer_lock))
    {
        state_->working = *engine_.committed();
        state_->token = token;
        state_->writable = writable;
    }

    ~MemoryTransaction() override {
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
        if (state_->writable) {
            engine_.publish(std::make_shared<const State>(std::move(state_->working)));
        }
        end();
        return {};
    }

    void rollback() override {
        if (state_->closed) return;
        end();
    }

    std::error_code get_store(std::string_view name, std::unique_ptr<Store>& out) override {
        if (auto ec = state_->check()) return ec;
        if (!state_->find(name)) {
            return make_error_code(errc::store_not_found);
        }
        out = std::make_unique<MemoryStore>(state_, std::string(name));
        return {};
    }

    std::error_code create_store(std::string_view name) override {
        if (auto ec = check_writable()) return ec;
        if (state_->find(name)) {
            return make_error_code(errc::store_already_exists);
        }
        const std::string key(name);
        state_->working.stores.emplace(key, std::make_shared<StoreData>());
        state_->owned.insert(key);
        return {};
    }

    std::error_code drop_store(std::string_view name) override {
        if (auto ec = check_writable()) return ec;
        auto it = state_->working.stores.find(name);
        if (it == state_->working.stores.end()) {
            return make_error_code(errc::store_not_found);
        }
        state_->working.stores.erase(it);
        if (auto owned = state_->owned.find(name); owned != state_->owned.end()) {
            state_->owned.erase(owned);
        }
        return {};
    }

    std::error_code list_stores(std::vector<std::string>& out) override {
        if (auto ec = state_->check()) return ec;
        out.clear();
        for (const auto& [name, _] : state_->working.stores) {
            out.push_back(name);
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

    void end() {
        state_->closed = true;
        state_->working = State{};
        state_->owned.clear();
        if (writer_lock_.owns_lock()) {
            writer_lock_.unlock();
        }
    }

    MemoryEngine& engine_;
    std::shared_ptr<TxState> state_;
    std::unique_lock<std::mutex> writer_lock_;
};

// ── MemoryEngine ─────────────────────────────────────────────────────────────

MemoryEngine::MemoryEngine()
    : committed_(std::make_shared<const State>())
{
    spdlog::debug("Memory engine created");
}

std::error_code MemoryEngine::begin(const CancellationToken& token,
                                    bool writable,
                                    std::unique_ptr<Transaction>& out) {
    if (auto ec = token.check()) {
        return ec;
    }

    std::unique_lock<std::mutex> writer_lock;
    if (writable) {
        writer_lock = std::unique_lock<std::mutex>(writer_mutex_);
    }

    out = std::make_unique<MemoryTransaction>(*this, token, writable, std::move(writer_lock));
    return {};
}

std::shared_ptr<const MemoryEngine::State> MemoryEngine::committed() const {
    std::lock_guard lock(state_mutex_);
    return committed_;
}

void MemoryEngine::publish(std::shared_ptr<const State> state) {
    std::lock_guard lock(state_mutex_);
    committed_ = std::move(state);
}

} // namespace docdb::storage
