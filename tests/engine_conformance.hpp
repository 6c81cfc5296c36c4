#pragma once

// Behaviour every storage engine must share.  A test file instantiates the
// suite with a factory type exposing
//
//   std::unique_ptr<Engine> open();
//
// The factory outlives the engine it opened.

#include "common/error.hpp"
#include "storage/cancellation.hpp"
#include "storage/engine.hpp"
#include "manual_clock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace docdb::storage {

// ── Fixture ──────────────────────────────────────────────────────────────────

template <class Factory>
class EngineConformanceTest : public ::testing::Test {
protected:
    void SetUp() override { engine_ = factory_.open(); }

    void TearDown() override { engine_.reset(); }

    std::unique_ptr<Transaction> begin(bool writable, const CancellationToken& token = {}) {
        std::unique_ptr<Transaction> tx;
        EXPECT_FALSE(engine_->begin(token, writable, tx));
        return tx;
    }

    std::unique_ptr<Store> open_store(Transaction& tx, std::string_view name) {
        std::unique_ptr<Store> store;
        EXPECT_FALSE(tx.get_store(name, store));
        return store;
    }

    // Creates `name` holding key → "v<key>" for every key and commits.
    void seed(std::string_view name, const std::vector<std::string>& keys) {
        auto tx = begin(true);
        ASSERT_FALSE(tx->create_store(name));
        auto store = open_store(*tx, name);
        for (const auto& k : keys) {
            ASSERT_FALSE(store->put(k, "v" + k));
        }
        ASSERT_FALSE(tx->commit());
    }

    // Keys visited from seek(pivot) to exhaustion.
    static std::vector<std::string> collect(Store& store, bool reverse, std::string_view pivot = {}) {
        std::vector<std::string> out;
        auto it = store.iterator({.reverse = reverse});
        for (it->seek(pivot); it->valid(); it->next()) {
            out.emplace_back(it->key());
        }
        EXPECT_FALSE(it->error());
        it->close();
        return out;
    }

    Factory factory_;
    std::unique_ptr<Engine> engine_;
};

TYPED_TEST_SUITE_P(EngineConformanceTest);

// ── Put / Get / Delete ───────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, GetReturnsWhatPutStored) {
    this->seed("s", {});
    auto tx = this->begin(true);
    auto store = this->open_store(*tx, "s");

    std::string out;
    EXPECT_EQ(store->get("k", out), errc::key_not_found);

    ASSERT_FALSE(store->put("k", "v1"));
    ASSERT_FALSE(store->get("k", out));
    EXPECT_EQ(out, "v1");

    ASSERT_FALSE(store->put("k", "v2"));
    ASSERT_FALSE(store->get("k", out));
    EXPECT_EQ(out, "v2");

    ASSERT_FALSE(store->del("k"));
    EXPECT_EQ(store->get("k", out), errc::key_not_found);
    EXPECT_EQ(store->del("k"), errc::key_not_found);
}

TYPED_TEST_P(EngineConformanceTest, KeysAndValuesAreBinarySafe) {
    this->seed("s", {});
    auto tx = this->begin(true);
    auto store = this->open_store(*tx, "s");

    const std::string key("\x00\xFF\x01", 3);
    const std::string value("\x00\x00", 2);
    ASSERT_FALSE(store->put(key, value));
    ASSERT_FALSE(store->put("", "empty key"));

    std::string out;
    ASSERT_FALSE(store->get(key, out));
    EXPECT_EQ(out, value);
    ASSERT_FALSE(store->get("", out));
    EXPECT_EQ(out, "empty key");
}

TYPED_TEST_P(EngineConformanceTest, StoresAreIsolatedFromEachOther) {
    this->seed("a", {"k"});
    this->seed("b", {});
    auto tx = this->begin(false);
    auto b = this->open_store(*tx, "b");

    std::string out;
    EXPECT_EQ(b->get("k", out), errc::key_not_found);
    EXPECT_TRUE(this->collect(*b, false).empty());
    EXPECT_TRUE(this->collect(*b, true).empty());
}

// ── Read-only transactions ───────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, ReadOnlyTransactionRejectsEveryMutation) {
    this->seed("s", {"a"});
    auto tx = this->begin(false);
    EXPECT_FALSE(tx->writable());
    auto store = this->open_store(*tx, "s");

    uint64_t seq = 0;
    EXPECT_EQ(store->put("b", "x"), errc::read_only);
    EXPECT_EQ(store->del("a"), errc::read_only);
    EXPECT_EQ(store->truncate(), errc::read_only);
    EXPECT_EQ(store->next_sequence(seq), errc::read_only);
    EXPECT_EQ(tx->create_store("t"), errc::read_only);
    EXPECT_EQ(tx->drop_store("s"), errc::read_only);

    std::string out;
    ASSERT_FALSE(store->get("a", out));
    EXPECT_EQ(out, "va");
    EXPECT_EQ(store->get("b", out), errc::key_not_found);
    EXPECT_EQ(this->collect(*store, false), (std::vector<std::string>{"a"}));
}

// ── Truncate ─────────────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, TruncateRemovesKeysAndStoreStaysUsable) {
    this->seed("s", {"a", "b", "c"});
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->truncate());

        std::string out;
        EXPECT_EQ(store->get("a", out), errc::key_not_found);
        EXPECT_TRUE(this->collect(*store, false).empty());

        ASSERT_FALSE(store->put("d", "vd"));
        ASSERT_FALSE(store->get("d", out));
        EXPECT_EQ(out, "vd");
        ASSERT_FALSE(tx->commit());
    }

    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");
    EXPECT_EQ(this->collect(*store, false), (std::vector<std::string>{"d"}));
}

// ── Sequences ────────────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, SequenceCountsFromOneWithoutRepeats) {
    this->seed("s", {});
    auto tx = this->begin(true);
    auto store = this->open_store(*tx, "s");

    std::string out;
    for (uint64_t want = 1; want <= 20; ++want) {
        uint64_t seq = 0;
        ASSERT_FALSE(store->next_sequence(seq));
        EXPECT_EQ(seq, want);
        ASSERT_FALSE(store->put("k" + std::to_string(want), "x"));
        ASSERT_FALSE(store->get("k" + std::to_string(want), out));
    }
}

TYPED_TEST_P(EngineConformanceTest, SequenceSurvivesCommitTruncateAndDrop) {
    this->seed("s", {});
    uint64_t seq = 0;
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->next_sequence(seq));
        ASSERT_FALSE(store->next_sequence(seq));
        ASSERT_FALSE(tx->commit());
    }
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->truncate());
        ASSERT_FALSE(store->next_sequence(seq));
        EXPECT_EQ(seq, 3u);
        ASSERT_FALSE(tx->commit());
    }
    {
        auto tx = this->begin(true);
        ASSERT_FALSE(tx->drop_store("s"));
        ASSERT_FALSE(tx->create_store("s"));
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->next_sequence(seq));
        EXPECT_EQ(seq, 4u);
        ASSERT_FALSE(tx->commit());
    }
}

TYPED_TEST_P(EngineConformanceTest, SequencesArePerStore) {
    this->seed("a", {});
    this->seed("b", {});
    auto tx = this->begin(true);
    auto a = this->open_store(*tx, "a");
    auto b = this->open_store(*tx, "b");

    uint64_t seq = 0;
    ASSERT_FALSE(a->next_sequence(seq));
    ASSERT_FALSE(a->next_sequence(seq));
    ASSERT_FALSE(b->next_sequence(seq));
    EXPECT_EQ(seq, 1u);
}

// ── Iteration ────────────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, ForwardIterationIsBytewiseOrdered) {
    this->seed("s", {"b", "ab", "a", std::string("\xFF", 1), std::string("a\x00", 2)});
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");

    EXPECT_EQ(this->collect(*store, false),
              (std::vector<std::string>{"a", std::string("a\x00", 2), "ab", "b",
                                        std::string("\xFF", 1)}));
}

TYPED_TEST_P(EngineConformanceTest, ForwardSeekLandsOnFirstKeyAtOrAfterPivot) {
    this->seed("s", {"1", "3", "5", "7"});
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");

    EXPECT_EQ(this->collect(*store, false, "4"), (std::vector<std::string>{"5", "7"}));
    EXPECT_EQ(this->collect(*store, false, "5"), (std::vector<std::string>{"5", "7"}));
    EXPECT_TRUE(this->collect(*store, false, "8").empty());
}

TYPED_TEST_P(EngineConformanceTest, ReverseSeekLandsOnLastKeyAtOrBeforePivot) {
    this->seed("s", {"1", "3", "5", "7"});
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");

    EXPECT_EQ(this->collect(*store, true, "6"), (std::vector<std::string>{"5", "3", "1"}));
    EXPECT_EQ(this->collect(*store, true, "5"), (std::vector<std::string>{"5", "3", "1"}));
    EXPECT_EQ(this->collect(*store, true, ""), (std::vector<std::string>{"7", "5", "3", "1"}));
    EXPECT_TRUE(this->collect(*store, true, "9").empty());
    EXPECT_TRUE(this->collect(*store, true, "0").empty());
}

TYPED_TEST_P(EngineConformanceTest, IterationNeverCrossesIntoNeighbourStores) {
    this->seed("a", {"x", "y"});
    this->seed("b", {"m"});
    this->seed("c", {"z"});
    auto tx = this->begin(false);
    auto b = this->open_store(*tx, "b");

    EXPECT_EQ(this->collect(*b, false), (std::vector<std::string>{"m"}));
    EXPECT_EQ(this->collect(*b, true), (std::vector<std::string>{"m"}));
    EXPECT_EQ(this->collect(*b, true, std::string(4, '\xFF')), (std::vector<std::string>{"m"}));
    EXPECT_TRUE(this->collect(*b, true, "a").empty());
}

TYPED_TEST_P(EngineConformanceTest, IteratorCopiesCurrentValue) {
    this->seed("s", {"k"});
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");

    auto it = store->iterator();
    EXPECT_FALSE(it->valid());
    it->seek("");
    ASSERT_TRUE(it->valid());
    std::string value;
    ASSERT_FALSE(it->value_copy(value));
    EXPECT_EQ(value, "vk");

    it->next();
    EXPECT_FALSE(it->valid());
    EXPECT_FALSE(it->error());

    it->close();
    it->close();
    EXPECT_FALSE(it->valid());
}

TYPED_TEST_P(EngineConformanceTest, WriterIteratesItsOwnWrites) {
    this->seed("s", {"a"});
    auto tx = this->begin(true);
    auto store = this->open_store(*tx, "s");
    ASSERT_FALSE(store->put("b", "x"));
    ASSERT_FALSE(store->del("a"));

    EXPECT_EQ(this->collect(*store, false), (std::vector<std::string>{"b"}));
}

// ── Store management ─────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, StoreManagementErrors) {
    auto tx = this->begin(true);
    std::unique_ptr<Store> store;
    EXPECT_EQ(tx->get_store("s", store), errc::store_not_found);
    EXPECT_EQ(tx->drop_store("s"), errc::store_not_found);

    ASSERT_FALSE(tx->create_store("s"));
    EXPECT_EQ(tx->create_store("s"), errc::store_already_exists);
    ASSERT_FALSE(tx->get_store("s", store));
    EXPECT_EQ(store->name(), "s");
}

TYPED_TEST_P(EngineConformanceTest, ListStoresIsSortedByName) {
    this->seed("orders", {});
    this->seed("accounts", {});
    this->seed("users", {});
    auto tx = this->begin(true);
    ASSERT_FALSE(tx->drop_store("orders"));

    std::vector<std::string> names;
    ASSERT_FALSE(tx->list_stores(names));
    EXPECT_EQ(names, (std::vector<std::string>{"accounts", "users"}));
}

TYPED_TEST_P(EngineConformanceTest, DroppedStoreComesBackEmpty) {
    this->seed("s", {"a", "b"});
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(tx->drop_store("s"));

        std::string out;
        EXPECT_EQ(store->get("a", out), errc::store_not_found);
        EXPECT_EQ(store->put("a", "x"), errc::store_not_found);
        EXPECT_TRUE(this->collect(*store, false).empty());

        ASSERT_FALSE(tx->create_store("s"));
        ASSERT_FALSE(tx->commit());
    }
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");
    EXPECT_TRUE(this->collect(*store, false).empty());
}

// ── Transactions ─────────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, CommitPublishesWrites) {
    this->seed("s", {"a"});
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");
    std::string out;
    ASSERT_FALSE(store->get("a", out));
    EXPECT_EQ(out, "va");
}

TYPED_TEST_P(EngineConformanceTest, RollbackDiscardsEveryMutation) {
    this->seed("s", {"a", "b"});
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->put("c", "x"));
        ASSERT_FALSE(store->truncate());
        ASSERT_FALSE(tx->create_store("t"));
        tx->rollback();
        tx->rollback();
    }

    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");
    EXPECT_EQ(this->collect(*store, false), (std::vector<std::string>{"a", "b"}));
    std::unique_ptr<Store> t;
    EXPECT_EQ(tx->get_store("t", t), errc::store_not_found);
}

TYPED_TEST_P(EngineConformanceTest, DestroyingAnOpenTransactionRollsBack) {
    this->seed("s", {});
    {
        auto tx = this->begin(true);
        auto store = this->open_store(*tx, "s");
        ASSERT_FALSE(store->put("a", "x"));
    }
    auto tx = this->begin(false);
    auto store = this->open_store(*tx, "s");
    EXPECT_TRUE(this->collect(*store, false).empty());
}

TYPED_TEST_P(EngineConformanceTest, ReaderDoesNotObserveLaterCommit) {
    this->seed("s", {"a"});
    auto reader = this->begin(false);
    auto before = this->open_store(*reader, "s");

    {
        auto writer = this->begin(true);
        auto store = this->open_store(*writer, "s");
        ASSERT_FALSE(store->put("b", "x"));
        ASSERT_FALSE(store->del("a"));
        ASSERT_FALSE(writer->commit());
    }

    std::string out;
    ASSERT_FALSE(before->get("a", out));
    EXPECT_EQ(before->get("b", out), errc::key_not_found);
    EXPECT_EQ(this->collect(*before, false), (std::vector<std::string>{"a"}));

    auto later = this->begin(false);
    auto after = this->open_store(*later, "s");
    EXPECT_EQ(this->collect(*after, false), (std::vector<std::string>{"b"}));
}

TYPED_TEST_P(EngineConformanceTest, HandlesFailAfterTransactionEnds) {
    this->seed("s", {"a"});
    auto tx = this->begin(true);
    auto store = this->open_store(*tx, "s");
    auto it = store->iterator();
    ASSERT_FALSE(tx->commit());

    std::string out;
    uint64_t seq = 0;
    EXPECT_EQ(store->get("a", out), errc::transaction_closed);
    EXPECT_EQ(store->put("a", "x"), errc::transaction_closed);
    EXPECT_EQ(store->del("a"), errc::transaction_closed);
    EXPECT_EQ(store->truncate(), errc::transaction_closed);
    EXPECT_EQ(store->next_sequence(seq), errc::transaction_closed);

    it->seek("");
    EXPECT_FALSE(it->valid());
    EXPECT_EQ(it->error(), errc::transaction_closed);

    std::unique_ptr<Store> again;
    EXPECT_EQ(tx->get_store("s", again), errc::transaction_closed);
    EXPECT_EQ(tx->commit(), errc::transaction_closed);
    tx->rollback();
}

TYPED_TEST_P(EngineConformanceTest, WritersAreSerialised) {
    this->seed("s", {});
    auto first = this->begin(true);
    auto store = this->open_store(*first, "s");
    ASSERT_FALSE(store->put("a", "x"));

    std::atomic<bool> committed{false};
    std::thread second([&] {
        std::unique_ptr<Transaction> tx;
        ASSERT_FALSE(this->engine_->begin({}, true, tx));
        EXPECT_TRUE(committed.load());
        std::unique_ptr<Store> s;
        ASSERT_FALSE(tx->get_store("s", s));
        std::string out;
        EXPECT_FALSE(s->get("a", out));
        tx->rollback();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    committed.store(true);
    ASSERT_FALSE(first->commit());
    second.join();
}

// ── Cancellation ─────────────────────────────────────────────────────────────

TYPED_TEST_P(EngineConformanceTest, BeginFailsOnCancelledToken) {
    CancellationSource source;
    source.cancel();
    std::unique_ptr<Transaction> tx;
    EXPECT_EQ(this->engine_->begin(source.token(), false, tx), errc::cancelled);
    EXPECT_FALSE(tx);
}

TYPED_TEST_P(EngineConformanceTest, CancelledTransactionFailsEveryOperation) {
    this->seed("s", {"a"});
    CancellationSource source;
    auto tx = this->begin(true, source.token());
    auto store = this->open_store(*tx, "s");
    ASSERT_FALSE(store->put("b", "x"));

    source.cancel();
    std::string out;
    EXPECT_EQ(store->get("a", out), errc::cancelled);
    EXPECT_EQ(store->put("c", "x"), errc::cancelled);
    std::unique_ptr<Store> again;
    EXPECT_EQ(tx->get_store("s", again), errc::cancelled);

    // Commit refuses and rolls back.
    EXPECT_EQ(tx->commit(), errc::cancelled);
    auto reader = this->begin(false);
    auto check = this->open_store(*reader, "s");
    EXPECT_EQ(check->get("b", out), errc::key_not_found);
}

TYPED_TEST_P(EngineConformanceTest, CancelBetweenStepsStopsIterator) {
    this->seed("s", {"a", "b", "c"});
    CancellationSource source;
    auto tx = this->begin(false, source.token());
    auto store = this->open_store(*tx, "s");

    auto it = store->iterator();
    it->seek("");
    ASSERT_TRUE(it->valid());
    it->next();
    ASSERT_TRUE(it->valid());

    source.cancel();
    it->next();
    EXPECT_FALSE(it->valid());
    EXPECT_EQ(it->error(), errc::cancelled);

    it->seek("");
    EXPECT_FALSE(it->valid());
    EXPECT_EQ(it->error(), errc::cancelled);
}

TYPED_TEST_P(EngineConformanceTest, DeadlineExpiresTransaction) {
    this->seed("s", {"a"});
    ManualClock clock;
    auto source = CancellationSource::with_timeout(std::chrono::milliseconds{10}, clock);
    auto tx = this->begin(false, source.token());
    auto store = this->open_store(*tx, "s");

    std::string out;
    ASSERT_FALSE(store->get("a", out));
    clock.advance(std::chrono::milliseconds{10});
    EXPECT_EQ(store->get("a", out), errc::deadline_exceeded);
}

REGISTER_TYPED_TEST_SUITE_P(EngineConformanceTest,
    GetReturnsWhatPutStored,
    KeysAndValuesAreBinarySafe,
    StoresAreIsolatedFromEachOther,
    ReadOnlyTransactionRejectsEveryMutation,
    TruncateRemovesKeysAndStoreStaysUsable,
    SequenceCountsFromOneWithoutRepeats,
    SequenceSurvivesCommitTruncateAndDrop,
    SequencesArePerStore,
    ForwardIterationIsBytewiseOrdered,
    ForwardSeekLandsOnFirstKeyAtOrAfterPivot,
    ReverseSeekLandsOnLastKeyAtOrBeforePivot,
    IterationNeverCrossesIntoNeighbourStores,
    IteratorCopiesCurrentValue,
    WriterIteratesItsOwnWrites,
    StoreManagementErrors,
    ListStoresIsSortedByName,
    DroppedStoreComesBackEmpty,
    CommitPublishesWrites,
    RollbackDiscardsEveryMutation,
    DestroyingAnOpenTransactionRollsBack,
    ReaderDoesNotObserveLaterCommit,
    HandlesFailAfterTransactionEnds,
    WritersAreSerialised,
    BeginFailsOnCancelledToken,
    CancelledTransactionFailsEveryOperation,
    CancelBetweenStepsStopsIterator,
    DeadlineExpiresTransaction);

} // namespace docdb::storage
