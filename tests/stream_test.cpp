#include "common/error.hpp"
#include "query/stream.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docdb::query {

// ── Test helpers ─────────────────────────────────────────────────────────────

// Counters shared between a test and the source it handed to a stream.
struct SourceCounters {
    int pulled = 0;
    int closed = 0;
};

// Yields one document per value, with field "n" set to it.  Fails with
// `fail_with` when asked for the document at position `fail_at`.
class VectorSource final : public DocumentSource {
public:
    VectorSource(std::vector<Value> values, SourceCounters& counters)
        : values_(std::move(values))
        , counters_(counters)
    {}

    std::error_code next(DocumentPtr& out) override {
        out = nullptr;
        if (closed_ || pos_ >= values_.size()) return {};
        if (pos_ == fail_at) {
            return make_error_code(fail_with);
        }
        ++counters_.pulled;
        auto doc = std::make_shared<FieldBuffer>();
        doc->add("n", values_[pos_]);
        doc->set_key(std::to_string(pos_));
        ++pos_;
        out = std::move(doc);
        return {};
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            ++counters_.closed;
        }
    }

    std::size_t fail_at = static_cast<std::size_t>(-1);
    errc fail_with = errc::corrupted;

private:
    std::vector<Value> values_;
    SourceCounters& counters_;
    std::size_t pos_ = 0;
    bool closed_ = false;
};

class StreamTest : public ::testing::Test {
protected:
    Stream numbers(int64_t count) {
        std::vector<Value> values;
        for (int64_t i = 1; i <= count; ++i) {
            values.push_back(Value::integer(i));
        }
        return Stream(std::make_unique<VectorSource>(std::move(values), counters_));
    }

    static std::vector<std::string> keys_of(Stream s) {
        std::vector<std::string> out;
        EXPECT_FALSE(s.iterate([&](const DocumentPtr& doc) -> std::error_code {
            out.emplace_back(doc->key());
            return {};
        }));
        return out;
    }

    static std::vector<int64_t> values_of(Stream s) {
        std::vector<int64_t> out;
        EXPECT_FALSE(s.iterate([&](const DocumentPtr& doc) -> std::error_code {
            Value v;
            if (auto ec = doc->get_by_field("n", v)) return ec;
            out.push_back(v.as_int64());
            return {};
        }));
        return out;
    }

    static Stream::Predicate even() {
        return [](const Document& doc, bool& keep) -> std::error_code {
            Value v;
            if (auto ec = doc.get_by_field("n", v)) return ec;
            keep = v.as_int64() % 2 == 0;
            return {};
        };
    }

    SourceCounters counters_;
};

// ── Terminal operations ──────────────────────────────────────────────────────

TEST_F(StreamTest, CountConsumesEverything) {
    uint64_t n = 0;
    auto s = numbers(5);
    ASSERT_FALSE(s.count(n));
    EXPECT_EQ(n, 5u);
    EXPECT_EQ(counters_.pulled, 5);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, EmptyStream) {
    uint64_t n = 7;
    Stream s;
    ASSERT_FALSE(s.count(n));
    EXPECT_EQ(n, 0u);
}

TEST_F(StreamTest, IterateStopsAtVisitorError) {
    auto s = numbers(5);
    int seen = 0;
    auto ec = s.iterate([&](const DocumentPtr&) -> std::error_code {
        return ++seen == 2 ? make_error_code(errc::cancelled) : std::error_code{};
    });
    EXPECT_EQ(ec, errc::cancelled);
    EXPECT_EQ(seen, 2);
    EXPECT_EQ(counters_.pulled, 2);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, SourceErrorClosesSource) {
    auto source = std::make_unique<VectorSource>(
        std::vector<Value>{Value::integer(1), Value::integer(2)}, counters_);
    source->fail_at = 1;
    Stream s(std::move(source));

    uint64_t n = 0;
    EXPECT_EQ(s.count(n), errc::corrupted);
    EXPECT_EQ(n, 1u);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, StreamIsConsumedOnce) {
    auto s = numbers(3);
    uint64_t n = 0;
    ASSERT_FALSE(s.count(n));
    EXPECT_TRUE(s.consumed());
    EXPECT_THROW((void)s.count(n), std::logic_error);
    EXPECT_THROW((void)std::move(s).limit(1), std::logic_error);
}

TEST_F(StreamTest, CombinatorConsumesItsInput) {
    auto s = numbers(3);
    auto limited = std::move(s).limit(1);
    EXPECT_TRUE(s.consumed());
    EXPECT_FALSE(limited.consumed());
}

TEST_F(StreamTest, DestroyingUnreadStreamClosesSource) {
    {
        auto s = numbers(3).filter(even());
    }
    EXPECT_EQ(counters_.pulled, 0);
    EXPECT_EQ(counters_.closed, 1);
}

// ── Combinators ──────────────────────────────────────────────────────────────

TEST_F(StreamTest, FilterKeepsMatchingDocuments) {
    EXPECT_EQ(values_of(numbers(6).filter(even())), (std::vector<int64_t>{2, 4, 6}));
}

TEST_F(StreamTest, FilterErrorAborts) {
    auto s = numbers(3).filter([](const Document&, bool&) -> std::error_code {
        return make_error_code(errc::type_mismatch);
    });
    uint64_t n = 0;
    EXPECT_EQ(s.count(n), errc::type_mismatch);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, MapReplacesDocuments) {
    auto s = numbers(3).map([](const DocumentPtr& in, DocumentPtr& out) -> std::error_code {
        Value v;
        if (auto ec = in->get_by_field("n", v)) return ec;
        auto doc = std::make_shared<FieldBuffer>();
        doc->add("n", Value::integer(v.as_int64() * 10));
        out = std::move(doc);
        return {};
    });
    EXPECT_EQ(values_of(std::move(s)), (std::vector<int64_t>{10, 20, 30}));
}

TEST_F(StreamTest, LimitClosesSourceOnceReached) {
    auto s = numbers(100).limit(3);
    uint64_t n = 0;
    ASSERT_FALSE(s.count(n));
    EXPECT_EQ(n, 3u);
    EXPECT_EQ(counters_.pulled, 3);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, LimitZeroReadsNothing) {
    uint64_t n = 0;
    auto s = numbers(5).limit(0);
    ASSERT_FALSE(s.count(n));
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(counters_.pulled, 0);
    EXPECT_EQ(counters_.closed, 1);
}

TEST_F(StreamTest, OffsetThenLimitSelectsWindow) {
    EXPECT_EQ(values_of(numbers(10).offset(3).limit(4)), (std::vector<int64_t>{4, 5, 6, 7}));
    EXPECT_EQ(counters_.pulled, 7);
}

TEST_F(StreamTest, OffsetPastEndYieldsNothing) {
    EXPECT_TRUE(values_of(numbers(3).offset(5)).empty());
}

TEST_F(StreamTest, OffsetAppliesAfterFilter) {
    EXPECT_EQ(values_of(numbers(10).filter(even()).offset(2).limit(2)),
              (std::vector<int64_t>{6, 8}));
}

// ── sort ─────────────────────────────────────────────────────────────────────

TEST_F(StreamTest, SortOrdersByValue) {
    Stream s(std::make_unique<VectorSource>(
        std::vector<Value>{Value::integer(3), Value::float64(1.5), Value::integer(-2),
                           Value::integer(10)},
        counters_));
    EXPECT_EQ(values_of(std::move(s).sort(ValuePath::parse("n")).map(
                  [](const DocumentPtr& in, DocumentPtr& out) -> std::error_code {
                      Value v;
                      if (auto ec = in->get_by_field("n", v)) return ec;
                      double d = 0;
                      if (auto ec = v.convert_to_float64(d)) return ec;
                      auto doc = std::make_shared<FieldBuffer>();
                      doc->add("n", Value::integer(static_cast<int64_t>(d * 10)));
                      out = std::move(doc);
                      return {};
                  })),
              (std::vector<int64_t>{-20, 15, 30, 100}));
}

TEST_F(StreamTest, SortDescending) {
    EXPECT_EQ(values_of(numbers(4).sort(ValuePath::parse("n"), true)),
              (std::vector<int64_t>{4, 3, 2, 1}));
}

TEST_F(StreamTest, SortIsStableAndPutsMissingFirst) {
    Stream s(std::make_unique<VectorSource>(
        std::vector<Value>{Value::integer(2), Value::integer(1), Value::integer(2),
                           Value::integer(1)},
        counters_));
    // Documents are keyed by their source position.
    EXPECT_EQ(keys_of(std::move(s).sort(ValuePath::parse("n"))),
              (std::vector<std::string>{"1", "3", "0", "2"}));

    SourceCounters other;
    Stream t(std::make_unique<VectorSource>(
        std::vector<Value>{Value::integer(5), Value::integer(6)}, other));
    EXPECT_EQ(keys_of(std::move(t).sort(ValuePath::parse("missing"))),
              (std::vector<std::string>{"0", "1"}));
}

TEST_F(StreamTest, SortThenLimit) {
    auto s = numbers(6).sort(ValuePath::parse("n"), true).limit(2);
    EXPECT_EQ(values_of(std::move(s)), (std::vector<int64_t>{6, 5}));
    EXPECT_EQ(counters_.closed, 1);
}

} // namespace docdb::query
