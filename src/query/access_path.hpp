#pragma once

#include "database/index.hpp"
#include "database/table.hpp"
#include "query/stream.hpp"
#include "storage/engine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace docdb::query {

// ── KeyRange ─────────────────────────────────────────────────────────────────
//
// Range of encoded keys.  `lo` is an inclusive lower bound; every key that is
// below `hi` or starts with `hi` is inside the upper bound, so a value
// prefix selects every entry stored under that value.  Empty bounds are
// open.

struct KeyRange {
    std::string lo;
    std::string hi;

    [[nodiscard]] bool below_hi(std::string_view key) const {
        return hi.empty() || key < hi || key.starts_with(hi);
    }

    [[nodiscard]] bool above_lo(std::string_view key) const {
        return key >= lo;
    }
};

// ── RangeCursor ──────────────────────────────────────────────────────────────
//
// Walks the keys of `range` in either direction.

class RangeCursor {
public:
    RangeCursor(std::unique_ptr<storage::Iterator> it, KeyRange range, bool reverse);

    // Moves to the next key inside the range; `has` is false once the range
    // is exhausted.
    [[nodiscard]] std::error_code advance(bool& has);

    [[nodiscard]] std::string_view key() const { return it_->key(); }
    [[nodiscard]] std::error_code value_copy(std::string& out) const { return it_->value_copy(out); }

    void close() { it_->close(); }

private:
    std::unique_ptr<storage::Iterator> it_;
    KeyRange range_;
    bool reverse_;
    bool started_ = false;
};

// ── Sources ──────────────────────────────────────────────────────────────────

// Rows of a table whose storage key falls in `range`, in key order.
class TableScanSource final : public DocumentSource {
public:
    TableScanSource(std::shared_ptr<Table> table, KeyRange range, bool reverse);

    [[nodiscard]] std::error_code next(DocumentPtr& out) override;
    void close() override;

private:
    std::shared_ptr<Table> table_;
    RangeCursor cursor_;
    bool closed_ = false;
};

// Rows of a table reached through the entries of one of its indexes that
// fall in `range`, in index order.
class IndexScanSource final : public DocumentSource {
public:
    IndexScanSource(std::shared_ptr<Table> table, Index& index, KeyRange range, bool reverse);

    [[nodiscard]] std::error_code next(DocumentPtr& out) override;
    void close() override;

private:
    std::shared_ptr<Table> table_;
    RangeCursor cursor_;
    bool closed_ = false;
};

} // namespace docdb::query
