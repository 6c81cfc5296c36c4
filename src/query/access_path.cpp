#include "query/access_path.hpp"

#include "common/error.hpp"
#include "document/encoding.hpp"
#include "document/key_encoding.hpp"

#include <utility>

namespace docdb::query {

// ── RangeCursor ──────────────────────────────────────────────────────────────

RangeCursor::RangeCursor(std::unique_ptr<storage::Iterator> it, KeyRange range, bool reverse)
    : it_(std::move(it))
    , range_(std::move(range))
    , reverse_(reverse)
{}

std::error_code RangeCursor::advance(bool& has) {
    has = false;
    if (!started_) {
        started_ = true;
        if (!reverse_) {
            it_->seek(range_.lo);
        } else {
            // Every key that starts with hi sorts below its successor; an
            // empty pivot positions on the last key.
            const std::string pivot = range_.hi.empty() ? std::string{} : keys::prefix_successor(range_.hi);
            it_->seek(pivot);
            if (!it_->valid() && !it_->error() && !pivot.empty()) {
                // Either every key is above the successor (empty range) or
                // every key is below it; the last key tells which.
                it_->seek({});
                if (it_->valid() && it_->key() >= pivot) {
                    it_->close();
                }
            }
            while (it_->valid() && !range_.below_hi(it_->key())) {
                it_->next();
            }
        }
    } else {
        it_->next();
    }

    if (!it_->valid()) {
        return it_->error();
    }
    has = reverse_ ? range_.above_lo(it_->key()) : range_.below_hi(it_->key());
    return {};
}

// ── TableScanSource ──────────────────────────────────────────────────────────

TableScanSource::TableScanSource(std::shared_ptr<Table> table, KeyRange range, bool reverse)
    : table_(std::move(table))
    , cursor_(table_->iterator({.reverse = reverse}), std::move(range), reverse)
{}

std::error_code TableScanSource::next(DocumentPtr& out) {
    out = nullptr;
    if (closed_) return {};

    bool has = false;
    if (auto ec = cursor_.advance(has)) return ec;
    if (!has) {
        close();
        return {};
    }

    std::string data;
    if (auto ec = cursor_.value_copy(data)) return ec;
    out = std::make_shared<EncodedDocument>(std::string(cursor_.key()), std::move(data));
    return {};
}

void TableScanSource::close() {
    if (closed_) return;
    closed_ = true;
    cursor_.close();
}

// ── IndexScanSource ──────────────────────────────────────────────────────────

IndexScanSource::IndexScanSource(std::shared_ptr<Table> table, Index& index,
                                 KeyRange range, bool reverse)
    : table_(std::move(table))
    , cursor_(index.iterator({.reverse = reverse}), std::move(range), reverse)
{}

std::error_code IndexScanSource::next(DocumentPtr& out) {
    out = nullptr;
    if (closed_) return {};

    bool has = false;
    if (auto ec = cursor_.advance(has)) return ec;
    if (!has) {
        close();
        return {};
    }

    std::string pk;
    if (auto ec = cursor_.value_copy(pk)) return ec;
    auto ec = table_->get(pk, out);
    if (ec == errc::key_not_found) {
        // Index entry without a row.
        return make_error_code(errc::corrupted);
    }
    return ec;
}

void IndexScanSource::close() {
    if (closed_) return;
    closed_ = true;
    cursor_.close();
}

} // namespace docdb::query
