#pragma once

#include "database/catalog.hpp"
#include "storage/engine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace docdb {

// Sets `found` when a key of `store` starts with a value equal to `v`.
// Equal numbers of different kinds (5 and 5.0) only share the encode_bound
// prefix, so every key under that prefix is decoded and compared.
[[nodiscard]] std::error_code find_equal_key(storage::Store& store, const Value& v, bool& found);

// ── Index ────────────────────────────────────────────────────────────────────
//
// Secondary index over one path of a table.  Entry layout in store i_<name>:
//
//   key   = encoded value [ encoded primary key ]
//   value = encoded primary key
//
// Unique indexes omit the primary key from the entry key, so a second row
// with the same value collides.  Rows where the path is missing are indexed
// as null, and null entries are never subject to uniqueness, which keeps
// every row of the table reachable from the index.

class Index {
public:
    Index(IndexConfig config, std::unique_ptr<storage::Store> store);

    [[nodiscard]] const IndexConfig& config() const noexcept { return config_; }

    // Adds the entry of the row stored under `pk` for document `doc`.
    // errc::duplicate_key when a unique index already holds the value.
    [[nodiscard]] std::error_code add(const Document& doc, std::string_view pk);

    // Removes the entry previously added for (`doc`, `pk`).
    [[nodiscard]] std::error_code remove(const Document& doc, std::string_view pk);

    [[nodiscard]] std::error_code truncate() { return store_->truncate(); }

    [[nodiscard]] std::unique_ptr<storage::Iterator> iterator(storage::IteratorOptions opts = {}) {
        return store_->iterator(opts);
    }

private:
    // Indexed value of `doc`: the value at the path, null when missing.
    [[nodiscard]] std::error_code value_of(const Document& doc, Value& out) const;

    [[nodiscard]] std::error_code entry_key(const Value& v, std::string_view pk, std::string& out) const;

    IndexConfig config_;
    std::unique_ptr<storage::Store> store_;
};

} // namespace docdb
