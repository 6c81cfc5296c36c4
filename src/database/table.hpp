#pragma once

#include "database/catalog.hpp"
#include "database/index.hpp"
#include "document/document.hpp"
#include "storage/engine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docdb {

// ── Table ────────────────────────────────────────────────────────────────────
//
// Rows of one table inside a transaction.  Rows live in store t_<name>,
// keyed by the order-preserving encoding of their primary key (the value at
// the primary-key path, or an int64 from next_sequence() when the table has
// none) and stored as encoded documents.  Every mutation keeps the table's
// indexes in step.
//
// A failed mutation may leave the transaction partially modified; callers
// roll the transaction back on error.

class Table {
public:
    // Loads the table definition and its indexes from the catalog.
    // errc::missing_table_selector / errc::table_not_found.
    [[nodiscard]] static std::error_code open(storage::Transaction& tx,
                                              std::string_view name,
                                              std::unique_ptr<Table>& out);

    [[nodiscard]] const TableConfig& config() const noexcept { return config_; }

    [[nodiscard]] const std::vector<std::unique_ptr<Index>>& indexes() const noexcept {
        return indexes_;
    }

    // First index declared on `path`, nullptr if none.
    [[nodiscard]] Index* find_index(const ValuePath& path) const;

    [[nodiscard]] storage::Transaction& transaction() const noexcept { return tx_; }

    // Inserts `doc` and returns its storage key in `key`.
    // errc::field_not_found when the primary key is missing from `doc`,
    // errc::duplicate_key when the primary key or a unique value is taken.
    [[nodiscard]] std::error_code insert(const Document& doc, std::string& key);

    // errc::key_not_found when absent.
    [[nodiscard]] std::error_code get(std::string_view key, DocumentPtr& out);

    // Overwrites the row stored under `key`.  The key is kept as is.
    [[nodiscard]] std::error_code replace(std::string_view key, const Document& doc);

    [[nodiscard]] std::error_code del(std::string_view key);

    // Removes every row and every index entry.
    [[nodiscard]] std::error_code truncate();

    [[nodiscard]] std::unique_ptr<storage::Iterator> iterator(storage::IteratorOptions opts = {}) {
        return store_->iterator(opts);
    }

    // Rebuilds the named index from the rows of the table.
    [[nodiscard]] std::error_code reindex(std::string_view index_name);

private:
    Table(storage::Transaction& tx, TableConfig config, std::unique_ptr<storage::Store> store)
        : tx_(tx)
        , config_(std::move(config))
        , store_(std::move(store))
    {}

    [[nodiscard]] std::error_code make_key(const Document& doc, std::string& key);

    storage::Transaction& tx_;
    TableConfig config_;
    std::unique_ptr<storage::Store> store_;
    std::vector<std::unique_ptr<Index>> indexes_;
};

} // namespace docdb
