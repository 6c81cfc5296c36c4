#pragma once

#include "document/document.hpp"
#include "storage/engine.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docdb {

// ── Catalog records ──────────────────────────────────────────────────────────

struct TableConfig {
    std::string name;
    // Empty: rows are keyed by a storage-assigned int64 from next_sequence().
    ValuePath primary_key;

    [[nodiscard]] std::string store_name() const { return "t_" + name; }
};

struct IndexConfig {
    std::string name;
    std::string table_name;
    ValuePath path;
    bool unique = false;

    [[nodiscard]] std::string store_name() const { return "i_" + name; }
};

// ── Catalog ──────────────────────────────────────────────────────────────────
//
// Table and index definitions, kept as protobuf records in the reserved
// "__docdb_catalog" store of the transaction.  The reserved store is created
// by the first create_table().  Creating or dropping tables and indexes also
// creates or drops their data stores, so the whole change commits or rolls
// back with the transaction.

class Catalog {
public:
    static constexpr std::string_view kStoreName = "__docdb_catalog";

    explicit Catalog(storage::Transaction& tx) : tx_(tx) {}

    // errc::table_already_exists if present.
    [[nodiscard]] std::error_code create_table(const TableConfig& config);

    // Drops the table, its rows and every index on it.
    [[nodiscard]] std::error_code drop_table(std::string_view name);

    // errc::missing_table_selector for an empty name, errc::table_not_found
    // when absent.
    [[nodiscard]] std::error_code get_table(std::string_view name, TableConfig& out) const;

    [[nodiscard]] std::error_code list_tables(std::vector<std::string>& out) const;

    // Creates the index and fills it from the rows already in the table.
    // errc::index_already_exists, errc::table_not_found, or
    // errc::duplicate_key when existing rows violate a unique index.
    [[nodiscard]] std::error_code create_index(const IndexConfig& config);

    [[nodiscard]] std::error_code drop_index(std::string_view name);

    [[nodiscard]] std::error_code get_index(std::string_view name, IndexConfig& out) const;

    // Indexes of `table`, or of every table when `table` is empty, ordered
    // by name.
    [[nodiscard]] std::error_code list_indexes(std::string_view table,
                                               std::vector<IndexConfig>& out) const;

private:
    // Opens the reserved store; `out` stays null when it does not exist yet.
    [[nodiscard]] std::error_code open_store(std::unique_ptr<storage::Store>& out) const;

    storage::Transaction& tx_;
};

} // namespace docdb
