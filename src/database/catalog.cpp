#include "database/catalog.hpp"

#include "catalog.pb.h"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "database/table.hpp"

#include <algorithm>

namespace docdb {

namespace {

constexpr std::string_view kTablePrefix = "t/";
constexpr std::string_view kIndexPrefix = "i/";

std::shared_ptr<spdlog::logger> catalog_log() {
    static auto logger = make_component_logger("catalog");
    return logger;
}

std::string record_key(std::string_view prefix, std::string_view name) {
    std::string key(prefix);
    key.append(name);
    return key;
}

std::string encode_table(const TableConfig& config) {
    pb::TableConfig msg;
    msg.set_name(config.name);
    msg.set_primary_key_path(config.primary_key.to_string());
    return msg.SerializeAsString();
}

std::error_code decode_table(const std::string& data, TableConfig& out) {
    pb::TableConfig msg;
    if (!msg.ParseFromString(data)) {
        return make_error_code(errc::corrupted);
    }
    out.name = msg.name();
    out.primary_key = ValuePath::parse(msg.primary_key_path());
    return {};
}

std::string encode_index(const IndexConfig& config) {
    pb::IndexConfig msg;
    msg.set_name(config.name);
    msg.set_table_name(config.table_name);
    msg.set_path(config.path.to_string());
    msg.set_unique(config.unique);
    return msg.SerializeAsString();
}

std::error_code decode_index(const std::string& data, IndexConfig& out) {
    pb::IndexConfig msg;
    if (!msg.ParseFromString(data)) {
        return make_error_code(errc::corrupted);
    }
    out.name = msg.name();
    out.table_name = msg.table_name();
    out.path = ValuePath::parse(msg.path());
    out.unique = msg.unique();
    return {};
}

} // anonymous namespace

std::error_code Catalog::open_store(std::unique_ptr<storage::Store>& out) const {
    out.reset();
    auto ec = tx_.get_store(kStoreName, out);
    if (ec == errc::store_not_found) {
        return {};
    }
    return ec;
}

// ── Tables ───────────────────────────────────────────────────────────────────

std::error_code Catalog::create_table(const TableConfig& config) {
    if (config.name.empty()) {
        return make_error_code(errc::missing_table_selector);
    }

    std::unique_ptr<storage::Store> store;
    if (auto ec = open_store(store)) return ec;
    if (!store) {
        if (auto ec = tx_.create_store(kStoreName)) return ec;
        if (auto ec = tx_.get_store(kStoreName, store)) return ec;
    }

    const auto key = record_key(kTablePrefix, config.name);
    std::string existing;
    auto ec = store->get(key, existing);
    if (!ec) {
        return make_error_code(errc::table_already_exists);
    }
    if (ec != errc::key_not_found) {
        return ec;
    }

    if (auto ec = tx_.create_store(config.store_name())) return ec;
    if (auto ec = store->put(key, encode_table(config))) return ec;

    catalog_log()->info("Created table {}", config.name);
    return {};
}

std::error_code Catalog::drop_table(std::string_view name) {
    TableConfig config;
    if (auto ec = get_table(name, config)) return ec;

    std::vector<IndexConfig> indexes;
    if (auto ec = list_indexes(name, indexes)) return ec;
    for (const auto& index : indexes) {
        if (auto ec = drop_index(index.name)) return ec;
    }

    std::unique_ptr<storage::Store> store;
    if (auto ec = tx_.get_store(kStoreName, store)) return ec;
    if (auto ec = store->del(record_key(kTablePrefix, name))) return ec;
    if (auto ec = tx_.drop_store(config.store_name())) return ec;

    catalog_log()->info("Dropped table {}", config.name);
    return {};
}

std::error_code Catalog::get_table(std::string_view name, TableConfig& out) const {
    if (name.empty()) {
        return make_error_code(errc::missing_table_selector);
    }

    std::unique_ptr<storage::Store> store;
    if (auto ec = open_store(store)) return ec;
    if (!store) {
        return make_error_code(errc::table_not_found);
    }

    std::string data;
    auto ec = store->get(record_key(kTablePrefix, name), data);
    if (ec == errc::key_not_found) {
        return make_error_code(errc::table_not_found);
    }
    if (ec) return ec;
    return decode_table(data, out);
}

std::error_code Catalog::list_tables(std::vector<std::string>& out) const {
    out.clear();
    std::unique_ptr<storage::Store> store;
    if (auto ec = open_store(store)) return ec;
    if (!store) return {};

    auto it = store->iterator();
    for (it->seek(kTablePrefix); it->valid() && it->key().starts_with(kTablePrefix); it->next()) {
        out.emplace_back(it->key().substr(kTablePrefix.size()));
    }
    auto ec = it->error();
    it->close();
    return ec;
}

// ── Indexes ──────────────────────────────────────────────────────────────────

std::error_code Catalog::create_index(const IndexConfig& config) {
    TableConfig table;
    if (auto ec = get_table(config.table_name, table)) return ec;

    std::unique_ptr<storage::Store> store;
    if (auto ec = tx_.get_store(kStoreName, store)) return ec;

    const auto key = record_key(kIndexPrefix, config.name);
    std::string existing;
    auto ec = store->get(key, existing);
    if (!ec) {
        return make_error_code(errc::index_already_exists);
    }
    if (ec != errc::key_not_found) {
        return ec;
    }

    if (auto ec = tx_.create_store(config.store_name())) return ec;
    if (auto ec = store->put(key, encode_index(config))) return ec;

    // Index the rows already present.
    std::unique_ptr<Table> t;
    if (auto ec = Table::open(tx_, config.table_name, t)) return ec;
    if (auto ec = t->reindex(config.name)) return ec;

    catalog_log()->info("Created index {} on {}({})",
                        config.name, config.table_name, config.path.to_string());
    return {};
}

std::error_code Catalog::drop_index(std::string_view name) {
    IndexConfig config;
    if (auto ec = get_index(name, config)) return ec;

    std::unique_ptr<storage::Store> store;
    if (auto ec = tx_.get_store(kStoreName, store)) return ec;
    if (auto ec = store->del(record_key(kIndexPrefix, name))) return ec;
    if (auto ec = tx_.drop_store(config.store_name())) return ec;

    catalog_log()->info("Dropped index {}", config.name);
    return {};
}

std::error_code Catalog::get_index(std::string_view name, IndexConfig& out) const {
    std::unique_ptr<storage::Store> store;
    if (auto ec = open_store(store)) return ec;
    if (!store) {
        return make_error_code(errc::index_not_found);
    }

    std::string data;
    auto ec = store->get(record_key(kIndexPrefix, name), data);
    if (ec == errc::key_not_found) {
        return make_error_code(errc::index_not_found);
    }
    if (ec) return ec;
    return decode_index(data, out);
}

std::error_code Catalog::list_indexes(std::string_view table,
                                      std::vector<IndexConfig>& out) const {
    out.clear();
    std::unique_ptr<storage::Store> store;
    if (auto ec = open_store(store)) return ec;
    if (!store) return {};

    auto it = store->iterator();
    for (it->seek(kIndexPrefix); it->valid() && it->key().starts_with(kIndexPrefix); it->next()) {
        std::string data;
        if (auto ec = it->value_copy(data)) {
            it->close();
            return ec;
        }
        IndexConfig config;
        if (auto ec = decode_index(data, config)) {
            it->close();
            return ec;
        }
        if (table.empty() || config.table_name == table) {
            out.push_back(std::move(config));
        }
    }
    auto ec = it->error();
    it->close();
    return ec;
}

} // namespace docdb
