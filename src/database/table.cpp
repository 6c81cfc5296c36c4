#include "database/table.hpp"

#include "common/error.hpp"
#include "document/encoding.hpp"
#include "document/key_encoding.hpp"

#include <utility>

namespace docdb {

std::error_code Table::open(storage::Transaction& tx,
                            std::string_view name,
                            std::unique_ptr<Table>& out) {
    Catalog catalog(tx);
    TableConfig config;
    if (auto ec = catalog.get_table(name, config)) return ec;

    std::vector<IndexConfig> index_configs;
    if (auto ec = catalog.list_indexes(name, index_configs)) return ec;

    std::unique_ptr<storage::Store> store;
    if (auto ec = tx.get_store(config.store_name(), store)) return ec;

    std::unique_ptr<Table> table(new Table(tx, std::move(config), std::move(store)));
    for (auto& ic : index_configs) {
        std::unique_ptr<storage::Store> index_store;
        if (auto ec = tx.get_store(ic.store_name(), index_store)) return ec;
        table->indexes_.push_back(std::make_unique<Index>(std::move(ic), std::move(index_store)));
    }

    out = std::move(table);
    return {};
}

Index* Table::find_index(const ValuePath& path) const {
    for (const auto& index : indexes_) {
        if (index->config().path == path) {
            return index.get();
        }
    }
    return nullptr;
}

std::error_code Table::make_key(const Document& doc, std::string& key) {
    if (config_.primary_key.empty()) {
        uint64_t seq = 0;
        if (auto ec = store_->next_sequence(seq)) return ec;
        return keys::encode_value(Value::int64(static_cast<int64_t>(seq)), key);
    }

    Value pk;
    if (auto ec = config_.primary_key.get_value(doc, pk)) return ec;
    if (auto ec = keys::encode_value(pk, key)) return ec;

    bool found = false;
    if (auto ec = find_equal_key(*store_, pk, found)) return ec;
    if (found) {
        return make_error_code(errc::duplicate_key);
    }
    return {};
}

std::error_code Table::insert(const Document& doc, std::string& key) {
    if (auto ec = make_key(doc, key)) return ec;

    std::string data;
    if (auto ec = encode_document(doc, data)) return ec;
    if (auto ec = store_->put(key, data)) return ec;

    for (const auto& index : indexes_) {
        if (auto ec = index->add(doc, key)) return ec;
    }
    return {};
}

std::error_code Table::get(std::string_view key, DocumentPtr& out) {
    std::string data;
    if (auto ec = store_->get(key, data)) return ec;
    out = std::make_shared<EncodedDocument>(std::string(key), std::move(data));
    return {};
}

std::error_code Table::replace(std::string_view key, const Document& doc) {
    DocumentPtr old;
    if (auto ec = get(key, old)) return ec;

    for (const auto& index : indexes_) {
        if (auto ec = index->remove(*old, key)) return ec;
    }

    std::string data;
    if (auto ec = encode_document(doc, data)) return ec;
    if (auto ec = store_->put(key, data)) return ec;

    for (const auto& index : indexes_) {
        if (auto ec = index->add(doc, key)) return ec;
    }
    return {};
}

std::error_code Table::del(std::string_view key) {
    DocumentPtr old;
    if (auto ec = get(key, old)) return ec;

    for (const auto& index : indexes_) {
        if (auto ec = index->remove(*old, key)) return ec;
    }
    return store_->del(key);
}

std::error_code Table::truncate() {
    if (auto ec = store_->truncate()) return ec;
    for (const auto& index : indexes_) {
        if (auto ec = index->truncate()) return ec;
    }
    return {};
}

std::error_code Table::reindex(std::string_view index_name) {
    Index* target = nullptr;
    for (const auto& index : indexes_) {
        if (index->config().name == index_name) {
            target = index.get();
        }
    }
    if (!target) {
        return make_error_code(errc::index_not_found);
    }
    if (auto ec = target->truncate()) return ec;

    auto it = store_->iterator();
    std::error_code ec;
    for (it->seek({}); it->valid(); it->next()) {
        std::string data;
        if ((ec = it->value_copy(data))) break;
        const EncodedDocument doc{std::string(it->key()), std::move(data)};
        if ((ec = target->add(doc, doc.key()))) break;
    }
    if (!ec) {
        ec = it->error();
    }
    it->close();
    return ec;
}

} // namespace docdb
