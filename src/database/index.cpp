#include "database/index.hpp"

#include "common/error.hpp"
#include "document/key_encoding.hpp"
#include "document/value.hpp"

#include <string_view>
#include <utility>

namespace docdb {

Index::Index(IndexConfig config, std::unique_ptr<storage::Store> store)
    : config_(std::move(config))
    , store_(std::move(store))
{}

std::error_code find_equal_key(storage::Store& store, const Value& v, bool& found) {
    found = false;
    std::string prefix;
    if (auto ec = keys::encode_bound(v, prefix)) return ec;

    auto it = store.iterator();
    for (it->seek(prefix); it->valid() && it->key().starts_with(prefix); it->next()) {
        std::string_view in = it->key();
        Value existing;
        if (auto ec = keys::decode_value(in, existing)) {
            it->close();
            return ec;
        }
        if (values_equal(existing, v)) {
            found = true;
            break;
        }
    }
    auto ec = it->error();
    it->close();
    return ec;
}

std::error_code Index::value_of(const Document& doc, Value& out) const {
    auto ec = config_.path.get_value(doc, out);
    if (ec == errc::field_not_found) {
        out = Value::null();
        return {};
    }
    return ec;
}

std::error_code Index::entry_key(const Value& v, std::string_view pk, std::string& out) const {
    if (auto ec = keys::encode_value(v, out)) return ec;
    if (!config_.unique || v.is_null()) {
        out.append(pk);
    }
    return {};
}

std::error_code Index::add(const Document& doc, std::string_view pk) {
    Value v;
    if (auto ec = value_of(doc, v)) return ec;

    std::string key;
    if (auto ec = entry_key(v, pk, key)) return ec;

    if (config_.unique && !v.is_null()) {
        bool found = false;
        if (auto ec = find_equal_key(*store_, v, found)) return ec;
        if (found) {
            return make_error_code(errc::duplicate_key);
        }
    }
    return store_->put(key, pk);
}

std::error_code Index::remove(const Document& doc, std::string_view pk) {
    Value v;
    if (auto ec = value_of(doc, v)) return ec;

    std::string key;
    if (auto ec = entry_key(v, pk, key)) return ec;
    return store_->del(key);
}

} // namespace docdb
