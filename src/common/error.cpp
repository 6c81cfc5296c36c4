#include "common/error.hpp"

#include <string>

namespace docdb {

namespace {

class DocdbCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "docdb"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                     return "success";
            case errc::key_not_found:          return "key not found";
            case errc::read_only:              return "transaction is read-only";
            case errc::cancelled:              return "operation cancelled";
            case errc::deadline_exceeded:      return "deadline exceeded";
            case errc::store_not_found:        return "store not found";
            case errc::store_already_exists:   return "store already exists";
            case errc::transaction_closed:     return "transaction already closed";
            case errc::storage_error:          return "storage backend error";
            case errc::corrupted:              return "corrupted data";
            case errc::type_mismatch:          return "type mismatch";
            case errc::conversion_failed:      return "value conversion failed";
            case errc::field_not_found:        return "field not found";
            case errc::missing_table_selector: return "missing table selector";
            case errc::table_not_found:        return "table not found";
            case errc::table_already_exists:   return "table already exists";
            case errc::index_not_found:        return "index not found";
            case errc::index_already_exists:   return "index already exists";
            case errc::duplicate_key:          return "duplicate key";
            case errc::param_not_found:        return "parameter not found";
        }
        return "unknown docdb error " + std::to_string(ev);
    }
};

} // anonymous namespace

const std::error_category& docdb_category() noexcept {
    static const DocdbCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), docdb_category()};
}

bool is_cancellation(const std::error_code& ec) noexcept {
    return ec == errc::cancelled || ec == errc::deadline_exceeded;
}

} // namespace docdb
