#pragma once

#include <system_error>
#include <type_traits>

namespace docdb {

// ── Error codes ──────────────────────────────────────────────────────────────
//
// Every fallible operation in docdb returns a std::error_code.  Values of
// this enum live in the "docdb" category; errors coming from the OS or from
// the filesystem keep their own categories.

enum class errc {
    ok = 0,

    // Storage
    key_not_found = 1,
    read_only,
    cancelled,
    deadline_exceeded,
    store_not_found,
    store_already_exists,
    transaction_closed,
    storage_error,
    corrupted,

    // Values / documents
    type_mismatch = 100,
    conversion_failed,
    field_not_found,

    // Catalog
    missing_table_selector = 200,
    table_not_found,
    table_already_exists,
    index_not_found,
    index_already_exists,
    duplicate_key,

    // Query
    param_not_found = 300,
};

[[nodiscard]] const std::error_category& docdb_category() noexcept;

[[nodiscard]] std::error_code make_error_code(errc e) noexcept;

// True for cancelled and deadline_exceeded.
[[nodiscard]] bool is_cancellation(const std::error_code& ec) noexcept;

} // namespace docdb

template <>
struct std::is_error_code_enum<docdb::errc> : std::true_type {};
