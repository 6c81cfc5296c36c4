#pragma once

#include "document/value.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace docdb {

// Callback used to walk the fields of a document.  Returning an error stops
// the walk and the error is returned by Document::iterate().
using FieldFunc = std::function<std::error_code(std::string_view field, const Value& value)>;

// ── Document ─────────────────────────────────────────────────────────────────
//
// Read-only view over a record.  Lookups are deterministic and have no side
// effects; a missing field is reported as errc::field_not_found.

class Document {
public:
    virtual ~Document() = default;

    [[nodiscard]] virtual std::error_code get_by_field(std::string_view field, Value& out) const = 0;

    [[nodiscard]] virtual std::error_code iterate(const FieldFunc& fn) const = 0;

    // Storage key of the record this document was read from.  Empty for
    // documents that do not come from a table.
    [[nodiscard]] virtual std::string_view key() const noexcept { return {}; }
};

// ── FieldBuffer ──────────────────────────────────────────────────────────────
//
// In-memory document keeping fields in insertion order.  Used to build
// documents for inserts and updates, and as the decoded form of stored ones.

class FieldBuffer final : public Document {
public:
    FieldBuffer() = default;

    // Appends a field without checking for duplicates.
    FieldBuffer& add(std::string field, Value value);

    // Replaces the field if present, appends it otherwise.
    void set(std::string_view field, Value value);

    // Removes the field.  Returns false if it did not exist.
    bool remove(std::string_view field);

    // Replaces the content with a copy of every field of `doc`.
    [[nodiscard]] std::error_code copy_from(const Document& doc);

    void set_key(std::string key) { key_ = std::move(key); }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const std::vector<std::pair<std::string, Value>>& fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] std::error_code get_by_field(std::string_view field, Value& out) const override;
    [[nodiscard]] std::error_code iterate(const FieldFunc& fn) const override;
    [[nodiscard]] std::string_view key() const noexcept override { return key_; }

private:
    std::vector<std::pair<std::string, Value>> fields_;
    std::string key_;
};

// ── ValuePath ────────────────────────────────────────────────────────────────
//
// Path to a value nested inside a document, e.g. "address.city" or
// "tags.0".  Fragments after the first that parse as unsigned integers are
// array indexes; everything else is a field name.

struct PathFragment {
    std::string field;
    std::optional<std::size_t> index;  // set for array-index fragments

    bool operator==(const PathFragment&) const = default;
};

class ValuePath {
public:
    ValuePath() = default;
    explicit ValuePath(std::vector<PathFragment> fragments);

    // Parses a dot-separated path.  An empty string yields an empty path.
    [[nodiscard]] static ValuePath parse(std::string_view dotted);

    [[nodiscard]] bool empty() const noexcept { return fragments_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return fragments_.size(); }
    [[nodiscard]] const std::vector<PathFragment>& fragments() const noexcept { return fragments_; }

    // Resolves the path against `doc`.  Fails with errc::field_not_found when
    // any fragment does not resolve.
    [[nodiscard]] std::error_code get_value(const Document& doc, Value& out) const;

    // Writes `value` at the path inside `buf`, creating the last field if
    // needed.  Intermediate fragments must exist and be documents or arrays.
    [[nodiscard]] std::error_code set_value(FieldBuffer& buf, Value value) const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ValuePath&) const = default;

private:
    std::vector<PathFragment> fragments_;
};

} // namespace docdb
