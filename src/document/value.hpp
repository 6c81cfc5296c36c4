#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace docdb {

class Document;
class Value;

using DocumentPtr = std::shared_ptr<const Document>;
using ValueArray  = std::vector<Value>;

// ── ValueType ────────────────────────────────────────────────────────────────

enum class ValueType : uint8_t {
    Null     = 0,
    Bool     = 1,
    Int8     = 2,
    Int16    = 3,
    Int32    = 4,
    Int64    = 5,
    Float64  = 6,
    Text     = 7,
    Blob     = 8,
    Array    = 9,
    Document = 10,
};

[[nodiscard]] const char* to_string(ValueType type) noexcept;

[[nodiscard]] constexpr bool is_integer(ValueType t) noexcept {
    return t == ValueType::Int8 || t == ValueType::Int16 ||
           t == ValueType::Int32 || t == ValueType::Int64;
}

[[nodiscard]] constexpr bool is_number(ValueType t) noexcept {
    return is_integer(t) || t == ValueType::Float64;
}

// ── Value ────────────────────────────────────────────────────────────────────
//
// Immutable tagged union.  Integers of every width are stored as int64_t and
// keep their declared width in the type tag; text and blob share the string
// storage.  Arrays and nested documents are shared, never copied.

class Value {
public:
    Value() = default;  // null

    [[nodiscard]] static Value null() { return {}; }
    [[nodiscard]] static Value boolean(bool v);
    [[nodiscard]] static Value int8(int8_t v);
    [[nodiscard]] static Value int16(int16_t v);
    [[nodiscard]] static Value int32(int32_t v);
    [[nodiscard]] static Value int64(int64_t v);
    [[nodiscard]] static Value float64(double v);
    [[nodiscard]] static Value text(std::string v);
    [[nodiscard]] static Value blob(std::string bytes);
    [[nodiscard]] static Value array(ValueArray values);
    [[nodiscard]] static Value document(DocumentPtr doc);

    // Smallest integer type able to hold `v`.
    [[nodiscard]] static Value integer(int64_t v);

    [[nodiscard]] ValueType type() const noexcept { return type_; }
    [[nodiscard]] bool is_null() const noexcept { return type_ == ValueType::Null; }
    [[nodiscard]] bool is_number() const noexcept { return docdb::is_number(type_); }
    [[nodiscard]] bool is_integer() const noexcept { return docdb::is_integer(type_); }

    // Unchecked accessors: the caller must have checked type() first.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_int64() const;
    [[nodiscard]] double as_float64() const;
    [[nodiscard]] const std::string& as_bytes() const;   // Text or Blob
    [[nodiscard]] const ValueArray& as_array() const;
    [[nodiscard]] const Document& as_document() const;
    [[nodiscard]] const DocumentPtr& document_ptr() const;

    // Converts to `target`.  Fails with errc::conversion_failed when the
    // conversion would lose information or is not meaningful.
    [[nodiscard]] std::error_code convert_to(ValueType target, Value& out) const;

    // Exact conversion of a number to int64.
    [[nodiscard]] std::error_code convert_to_int64(int64_t& out) const;

    // Numeric value as double (integers are widened).
    [[nodiscard]] std::error_code convert_to_float64(double& out) const;

    // null, false, numeric zero and empty text/blob/array/document are falsy.
    [[nodiscard]] bool is_truthy() const;

    // JSON-like rendering, for tools and log lines.
    [[nodiscard]] std::string to_string() const;

private:
    using ArrayPtr = std::shared_ptr<const ValueArray>;

    ValueType type_ = ValueType::Null;
    std::variant<std::monostate, bool, int64_t, double, std::string, ArrayPtr, DocumentPtr> data_;
};

// ── Comparison ───────────────────────────────────────────────────────────────

// Orders two values: <0, 0 or >0.  Numbers compare across widths, text with
// text, blob with blob, bool with bool, arrays element-wise, null with null.
// Returns std::nullopt when the values are not comparable.
[[nodiscard]] std::optional<int> compare_values(const Value& a, const Value& b);

// Deep equality; documents are equal when they have the same field set.
[[nodiscard]] bool values_equal(const Value& a, const Value& b);

} // namespace docdb
