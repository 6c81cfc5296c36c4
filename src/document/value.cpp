#include "document/value.hpp"

#include "common/error.hpp"
#include "document/document.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace docdb {

namespace {

// Range of each integer width.
[[nodiscard]] bool fits(ValueType t, int64_t v) noexcept {
    switch (t) {
        case ValueType::Int8:
            return v >= std::numeric_limits<int8_t>::min() && v <= std::numeric_limits<int8_t>::max();
        case ValueType::Int16:
            return v >= std::numeric_limits<int16_t>::min() && v <= std::numeric_limits<int16_t>::max();
        case ValueType::Int32:
            return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
        case ValueType::Int64:
            return true;
        default:
            return false;
    }
}

template <typename T>
[[nodiscard]] int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

void append_quoted(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
}

[[nodiscard]] bool documents_equal(const Document& a, const Document& b) {
    std::size_t a_count = 0;
    bool equal = true;
    auto ec = a.iterate([&](std::string_view field, const Value& av) -> std::error_code {
        ++a_count;
        Value bv;
        if (b.get_by_field(field, bv) || !values_equal(av, bv)) {
            equal = false;
            return make_error_code(errc::type_mismatch);  // stop iterating
        }
        return {};
    });
    if (ec || !equal) return false;

    std::size_t b_count = 0;
    if (b.iterate([&](std::string_view, const Value&) -> std::error_code {
            ++b_count;
            return {};
        })) {
        return false;
    }
    return a_count == b_count;
}

} // anonymous namespace

// ── ValueType ────────────────────────────────────────────────────────────────

const char* to_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:     return "null";
        case ValueType::Bool:     return "bool";
        case ValueType::Int8:     return "int8";
        case ValueType::Int16:    return "int16";
        case ValueType::Int32:    return "int32";
        case ValueType::Int64:    return "int64";
        case ValueType::Float64:  return "float64";
        case ValueType::Text:     return "text";
        case ValueType::Blob:     return "blob";
        case ValueType::Array:    return "array";
        case ValueType::Document: return "document";
    }
    return "unknown";
}

// ── Factories ────────────────────────────────────────────────────────────────

Value Value::boolean(bool v) {
    Value out;
    out.type_ = ValueType::Bool;
    out.data_ = v;
    return out;
}

Value Value::int8(int8_t v) {
    Value out;
    out.type_ = ValueType::Int8;
    out.data_ = static_cast<int64_t>(v);
    return out;
}

Value Value::int16(int16_t v) {
    Value out;
    out.type_ = ValueType::Int16;
    out.data_ = static_cast<int64_t>(v);
    return out;
}

Value Value::int32(int32_t v) {
    Value out;
    out.type_ = ValueType::Int32;
    out.data_ = static_cast<int64_t>(v);
    return out;
}

Value Value::int64(int64_t v) {
    Value out;
    out.type_ = ValueType::Int64;
    out.data_ = v;
    return out;
}

Value Value::integer(int64_t v) {
    if (fits(ValueType::Int8, v))  return int8(static_cast<int8_t>(v));
    if (fits(ValueType::Int16, v)) return int16(static_cast<int16_t>(v));
    if (fits(ValueType::Int32, v)) return int32(static_cast<int32_t>(v));
    return int64(v);
}

Value Value::float64(double v) {
    Value out;
    out.type_ = ValueType::Float64;
    out.data_ = v;
    return out;
}

Value Value::text(std::string v) {
    Value out;
    out.type_ = ValueType::Text;
    out.data_ = std::move(v);
    return out;
}

Value Value::blob(std::string bytes) {
    Value out;
    out.type_ = ValueType::Blob;
    out.data_ = std::move(bytes);
    return out;
}

Value Value::array(ValueArray values) {
    Value out;
    out.type_ = ValueType::Array;
    out.data_ = std::make_shared<const ValueArray>(std::move(values));
    return out;
}

Value Value::document(DocumentPtr doc) {
    if (!doc) {
        throw std::invalid_argument("Value::document requires a document");
    }
    Value out;
    out.type_ = ValueType::Document;
    out.data_ = std::move(doc);
    return out;
}

// ── Accessors ────────────────────────────────────────────────────────────────

bool Value::as_bool() const { return std::get<bool>(data_); }

int64_t Value::as_int64() const { return std::get<int64_t>(data_); }

double Value::as_float64() const { return std::get<double>(data_); }

const std::string& Value::as_bytes() const { return std::get<std::string>(data_); }

const ValueArray& Value::as_array() const { return *std::get<ArrayPtr>(data_); }

const Document& Value::as_document() const { return *std::get<DocumentPtr>(data_); }

const DocumentPtr& Value::document_ptr() const { return std::get<DocumentPtr>(data_); }

// ── Conversions ──────────────────────────────────────────────────────────────

std::error_code Value::convert_to(ValueType target, Value& out) const {
    if (target == type_) {
        out = *this;
        return {};
    }

    switch (target) {
        case ValueType::Bool:
            if (is_integer()) {
                out = boolean(as_int64() != 0);
                return {};
            }
            return make_error_code(errc::conversion_failed);

        case ValueType::Int8:
        case ValueType::Int16:
        case ValueType::Int32:
        case ValueType::Int64: {
            int64_t v = 0;
            if (type_ == ValueType::Bool) {
                v = as_bool() ? 1 : 0;
            } else if (auto ec = convert_to_int64(v)) {
                return ec;
            }
            if (!fits(target, v)) {
                return make_error_code(errc::conversion_failed);
            }
            out = int64(v);
            out.type_ = target;
            return {};
        }

        case ValueType::Float64: {
            double d = 0;
            if (auto ec = convert_to_float64(d)) return ec;
            out = float64(d);
            return {};
        }

        case ValueType::Text:
            if (type_ == ValueType::Blob) {
                out = text(as_bytes());
                return {};
            }
            return make_error_code(errc::conversion_failed);

        case ValueType::Blob:
            if (type_ == ValueType::Text) {
                out = blob(as_bytes());
                return {};
            }
            return make_error_code(errc::conversion_failed);

        case ValueType::Null:
        case ValueType::Array:
        case ValueType::Document:
            return make_error_code(errc::conversion_failed);
    }
    return make_error_code(errc::conversion_failed);
}

std::error_code Value::convert_to_int64(int64_t& out) const {
    if (is_integer()) {
        out = as_int64();
        return {};
    }
    if (type_ != ValueType::Float64) {
        return make_error_code(errc::conversion_failed);
    }

    const double d = as_float64();
    // 2^63 is exactly representable; anything at or above it overflows.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(d) || std::trunc(d) != d || d >= kLimit || d < -kLimit) {
        return make_error_code(errc::conversion_failed);
    }
    out = static_cast<int64_t>(d);
    return {};
}

std::error_code Value::convert_to_float64(double& out) const {
    if (is_integer()) {
        out = static_cast<double>(as_int64());
        return {};
    }
    if (type_ == ValueType::Float64) {
        out = as_float64();
        return {};
    }
    return make_error_code(errc::conversion_failed);
}

bool Value::is_truthy() const {
    switch (type_) {
        case ValueType::Null:
            return false;
        case ValueType::Bool:
            return as_bool();
        case ValueType::Int8:
        case ValueType::Int16:
        case ValueType::Int32:
        case ValueType::Int64:
            return as_int64() != 0;
        case ValueType::Float64:
            return as_float64() != 0.0;
        case ValueType::Text:
        case ValueType::Blob:
            return !as_bytes().empty();
        case ValueType::Array:
            return !as_array().empty();
        case ValueType::Document: {
            bool any = false;
            (void)as_document().iterate([&](std::string_view, const Value&) -> std::error_code {
                any = true;
                return make_error_code(errc::type_mismatch);  // stop at first field
            });
            return any;
        }
    }
    return false;
}

std::string Value::to_string() const {
    switch (type_) {
        case ValueType::Null:
            return "NULL";
        case ValueType::Bool:
            return as_bool() ? "true" : "false";
        case ValueType::Int8:
        case ValueType::Int16:
        case ValueType::Int32:
        case ValueType::Int64:
            return std::to_string(as_int64());
        case ValueType::Float64:
            return fmt::format("{}", as_float64());
        case ValueType::Text: {
            std::string out;
            append_quoted(out, as_bytes());
            return out;
        }
        case ValueType::Blob: {
            std::string out = "\"\\x";
            for (unsigned char c : as_bytes()) {
                out += fmt::format("{:02X}", c);
            }
            out += '"';
            return out;
        }
        case ValueType::Array: {
            std::string out = "[";
            bool first = true;
            for (const auto& v : as_array()) {
                if (!first) out += ", ";
                first = false;
                out += v.to_string();
            }
            out += ']';
            return out;
        }
        case ValueType::Document: {
            std::string out = "{";
            bool first = true;
            (void)as_document().iterate([&](std::string_view field, const Value& v) -> std::error_code {
                if (!first) out += ", ";
                first = false;
                append_quoted(out, field);
                out += ": ";
                out += v.to_string();
                return {};
            });
            out += '}';
            return out;
        }
    }
    return {};
}

// ── Comparison ───────────────────────────────────────────────────────────────

std::optional<int> compare_values(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_integer() && b.is_integer()) {
            return three_way(a.as_int64(), b.as_int64());
        }
        double da = 0;
        double db = 0;
        (void)a.convert_to_float64(da);
        (void)b.convert_to_float64(db);
        if (std::isnan(da) || std::isnan(db)) return std::nullopt;
        return three_way(da, db);
    }

    if (a.type() != b.type()) {
        return std::nullopt;
    }

    switch (a.type()) {
        case ValueType::Null:
            return 0;
        case ValueType::Bool:
            return three_way(a.as_bool(), b.as_bool());
        case ValueType::Text:
        case ValueType::Blob: {
            const int c = a.as_bytes().compare(b.as_bytes());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case ValueType::Array: {
            const auto& xs = a.as_array();
            const auto& ys = b.as_array();
            const std::size_t n = std::min(xs.size(), ys.size());
            for (std::size_t i = 0; i < n; ++i) {
                auto c = compare_values(xs[i], ys[i]);
                if (!c) return std::nullopt;
                if (*c != 0) return c;
            }
            return three_way(xs.size(), ys.size());
        }
        case ValueType::Document:
            if (documents_equal(a.as_document(), b.as_document())) return 0;
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

bool values_equal(const Value& a, const Value& b) {
    auto c = compare_values(a, b);
    return c && *c == 0;
}

} // namespace docdb
