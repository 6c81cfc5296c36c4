#include "document/key_encoding.hpp"

#include "common/error.hpp"
#include "document/document.hpp"
#include "document/encoding.hpp"

#include <bit>
#include <cstring>

namespace docdb::keys {

namespace {

constexpr uint64_t kSignBit = 0x8000000000000000ULL;
constexpr uint8_t kSubtagFloat = 0x00;
constexpr uint8_t kSubtagInt   = 0x01;

[[nodiscard]] uint64_t ordered_double(double d) {
    if (d == 0.0) d = 0.0;  // fold -0.0 into +0.0
    const auto bits = std::bit_cast<uint64_t>(d);
    return (bits & kSignBit) ? ~bits : (bits | kSignBit);
}

[[nodiscard]] double unordered_double(uint64_t bits) {
    bits = (bits & kSignBit) ? (bits & ~kSignBit) : ~bits;
    return std::bit_cast<double>(bits);
}

void append_escaped(std::string& out, std::string_view bytes) {
    for (char c : bytes) {
        out += c;
        if (c == '\0') {
            out += '\xFF';
        }
    }
    out += '\0';
    out += '\x01';
}

[[nodiscard]] std::error_code read_escaped(std::string_view& in, std::string& out) {
    out.clear();
    std::size_t i = 0;
    while (i < in.size()) {
        const char c = in[i];
        if (c != '\0') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 >= in.size()) {
            break;
        }
        const auto next = static_cast<uint8_t>(in[i + 1]);
        if (next == 0xFF) {
            out += '\0';
            i += 2;
        } else if (next == 0x01) {
            in.remove_prefix(i + 2);
            return {};
        } else {
            break;
        }
    }
    return make_error_code(errc::corrupted);
}

// Arrays and documents are wrapped in a single-field document so that the
// protobuf codec can carry them.
[[nodiscard]] std::error_code encode_nested(const Value& v, std::string& out) {
    FieldBuffer wrapper;
    wrapper.add("", v);
    return encode_document(wrapper, out);
}

[[nodiscard]] std::error_code decode_nested(std::string_view bytes, Value& out) {
    FieldBuffer wrapper;
    if (auto ec = decode_document(bytes, wrapper)) return ec;
    if (wrapper.size() != 1) {
        return make_error_code(errc::corrupted);
    }
    out = wrapper.fields().front().second;
    return {};
}

} // anonymous namespace

void append_u64(std::string& out, uint64_t v) {
    char b[8];
    for (int i = 0; i < 8; ++i) {
        b[i] = static_cast<char>(v >> ((7 - i) * 8));
    }
    out.append(b, 8);
}

uint64_t read_u64(std::string_view in) {
    uint64_t v = 0;
    for (std::size_t i = 0; i < 8 && i < in.size(); ++i) {
        v = (v << 8) | static_cast<uint8_t>(in[i]);
    }
    return v;
}

std::error_code append_value(std::string& out, const Value& v) {
    switch (v.type()) {
        case ValueType::Null:
            out += static_cast<char>(kTagNull);
            return {};

        case ValueType::Bool:
            out += static_cast<char>(kTagBool);
            out += v.as_bool() ? '\x01' : '\x00';
            return {};

        case ValueType::Int8:
        case ValueType::Int16:
        case ValueType::Int32:
        case ValueType::Int64: {
            const int64_t i = v.as_int64();
            out += static_cast<char>(kTagNumber);
            append_u64(out, ordered_double(static_cast<double>(i)));
            out += static_cast<char>(kSubtagInt);
            append_u64(out, static_cast<uint64_t>(i) ^ kSignBit);
            return {};
        }

        case ValueType::Float64:
            out += static_cast<char>(kTagNumber);
            append_u64(out, ordered_double(v.as_float64()));
            out += static_cast<char>(kSubtagFloat);
            return {};

        case ValueType::Text:
            out += static_cast<char>(kTagText);
            append_escaped(out, v.as_bytes());
            return {};

        case ValueType::Blob:
            out += static_cast<char>(kTagBlob);
            append_escaped(out, v.as_bytes());
            return {};

        case ValueType::Array:
        case ValueType::Document: {
            std::string nested;
            if (auto ec = encode_nested(v, nested)) return ec;
            out += static_cast<char>(v.type() == ValueType::Array ? kTagArray : kTagDocument);
            append_escaped(out, nested);
            return {};
        }
    }
    return make_error_code(errc::type_mismatch);
}

std::error_code encode_value(const Value& v, std::string& out) {
    out.clear();
    return append_value(out, v);
}

std::error_code decode_value(std::string_view& in, Value& out) {
    if (in.empty()) {
        return make_error_code(errc::corrupted);
    }

    const auto tag = static_cast<uint8_t>(in.front());
    std::string_view rest = in.substr(1);

    switch (tag) {
        case kTagNull:
            out = Value::null();
            break;

        case kTagBool:
            if (rest.empty()) return make_error_code(errc::corrupted);
            out = Value::boolean(rest.front() != '\0');
            rest.remove_prefix(1);
            break;

        case kTagNumber: {
            if (rest.size() < 9) return make_error_code(errc::corrupted);
            const double d = unordered_double(read_u64(rest));
            const auto subtag = static_cast<uint8_t>(rest[8]);
            rest.remove_prefix(9);
            if (subtag == kSubtagFloat) {
                out = Value::float64(d);
            } else if (subtag == kSubtagInt && rest.size() >= 8) {
                out = Value::int64(static_cast<int64_t>(read_u64(rest) ^ kSignBit));
                rest.remove_prefix(8);
            } else {
                return make_error_code(errc::corrupted);
            }
            break;
        }

        case kTagText:
        case kTagBlob: {
            std::string bytes;
            if (auto ec = read_escaped(rest, bytes)) return ec;
            out = (tag == kTagText) ? Value::text(std::move(bytes)) : Value::blob(std::move(bytes));
            break;
        }

        case kTagArray:
        case kTagDocument: {
            std::string nested;
            if (auto ec = read_escaped(rest, nested)) return ec;
            if (auto ec = decode_nested(nested, out)) return ec;
            break;
        }

        default:
            return make_error_code(errc::corrupted);
    }

    in = rest;
    return {};
}

std::string prefix_successor(std::string_view prefix) {
    std::string out(prefix);
    while (!out.empty()) {
        auto& last = reinterpret_cast<unsigned char&>(out.back());
        if (last != 0xFF) {
            ++last;
            return out;
        }
        out.pop_back();
    }
    return out;
}

std::error_code encode_bound(const Value& v, std::string& out) {
    if (auto ec = encode_value(v, out)) return ec;
    if (v.is_number()) {
        out.resize(9);
    }
    return {};
}

} // namespace docdb::keys
