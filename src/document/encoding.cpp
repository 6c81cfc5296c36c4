#include "document/encoding.hpp"

#include "common/error.hpp"
#include "document.pb.h"

#include <memory>
#include <utility>

namespace docdb {

namespace {

// Protobuf's default recursion limit is 100; keep nesting well below it.
constexpr int kMaxNesting = 64;

[[nodiscard]] std::error_code encode_fields(const Document& doc, pb::EncodedDocument& out, int depth);

[[nodiscard]] std::error_code encode_value(const Value& v, pb::EncodedValue& out, int depth) {
    if (depth > kMaxNesting) {
        return make_error_code(errc::type_mismatch);
    }

    switch (v.type()) {
        case ValueType::Null:
            out.set_null_value(true);
            break;
        case ValueType::Bool:
            out.set_bool_value(v.as_bool());
            break;
        case ValueType::Int8:
            out.set_int_value(v.as_int64());
            out.set_int_width(pb::EncodedValue::INT8);
            break;
        case ValueType::Int16:
            out.set_int_value(v.as_int64());
            out.set_int_width(pb::EncodedValue::INT16);
            break;
        case ValueType::Int32:
            out.set_int_value(v.as_int64());
            out.set_int_width(pb::EncodedValue::INT32);
            break;
        case ValueType::Int64:
            out.set_int_value(v.as_int64());
            out.set_int_width(pb::EncodedValue::INT64);
            break;
        case ValueType::Float64:
            out.set_float_value(v.as_float64());
            break;
        case ValueType::Text:
            out.set_text_value(v.as_bytes());
            break;
        case ValueType::Blob:
            out.set_blob_value(v.as_bytes());
            break;
        case ValueType::Array: {
            auto* arr = out.mutable_array_value();
            for (const auto& item : v.as_array()) {
                if (auto ec = encode_value(item, *arr->add_values(), depth + 1)) return ec;
            }
            break;
        }
        case ValueType::Document:
            return encode_fields(v.as_document(), *out.mutable_document_value(), depth + 1);
    }
    return {};
}

std::error_code encode_fields(const Document& doc, pb::EncodedDocument& out, int depth) {
    return doc.iterate([&](std::string_view field, const Value& v) -> std::error_code {
        auto* f = out.add_fields();
        f->set_name(std::string(field));
        return encode_value(v, *f->mutable_value(), depth);
    });
}

[[nodiscard]] std::error_code decode_fields(const pb::EncodedDocument& in, FieldBuffer& out);

[[nodiscard]] std::error_code decode_value(const pb::EncodedValue& in, Value& out) {
    switch (in.kind_case()) {
        case pb::EncodedValue::kNullValue:
            out = Value::null();
            return {};
        case pb::EncodedValue::kBoolValue:
            out = Value::boolean(in.bool_value());
            return {};
        case pb::EncodedValue::kIntValue: {
            Value wide = Value::int64(in.int_value());
            ValueType width = ValueType::Int64;
            switch (in.int_width()) {
                case pb::EncodedValue::INT8:  width = ValueType::Int8; break;
                case pb::EncodedValue::INT16: width = ValueType::Int16; break;
                case pb::EncodedValue::INT32: width = ValueType::Int32; break;
                default: break;
            }
            if (wide.convert_to(width, out)) {
                return make_error_code(errc::corrupted);
            }
            return {};
        }
        case pb::EncodedValue::kFloatValue:
            out = Value::float64(in.float_value());
            return {};
        case pb::EncodedValue::kTextValue:
            out = Value::text(in.text_value());
            return {};
        case pb::EncodedValue::kBlobValue:
            out = Value::blob(in.blob_value());
            return {};
        case pb::EncodedValue::kArrayValue: {
            ValueArray items;
            items.reserve(static_cast<std::size_t>(in.array_value().values_size()));
            for (const auto& item : in.array_value().values()) {
                Value v;
                if (auto ec = decode_value(item, v)) return ec;
                items.push_back(std::move(v));
            }
            out = Value::array(std::move(items));
            return {};
        }
        case pb::EncodedValue::kDocumentValue: {
            auto nested = std::make_shared<FieldBuffer>();
            if (auto ec = decode_fields(in.document_value(), *nested)) return ec;
            out = Value::document(std::move(nested));
            return {};
        }
        case pb::EncodedValue::KIND_NOT_SET:
            break;
    }
    return make_error_code(errc::corrupted);
}

std::error_code decode_fields(const pb::EncodedDocument& in, FieldBuffer& out) {
    for (const auto& f : in.fields()) {
        Value v;
        if (auto ec = decode_value(f.value(), v)) return ec;
        out.add(f.name(), std::move(v));
    }
    return {};
}

} // anonymous namespace

std::error_code encode_document(const Document& doc, std::string& out) {
    pb::EncodedDocument msg;
    if (auto ec = encode_fields(doc, msg, 0)) {
        return ec;
    }
    out.clear();
    if (!msg.SerializeToString(&out)) {
        return make_error_code(errc::corrupted);
    }
    return {};
}

std::error_code decode_document(std::string_view data, FieldBuffer& out) {
    pb::EncodedDocument msg;
    if (!msg.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return make_error_code(errc::corrupted);
    }
    return decode_fields(msg, out);
}

// ── EncodedDocument ──────────────────────────────────────────────────────────

EncodedDocument::EncodedDocument(std::string key, std::string data)
    : key_(std::move(key))
    , data_(std::move(data))
{}

std::error_code EncodedDocument::decode() const {
    if (decoded_ || decode_error_) {
        return decode_error_;
    }
    auto buf = std::make_unique<FieldBuffer>();
    decode_error_ = decode_document(data_, *buf);
    if (!decode_error_) {
        buf->set_key(key_);
        decoded_ = std::move(buf);
    }
    return decode_error_;
}

std::error_code EncodedDocument::get_by_field(std::string_view field, Value& out) const {
    if (auto ec = decode()) return ec;
    return decoded_->get_by_field(field, out);
}

std::error_code EncodedDocument::iterate(const FieldFunc& fn) const {
    if (auto ec = decode()) return ec;
    return decoded_->iterate(fn);
}

} // namespace docdb
