#pragma once

#include "document/document.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace docdb {

// ── Document encoding ────────────────────────────────────────────────────────
//
// Stored documents are docdb.pb.EncodedDocument protobuf messages (see
// proto/document.proto).  Nested documents and arrays are encoded inline.

// Serialises every field of `doc` into `out` (previous content replaced).
[[nodiscard]] std::error_code encode_document(const Document& doc, std::string& out);

// Decodes `data` into `out`.  Fails with errc::corrupted on malformed input.
[[nodiscard]] std::error_code decode_document(std::string_view data, FieldBuffer& out);

// ── EncodedDocument ──────────────────────────────────────────────────────────
//
// Read-only view over a stored record.  The payload is decoded on first
// access and cached; a payload that fails to decode reports errc::corrupted
// from every lookup.

class EncodedDocument final : public Document {
public:
    EncodedDocument(std::string key, std::string data);

    [[nodiscard]] std::error_code get_by_field(std::string_view field, Value& out) const override;
    [[nodiscard]] std::error_code iterate(const FieldFunc& fn) const override;
    [[nodiscard]] std::string_view key() const noexcept override { return key_; }

    [[nodiscard]] const std::string& data() const noexcept { return data_; }

private:
    [[nodiscard]] std::error_code decode() const;

    std::string key_;
    std::string data_;
    mutable std::unique_ptr<FieldBuffer> decoded_;
    mutable std::error_code decode_error_;
};

} // namespace docdb
