#pragma once

#include "document/value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace docdb::keys {

// ── Order-preserving key encoding ────────────────────────────────────────────
//
// Encodes values so that bytewise comparison of the encodings orders values
// the same way compare_values() does, across types by tag:
//
//   [tag: u8][payload]
//
//   null      0x05  (no payload)
//   bool      0x10  [0x00 | 0x01]
//   number    0x20  [ordered f64: 8B BE][0x00 float | 0x01 int][int: 8B BE, ints only]
//   text      0x30  [escaped bytes][0x00 0x01]
//   blob      0x40  [escaped bytes][0x00 0x01]
//   array     0x50  [escaped protobuf bytes][0x00 0x01]
//   document  0x60  [escaped protobuf bytes][0x00 0x01]
//
// Escaping replaces 0x00 with 0x00 0xFF, so the terminator sorts first.
// Numbers sort by their double value, with exact int64 tie-breaking, so
// every encoding is self-delimiting and integer keys round-trip exactly.
// Arrays and documents only support equality.

inline constexpr uint8_t kTagNull     = 0x05;
inline constexpr uint8_t kTagBool     = 0x10;
inline constexpr uint8_t kTagNumber   = 0x20;
inline constexpr uint8_t kTagText     = 0x30;
inline constexpr uint8_t kTagBlob     = 0x40;
inline constexpr uint8_t kTagArray    = 0x50;
inline constexpr uint8_t kTagDocument = 0x60;

// Appends the encoding of `v` to `out`.
[[nodiscard]] std::error_code append_value(std::string& out, const Value& v);

// Returns the encoding of `v` (previous content of `out` replaced).
[[nodiscard]] std::error_code encode_value(const Value& v, std::string& out);

// Decodes one value from the front of `in` and advances `in` past it.
// Integers decode as int64.  Fails with errc::corrupted on malformed input.
[[nodiscard]] std::error_code decode_value(std::string_view& in, Value& out);

// Smallest byte string greater than every string that starts with
// `prefix`.  Empty when no such string exists (prefix is all 0xFF bytes).
[[nodiscard]] std::string prefix_successor(std::string_view prefix);

// Prefix of the encoding of `v` shared by every value comparing equal to it.
// For numbers this is the tag and the ordered double, so that integers and
// floats of the same magnitude fall in the same range.
[[nodiscard]] std::error_code encode_bound(const Value& v, std::string& out);

// Big-endian fixed-width integers, used for namespaces and sequences.
void append_u64(std::string& out, uint64_t v);
[[nodiscard]] uint64_t read_u64(std::string_view in);

} // namespace docdb::keys
