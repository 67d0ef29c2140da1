#pragma once

// Fixed-width scalar and string encodings shared by the encoder and decoder.
// Everything on the wire is little-endian.

#include "bsonkit/bson.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace bsonkit::wire {

// ------------------------------
// Type tags
// ------------------------------

enum Tag : std::uint8_t {
    kDouble = 0x01,
    kString = 0x02,
    kDocument = 0x03,
    kArray = 0x04,
    kBinary = 0x05,
    kUndefined = 0x06,
    kObjectId = 0x07,
    kBool = 0x08,
    kDateTime = 0x09,
    kNull = 0x0A,
    kRegex = 0x0B,
    kDbPointer = 0x0C,
    kJavaScript = 0x0D,
    kSymbol = 0x0E,
    kJavaScriptWithScope = 0x0F,
    kInt32 = 0x10,
    kTimestamp = 0x11,
    kInt64 = 0x12,
    kDecimal128 = 0x13,
    kMaxKey = 0x7F,
    kMinKey = 0xFF,
};

static constexpr std::uint8_t kSubtypeGeneric = 0x00;
static constexpr std::uint8_t kSubtypeReservedLow = 10;   // 10..127 are never valid
static constexpr std::uint8_t kSubtypeReservedHigh = 127;

static constexpr std::int64_t kMaxInt32 = (std::numeric_limits<std::int32_t>::max)();
static constexpr std::int64_t kMinInt32 = (std::numeric_limits<std::int32_t>::min)();
static constexpr std::size_t kMinDocumentSize = 5; // length prefix + terminator
// Elements an int32-sized array block can hold (3 bytes minimum each).
static constexpr std::uint64_t kMaxArrayLength = (static_cast<std::uint64_t>(kMaxInt32) - kMinDocumentSize) / 3;

bool is_known_tag(std::uint8_t tag) noexcept;
const char* tag_name(std::uint8_t tag) noexcept;

// ------------------------------
// Encoding
// ------------------------------

inline void append_u8(Bytes& out, std::uint8_t v) {
    out.push_back(v);
}

inline void append_u32_le(Bytes& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

inline void append_i32_le(Bytes& out, std::int32_t v) {
    append_u32_le(out, static_cast<std::uint32_t>(v));
}

inline void append_i64_le(Bytes& out, std::int64_t v) {
    std::uint64_t u = static_cast<std::uint64_t>(v);
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((u >> (8*i)) & 0xFFu));
}

inline void append_double_le(Bytes& out, double d) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(d), "double must be 64-bit IEEE-754");
    std::memcpy(&u, &d, sizeof(u));
    append_i64_le(out, static_cast<std::int64_t>(u));
}

// Overwrite four bytes at `at` (used to back-patch length prefixes).
inline void patch_i32_le(Bytes& out, std::size_t at, std::int32_t v) {
    std::uint32_t u = static_cast<std::uint32_t>(v);
    out[at + 0] = static_cast<std::uint8_t>(u & 0xFFu);
    out[at + 1] = static_cast<std::uint8_t>((u >> 8) & 0xFFu);
    out[at + 2] = static_cast<std::uint8_t>((u >> 16) & 0xFFu);
    out[at + 3] = static_cast<std::uint8_t>((u >> 24) & 0xFFu);
}

// Element name. Caller guarantees no embedded NUL.
void append_cstring(Bytes& out, const std::string& s);

// int32 length (including terminator), bytes, 0x00. StringTooBig when the
// length does not fit a signed 32-bit integer.
void append_string(Bytes& out, const std::string& s);

// int32 length, subtype, bytes. BinaryTooBig when oversized.
void append_binary(Bytes& out, const Binary& b, std::uint8_t subtype = kSubtypeGeneric);

// ------------------------------
// Decoding
// ------------------------------

// A read window over a complete input buffer. Reads never cross `end`.
struct Slice {
    const std::uint8_t* data{nullptr};
    std::size_t end{0};
};

inline std::uint32_t read_u32_le_from(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

inline std::int32_t read_i32_le_from(const std::uint8_t* p) {
    return static_cast<std::int32_t>(read_u32_le_from(p));
}

inline std::int64_t read_i64_le_from(const std::uint8_t* p) {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; ++i) u |= (static_cast<std::uint64_t>(p[i]) << (8*i));
    return static_cast<std::int64_t>(u);
}

// NotEnoughData when fewer than `n` bytes remain before `s.end`.
void require(const Slice& s, std::size_t pos, std::size_t n, const char* what);

std::uint8_t read_u8(const Slice& s, std::size_t& pos);
std::int32_t read_i32(const Slice& s, std::size_t& pos);
std::int64_t read_i64(const Slice& s, std::size_t& pos);
double read_double(const Slice& s, std::size_t& pos);
// Any nonzero byte decodes as true.
bool read_bool(const Slice& s, std::size_t& pos);

// NUL-terminated name or regex part. BadKeyEncoding / BadStringEncoding for
// invalid UTF-8 depending on `is_key`; BrokenData when no terminator is found.
std::string read_cstring(const Slice& s, std::size_t& pos, bool is_key);

// Length-prefixed string value.
std::string read_string(const Slice& s, std::size_t& pos);

// ------------------------------
// UTF-8
// ------------------------------

// Strict RFC 3629: rejects overlongs, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const std::uint8_t* p, std::size_t n) noexcept;

inline bool is_valid_utf8(const std::string& s) noexcept {
    return is_valid_utf8(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace bsonkit::wire
