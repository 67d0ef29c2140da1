#include "wire.hpp"

namespace bsonkit::wire {

bool is_known_tag(std::uint8_t tag) noexcept {
    return (tag >= kDouble && tag <= kDecimal128) || tag == kMaxKey || tag == kMinKey;
}

const char* tag_name(std::uint8_t tag) noexcept {
    switch (tag) {
        case kDouble: return "double";
        case kString: return "string";
        case kDocument: return "object";
        case kArray: return "array";
        case kBinary: return "binData";
        case kUndefined: return "undefined";
        case kObjectId: return "objectId";
        case kBool: return "bool";
        case kDateTime: return "date";
        case kNull: return "null";
        case kRegex: return "regex";
        case kDbPointer: return "dbPointer";
        case kJavaScript: return "javascript";
        case kSymbol: return "symbol";
        case kJavaScriptWithScope: return "javascriptWithScope";
        case kInt32: return "int";
        case kTimestamp: return "timestamp";
        case kInt64: return "long";
        case kDecimal128: return "decimal";
        case kMaxKey: return "maxKey";
        case kMinKey: return "minKey";
        default: return "unknown";
    }
}

// ------------------------------
// Encoding
// ------------------------------

void append_cstring(Bytes& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

void append_string(Bytes& out, const std::string& s) {
    if (s.size() >= static_cast<std::size_t>(kMaxInt32)) {
        throw MarshalError(ErrorKind::StringTooBig,
                           "string of " + std::to_string(s.size()) + " bytes does not fit an int32 length");
    }
    append_i32_le(out, static_cast<std::int32_t>(s.size() + 1));
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

void append_binary(Bytes& out, const Binary& b, std::uint8_t subtype) {
    if (b.size() > static_cast<std::size_t>(kMaxInt32)) {
        throw MarshalError(ErrorKind::BinaryTooBig,
                           "binary of " + std::to_string(b.size()) + " bytes does not fit an int32 length");
    }
    append_i32_le(out, static_cast<std::int32_t>(b.size()));
    out.push_back(subtype);
    out.insert(out.end(), b.begin(), b.end());
}

// ------------------------------
// Decoding
// ------------------------------

void require(const Slice& s, std::size_t pos, std::size_t n, const char* what) {
    if (pos > s.end || s.end - pos < n) {
        throw UnmarshalError(ErrorKind::NotEnoughData, std::string("unexpected end of data reading ") + what);
    }
}

std::uint8_t read_u8(const Slice& s, std::size_t& pos) {
    require(s, pos, 1, "byte");
    return s.data[pos++];
}

std::int32_t read_i32(const Slice& s, std::size_t& pos) {
    require(s, pos, 4, "int32");
    std::int32_t v = read_i32_le_from(s.data + pos);
    pos += 4;
    return v;
}

std::int64_t read_i64(const Slice& s, std::size_t& pos) {
    require(s, pos, 8, "int64");
    std::int64_t v = read_i64_le_from(s.data + pos);
    pos += 8;
    return v;
}

double read_double(const Slice& s, std::size_t& pos) {
    require(s, pos, 8, "double");
    std::uint64_t u = static_cast<std::uint64_t>(read_i64_le_from(s.data + pos));
    pos += 8;
    double d = 0.0;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

bool read_bool(const Slice& s, std::size_t& pos) {
    require(s, pos, 1, "bool");
    return s.data[pos++] != 0;
}

std::string read_cstring(const Slice& s, std::size_t& pos, bool is_key) {
    if (pos > s.end) {
        throw UnmarshalError(ErrorKind::NotEnoughData, "unexpected end of data reading cstring");
    }
    const void* nul = std::memchr(s.data + pos, 0, s.end - pos);
    if (!nul) {
        throw UnmarshalError(ErrorKind::BrokenData,
                             is_key ? "element name is not NUL-terminated" : "cstring is not NUL-terminated");
    }
    std::size_t len = static_cast<std::size_t>(static_cast<const std::uint8_t*>(nul) - (s.data + pos));
    if (!is_valid_utf8(s.data + pos, len)) {
        if (is_key) throw UnmarshalError(ErrorKind::BadKeyEncoding, "element name is not valid UTF-8");
        throw UnmarshalError(ErrorKind::BadStringEncoding, "cstring is not valid UTF-8");
    }
    std::string out(reinterpret_cast<const char*>(s.data + pos), len);
    pos += len + 1;
    return out;
}

std::string read_string(const Slice& s, std::size_t& pos) {
    std::int32_t len = read_i32(s, pos);
    if (len < 1) {
        throw UnmarshalError(ErrorKind::StringSizeError, "string length " + std::to_string(len) + " is below 1");
    }
    if (s.end - pos < static_cast<std::size_t>(len)) {
        throw UnmarshalError(ErrorKind::InconsistentStringSize,
                             "string length " + std::to_string(len) + " runs past the enclosing document");
    }
    const std::uint8_t* p = s.data + pos;
    std::size_t n = static_cast<std::size_t>(len) - 1;
    if (p[n] != 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "string is not NUL-terminated");
    }
    if (!is_valid_utf8(p, n)) {
        throw UnmarshalError(ErrorKind::BadStringEncoding, "string is not valid UTF-8");
    }
    pos += static_cast<std::size_t>(len);
    return std::string(reinterpret_cast<const char*>(p), n);
}

// ------------------------------
// UTF-8
// ------------------------------

bool is_valid_utf8(const std::uint8_t* p, std::size_t n) noexcept {
    std::size_t i = 0;
    while (i < n) {
        std::uint8_t c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t need = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; min_cp = 0x10000; }
        else return false;

        if (n - i <= need) return false;
        for (std::size_t k = 1; k <= need; ++k) {
            std::uint8_t cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += need + 1;
    }
    return true;
}

} // namespace bsonkit::wire
