#include "codec.hpp"

#include <limits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bsonkit::detail {

namespace {

void skip(const wire::Slice& s, std::size_t& pos, std::size_t n, const char* what) {
    wire::require(s, pos, n, what);
    pos += n;
}

// Reads the length prefix of a document block and returns its end offset.
std::size_t open_document(const wire::Slice& s, std::size_t& pos) {
    std::size_t start = pos;
    std::int32_t total = wire::read_i32(s, pos);
    if (total < static_cast<std::int32_t>(wire::kMinDocumentSize)) {
        throw UnmarshalError(ErrorKind::IncorrectSize,
                             "document length " + std::to_string(total) + " is below the minimum of 5");
    }
    if (s.end - start < static_cast<std::size_t>(total)) {
        throw UnmarshalError(ErrorKind::NotEnoughData,
                             "document of " + std::to_string(total) + " bytes exceeds the " +
                             std::to_string(s.end - start) + " bytes available");
    }
    return start + static_cast<std::size_t>(total);
}

void reject_in_strict(const DecodeContext& ctx, std::uint8_t tag) {
    if (ctx.strict) {
        throw UnmarshalError(ErrorKind::InvalidElementType,
                             std::string("element type '") + wire::tag_name(tag) + "' is not supported in strict mode");
    }
}

// Skips a nested document structurally (length prefix and terminator only).
void skip_document(const wire::Slice& s, std::size_t& pos) {
    std::size_t end = open_document(s, pos);
    if (s.data[end - 1] != 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "document is not NUL-terminated");
    }
    pos = end;
}

std::optional<Value> decode_binary(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx) {
    std::int32_t len = wire::read_i32(s, pos);
    if (len < 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "negative binary length " + std::to_string(len));
    }
    std::uint8_t subtype = wire::read_u8(s, pos);
    if (subtype >= wire::kSubtypeReservedLow && subtype <= wire::kSubtypeReservedHigh) {
        throw UnmarshalError(ErrorKind::InvalidBinarySubtype, "reserved binary subtype " + std::to_string(subtype));
    }
    wire::require(s, pos, static_cast<std::size_t>(len), "binary payload");
    if (subtype != wire::kSubtypeGeneric) {
        if (ctx.strict) {
            throw UnmarshalError(ErrorKind::InvalidBinarySubtype,
                                 "binary subtype " + std::to_string(subtype) + " is not supported in strict mode");
        }
        pos += static_cast<std::size_t>(len);
        return std::nullopt;
    }
    Binary out(s.data + pos, s.data + pos + len);
    pos += static_cast<std::size_t>(len);
    return Value::make_binary(std::move(out));
}

void skip_code_with_scope(const wire::Slice& s, std::size_t& pos) {
    std::size_t start = pos;
    std::int32_t total = wire::read_i32(s, pos);
    // int32 + empty string (4 + 1) + empty document (5)
    if (total < 14) {
        throw UnmarshalError(ErrorKind::BrokenData, "code-with-scope length " + std::to_string(total) + " is too small");
    }
    wire::require(s, start, static_cast<std::size_t>(total), "code-with-scope");
    wire::Slice inner{s.data, start + static_cast<std::size_t>(total)};
    (void)wire::read_string(inner, pos);
    skip_document(inner, pos);
    if (pos != inner.end) {
        throw UnmarshalError(ErrorKind::BrokenData, "code-with-scope length does not match its contents");
    }
}

std::optional<Value> decode_payload(std::uint8_t tag, const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx) {
    switch (tag) {
        case wire::kDouble:
            return Value::make_double(wire::read_double(s, pos));
        case wire::kString:
            return Value::make_string(wire::read_string(s, pos));
        case wire::kDocument:
            return Value::make_document(decode_document(s, pos, ctx));
        case wire::kArray:
            return Value::make_array(decode_array(s, pos, ctx));
        case wire::kBinary:
            return decode_binary(s, pos, ctx);
        case wire::kBool:
            return Value::make_bool(wire::read_bool(s, pos));
        case wire::kDateTime:
            return Value::make_datetime(wire::read_i64(s, pos));
        case wire::kNull:
            return Value::make_null();
        case wire::kInt32:
            return Value::make_int32(wire::read_i32(s, pos));
        case wire::kInt64:
            return Value::make_int64(wire::read_i64(s, pos));
        default:
            break;
    }

    // Valid wire types with no counterpart in the value union.
    reject_in_strict(ctx, tag);
    switch (tag) {
        case wire::kUndefined:
        case wire::kMinKey:
        case wire::kMaxKey:
            break;
        case wire::kObjectId:
            skip(s, pos, 12, "objectId");
            break;
        case wire::kRegex:
            (void)wire::read_cstring(s, pos, false);
            (void)wire::read_cstring(s, pos, false);
            break;
        case wire::kDbPointer:
            (void)wire::read_string(s, pos);
            skip(s, pos, 12, "dbPointer");
            break;
        case wire::kJavaScript:
        case wire::kSymbol:
            (void)wire::read_string(s, pos);
            break;
        case wire::kJavaScriptWithScope:
            skip_code_with_scope(s, pos);
            break;
        case wire::kTimestamp:
            skip(s, pos, 8, "timestamp");
            break;
        case wire::kDecimal128:
            skip(s, pos, 16, "decimal128");
            break;
        default:
            throw UnmarshalError(ErrorKind::InvalidElementType, "unknown element type " + std::to_string(tag));
    }
    return std::nullopt;
}

// Parses the element list of the block starting at `pos` and hands every
// kept element to `sink(name, index, value)`. Skipped elements still claim their name.
template <typename Sink>
void decode_elements(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx, bool is_array, Sink&& sink) {
    std::size_t end = open_document(s, pos);
    std::size_t list_end = end - 1;
    wire::Slice body{s.data, end};

    std::unordered_set<std::string> seen;
    while (pos < list_end) {
        DecodedElement el = decode_element(body, pos, ctx);
        if (pos > list_end) {
            throw UnmarshalError(ErrorKind::BrokenData, "element '" + el.name + "' overruns the document terminator");
        }
        std::uint64_t index = 0;
        if (is_array) {
            if (!parse_array_index(el.name, index)) {
                throw UnmarshalError(ErrorKind::BadArrayIndex, "'" + el.name + "' is not a canonical array index");
            }
            if (index >= wire::kMaxArrayLength) {
                throw UnmarshalError(ErrorKind::InvalidArray,
                                     "array index " + el.name + " exceeds the maximum array length of " +
                                     std::to_string(wire::kMaxArrayLength));
            }
        }
        if (!seen.insert(el.name).second) {
            throw UnmarshalError(ErrorKind::RepeatedKeyData, "repeated key '" + el.name + "'");
        }
        if (el.value) {
            sink(std::move(el.name), index, std::move(*el.value));
        }
    }
    if (s.data[list_end] != 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "document is not NUL-terminated");
    }
    pos = end;
}

} // namespace

bool parse_array_index(const std::string& key, std::uint64_t& out) noexcept {
    if (key.empty()) return false;
    if (key.size() > 1 && key[0] == '0') return false;
    constexpr std::uint64_t kMax = (std::numeric_limits<std::uint64_t>::max)();
    std::uint64_t v = 0;
    for (char c : key) {
        if (c < '0' || c > '9') return false;
        auto d = static_cast<std::uint64_t>(c - '0');
        v = (v > (kMax - d) / 10) ? kMax : v * 10 + d;
    }
    out = v;
    return true;
}

DecodedElement decode_element(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx) {
    DecodedElement el;
    el.tag = wire::read_u8(s, pos);
    if (el.tag == 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "unexpected terminator inside element list");
    }
    if (!wire::is_known_tag(el.tag)) {
        throw UnmarshalError(ErrorKind::InvalidElementType, "unknown element type " + std::to_string(el.tag));
    }
    el.name = wire::read_cstring(s, pos, true);
    el.value = decode_payload(el.tag, s, pos, ctx);
    return el;
}

DocumentPtr decode_document(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx) {
    auto doc = std::make_shared<Document>();
    decode_elements(s, pos, ctx, false, [&](std::string name, std::size_t, Value v) {
        doc->set(std::move(name), std::move(v));
    });
    return doc;
}

ArrayPtr decode_array(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx) {
    std::vector<std::pair<std::size_t, Value>> items;
    std::size_t count = 0; // max index + 1
    decode_elements(s, pos, ctx, true, [&](std::string, std::uint64_t index, Value v) {
        auto i = static_cast<std::size_t>(index);
        if (i + 1 > count) count = i + 1;
        items.emplace_back(i, std::move(v));
    });

    if (ctx.strict && items.size() != count) {
        throw UnmarshalError(ErrorKind::InvalidArray,
                             "array has " + std::to_string(count - items.size()) + " missing indices");
    }
    // Holes below the highest index are null.
    auto arr = std::make_shared<Array>(count);
    for (auto& it : items) {
        (*arr)[it.first] = std::move(it.second);
    }
    return arr;
}

Value decode_root(const std::uint8_t* data, std::size_t size, const DecodeContext& ctx) {
    wire::Slice s{data, size};
    std::size_t pos = 0;
    if (size >= 4) {
        std::int32_t total = wire::read_i32_le_from(data);
        if (total >= static_cast<std::int32_t>(wire::kMinDocumentSize) && size > static_cast<std::size_t>(total)) {
            throw UnmarshalError(ErrorKind::TooManyData,
                                 std::to_string(size - static_cast<std::size_t>(total)) +
                                 " trailing bytes after the document");
        }
    }
    DocumentPtr doc = decode_document(s, pos, ctx);
    return Value::make_document(std::move(doc));
}

} // namespace bsonkit::detail
