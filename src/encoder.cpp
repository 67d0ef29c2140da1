#include "codec.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace bsonkit::detail {

// ------------------------------
// Validator
// ------------------------------

void validate_value(const Value& v) {
    if (std::holds_alternative<Foreign>(v.v)) {
        throw MarshalError(ErrorKind::UnsupportedObject,
                           "unsupported object of type '" + std::get<Foreign>(v.v).type_name + "'");
    }
    if (std::holds_alternative<DateTime>(v.v) && std::get<DateTime>(v.v).timezone.empty()) {
        throw MarshalError(ErrorKind::UnsupportedObject, "datetime has no timezone");
    }
    if (std::holds_alternative<DocumentPtr>(v.v) && !std::get<DocumentPtr>(v.v)) {
        throw MarshalError(ErrorKind::UnsupportedObject, "null document handle");
    }
    if (std::holds_alternative<ArrayPtr>(v.v) && !std::get<ArrayPtr>(v.v)) {
        throw MarshalError(ErrorKind::UnsupportedObject, "null array handle");
    }
}

void validate_document(const Document& d) {
    for (const auto& kv : d) {
        if (!is_text(kv.first)) {
            throw MarshalError(ErrorKind::UnsupportedKey, "field name " + to_string(kv.first) + " is not text");
        }
    }
    for (const auto& kv : d) {
        const auto& name = std::get<std::string>(kv.first);
        if (name.find('\0') != std::string::npos) {
            throw MarshalError(ErrorKind::KeyWithZeroByte, "field name contains a NUL byte");
        }
    }
    for (const auto& kv : d) {
        validate_value(kv.second);
    }
}

// ------------------------------
// Element encoding
// ------------------------------

namespace {

// Appends the payload of `v` and returns its type tag.
struct PayloadWriter {
    Bytes& out;
    EncodeContext& ctx;

    std::uint8_t operator()(std::nullptr_t) const { return wire::kNull; }

    std::uint8_t operator()(double d) const {
        wire::append_double_le(out, d);
        return wire::kDouble;
    }

    std::uint8_t operator()(std::int32_t i) const {
        wire::append_i32_le(out, i);
        return wire::kInt32;
    }

    std::uint8_t operator()(std::int64_t i) const {
        if (i >= wire::kMinInt32 && i <= wire::kMaxInt32) {
            wire::append_i32_le(out, static_cast<std::int32_t>(i));
            return wire::kInt32;
        }
        wire::append_i64_le(out, i);
        return wire::kInt64;
    }

    std::uint8_t operator()(std::uint64_t u) const {
        if (u > static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())) {
            throw MarshalError(ErrorKind::IntegerOverflow,
                               "integer " + std::to_string(u) + " exceeds the int64 range");
        }
        return (*this)(static_cast<std::int64_t>(u));
    }

    std::uint8_t operator()(bool b) const {
        wire::append_u8(out, b ? 1 : 0);
        return wire::kBool;
    }

    std::uint8_t operator()(const std::string& s) const {
        wire::append_string(out, s);
        return wire::kString;
    }

    std::uint8_t operator()(const Binary& b) const {
        wire::append_binary(out, b);
        return wire::kBinary;
    }

    std::uint8_t operator()(const DateTime& dt) const {
        if (dt.timezone.empty()) {
            throw MarshalError(ErrorKind::UnsupportedObject, "datetime has no timezone");
        }
        wire::append_i64_le(out, dt.unix_ms);
        return wire::kDateTime;
    }

    std::uint8_t operator()(const DocumentPtr& d) const {
        if (!d) throw MarshalError(ErrorKind::UnsupportedObject, "null document handle");
        encode_document(out, *d, ctx);
        return wire::kDocument;
    }

    std::uint8_t operator()(const ArrayPtr& a) const {
        if (!a) throw MarshalError(ErrorKind::UnsupportedObject, "null array handle");
        encode_array(out, *a, ctx);
        return wire::kArray;
    }

    std::uint8_t operator()(const Foreign& f) const {
        throw MarshalError(ErrorKind::UnsupportedObject, "unsupported object of type '" + f.type_name + "'");
    }
};

void check_document_size(const Bytes& out, std::size_t start) {
    // body so far + trailing NUL must fit the int32 length prefix
    if (out.size() - start + 1 > static_cast<std::size_t>(wire::kMaxInt32)) {
        throw MarshalError(ErrorKind::DocumentTooBig, "document exceeds the int32 size limit");
    }
}

void close_document(Bytes& out, std::size_t start) {
    check_document_size(out, start);
    out.push_back(0);
    wire::patch_i32_le(out, start, static_cast<std::int32_t>(out.size() - start));
}

} // namespace

void encode_element(Bytes& out, const std::string& name, const Value& v, EncodeContext& ctx) {
    std::size_t tag_at = out.size();
    out.push_back(0); // patched below
    wire::append_cstring(out, name);
    out[tag_at] = std::visit(PayloadWriter{out, ctx}, v.v);
}

void encode_document(Bytes& out, const Document& d, EncodeContext& ctx) {
    validate_document(d);
    CycleGuard::Scope scope(ctx.guard, &d, "document");

    std::vector<const Document::Entry*> fields;
    fields.reserve(d.size());
    for (const auto& kv : d) fields.push_back(&kv);
    std::sort(fields.begin(), fields.end(), [](const Document::Entry* a, const Document::Entry* b) {
        return std::get<std::string>(a->first) < std::get<std::string>(b->first);
    });

    std::size_t start = out.size();
    wire::append_i32_le(out, 0); // patched in close_document
    for (const auto* kv : fields) {
        encode_element(out, std::get<std::string>(kv->first), kv->second, ctx);
        check_document_size(out, start);
    }
    close_document(out, start);
}

void encode_array(Bytes& out, const Array& a, EncodeContext& ctx) {
    CycleGuard::Scope scope(ctx.guard, &a, "array");

    std::size_t start = out.size();
    wire::append_i32_le(out, 0);
    for (std::size_t i = 0; i < a.size(); ++i) {
        validate_value(a[i]);
        encode_element(out, std::to_string(i), a[i], ctx);
        check_document_size(out, start);
    }
    close_document(out, start);
}

Bytes encode_root(const Document& d) {
    EncodeContext ctx;
    Bytes out;
    out.reserve(256);
    encode_document(out, d, ctx);
    return out;
}

} // namespace bsonkit::detail
