#include "bsonkit/bson.hpp"

#include "codec.hpp"

#include <algorithm>
#include <limits>
#include <locale>
#include <sstream>

namespace bsonkit {

// ------------------------------
// Errors
// ------------------------------

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnsupportedObject: return "UnsupportedObject";
        case ErrorKind::UnsupportedKey: return "UnsupportedKey";
        case ErrorKind::KeyWithZeroByte: return "KeyWithZeroByte";
        case ErrorKind::IntegerOverflow: return "IntegerOverflow";
        case ErrorKind::StringTooBig: return "StringTooBig";
        case ErrorKind::BinaryTooBig: return "BinaryTooBig";
        case ErrorKind::DocumentTooBig: return "DocumentTooBig";
        case ErrorKind::CycleDetected: return "CycleDetected";
        case ErrorKind::BrokenData: return "BrokenData";
        case ErrorKind::IncorrectSize: return "IncorrectSize";
        case ErrorKind::TooManyData: return "TooManyData";
        case ErrorKind::NotEnoughData: return "NotEnoughData";
        case ErrorKind::InvalidElementType: return "InvalidElementType";
        case ErrorKind::BadKeyEncoding: return "BadKeyEncoding";
        case ErrorKind::BadStringEncoding: return "BadStringEncoding";
        case ErrorKind::StringSizeError: return "StringSizeError";
        case ErrorKind::InconsistentStringSize: return "InconsistentStringSize";
        case ErrorKind::RepeatedKeyData: return "RepeatedKeyData";
        case ErrorKind::BadArrayIndex: return "BadArrayIndex";
        case ErrorKind::InvalidBinarySubtype: return "InvalidBinarySubtype";
        case ErrorKind::InvalidArray: return "InvalidArray";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::UnsupportedOption: return "UnsupportedOption";
        case ErrorKind::Io: return "Io";
        case ErrorKind::ZlibError: return "ZlibError";
        case ErrorKind::NotFound: return "NotFound";
    }
    return "Unknown";
}

bool is_marshal_kind(ErrorKind k) noexcept {
    return k >= ErrorKind::UnsupportedObject && k <= ErrorKind::CycleDetected;
}

bool is_unmarshal_kind(ErrorKind k) noexcept {
    return k >= ErrorKind::BrokenData && k <= ErrorKind::InvalidArray;
}

BsonError::BsonError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind BsonError::kind() const noexcept { return kind_; }

MarshalError::MarshalError(ErrorKind k, const std::string& msg) : BsonError(k, msg) {}
UnmarshalError::UnmarshalError(ErrorKind k, const std::string& msg) : BsonError(k, msg) {}
ConfigError::ConfigError(ErrorKind k, const std::string& msg) : BsonError(k, msg) {}
IoError::IoError(ErrorKind k, const std::string& msg) : BsonError(k, msg) {}

// ------------------------------
// Value
// ------------------------------

std::string to_string(ValueType t) {
    switch (t) {
        case ValueType::Null: return "null";
        case ValueType::Double: return "double";
        case ValueType::Int32: return "int32";
        case ValueType::Int64: return "int64";
        case ValueType::UInt64: return "uint64";
        case ValueType::Bool: return "bool";
        case ValueType::String: return "string";
        case ValueType::Binary: return "binary";
        case ValueType::DateTime: return "datetime";
        case ValueType::Document: return "document";
        case ValueType::Array: return "array";
        case ValueType::Foreign: return "foreign";
    }
    return "unknown";
}

Value Value::make_null() { return Value{}; }

Value Value::make_double(double d) {
    Value out;
    out.v = d;
    return out;
}

Value Value::make_int32(std::int32_t i) {
    Value out;
    out.v = i;
    return out;
}

Value Value::make_int64(std::int64_t i) {
    Value out;
    out.v = i;
    return out;
}

Value Value::make_uint64(std::uint64_t u) {
    Value out;
    out.v = u;
    return out;
}

Value Value::make_bool(bool b) {
    Value out;
    out.v = b;
    return out;
}

Value Value::make_string(std::string s) {
    Value out;
    out.v = std::move(s);
    return out;
}

Value Value::make_binary(Binary b) {
    Value out;
    out.v = std::move(b);
    return out;
}

Value Value::make_datetime(std::int64_t unix_ms) {
    return make_datetime(DateTime{unix_ms, "UTC"});
}

Value Value::make_datetime(const DateTime& dt) {
    Value out;
    out.v = dt;
    return out;
}

Value Value::make_document() {
    return make_document(std::make_shared<Document>());
}

Value Value::make_document(DocumentPtr d) {
    Value out;
    out.v = std::move(d);
    return out;
}

Value Value::make_array() {
    return make_array(std::make_shared<Array>());
}

Value Value::make_array(ArrayPtr a) {
    Value out;
    out.v = std::move(a);
    return out;
}

Value Value::make_array(Array a) {
    return make_array(std::make_shared<Array>(std::move(a)));
}

Value Value::make_foreign(std::string type_name) {
    Value out;
    out.v = Foreign{std::move(type_name)};
    return out;
}

ValueType Value::type() const noexcept {
    return static_cast<ValueType>(v.index());
}

bool Value::is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v); }
bool Value::is_double() const noexcept { return std::holds_alternative<double>(v); }
bool Value::is_integer() const noexcept {
    return std::holds_alternative<std::int32_t>(v) || std::holds_alternative<std::int64_t>(v) ||
           std::holds_alternative<std::uint64_t>(v);
}
bool Value::is_bool() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_string() const noexcept { return std::holds_alternative<std::string>(v); }
bool Value::is_binary() const noexcept { return std::holds_alternative<Binary>(v); }
bool Value::is_datetime() const noexcept { return std::holds_alternative<DateTime>(v); }
bool Value::is_document() const noexcept { return std::holds_alternative<DocumentPtr>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<ArrayPtr>(v); }

double Value::as_double() const { return std::get<double>(v); }

std::int64_t Value::as_int64() const {
    if (std::holds_alternative<std::int32_t>(v)) return std::get<std::int32_t>(v);
    if (std::holds_alternative<std::int64_t>(v)) return std::get<std::int64_t>(v);
    std::uint64_t u = std::get<std::uint64_t>(v);
    if (u > static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())) {
        throw BsonError(ErrorKind::UnsupportedObject, "integer " + std::to_string(u) + " exceeds the int64 range");
    }
    return static_cast<std::int64_t>(u);
}

bool Value::as_bool() const { return std::get<bool>(v); }
const std::string& Value::as_string() const { return std::get<std::string>(v); }
const Binary& Value::as_binary() const { return std::get<Binary>(v); }
const DateTime& Value::as_datetime() const { return std::get<DateTime>(v); }

const Document& Value::as_document() const {
    const auto& p = std::get<DocumentPtr>(v);
    if (!p) throw BsonError(ErrorKind::UnsupportedObject, "null document handle");
    return *p;
}

Document& Value::as_document() {
    auto& p = std::get<DocumentPtr>(v);
    if (!p) throw BsonError(ErrorKind::UnsupportedObject, "null document handle");
    return *p;
}

const Array& Value::as_array() const {
    const auto& p = std::get<ArrayPtr>(v);
    if (!p) throw BsonError(ErrorKind::UnsupportedObject, "null array handle");
    return *p;
}

Array& Value::as_array() {
    auto& p = std::get<ArrayPtr>(v);
    if (!p) throw BsonError(ErrorKind::UnsupportedObject, "null array handle");
    return *p;
}

// ------------------------------
// Equality
// ------------------------------

bool operator==(const DateTime& a, const DateTime& b) {
    return a.unix_ms == b.unix_ms && a.timezone == b.timezone;
}

bool operator==(const Foreign& a, const Foreign& b) {
    return a.type_name == b.type_name;
}

// Integers of different widths compare by numeric value.
static bool integer_equal(const Value& a, const Value& b) {
    bool a_big = std::holds_alternative<std::uint64_t>(a.v);
    bool b_big = std::holds_alternative<std::uint64_t>(b.v);
    if (a_big && b_big) return std::get<std::uint64_t>(a.v) == std::get<std::uint64_t>(b.v);
    if (a_big || b_big) {
        std::uint64_t u = a_big ? std::get<std::uint64_t>(a.v) : std::get<std::uint64_t>(b.v);
        const Value& other = a_big ? b : a;
        std::int64_t s = other.as_int64();
        return s >= 0 && static_cast<std::uint64_t>(s) == u;
    }
    return a.as_int64() == b.as_int64();
}

bool operator==(const Value& a, const Value& b) {
    if (a.is_integer() && b.is_integer()) return integer_equal(a, b);
    if (a.v.index() != b.v.index()) return false;

    if (a.is_document()) {
        const auto& pa = std::get<DocumentPtr>(a.v);
        const auto& pb = std::get<DocumentPtr>(b.v);
        if (pa == pb) return true;
        if (!pa || !pb) return false;
        return *pa == *pb;
    }
    if (a.is_array()) {
        const auto& pa = std::get<ArrayPtr>(a.v);
        const auto& pb = std::get<ArrayPtr>(b.v);
        if (pa == pb) return true;
        if (!pa || !pb) return false;
        return *pa == *pb;
    }
    return a.v == b.v;
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

// ------------------------------
// Keys and documents
// ------------------------------

bool is_text(const Key& k) noexcept {
    return std::holds_alternative<std::string>(k);
}

std::string to_string(const Key& k) {
    if (std::holds_alternative<std::string>(k)) return "'" + std::get<std::string>(k) + "'";
    if (std::holds_alternative<std::int64_t>(k)) return std::to_string(std::get<std::int64_t>(k));
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::get<double>(k);
    return oss.str();
}

Document::Document(std::initializer_list<std::pair<std::string, Value>> fields) {
    for (const auto& kv : fields) set(kv.first, kv.second);
}

void Document::set(Key key, Value value) {
    for (auto& e : entries_) {
        if (e.first == key) {
            e.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

Value& Document::operator[](const std::string& name) {
    if (Value* p = find(name)) return *p;
    entries_.emplace_back(name, Value{});
    return entries_.back().second;
}

const Value* Document::find(const std::string& name) const {
    for (const auto& e : entries_) {
        const auto* s = std::get_if<std::string>(&e.first);
        if (s && *s == name) return &e.second;
    }
    return nullptr;
}

Value* Document::find(const std::string& name) {
    for (auto& e : entries_) {
        const auto* s = std::get_if<std::string>(&e.first);
        if (s && *s == name) return &e.second;
    }
    return nullptr;
}

bool Document::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const Value& Document::at(const std::string& name) const {
    const Value* p = find(name);
    if (!p) throw BsonError(ErrorKind::NotFound, "no field named '" + name + "'");
    return *p;
}

bool Document::erase(const Key& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

void Document::clear() noexcept { entries_.clear(); }
std::size_t Document::size() const noexcept { return entries_.size(); }
bool Document::empty() const noexcept { return entries_.empty(); }
Document::const_iterator Document::begin() const noexcept { return entries_.begin(); }
Document::const_iterator Document::end() const noexcept { return entries_.end(); }

// Field order does not matter.
bool operator==(const Document& a, const Document& b) {
    if (a.size() != b.size()) return false;
    for (const auto& e : a) {
        auto it = std::find_if(b.begin(), b.end(), [&](const Document::Entry& o) { return o.first == e.first; });
        if (it == b.end() || it->second != e.second) return false;
    }
    return true;
}

// ------------------------------
// Mapper
// ------------------------------

Mapper::Mapper(const MapperOptions& opts) : opts_(opts) {}

Mapper Mapper::from_config(const Document& config) {
    MapperOptions opts;
    for (const auto& kv : config) {
        if (!is_text(kv.first)) {
            throw ConfigError(ErrorKind::UnsupportedOption, "unsupported option " + to_string(kv.first));
        }
        const auto& name = std::get<std::string>(kv.first);
        if (name == "strict") {
            if (!kv.second.is_bool()) {
                throw ConfigError(ErrorKind::ConfigError,
                                  "option 'strict' must be a bool, got " + to_string(kv.second.type()));
            }
            opts.strict = kv.second.as_bool();
        } else {
            throw ConfigError(ErrorKind::UnsupportedOption, "unsupported option '" + name + "'");
        }
    }
    return Mapper(opts);
}

const MapperOptions& Mapper::options() const noexcept { return opts_; }
bool Mapper::strict() const noexcept { return opts_.strict; }

Bytes Mapper::marshal(const Value& root) const {
    if (!root.is_document()) {
        throw MarshalError(ErrorKind::UnsupportedObject,
                           "top-level value must be a document, got " + to_string(root.type()));
    }
    const auto& p = std::get<DocumentPtr>(root.v);
    if (!p) throw MarshalError(ErrorKind::UnsupportedObject, "null document handle");
    return detail::encode_root(*p);
}

Bytes Mapper::marshal(const Document& root) const {
    return detail::encode_root(root);
}

Value Mapper::unmarshal(const Bytes& data) const {
    return unmarshal(data.data(), data.size());
}

Value Mapper::unmarshal(const std::uint8_t* data, std::size_t size) const {
    detail::DecodeContext ctx;
    ctx.strict = opts_.strict;
    return detail::decode_root(data, size, ctx);
}

Bytes marshal(const Value& root) {
    return Mapper().marshal(root);
}

Value unmarshal(const Bytes& data) {
    return Mapper().unmarshal(data);
}

} // namespace bsonkit
