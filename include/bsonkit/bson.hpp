#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bsonkit {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    // marshal
    UnsupportedObject,
    UnsupportedKey,
    KeyWithZeroByte,
    IntegerOverflow,
    StringTooBig,
    BinaryTooBig,
    DocumentTooBig,
    CycleDetected,

    // unmarshal
    BrokenData,
    IncorrectSize,
    TooManyData,
    NotEnoughData,
    InvalidElementType,
    BadKeyEncoding,
    BadStringEncoding,
    StringSizeError,
    InconsistentStringSize,
    RepeatedKeyData,
    BadArrayIndex,
    InvalidBinarySubtype,
    InvalidArray,

    // configuration
    ConfigError,
    UnsupportedOption,

    // file layer / utilities
    Io,
    ZlibError,
    NotFound,
};

std::string to_string(ErrorKind k);
bool is_marshal_kind(ErrorKind k) noexcept;
bool is_unmarshal_kind(ErrorKind k) noexcept;

class BsonError : public std::runtime_error {
public:
    BsonError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

class MarshalError : public BsonError {
public:
    MarshalError(ErrorKind k, const std::string& msg);
};

class UnmarshalError : public BsonError {
public:
    UnmarshalError(ErrorKind k, const std::string& msg);
};

class ConfigError : public BsonError {
public:
    ConfigError(ErrorKind k, const std::string& msg);
};

class IoError : public BsonError {
public:
    IoError(ErrorKind k, const std::string& msg);
};

// ------------------------------
// Public data model
// ------------------------------

using Bytes = std::vector<std::uint8_t>;
using Binary = std::vector<std::uint8_t>;

struct DateTime {
    std::int64_t unix_ms{0};         // milliseconds since Unix epoch (UTC)
    std::string timezone{"UTC"};     // empty => naive, not encodable
};

// A host object with no counterpart in the value union.
struct Foreign {
    std::string type_name{};
};

struct Value;
class Document;

using Array = std::vector<Value>;
using DocumentPtr = std::shared_ptr<Document>;
using ArrayPtr = std::shared_ptr<Array>;

enum class ValueType {
    Null,
    Double,
    Int32,
    Int64,
    UInt64,
    Bool,
    String,
    Binary,
    DateTime,
    Document,
    Array,
    Foreign,
};

std::string to_string(ValueType t);

struct Value {
    std::variant<
        std::nullptr_t,
        double,
        std::int32_t,
        std::int64_t,
        std::uint64_t,
        bool,
        std::string,
        Binary,
        DateTime,
        DocumentPtr,
        ArrayPtr,
        Foreign
    > v{nullptr};

    // Convenience constructors
    static Value make_null();
    static Value make_double(double d);
    static Value make_int32(std::int32_t i);
    static Value make_int64(std::int64_t i);
    static Value make_uint64(std::uint64_t u);
    static Value make_bool(bool b);
    static Value make_string(std::string s);
    static Value make_binary(Binary b);
    static Value make_datetime(std::int64_t unix_ms);
    static Value make_datetime(const DateTime& dt);
    static Value make_document();
    static Value make_document(DocumentPtr d);
    static Value make_array();
    static Value make_array(ArrayPtr a);
    static Value make_array(Array a);
    static Value make_foreign(std::string type_name);

    ValueType type() const noexcept;

    bool is_null() const noexcept;
    bool is_double() const noexcept;
    bool is_integer() const noexcept;
    bool is_bool() const noexcept;
    bool is_string() const noexcept;
    bool is_binary() const noexcept;
    bool is_datetime() const noexcept;
    bool is_document() const noexcept;
    bool is_array() const noexcept;

    double as_double() const;
    // Any of the integer alternatives; throws UnsupportedObject above int64 range.
    std::int64_t as_int64() const;
    bool as_bool() const;
    const std::string& as_string() const;
    const Binary& as_binary() const;
    const DateTime& as_datetime() const;
    const Document& as_document() const;
    Document& as_document();
    const Array& as_array() const;
    Array& as_array();
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);
bool operator==(const DateTime& a, const DateTime& b);
bool operator==(const Foreign& a, const Foreign& b);

// Field names are text on the wire; the other alternatives exist so that
// collaborators can hand over non-text keys and have them rejected.
using Key = std::variant<std::string, std::int64_t, double>;

bool is_text(const Key& k) noexcept;
std::string to_string(const Key& k);

class Document {
public:
    using Entry = std::pair<Key, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Document() = default;
    Document(std::initializer_list<std::pair<std::string, Value>> fields);

    // Insert or replace; insertion order of first occurrence is kept.
    void set(Key key, Value value);
    Value& operator[](const std::string& name);

    const Value* find(const std::string& name) const;
    Value* find(const std::string& name);
    bool contains(const std::string& name) const;
    const Value& at(const std::string& name) const;
    bool erase(const Key& key);
    void clear() noexcept;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    std::vector<Entry> entries_;
};

bool operator==(const Document& a, const Document& b);

// ------------------------------
// Mapper
// ------------------------------

struct MapperOptions {
    bool strict{false}; // unsupported wire constructs and array holes become errors
};

class Mapper {
public:
    Mapper() = default;
    explicit Mapper(const MapperOptions& opts);

    /// Build from a loosely typed option document ({"strict": bool}).
    static Mapper from_config(const Document& config);

    const MapperOptions& options() const noexcept;
    bool strict() const noexcept;

    /// Encode a document-shaped root. Arrays and scalars are rejected.
    Bytes marshal(const Value& root) const;
    Bytes marshal(const Document& root) const;

    /// Decode one complete top-level document.
    Value unmarshal(const Bytes& data) const;
    Value unmarshal(const std::uint8_t* data, std::size_t size) const;

private:
    MapperOptions opts_{};
};

Bytes marshal(const Value& root);
Value unmarshal(const Bytes& data);

// ------------------------------
// File API
// ------------------------------

struct ReadOptions {
    bool strict{false};
};

enum class CompressionMode {
    Never,
    Always,
    Auto,
};

struct WriteOptions {
    CompressionMode compression{CompressionMode::Never};
    int zlib_level{6}; // 0..9
};

struct FileInfo {
    std::uint64_t file_size{0};
    bool compressed{false};
    std::uint32_t document_size{0};
    std::uint32_t crc32{0};   // over the uncompressed document bytes
    std::size_t field_count{0};
};

/// Read one document from a raw or gzip-compressed .bson file.
Value read_file(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

/// Inspect framing and checksum without building values.
FileInfo read_file_info(const std::filesystem::path& file);

/// Marshal `root` and write it out.
void write_file(
    const std::filesystem::path& file,
    const Value& root,
    const WriteOptions& opts = WriteOptions{}
);

// ------------------------------
// Utilities
// ------------------------------

/// Resolve a dot-separated path; array segments are decimal indices.
const Value& lookup(const Value& root, const std::string& path);

/// Relaxed Extended JSON rendering.
std::string to_json(const Value& v, bool pretty = false);

/// BSON type name ("string", "int32", "object", ...).
std::string type_name(const Value& v);

} // namespace bsonkit
