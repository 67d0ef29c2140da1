#pragma once

#include "bsonkit/bson.hpp"
#include "wire.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace bsonkit::detail {

// ------------------------------
// Cycle guard
// ------------------------------

// Containers currently being packed, keyed by address. One guard per
// marshal call; never shared between calls.
class CycleGuard {
public:
    class Scope {
    public:
        // Throws CycleDetected when `id` is already on the path.
        Scope(CycleGuard& guard, const void* id, const char* what);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        CycleGuard& guard_;
        const void* id_;
    };

    bool active(const void* id) const;
    std::size_t depth() const noexcept;

private:
    std::unordered_set<const void*> in_progress_;
};

// ------------------------------
// Validator
// ------------------------------

// Keys must be text and NUL-free; values must belong to the value union.
void validate_document(const Document& d);
void validate_value(const Value& v);

// ------------------------------
// Encoder
// ------------------------------

struct EncodeContext {
    CycleGuard guard;
};

// Appends tag, name and payload.
void encode_element(Bytes& out, const std::string& name, const Value& v, EncodeContext& ctx);
// Appends a complete length-prefixed block; fields in ascending name order.
void encode_document(Bytes& out, const Document& d, EncodeContext& ctx);
// Appends a block whose names are "0", "1", ...
void encode_array(Bytes& out, const Array& a, EncodeContext& ctx);

Bytes encode_root(const Document& d);

// ------------------------------
// Decoder
// ------------------------------

struct DecodeContext {
    bool strict{false};
};

struct DecodedElement {
    std::uint8_t tag{0};
    std::string name{};
    std::optional<Value> value{}; // empty when the element was skipped
};

// Reads one element starting at `pos`; reads never cross `s.end`.
DecodedElement decode_element(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx);

DocumentPtr decode_document(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx);
ArrayPtr decode_array(const wire::Slice& s, std::size_t& pos, const DecodeContext& ctx);

// Whole-buffer decode: the buffer must hold exactly one document.
Value decode_root(const std::uint8_t* data, std::size_t size, const DecodeContext& ctx);

// Canonical array index ("0", "1", ... no sign, no leading zero). Values too
// large for 64 bits saturate; range checks are the caller's.
bool parse_array_index(const std::string& key, std::uint64_t& out) noexcept;

} // namespace bsonkit::detail
