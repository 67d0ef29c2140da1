#include "check.hpp"
#include "bsonkit/bson_easy.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace bsonkit;
using namespace bsonkit::easy;

static std::int32_t length_prefix(const Bytes& b) {
    return static_cast<std::int32_t>(
        static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
        (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24));
}

// Byte offset of the first occurrence of `needle`, or npos.
static std::size_t find_bytes(const Bytes& hay, const Bytes& needle) {
    if (needle.size() > hay.size()) return std::string::npos;
    for (std::size_t i = 0; i + needle.size() <= hay.size(); ++i) {
        bool match = true;
        for (std::size_t k = 0; k < needle.size() && match; ++k) match = hay[i + k] == needle[k];
        if (match) return i;
    }
    return std::string::npos;
}

static ErrorKind marshal_kind(const Value& v) {
    try {
        (void)marshal(v);
    } catch (const MarshalError& e) {
        return e.kind();
    }
    throw std::runtime_error("expected MarshalError");
}

int main() {
    try {
        // Empty document
        {
            Bytes b = marshal(Value::make_document());
            CHECK(b == (Bytes{5, 0, 0, 0, 0}));
        }

        // {"x": 1, "y": "hi"} byte for byte; x narrows to int32
        {
            Bytes b = marshal(doc({{"x", i64(1)}, {"y", str("hi")}}));
            Bytes expected = {
                22, 0, 0, 0,
                0x10, 'x', 0, 1, 0, 0, 0,
                0x02, 'y', 0, 3, 0, 0, 0, 'h', 'i', 0,
                0,
            };
            CHECK(b == expected);
        }

        // {"n": 5000000000} needs the 64-bit tag
        {
            Bytes b = marshal(doc({{"n", i64(5000000000LL)}}));
            CHECK(b.size() == 4 + 1 + 2 + 8 + 1);
            CHECK(b[4] == 0x12);
            CHECK(length_prefix(b) == static_cast<std::int32_t>(b.size()));
        }

        // Width boundaries
        {
            Bytes lo = marshal(doc({{"v", i64(std::numeric_limits<std::int32_t>::min())}}));
            Bytes hi = marshal(doc({{"v", i64(std::numeric_limits<std::int32_t>::max())}}));
            Bytes over = marshal(doc({{"v", i64(std::int64_t(std::numeric_limits<std::int32_t>::max()) + 1)}}));
            Bytes under = marshal(doc({{"v", i64(std::int64_t(std::numeric_limits<std::int32_t>::min()) - 1)}}));
            CHECK(lo[4] == 0x10);
            CHECK(hi[4] == 0x10);
            CHECK(over[4] == 0x12);
            CHECK(under[4] == 0x12);

            Bytes u = marshal(doc({{"v", Value::make_uint64(7)}}));
            CHECK(u[4] == 0x10);
            Bytes umax = marshal(doc({{"v", Value::make_uint64(std::uint64_t(std::numeric_limits<std::int64_t>::max()))}}));
            CHECK(umax[4] == 0x12);
        }

        // Fields come out in ascending name order
        {
            Bytes b = marshal(doc({{"b", i64(2)}, {"a", i64(1)}, {"c", i64(3)}}));
            std::size_t pa = find_bytes(b, Bytes{'a', 0});
            std::size_t pb = find_bytes(b, Bytes{'b', 0});
            std::size_t pc = find_bytes(b, Bytes{'c', 0});
            CHECK(pa != std::string::npos && pb != std::string::npos && pc != std::string::npos);
            CHECK(pa < pb && pb < pc);
        }

        // Arrays use "0", "1", "2" as element names
        {
            Bytes b = marshal(doc({{"a", arr({str("a"), str("b"), str("c")})}}));
            std::size_t body = 4 + 1 + 2; // outer prefix, tag, "a\0"
            CHECK(b[4] == 0x04);
            std::size_t p0 = find_bytes(b, Bytes{0x02, '0', 0});
            std::size_t p1 = find_bytes(b, Bytes{0x02, '1', 0});
            std::size_t p2 = find_bytes(b, Bytes{0x02, '2', 0});
            CHECK(p0 == body + 4);
            CHECK(p0 < p1 && p1 < p2);

            // inner block length covers exactly the array
            Bytes inner(b.begin() + static_cast<std::ptrdiff_t>(body), b.end() - 1);
            CHECK(length_prefix(inner) == static_cast<std::int32_t>(inner.size()));
        }

        // Scalars
        {
            Bytes b = marshal(doc({
                {"d", f64(1.0)},
                {"t", boolean(true)},
                {"f", boolean(false)},
                {"z", null()},
                {"m", Value::make_datetime(-1)},
                {"bin", bytes("\x01\x02")},
            }));
            CHECK(length_prefix(b) == static_cast<std::int32_t>(b.size()));
            CHECK(find_bytes(b, Bytes{0x01, 'd', 0, 0, 0, 0, 0, 0, 0, 0xF0, 0x3F}) != std::string::npos);
            CHECK(find_bytes(b, Bytes{0x08, 't', 0, 1}) != std::string::npos);
            CHECK(find_bytes(b, Bytes{0x08, 'f', 0, 0}) != std::string::npos);
            CHECK(find_bytes(b, Bytes{0x0A, 'z', 0}) != std::string::npos);
            CHECK(find_bytes(b, Bytes{0x09, 'm', 0, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}) != std::string::npos);
            CHECK(find_bytes(b, Bytes{0x05, 'b', 'i', 'n', 0, 2, 0, 0, 0, 0, 1, 2}) != std::string::npos);
        }

        // Length exactness across nesting
        {
            Value v = doc({
                {"outer", doc({{"inner", doc({{"deep", arr({i64(1), arr({}), doc({})})}})}})},
                {"s", str("caff\xC3\xA8")},
            });
            Bytes b = marshal(v);
            CHECK(length_prefix(b) == static_cast<std::int32_t>(b.size()));
            CHECK(b.back() == 0);
        }

        // Shared (acyclic) subtrees are fine
        {
            Value shared = doc({{"k", i64(1)}});
            Value v = doc({{"a", shared}, {"b", shared}, {"c", arr({shared, shared})}});
            Bytes b = marshal(v);
            CHECK(length_prefix(b) == static_cast<std::int32_t>(b.size()));
        }

        // Root must be a document
        {
            CHECK(marshal_kind(arr({i64(1)})) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(i64(1)) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(null()) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(Value::make_document(DocumentPtr{})) == ErrorKind::UnsupportedObject);
        }

        // Values outside the union
        {
            CHECK(marshal_kind(doc({{"o", Value::make_foreign("socket")}})) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(doc({{"a", arr({Value::make_foreign("set")})}})) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(doc({{"t", Value::make_datetime(DateTime{0, ""})}})) == ErrorKind::UnsupportedObject);
            CHECK(marshal_kind(doc({{"a", Value::make_array(ArrayPtr{})}})) == ErrorKind::UnsupportedObject);
        }

        // Keys
        {
            auto d = std::make_shared<Document>();
            d->set(std::int64_t{1}, i64(1));
            CHECK(marshal_kind(Value::make_document(d)) == ErrorKind::UnsupportedKey);

            auto f = std::make_shared<Document>();
            f->set(2.5, i64(1));
            CHECK(marshal_kind(Value::make_document(f)) == ErrorKind::UnsupportedKey);

            CHECK(marshal_kind(doc({{std::string("a\0b", 3), i64(1)}})) == ErrorKind::KeyWithZeroByte);

            // nested documents are validated too
            CHECK(marshal_kind(doc({{"x", doc({{std::string("\0", 1), null()}})}})) == ErrorKind::KeyWithZeroByte);
        }

        // Integer range
        {
            Value v = doc({{"big", Value::make_uint64(std::numeric_limits<std::uint64_t>::max())}});
            CHECK(marshal_kind(v) == ErrorKind::IntegerOverflow);
            // same error every time
            CHECK(marshal_kind(v) == ErrorKind::IntegerOverflow);
        }

        // Direct cycle
        {
            auto d = std::make_shared<Document>();
            d->set("self", Value::make_document(d));
            Value root = Value::make_document(d);
            CHECK(marshal_kind(root) == ErrorKind::CycleDetected);
            CHECK(marshal_kind(root) == ErrorKind::CycleDetected);
            d->clear();
        }

        // Transitive cycle through an array, regardless of which sibling holds it
        {
            for (const char* holder : {"a", "m", "z"}) {
                auto top = std::make_shared<Document>();
                auto mid = std::make_shared<Array>();
                top->set("a", i64(1));
                top->set("m", str("x"));
                top->set("z", null());
                mid->push_back(Value::make_document(top));
                top->set(holder, Value::make_array(mid));
                CHECK(marshal_kind(Value::make_document(top)) == ErrorKind::CycleDetected);
                mid->clear();
                top->clear();
            }
        }

        // Array containing itself
        {
            auto a = std::make_shared<Array>();
            a->push_back(Value::make_array(a));
            CHECK(marshal_kind(doc({{"a", Value::make_array(a)}})) == ErrorKind::CycleDetected);
            a->clear();
        }

        // A failure part-way does not leave stale entries behind
        {
            auto inner = std::make_shared<Document>();
            inner->set("ok", i64(1));
            Value bad = doc({{"a", Value::make_document(inner)}, {"b", Value::make_foreign("x")}});
            Mapper m;
            CHECK_THROWS_KIND(m.marshal(bad), ErrorKind::UnsupportedObject);
            Bytes b = m.marshal(doc({{"again", Value::make_document(inner)}}));
            CHECK(length_prefix(b) == static_cast<std::int32_t>(b.size()));
        }

        // Errors surface as MarshalError
        {
            bool threw = false;
            try {
                (void)marshal(i64(1));
            } catch (const MarshalError& e) {
                threw = is_marshal_kind(e.kind());
            }
            CHECK(threw);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
