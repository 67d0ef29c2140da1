#include "check.hpp"
#include "wire.hpp"

#include <iostream>
#include <string>
#include <vector>

using bsonkit::Bytes;
using bsonkit::ErrorKind;
namespace wire = bsonkit::wire;

static wire::Slice slice_of(const Bytes& b) {
    return wire::Slice{b.data(), b.size()};
}

static bool utf8(const std::string& s) {
    return wire::is_valid_utf8(s);
}

int main() {
    try {
        // Fixed-width little-endian scalars
        {
            Bytes b;
            wire::append_i32_le(b, 0x01020304);
            CHECK(b.size() == 4);
            CHECK(b[0] == 0x04 && b[1] == 0x03 && b[2] == 0x02 && b[3] == 0x01);

            wire::append_i64_le(b, -2);
            wire::append_double_le(b, 1.5);
            CHECK(b.size() == 20);

            std::size_t pos = 0;
            auto s = slice_of(b);
            CHECK(wire::read_i32(s, pos) == 0x01020304);
            CHECK(wire::read_i64(s, pos) == -2);
            CHECK(wire::read_double(s, pos) == 1.5);
            CHECK(pos == b.size());

            CHECK_THROWS_KIND(wire::read_u8(s, pos), ErrorKind::NotEnoughData);
        }

        // Patching a length in place
        {
            Bytes b = {0, 0, 0, 0, 0xAA};
            wire::patch_i32_le(b, 0, 5);
            CHECK(b[0] == 5 && b[1] == 0 && b[4] == 0xAA);
        }

        // A short read never touches bytes past the slice end
        {
            Bytes b = {1, 2, 3};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_i32(slice_of(b), pos), ErrorKind::NotEnoughData);
            CHECK(pos == 0);
        }

        // Bool: any nonzero byte is true
        {
            Bytes b = {0, 1, 0x7F};
            std::size_t pos = 0;
            auto s = slice_of(b);
            CHECK(!wire::read_bool(s, pos));
            CHECK(wire::read_bool(s, pos));
            CHECK(wire::read_bool(s, pos));
        }

        // Length-prefixed strings
        {
            Bytes b;
            wire::append_string(b, "hi");
            CHECK(b.size() == 4 + 2 + 1);
            CHECK(b[0] == 3);
            CHECK(b.back() == 0);

            std::size_t pos = 0;
            CHECK(wire::read_string(slice_of(b), pos) == "hi");
            CHECK(pos == b.size());
        }
        {
            Bytes b;
            wire::append_string(b, "");
            std::size_t pos = 0;
            CHECK(wire::read_string(slice_of(b), pos).empty());
        }
        {
            Bytes b = {0, 0, 0, 0};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_string(slice_of(b), pos), ErrorKind::StringSizeError);
        }
        {
            Bytes b = {10, 0, 0, 0, 'a', 0};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_string(slice_of(b), pos), ErrorKind::InconsistentStringSize);
        }
        {
            Bytes b = {2, 0, 0, 0, 'a', 'b'};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_string(slice_of(b), pos), ErrorKind::BrokenData);
        }
        {
            Bytes b = {2, 0, 0, 0, 0xC3, 0};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_string(slice_of(b), pos), ErrorKind::BadStringEncoding);
        }
        {
            // truncated inside the length field
            Bytes b = {2, 0};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_string(slice_of(b), pos), ErrorKind::NotEnoughData);
        }

        // C-strings
        {
            Bytes b;
            wire::append_cstring(b, "key");
            std::size_t pos = 0;
            CHECK(wire::read_cstring(slice_of(b), pos, true) == "key");
            CHECK(pos == 4);
        }
        {
            Bytes b = {'a', 'b'};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_cstring(slice_of(b), pos, true), ErrorKind::BrokenData);
        }
        {
            Bytes b = {0xFF, 0};
            std::size_t pos = 0;
            CHECK_THROWS_KIND(wire::read_cstring(slice_of(b), pos, true), ErrorKind::BadKeyEncoding);
            pos = 0;
            CHECK_THROWS_KIND(wire::read_cstring(slice_of(b), pos, false), ErrorKind::BadStringEncoding);
        }

        // Binary framing
        {
            Bytes b;
            wire::append_binary(b, bsonkit::Binary{1, 2, 3});
            CHECK(b.size() == 4 + 1 + 3);
            CHECK(b[0] == 3 && b[4] == wire::kSubtypeGeneric && b[7] == 3);
        }

        // UTF-8 validation
        {
            CHECK(utf8(""));
            CHECK(utf8("plain ascii"));
            CHECK(utf8("caff\xC3\xA8"));                 // è
            CHECK(utf8("\xE2\x82\xAC"));                 // €
            CHECK(utf8("\xF0\x9F\x98\x80"));             // U+1F600
            CHECK(!utf8("\xC0\xAF"));                    // overlong '/'
            CHECK(!utf8("\xE0\x80\xAF"));                // overlong
            CHECK(!utf8("\xED\xA0\x80"));                // surrogate
            CHECK(!utf8("\xF4\x90\x80\x80"));            // above U+10FFFF
            CHECK(!utf8("\xE2\x82"));                    // truncated sequence
            CHECK(!utf8("\x80"));                        // stray continuation
        }

        // Tag table
        {
            CHECK(wire::is_known_tag(wire::kDouble));
            CHECK(wire::is_known_tag(wire::kDecimal128));
            CHECK(wire::is_known_tag(wire::kMinKey));
            CHECK(wire::is_known_tag(wire::kMaxKey));
            CHECK(!wire::is_known_tag(0x00));
            CHECK(!wire::is_known_tag(0x14));
            CHECK(!wire::is_known_tag(0x80));
            CHECK(std::string(wire::tag_name(wire::kInt32)) == "int");
            CHECK(std::string(wire::tag_name(0x42)) == "unknown");
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
