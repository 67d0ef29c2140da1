#include "bsonkit/bson_easy.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

int main() {
    try {
        using namespace bsonkit;
        using namespace bsonkit::easy;

        // Build root document
        Value root = doc({
            {"name", str("sensor-7")},
            {"reading", f64(21.5)},
            {"samples", i64(5000000000LL)},
            {"active", boolean(true)},
            {"calibrated", datetime(std::chrono::system_clock::now())},
            {"raw", bytes("\x01\x02\x03\x04")},
            {"tags", arr({str("lab"), str("north")})},
            {"limits", doc({{"low", i64(-40)}, {"high", i64(85)}})},
        });

        // Write
        WriteOptions wo;
        wo.compression = CompressionMode::Auto;
        wo.zlib_level = 6;

        std::string file = "demo_out.bson";
        write_file(file, root, wo);

        FileInfo info = read_file_info(file);
        std::cout << "Wrote: " << file << " (" << info.file_size << " bytes, "
                  << (info.compressed ? "gzip" : "raw") << ")\n";

        // Read back root
        Value read_root = read_file(file, ReadOptions{true});
        std::cout << "Round trip " << (read_root == root ? "matches" : "DIFFERS") << "\n";

        // Read a few leaves
        const Value& high = lookup(read_root, "limits.high");
        std::cout << "Read limits.high: " << type_name(high) << " " << high.as_int64() << "\n";

        const Value& tag = lookup(read_root, "tags.1");
        std::cout << "Read tags.1: " << tag.as_string() << "\n";

        std::cout << to_json(read_root, true) << "\n";
        std::cout << "OK\n";
        return 0;

    } catch (const bsonkit::BsonError& e) {
        std::cerr << "BSON error [" << bsonkit::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
