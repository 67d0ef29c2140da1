#include "bsonkit/bson.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static bsonkit::Value make_payload(std::size_t records) {
    auto root = std::make_shared<bsonkit::Document>();

    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    // Many small nested documents
    auto rows = std::make_shared<bsonkit::Array>();
    rows->reserve(records);
    for (std::size_t i = 0; i < records; ++i) {
        auto row = std::make_shared<bsonkit::Document>();
        row->set("id", bsonkit::Value::make_int64(static_cast<std::int64_t>(i)));
        row->set("score", bsonkit::Value::make_double(dist(rng)));
        row->set("label", bsonkit::Value::make_string("row-" + std::to_string(i)));
        row->set("flag", bsonkit::Value::make_bool(i % 3 == 0));
        rows->push_back(bsonkit::Value::make_document(row));
    }
    root->set("rows", bsonkit::Value::make_array(rows));

    // One large blob
    bsonkit::Binary blob(4 * 1024 * 1024);
    std::mt19937 brng(456);
    for (auto& b : blob) b = static_cast<std::uint8_t>(brng() & 0x0F);
    root->set("blob", bsonkit::Value::make_binary(std::move(blob)));

    return bsonkit::Value::make_document(root);
}

static void bench_codec(const bsonkit::Value& root) {
    std::cout << "=== in-memory ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    bsonkit::Bytes b = bsonkit::marshal(root);
    double m_ms = ms_since(t0);
    double mb = static_cast<double>(b.size()) / (1024.0 * 1024.0);
    std::cout << "marshal  : " << m_ms << " ms, doc=" << mb << " MiB, throughput=" << (mb / (m_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    bsonkit::Value back = bsonkit::Mapper(bsonkit::MapperOptions{true}).unmarshal(b);
    double u_ms = ms_since(t0);
    std::cout << "unmarshal: " << u_ms << " ms, throughput=" << (mb / (u_ms / 1000.0)) << " MiB/s\n";
}

static void bench_one(const std::filesystem::path& file, const bsonkit::Value& root, bsonkit::CompressionMode comp) {
    bsonkit::WriteOptions wo;
    wo.compression = comp;
    wo.zlib_level = 6;

    std::cout << "=== " << (comp == bsonkit::CompressionMode::Never ? "compression=none" :
                             comp == bsonkit::CompressionMode::Always ? "compression=gzip" : "compression=auto")
              << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    bsonkit::write_file(file, root, wo);
    double w_ms = ms_since(t0);

    std::uintmax_t sz = std::filesystem::file_size(file);
    double mb = static_cast<double>(sz) / (1024.0 * 1024.0);

    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    bsonkit::Value read = bsonkit::read_file(file, bsonkit::ReadOptions{true});
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, throughput=" << (mb / (r_ms / 1000.0)) << " MiB/s\n";
}

int main(int argc, char** argv) {
    std::filesystem::path file = (argc >= 2) ? argv[1] : (std::filesystem::temp_directory_path() / "bsonkit_cpp_bench.bson");
    try {
        bsonkit::Value root = make_payload(200000);
        bench_codec(root);
        bench_one(file, root, bsonkit::CompressionMode::Never);
        bench_one(file, root, bsonkit::CompressionMode::Always);
        bench_one(file, root, bsonkit::CompressionMode::Auto);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
