#include "bsonkit/bson.hpp"

#include "codec.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <zlib.h>

namespace bsonkit {

// ------------------------------
// Limits / helpers
// ------------------------------

static constexpr std::uint64_t kMaxFileSize = 2ull * 1024ull * 1024ull * 1024ull; // 2 GiB, int32 documents
static constexpr int kGzipWindowBits = 15 + 16; // deflate with gzip wrapper
static constexpr std::size_t kInflateChunk = 64u * 1024u;

// A raw document may also start with 1F 8B; its length prefix then matches the file.
static bool is_gzip(const Bytes& data) {
    if (data.size() < 4 || data[0] != 0x1F || data[1] != 0x8B) return false;
    return static_cast<std::size_t>(wire::read_u32_le_from(data.data())) != data.size();
}

static std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

static std::string zlib_message(const char* what, int rc, const z_stream& zs) {
    std::ostringstream oss;
    oss << what << " failed (rc=" << rc << ")";
    if (zs.msg) oss << ": " << zs.msg;
    return oss.str();
}

static Bytes gzip_compress(const Bytes& in, int level) {
    if (level < 0 || level > 9) {
        throw ConfigError(ErrorKind::ConfigError, "zlib level must be in 0..9, got " + std::to_string(level));
    }
    z_stream zs{};
    int rc = ::deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw IoError(ErrorKind::ZlibError, zlib_message("deflateInit2", rc, zs));
    }

    Bytes out(::deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    rc = ::deflate(&zs, Z_FINISH);
    if (rc != Z_STREAM_END) {
        std::string msg = zlib_message("deflate", rc, zs);
        ::deflateEnd(&zs);
        throw IoError(ErrorKind::ZlibError, msg);
    }
    out.resize(static_cast<std::size_t>(zs.total_out));
    ::deflateEnd(&zs);
    return out;
}

static Bytes gzip_decompress(const Bytes& in) {
    z_stream zs{};
    int rc = ::inflateInit2(&zs, kGzipWindowBits);
    if (rc != Z_OK) {
        throw IoError(ErrorKind::ZlibError, zlib_message("inflateInit2", rc, zs));
    }
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    Bytes out;
    Bytes chunk(kInflateChunk);
    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = ::inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zlib_message("inflate", rc, zs);
            ::inflateEnd(&zs);
            throw IoError(ErrorKind::ZlibError, msg);
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs.avail_out));
        if (out.size() > kMaxFileSize) {
            ::inflateEnd(&zs);
            throw IoError(ErrorKind::ZlibError, "decompressed document exceeds the size limit");
        }
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            ::inflateEnd(&zs);
            throw IoError(ErrorKind::ZlibError, "compressed stream is truncated");
        }
    } while (rc != Z_STREAM_END);
    ::inflateEnd(&zs);
    return out;
}

static Bytes read_all(const std::filesystem::path& file) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        throw IoError(ErrorKind::Io, "failed to stat file: " + file.string() + " (" + ec.message() + ")");
    }
    if (size > kMaxFileSize) {
        throw IoError(ErrorKind::Io, "file exceeds the size limit: " + file.string());
    }
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw IoError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    Bytes data(static_cast<std::size_t>(size));
    is.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!is && !data.empty()) {
        throw IoError(ErrorKind::Io, "short read from file: " + file.string());
    }
    return data;
}

// Raw document bytes, inflated when the file is gzip-wrapped.
static Bytes load_document_bytes(const std::filesystem::path& file, bool& compressed, std::uint64_t& file_size) {
    Bytes data = read_all(file);
    file_size = data.size();
    compressed = is_gzip(data);
    if (compressed) return gzip_decompress(data);
    return data;
}

// ------------------------------
// API implementations
// ------------------------------

Value read_file(const std::filesystem::path& file, const ReadOptions& opts) {
    bool compressed = false;
    std::uint64_t file_size = 0;
    Bytes doc = load_document_bytes(file, compressed, file_size);

    MapperOptions mo;
    mo.strict = opts.strict;
    return Mapper(mo).unmarshal(doc);
}

FileInfo read_file_info(const std::filesystem::path& file) {
    FileInfo info;
    Bytes doc = load_document_bytes(file, info.compressed, info.file_size);

    if (doc.size() < 4) {
        throw UnmarshalError(ErrorKind::NotEnoughData, "file too small for a document length prefix");
    }
    std::int32_t total = wire::read_i32_le_from(doc.data());
    if (total < static_cast<std::int32_t>(wire::kMinDocumentSize)) {
        throw UnmarshalError(ErrorKind::IncorrectSize, "document length " + std::to_string(total) + " is below 5");
    }
    if (static_cast<std::size_t>(total) > doc.size()) {
        throw UnmarshalError(ErrorKind::NotEnoughData, "document length exceeds the file contents");
    }
    info.document_size = static_cast<std::uint32_t>(total);
    info.crc32 = crc32_bytes(doc.data(), static_cast<std::size_t>(total));

    // Count top-level elements by walking the list with skipping enabled.
    wire::Slice s{doc.data(), static_cast<std::size_t>(total)};
    if (doc[s.end - 1] != 0) {
        throw UnmarshalError(ErrorKind::BrokenData, "document is not NUL-terminated");
    }
    std::size_t pos = 4;
    detail::DecodeContext ctx;
    while (pos < s.end - 1) {
        detail::DecodedElement el = detail::decode_element(s, pos, ctx);
        if (pos > s.end - 1) {
            throw UnmarshalError(ErrorKind::BrokenData, "element '" + el.name + "' overruns the document terminator");
        }
        ++info.field_count;
    }
    return info;
}

void write_file(const std::filesystem::path& file, const Value& root, const WriteOptions& opts) {
    Bytes doc = Mapper().marshal(root);

    const Bytes* payload = &doc;
    Bytes packed;
    if (opts.compression != CompressionMode::Never) {
        packed = gzip_compress(doc, opts.zlib_level);
        if (opts.compression == CompressionMode::Always || packed.size() < doc.size()) {
            payload = &packed;
        }
    }

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) {
        throw IoError(ErrorKind::Io, "failed to open output file: " + file.string());
    }
    os.write(reinterpret_cast<const char*>(payload->data()), static_cast<std::streamsize>(payload->size()));
    if (!os) {
        throw IoError(ErrorKind::Io, "write failed: " + file.string());
    }
}

} // namespace bsonkit
