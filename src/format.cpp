#include "bsonkit/bson.hpp"

#include "codec.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace bsonkit {

// ------------------------------
// Paths
// ------------------------------

static std::vector<std::string> split_path(const std::string& s) {
    std::vector<std::string> parts;
    if (s.empty()) return parts;
    std::size_t start = 0;
    while (true) {
        auto dot = s.find('.', start);
        if (dot == std::string::npos) dot = s.size();
        parts.push_back(s.substr(start, dot - start));
        if (parts.back().empty()) {
            throw BsonError(ErrorKind::NotFound, "invalid path '" + s + "': empty segment");
        }
        if (dot == s.size()) break;
        start = dot + 1;
    }
    return parts;
}

const Value& lookup(const Value& root, const std::string& path) {
    const Value* cur = &root;
    std::string walked;
    for (const auto& seg : split_path(path)) {
        if (cur->is_document()) {
            const Value* next = cur->as_document().find(seg);
            if (!next) {
                throw BsonError(ErrorKind::NotFound, "no field '" + seg + "' under '" + walked + "'");
            }
            cur = next;
        } else if (cur->is_array()) {
            std::uint64_t idx = 0;
            const Array& arr = cur->as_array();
            if (!detail::parse_array_index(seg, idx) || idx >= arr.size()) {
                throw BsonError(ErrorKind::NotFound, "no element '" + seg + "' in array '" + walked + "'");
            }
            cur = &arr[static_cast<std::size_t>(idx)];
        } else {
            throw BsonError(ErrorKind::NotFound,
                            "'" + walked + "' is a " + type_name(*cur) + ", cannot descend into '" + seg + "'");
        }
        if (!walked.empty()) walked.push_back('.');
        walked += seg;
    }
    return *cur;
}

// ------------------------------
// Type names
// ------------------------------

std::string type_name(const Value& v) {
    switch (v.type()) {
        case ValueType::Null: return "null";
        case ValueType::Double: return "double";
        case ValueType::Int32: return "int32";
        case ValueType::Int64: return "int64";
        case ValueType::UInt64: {
            // no tag of its own; named after the width it encodes to
            std::uint64_t u = std::get<std::uint64_t>(v.v);
            return u <= static_cast<std::uint64_t>(wire::kMaxInt32) ? "int32" : "int64";
        }
        case ValueType::Bool: return "bool";
        case ValueType::String: return "string";
        case ValueType::Binary: return "binData";
        case ValueType::DateTime: return "date";
        case ValueType::Document: return "object";
        case ValueType::Array: return "array";
        case ValueType::Foreign: return "unsupported";
    }
    return "unknown";
}

// ------------------------------
// JSON rendering
// ------------------------------

namespace {

const char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const Binary& in) {
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < in.size(); i += 3) {
        std::uint32_t n = (std::uint32_t(in[i]) << 16) | (std::uint32_t(in[i + 1]) << 8) | in[i + 2];
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
    }
    if (i + 1 == in.size()) {
        std::uint32_t n = std::uint32_t(in[i]) << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (i + 2 == in.size()) {
        std::uint32_t n = (std::uint32_t(in[i]) << 16) | (std::uint32_t(in[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

void json_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

// Fewest digits that still read back to the same double.
std::string shortest_double(double d) {
    for (int prec = 15; prec <= 17; ++prec) {
        std::ostringstream tmp;
        tmp.imbue(std::locale::classic());
        tmp << std::setprecision(prec) << d;
        std::istringstream back(tmp.str());
        back.imbue(std::locale::classic());
        double r = 0.0;
        back >> r;
        if (r == d || prec == 17) return tmp.str();
    }
    return {};
}

class JsonWriter {
public:
    JsonWriter(std::ostream& os, bool pretty) : os_(os), pretty_(pretty) {}

    void write(const Value& v) {
        std::visit([this](const auto& x) { this->scalar_or_container(x); }, v.v);
    }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_{0};
    detail::CycleGuard guard_;

    void newline() {
        if (!pretty_) return;
        os_ << '\n';
        for (int i = 0; i < depth_; ++i) os_ << "  ";
    }

    void key(const std::string& k) {
        json_escape_string(os_, k);
        os_ << (pretty_ ? ": " : ":");
    }

    void scalar_or_container(std::nullptr_t) { os_ << "null"; }
    void scalar_or_container(bool b) { os_ << (b ? "true" : "false"); }
    void scalar_or_container(std::int32_t i) { os_ << i; }

    void scalar_or_container(std::int64_t i) {
        if (i >= wire::kMinInt32 && i <= wire::kMaxInt32) {
            os_ << i;
        } else {
            wrapped("$numberLong", [&] { json_escape_string(os_, std::to_string(i)); });
        }
    }

    void scalar_or_container(std::uint64_t u) {
        if (u <= static_cast<std::uint64_t>(wire::kMaxInt32)) {
            os_ << u;
        } else {
            wrapped("$numberLong", [&] { json_escape_string(os_, std::to_string(u)); });
        }
    }

    void scalar_or_container(double d) {
        if (std::isnan(d)) {
            wrapped("$numberDouble", [&] { os_ << "\"NaN\""; });
        } else if (std::isinf(d)) {
            wrapped("$numberDouble", [&] { os_ << (d > 0 ? "\"Infinity\"" : "\"-Infinity\""); });
        } else {
            std::string s = shortest_double(d);
            if (s.find_first_of(".eE") == std::string::npos) s += ".0";
            os_ << s;
        }
    }

    void scalar_or_container(const std::string& s) { json_escape_string(os_, s); }

    void scalar_or_container(const Binary& b) {
        wrapped("$binary", [&] {
            os_ << '{';
            ++depth_;
            newline();
            key("base64");
            json_escape_string(os_, base64_encode(b));
            os_ << ',';
            newline();
            key("subType");
            os_ << "\"00\"";
            --depth_;
            newline();
            os_ << '}';
        });
    }

    void scalar_or_container(const DateTime& dt) {
        wrapped("$date", [&] { os_ << dt.unix_ms; });
    }

    void scalar_or_container(const DocumentPtr& d) {
        if (!d) throw BsonError(ErrorKind::UnsupportedObject, "null document handle");
        detail::CycleGuard::Scope scope(guard_, d.get(), "document");
        if (d->empty()) {
            os_ << "{}";
            return;
        }
        os_ << '{';
        ++depth_;
        bool first = true;
        for (const auto& kv : *d) {
            if (!first) os_ << ',';
            first = false;
            newline();
            key(is_text(kv.first) ? std::get<std::string>(kv.first) : to_string(kv.first));
            write(kv.second);
        }
        --depth_;
        newline();
        os_ << '}';
    }

    void scalar_or_container(const ArrayPtr& a) {
        if (!a) throw BsonError(ErrorKind::UnsupportedObject, "null array handle");
        detail::CycleGuard::Scope scope(guard_, a.get(), "array");
        if (a->empty()) {
            os_ << "[]";
            return;
        }
        os_ << '[';
        ++depth_;
        for (std::size_t i = 0; i < a->size(); ++i) {
            if (i) os_ << ',';
            newline();
            write((*a)[i]);
        }
        --depth_;
        newline();
        os_ << ']';
    }

    void scalar_or_container(const Foreign& f) {
        throw BsonError(ErrorKind::UnsupportedObject, "cannot render object of type '" + f.type_name + "'");
    }

    template <typename Body>
    void wrapped(const char* tag, Body&& body) {
        os_ << '{';
        key(tag);
        body();
        os_ << '}';
    }
};

} // namespace

std::string to_json(const Value& v, bool pretty) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    JsonWriter(oss, pretty).write(v);
    return oss.str();
}

} // namespace bsonkit
