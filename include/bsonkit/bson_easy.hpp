#pragma once

#include "bsonkit/bson.hpp"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace bsonkit::easy {

// Shorthand for nested literals:
//   doc({{"name", str("x")}, {"tags", arr({str("a"), str("b")})}})
inline Value doc(std::initializer_list<std::pair<std::string, Value>> fields) {
    return Value::make_document(std::make_shared<Document>(fields));
}

inline Value arr(std::initializer_list<Value> items) {
    return Value::make_array(Array(items));
}

inline Value str(std::string s) { return Value::make_string(std::move(s)); }
inline Value i64(std::int64_t i) { return Value::make_int64(i); }
inline Value f64(double d) { return Value::make_double(d); }
inline Value boolean(bool b) { return Value::make_bool(b); }
inline Value null() { return Value::make_null(); }

// Text is stored as its UTF-8 bytes.
inline Value bytes(const std::string& s) {
    return Value::make_binary(Binary(s.begin(), s.end()));
}

// Millisecond precision; anything finer is truncated toward negative infinity.
inline Value datetime(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ms = floor<milliseconds>(tp).time_since_epoch().count();
    return Value::make_datetime(static_cast<std::int64_t>(ms));
}

inline std::chrono::system_clock::time_point to_time_point(const DateTime& dt) {
    using namespace std::chrono;
    return system_clock::time_point(duration_cast<system_clock::duration>(milliseconds(dt.unix_ms)));
}

inline void set(Document& root, std::string key, Value v) {
    root.set(std::move(key), std::move(v));
}

} // namespace bsonkit::easy
