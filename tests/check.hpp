#pragma once

#include "bsonkit/bson.hpp"

#include <sstream>
#include <stdexcept>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// Evaluates `expr` and requires a BsonError of the given kind.
#define CHECK_THROWS_KIND(expr, k) do { \
    bool _threw = false; \
    try { \
        (void)(expr); \
    } catch (const bsonkit::BsonError& _e) { \
        _threw = true; \
        if (_e.kind() != (k)) { \
            std::ostringstream _oss; \
            _oss << "CHECK_THROWS_KIND failed: " #expr " threw " << bsonkit::to_string(_e.kind()) \
                 << " (" << _e.what() << "), expected " #k " at " << __FILE__ << ":" << __LINE__; \
            throw std::runtime_error(_oss.str()); \
        } \
    } \
    if (!_threw) { \
        std::ostringstream _oss; \
        _oss << "CHECK_THROWS_KIND failed: " #expr " did not throw at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)
