#pragma once

#include <od/ordered_map.h>
#include <od/value.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace od {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// Thrown by dump_json for a map that has no faithful JSON rendering.
struct JsonWriteError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Objects become maps with string keys in document order, arrays become maps
// keyed 0..n-1. `//` and `/* */` comments are skipped.
Value parse_json(const std::string& text);

// Maps keyed exactly 0..n-1 are written as arrays, all other maps as
// objects. indent == 0 writes a single line. An object whose integer and
// string keys would collide (0 and "0") throws JsonWriteError.
std::string dump_json(const Value& v, int indent = 0);
std::string dump_json(const OrderedMap& m, int indent = 0);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace od
