#pragma once

#include <stdexcept>
#include <string>

namespace od {

// Raised by any mutating call on a read-only dictionary. The check runs
// before any write, so the dictionary is left untouched.
struct ReadOnlyError : public std::logic_error {
    ReadOnlyError() : std::logic_error("Dictionary is read only.") {}
    explicit ReadOnlyError(const std::string& msg) : std::logic_error(msg) {}
};

// Raised when bulk import is handed something that is not a key/value source.
struct TypeError : public std::invalid_argument {
    explicit TypeError(const std::string& msg) : std::invalid_argument(msg) {}
};

}  // namespace od
