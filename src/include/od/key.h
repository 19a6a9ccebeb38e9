#pragma once

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace od {

// A dictionary key: either a signed integer or a string.
// The two kinds are never coerced into each other, so Key(0) and Key("0")
// are distinct keys. Merging depends on the distinction.
class Key {
  public:
    // Any integral type except bool. Unsigned values above INT64_MAX throw
    // std::overflow_error.
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T> and not std::is_same_v<T, bool> > >
    Key(T n) : k_(checked_int64(n)) {}
    Key(const char* s) : k_(std::string(s)) {}
    Key(const std::string& s) : k_(s) {}
    Key(std::string&& s) : k_(std::move(s)) {}

    bool isInt() const noexcept { return std::holds_alternative<int64_t>(k_); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(k_); }

    int64_t asInt() const { return std::get<int64_t>(k_); }
    const std::string& asString() const { return std::get<std::string>(k_); }

    std::string to_string() const {
        if (isInt()) return std::to_string(asInt());
        return asString();
    }

    // Integers order before strings.
    bool operator<(const Key& rhs) const { return k_ < rhs.k_; }
    bool operator==(const Key& rhs) const { return k_ == rhs.k_; }
    bool operator!=(const Key& rhs) const { return not(*this == rhs); }

  private:
    template <typename T>
    static int64_t checked_int64(T n) {
        if constexpr (std::is_unsigned_v<T>) {
            if (n > static_cast<std::make_unsigned_t<int64_t> >(std::numeric_limits<int64_t>::max()))
                throw std::overflow_error("integer key " + std::to_string(n) + " is out of range");
        }
        return static_cast<int64_t>(n);
    }

    std::variant<int64_t, std::string> k_;
};

inline std::ostream& operator<<(std::ostream& os, const Key& k) {
    if (k.isString())
        os << '"' << k.asString() << '"';
    else
        os << k.asInt();
    return os;
}

}  // namespace od
