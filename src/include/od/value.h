#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace od {

class OrderedMap;  // forward

// The opaque payload stored in a dictionary. A value may itself hold a
// nested OrderedMap; that is the case recursive merges descend into.
//
// Values behave like values: copying one that holds a map deep-copies the
// map, so no two Values ever share nested state.
class Value {
  public:
    using map_ptr = std::shared_ptr<OrderedMap>;

    enum TYPE { Null, Boolean, Integer, Double, String, Map };

    Value() = default;
    Value(bool b) : v_(b) {}
    // Integral types other than bool; unsigned values above INT64_MAX throw
    // std::overflow_error.
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T> and not std::is_same_v<T, bool> > >
    Value(T n) : v_(checked_int64(n)) {}
    Value(double x) : v_(x) {}
    Value(const char* s) : v_(std::string(s)) {}
    Value(const std::string& s) : v_(s) {}
    Value(std::string&& s) : v_(std::move(s)) {}
    Value(const OrderedMap& m);
    Value(OrderedMap&& m);

    Value(const Value& o);
    Value(Value&& o) noexcept;
    Value& operator=(const Value& o);
    Value& operator=(Value&& o) noexcept;
    ~Value() = default;

    static Value null() { return Value(); }
    static Value map();

    TYPE type() const noexcept { return static_cast<TYPE>(v_.index()); }
    std::string typeString() const;

    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(v_); }
    bool isBool() const noexcept { return std::holds_alternative<bool>(v_); }
    bool isInt() const noexcept { return std::holds_alternative<int64_t>(v_); }
    bool isDouble() const noexcept { return std::holds_alternative<double>(v_); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(v_); }
    bool isMap() const noexcept { return std::holds_alternative<map_ptr>(v_); }

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const OrderedMap& asMap() const;
    OrderedMap& asMap();

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    // Compact JSON rendering, used for messages and stream output.
    std::string to_string() const;

  private:
    template <typename T>
    static int64_t checked_int64(T n) {
        if constexpr (std::is_unsigned_v<T>) {
            if (n > static_cast<std::make_unsigned_t<int64_t> >(std::numeric_limits<int64_t>::max()))
                throw std::overflow_error("integer value " + std::to_string(n) + " is out of range");
        }
        return static_cast<int64_t>(n);
    }

    std::variant<std::monostate, bool, int64_t, double, std::string, map_ptr> v_;
};

std::ostream& operator<<(std::ostream& os, const Value& v);

}  // namespace od
