#include <od/value.h>
#include <od/json.h>
#include <od/ordered_map.h>

#include <stdexcept>

namespace od {

Value::Value(const OrderedMap& m) : v_(std::make_shared<OrderedMap>(m)) {}

Value::Value(OrderedMap&& m) : v_(std::make_shared<OrderedMap>(std::move(m))) {}

Value Value::map() { return Value(OrderedMap()); }

Value::Value(const Value& o) : v_(o.v_) {
    // deep-copy nested maps so this Value does not share state with `o`
    if (auto* p = std::get_if<map_ptr>(&v_)) *p = std::make_shared<OrderedMap>(**p);
}

Value::Value(Value&& o) noexcept : v_(std::move(o.v_)) { o.v_ = std::monostate{}; }

Value& Value::operator=(const Value& o) {
    if (this == &o) return *this;
    // Copy first: `o` may live inside the map this Value is about to release.
    Value tmp(o);
    v_.swap(tmp.v_);
    return *this;
}

Value& Value::operator=(Value&& o) noexcept {
    if (this == &o) return *this;
    // Moving through a temporary keeps `o` alive even if it is nested in *this.
    Value tmp(std::move(o));
    v_.swap(tmp.v_);
    return *this;
}

std::string Value::typeString() const {
    switch (type()) {
        case TYPE::Null:
            return "Null";
        case TYPE::Boolean:
            return "Boolean";
        case TYPE::Integer:
            return "Integer";
        case TYPE::Double:
            return "Double";
        case TYPE::String:
            return "String";
        case TYPE::Map:
            return "Map";
    }
    throw std::logic_error("Not a valid type");
}

bool Value::asBool() const {
    if (isBool()) return std::get<bool>(v_);
    throw std::runtime_error("not a bool: " + typeString());
}

int64_t Value::asInt() const {
    if (isInt()) return std::get<int64_t>(v_);
    if (isDouble()) return static_cast<int64_t>(std::get<double>(v_));
    throw std::runtime_error("not an int: " + typeString());
}

double Value::asDouble() const {
    if (isDouble()) return std::get<double>(v_);
    if (isInt()) return static_cast<double>(std::get<int64_t>(v_));
    throw std::runtime_error("not a double: " + typeString());
}

const std::string& Value::asString() const {
    if (isString()) return std::get<std::string>(v_);
    throw std::runtime_error("not a string: " + typeString());
}

const OrderedMap& Value::asMap() const {
    if (isMap()) return *std::get<map_ptr>(v_);
    throw std::runtime_error("not a map: " + typeString());
}

OrderedMap& Value::asMap() {
    if (isMap()) return *std::get<map_ptr>(v_);
    throw std::runtime_error("not a map: " + typeString());
}

bool Value::operator==(const Value& rhs) const {
    if (type() != rhs.type()) return false;
    switch (type()) {
        case TYPE::Null:
            return true;
        case TYPE::Boolean:
            return std::get<bool>(v_) == std::get<bool>(rhs.v_);
        case TYPE::Integer:
            return std::get<int64_t>(v_) == std::get<int64_t>(rhs.v_);
        case TYPE::Double:
            return std::get<double>(v_) == std::get<double>(rhs.v_);
        case TYPE::String:
            return std::get<std::string>(v_) == std::get<std::string>(rhs.v_);
        case TYPE::Map:
            return asMap() == rhs.asMap();
    }
    return false;
}

std::string Value::to_string() const { return dump_json(*this); }

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.to_string();
    return os;
}

}  // namespace od
