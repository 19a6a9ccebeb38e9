#include <catch2/catch_test_macros.hpp>
#include <od/ordered_map.h>
#include <od/value.h>

#include <limits>
#include <sstream>
#include <vector>

using namespace od;

TEST_CASE("Integer and string keys are distinct", "[key]") {
    Key i(0);
    Key s("0");
    REQUIRE(i.isInt());
    REQUIRE(s.isString());
    REQUIRE(i != s);
    REQUIRE(i.to_string() == s.to_string());
    // integers sort before strings
    REQUIRE(i < s);
    REQUIRE_FALSE(s < i);
}

TEST_CASE("Keys print with quotes only for strings", "[key]") {
    std::ostringstream ss;
    ss << Key(7) << " " << Key("name");
    REQUIRE(ss.str() == "7 \"name\"");
}

TEST_CASE("Value reports its type", "[value]") {
    REQUIRE(Value().isNull());
    REQUIRE(Value::null().type() == Value::Null);
    REQUIRE(Value(true).isBool());
    REQUIRE(Value(3).isInt());
    REQUIRE(Value(int64_t(1) << 40).asInt() == (int64_t(1) << 40));
    REQUIRE(Value(2.5).isDouble());
    REQUIRE(Value("text").isString());
    REQUIRE(Value::map().isMap());
    REQUIRE(Value(std::string("abc")).typeString() == "String");
}

TEST_CASE("Value accessors throw on the wrong type", "[value]") {
    Value v("text");
    REQUIRE_THROWS_AS(v.asInt(), std::runtime_error);
    REQUIRE_THROWS_AS(v.asMap(), std::runtime_error);
    REQUIRE(Value(4).asDouble() == 4.0);
}

TEST_CASE("Copying a Value deep-copies nested maps", "[value]") {
    Value a = OrderedMap{{"x", 1}};
    Value b = a;
    b.asMap().set("x", 2);
    REQUIRE(a.asMap().find("x")->asInt() == 1);
    REQUIRE(b.asMap().find("x")->asInt() == 2);
    REQUIRE(a != b);
}

TEST_CASE("Assigning a nested value to its parent is safe", "[value]") {
    Value parent = OrderedMap{{"child", OrderedMap{{"leaf", "ok"}}}};
    parent = *parent.asMap().find("child");
    REQUIRE(parent.isMap());
    REQUIRE(parent.asMap().find("leaf")->asString() == "ok");
}

TEST_CASE("Moved-from values are null", "[value]") {
    Value a = OrderedMap{{"x", 1}};
    Value b = std::move(a);
    REQUIRE(b.isMap());
    REQUIRE(a.isNull());
}

TEST_CASE("Values compare by type and content", "[value]") {
    REQUIRE(Value(1) == Value(int64_t(1)));
    REQUIRE(Value(1) != Value(1.0));
    REQUIRE(Value() == Value::null());
    REQUIRE(Value(OrderedMap{{"a", 1}, {"b", 2}}) == Value(OrderedMap{{"a", 1}, {"b", 2}}));
    // same pairs, different order
    REQUIRE(Value(OrderedMap{{"a", 1}, {"b", 2}}) != Value(OrderedMap{{"b", 2}, {"a", 1}}));
}

TEST_CASE("Keys and values accept any integral type", "[key][value]") {
    std::vector<int> v{1, 2, 3};
    OrderedMap m;
    m.set(v.size(), "size");
    m.set(static_cast<long long>(7), static_cast<unsigned short>(9));
    REQUIRE(m.find(3)->asString() == "size");
    REQUIRE(m.find(7)->asInt() == 9);
    REQUIRE(Value(v.size()).asInt() == 3);
    REQUIRE(Value(true).isBool());

    uint64_t too_big = uint64_t(std::numeric_limits<int64_t>::max()) + 1;
    REQUIRE_THROWS_AS(Key(too_big), std::overflow_error);
    REQUIRE_THROWS_AS(Value(too_big), std::overflow_error);
}
