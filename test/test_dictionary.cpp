#include <catch2/catch_test_macros.hpp>
#include <od/dictionary.h>

#include <optional>

using namespace od;

TEST_CASE("Dictionary basic operations") {
    OrderedDictionary d;
    REQUIRE(d.empty());

    d.add("one", 1);
    d.add("pi", 3.1415);
    d.add("name", "odict");

    REQUIRE(d.count() == 3);
    REQUIRE(d.contains("one"));
    REQUIRE(d.itemAt("one").asInt() == 1);
    REQUIRE(d["pi"].isDouble());
    REQUIRE(d["name"].asString() == "odict");

    auto keys = d.keys();
    REQUIRE(keys.size() == 3);
    REQUIRE(keys[0] == Key("one"));

    REQUIRE(d.remove("one").asInt() == 1);
    REQUIRE_FALSE(d.contains("one"));
    REQUIRE(d.size() == 2);
}

TEST_CASE("add then itemAt returns the value", "[dictionary]") {
    OrderedDictionary d;
    d.add("k", "v");
    d.add(3, 42);
    REQUIRE(d.itemAt("k") == Value("v"));
    REQUIRE(d.itemAt(3) == Value(42));
}

TEST_CASE("add with no key appends", "[dictionary]") {
    OrderedDictionary d;
    d.add(std::nullopt, "first");
    d.add(std::nullopt, "second");
    d.add("name", "n");
    Key k = d.append("third");

    REQUIRE(d.itemAt(0).asString() == "first");
    REQUIRE(d.itemAt(1).asString() == "second");
    REQUIRE(k == Key(2));
    REQUIRE(d.count() == 4);
}

TEST_CASE("Missing keys read as null", "[dictionary]") {
    OrderedDictionary d;
    d.add("present", 1);
    REQUIRE(d.itemAt("absent").isNull());
    REQUIRE(d["absent"].isNull());
    REQUIRE(d.find("absent") == nullptr);
    REQUIRE(d.find("present") != nullptr);
}

TEST_CASE("contains tests presence, not the stored value", "[dictionary]") {
    OrderedDictionary d;
    d.add("nothing", Value::null());
    d.add("no", false);
    REQUIRE(d.contains("nothing"));
    REQUIRE(d.contains("no"));
    REQUIRE(d.itemAt("nothing").isNull());
    REQUIRE_FALSE(d.contains("other"));
}

TEST_CASE("Integer and string keys do not collide", "[dictionary]") {
    OrderedDictionary d;
    d.add(1, "int");
    d.add("1", "string");
    REQUIRE(d.count() == 2);
    REQUIRE(d.itemAt(1).asString() == "int");
    REQUIRE(d.itemAt("1").asString() == "string");
}

TEST_CASE("Removing an absent key returns null and changes nothing", "[dictionary]") {
    OrderedDictionary d;
    d.add("a", 1);
    Value removed = d.remove("b");
    REQUIRE(removed.isNull());
    REQUIRE(d.count() == 1);
}

TEST_CASE("clear removes every entry", "[dictionary]") {
    OrderedDictionary d;
    d.add("a", 1);
    d.add("b", 2);
    d.append("c");
    d.clear();
    REQUIRE(d.count() == 0);
    REQUIRE_FALSE(d.contains("a"));
    REQUIRE_FALSE(d.contains("b"));
    REQUIRE_FALSE(d.contains(0));
}

TEST_CASE("Re-adding a removed key moves it to the end", "[dictionary]") {
    OrderedDictionary d;
    d.add("k1", "v1");
    d.add("k2", "v2");
    d.remove("k1");
    d.add("k1", "v3");

    auto keys = d.keys();
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0] == Key("k2"));
    REQUIRE(keys[1] == Key("k1"));
    REQUIRE(d["k1"].asString() == "v3");
}

TEST_CASE("Container-style access", "[dictionary]") {
    OrderedDictionary d;
    d.set("x", 1);
    d.set("x", 2);
    REQUIRE(d.size() == 1);
    REQUIRE(d["x"].asInt() == 2);
    REQUIRE(d.erase("x").asInt() == 2);
    REQUIRE(d.empty());
}

TEST_CASE("clone is independent of its source", "[dictionary]") {
    OrderedDictionary d;
    d.add("nested", OrderedMap{{"a", 1}});
    OrderedDictionary copy = d.clone();
    copy.add("extra", true);
    REQUIRE(d.count() == 1);
    REQUIRE(copy.count() == 2);
    REQUIRE(copy.toMap().find("nested")->asMap() == d.toMap().find("nested")->asMap());
}

TEST_CASE("Shared dictionaries observe each other's changes", "[dictionary]") {
    DictionaryPtr a = std::make_shared<OrderedDictionary>();
    DictionaryPtr b = a;
    a->add("seen", 1);
    REQUIRE(b->contains("seen"));
}
