#include <catch2/catch_test_macros.hpp>
#include <od/dictionary.h>

#include <string>
#include <vector>

using namespace od;

TEST_CASE("Iteration yields pairs in storage order", "[iteration]") {
    OrderedDictionary d;
    d.add("k1", "v1");
    d.add("k2", "v2");
    d.remove("k1");
    d.add("k1", "v3");

    std::vector<std::string> seen;
    for (auto it = d.iterator(); it.valid(); it.next())
        seen.push_back(it.key().to_string() + "=" + it.value().asString());
    REQUIRE(seen == std::vector<std::string>{"k2=v2", "k1=v3"});
}

TEST_CASE("Range-for walks the dictionary", "[iteration]") {
    OrderedDictionary d(OrderedMap{{"a", 1}, {0, 2}, {"b", 3}});
    int64_t sum = 0;
    std::vector<Key> keys;
    for (auto const& [k, v] : d) {
        keys.push_back(k);
        sum += v.asInt();
    }
    REQUIRE(sum == 6);
    REQUIRE(keys == d.keys());
}

TEST_CASE("Iterators snapshot the keys", "[iteration]") {
    OrderedDictionary d(OrderedMap{{"a", 1}, {"b", 2}, {"c", 3}});
    auto it = d.iterator();
    REQUIRE(it.key() == Key("a"));

    // removed keys are skipped, new keys are not visited
    d.remove("b");
    d.add("d", 4);

    std::vector<std::string> seen;
    for (; it.valid(); it.next()) seen.push_back(it.key().to_string());
    REQUIRE(seen == std::vector<std::string>{"a", "c"});
}

TEST_CASE("Removing every key while iterating is safe", "[iteration]") {
    OrderedDictionary d(OrderedMap{{"a", 1}, {"b", 2}});
    for (auto it = d.iterator(); it.valid(); it.next()) d.remove(it.key());
    REQUIRE(d.empty());
}

TEST_CASE("Iterators see live values", "[iteration]") {
    OrderedDictionary d(OrderedMap{{"a", 1}});
    auto it = d.iterator();
    d.add("a", 10);
    REQUIRE(it.value().asInt() == 10);
    d.remove("a");
    REQUIRE(it.value().isNull());
}

TEST_CASE("A fresh iterator can be obtained after exhaustion", "[iteration]") {
    OrderedDictionary d(OrderedMap{{"a", 1}});
    auto it = d.iterator();
    it.next();
    REQUIRE_FALSE(it.valid());
    it.next();
    REQUIRE_FALSE(it.valid());
    REQUIRE(d.iterator().valid());
}

TEST_CASE("Empty dictionaries produce an exhausted iterator", "[iteration]") {
    OrderedDictionary d;
    REQUIRE_FALSE(d.iterator().valid());
    REQUIRE(d.begin() == d.end());
}
