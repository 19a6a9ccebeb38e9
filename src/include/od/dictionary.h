#pragma once

#include <od/error.h>
#include <od/key.h>
#include <od/key_value_source.h>
#include <od/ordered_map.h>
#include <od/value.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace od {

class DictionaryIterator;

// An insertion-ordered dictionary keyed by integers and strings, with an
// optional read-only mode and recursive merging (see mergeArray).
//
// add, append, remove, copyFrom and mergeWith check the read-only flag
// before touching storage and throw ReadOnlyError if it is set. clear() goes
// through remove(), so on a read-only dictionary it throws only when there is
// an entry to remove. Reads never throw; a missing key reads as Value::null().
//
// Dictionaries are move-only. Use clone() for an independent copy, or hold a
// DictionaryPtr when several owners must observe the same instance.
//
// Not thread-safe: concurrent use must be serialized by the caller.
class OrderedDictionary : public KeyValueSource {
  public:
    OrderedDictionary() = default;
    explicit OrderedDictionary(const KeyValueSource& data, bool readOnly = false);
    explicit OrderedDictionary(const Value& data, bool readOnly = false);

    OrderedDictionary(const OrderedDictionary&) = delete;
    OrderedDictionary& operator=(const OrderedDictionary&) = delete;
    OrderedDictionary(OrderedDictionary&&) = default;
    OrderedDictionary& operator=(OrderedDictionary&&) = default;
    ~OrderedDictionary() override = default;

    // Parse a JSON object or array. Other top-level JSON values are a TypeError.
    static OrderedDictionary fromJson(const std::string& text, bool readOnly = false);

    OrderedDictionary clone() const;

    bool isReadOnly() const noexcept { return readOnly_; }
    void setReadOnly(bool readOnly) noexcept { readOnly_ = readOnly; }

    const Value& itemAt(const Key& k) const;
    const Value* find(const Key& k) const { return entries_.find(k); }

    // Store `value` at `k`, or under the next free integer index when `k`
    // is std::nullopt. An existing key keeps its position.
    void add(std::optional<Key> k, Value value);
    Key append(Value value);

    // Returns the removed value, or null if `k` was not present.
    Value remove(const Key& k);
    void clear();

    bool contains(const Key& k) const { return entries_.contains(k); }
    size_t count() const noexcept { return entries_.size(); }
    std::vector<Key> keys() const { return entries_.keys(); }
    const OrderedMap& toMap() const noexcept { return entries_; }

    // Replace the contents with the pairs of `data`, inserted one by one.
    void copyFrom(const KeyValueSource& data);
    void copyFrom(const Value& data);

    // Non-recursive: add() every pair of `data` over the current entries.
    // Recursive: replace the entries with mergeArray(entries, data).
    void mergeWith(const KeyValueSource& data, bool recursive = true);
    void mergeWith(const Value& data, bool recursive = true);

    // Iterator over a snapshot of the current keys; see DictionaryIterator.
    DictionaryIterator iterator() const;

    std::string toJson(int indent = 0) const;

    // container-style access
    const Value& operator[](const Key& k) const { return itemAt(k); }
    void set(const Key& k, Value value) { add(k, std::move(value)); }
    Value erase(const Key& k) { return remove(k); }
    size_t size() const noexcept { return count(); }
    bool empty() const noexcept { return entries_.empty(); }
    OrderedMap::const_iterator begin() const noexcept { return entries_.begin(); }
    OrderedMap::const_iterator end() const noexcept { return entries_.end(); }

    void forEach(const Visitor& visit) const override { entries_.forEach(visit); }
    const OrderedMap* entries() const noexcept override { return &entries_; }

  private:
    void checkWritable() const;

    OrderedMap entries_;
    bool readOnly_ = false;
};

using DictionaryPtr = std::shared_ptr<OrderedDictionary>;

// Walks the keys a dictionary held when the iterator was created, in order.
// Values are read from the live dictionary; keys removed since creation are
// skipped and keys added since are not visited. If the current key is removed
// while the iterator sits on it, value() reads as null. An exhausted iterator
// stays exhausted; call OrderedDictionary::iterator() again for a fresh one.
// The dictionary must outlive the iterator.
class DictionaryIterator {
  public:
    explicit DictionaryIterator(const OrderedMap& entries);

    bool valid() const noexcept { return pos_ < keys_.size(); }
    const Key& key() const { return keys_.at(pos_); }
    const Value& value() const;
    void next();

  private:
    void skipRemoved();

    const OrderedMap& entries_;
    std::vector<Key> keys_;
    size_t pos_ = 0;
};

}  // namespace od
