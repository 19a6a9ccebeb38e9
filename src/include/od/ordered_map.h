#pragma once

#include <od/key.h>
#include <od/key_value_source.h>
#include <od/value.h>

#include <cstdint>
#include <initializer_list>
#include <list>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace od {

// Insertion-ordered, key-unique map from Key to Value.
//
// Entries live in a list so their order survives overwrites and erasures of
// other keys; an index map gives logarithmic lookup by key. Overwriting an
// existing key keeps its position, a new key goes to the end.
//
// append() uses the next free integer index: one past the largest
// non-negative integer key this map has ever held. Erasing keys never moves
// that index backwards.
class OrderedMap : public KeyValueSource {
  public:
    using value_type = std::pair<const Key, Value>;
    using list_type = std::list<value_type>;
    using const_iterator = list_type::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<std::pair<Key, Value> > init);
    OrderedMap(const OrderedMap& o);
    OrderedMap(OrderedMap&& o) noexcept;
    OrderedMap& operator=(OrderedMap o) noexcept;
    ~OrderedMap() override = default;

    void swap(OrderedMap& o) noexcept;

    const Value* find(const Key& k) const;
    Value* find(const Key& k);
    bool contains(const Key& k) const { return index_.count(k) == 1; }

    // Overwrite in place or append a new entry at the end.
    void set(const Key& k, Value v);

    // Store under the next free integer index and return that index.
    // Throws std::overflow_error once the index space is used up.
    Key append(Value v);

    // Remove the entry and hand back its value, if there was one.
    std::optional<Value> take(const Key& k);
    bool erase(const Key& k) { return take(k).has_value(); }

    void clear() noexcept;

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    std::vector<Key> keys() const;
    int64_t nextIndex() const noexcept { return next_index_; }

    // True when the keys are exactly 0, 1, ..., size()-1 in that order.
    bool isList() const;

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    // Same keys in the same order mapped to equal values.
    bool operator==(const OrderedMap& rhs) const;
    bool operator!=(const OrderedMap& rhs) const { return not(*this == rhs); }

    void forEach(const Visitor& visit) const override;
    const OrderedMap* entries() const noexcept override { return this; }

  private:
    void noteKey(const Key& k) noexcept;

    list_type entries_;
    std::map<Key, list_type::iterator> index_;
    int64_t next_index_ = 0;
    bool index_exhausted_ = false;
};

}  // namespace od
