#include <od/ordered_map.h>

#include <iterator>
#include <limits>
#include <stdexcept>

namespace od {

OrderedMap::OrderedMap(std::initializer_list<std::pair<Key, Value> > init) {
    for (auto const& p : init) set(p.first, p.second);
}

OrderedMap::OrderedMap(const OrderedMap& o)
    : KeyValueSource(),
      entries_(o.entries_),
      next_index_(o.next_index_),
      index_exhausted_(o.index_exhausted_) {
    // the copied list has fresh nodes, so the index is rebuilt against them
    for (auto it = entries_.begin(); it != entries_.end(); ++it) index_.emplace(it->first, it);
}

// std::list and std::map moves transfer their nodes, so the iterators held in
// index_ stay valid and now point into this object's list.
OrderedMap::OrderedMap(OrderedMap&& o) noexcept
    : KeyValueSource(),
      entries_(std::move(o.entries_)),
      index_(std::move(o.index_)),
      next_index_(o.next_index_),
      index_exhausted_(o.index_exhausted_) {
    o.entries_.clear();
    o.index_.clear();
    o.next_index_ = 0;
    o.index_exhausted_ = false;
}

OrderedMap& OrderedMap::operator=(OrderedMap o) noexcept {
    swap(o);
    return *this;
}

void OrderedMap::swap(OrderedMap& o) noexcept {
    entries_.swap(o.entries_);
    index_.swap(o.index_);
    std::swap(next_index_, o.next_index_);
    std::swap(index_exhausted_, o.index_exhausted_);
}

const Value* OrderedMap::find(const Key& k) const {
    auto it = index_.find(k);
    if (it == index_.end()) return nullptr;
    return &it->second->second;
}

Value* OrderedMap::find(const Key& k) {
    auto it = index_.find(k);
    if (it == index_.end()) return nullptr;
    return &it->second->second;
}

void OrderedMap::noteKey(const Key& k) noexcept {
    if (not k.isInt()) return;
    int64_t n = k.asInt();
    if (n < 0) return;
    if (n == std::numeric_limits<int64_t>::max()) {
        index_exhausted_ = true;
        return;
    }
    if (n >= next_index_) next_index_ = n + 1;
}

void OrderedMap::set(const Key& k, Value v) {
    auto it = index_.find(k);
    if (it != index_.end()) {
        it->second->second = std::move(v);
        return;
    }
    entries_.emplace_back(k, std::move(v));
    index_.emplace(k, std::prev(entries_.end()));
    noteKey(k);
}

Key OrderedMap::append(Value v) {
    if (index_exhausted_)
        throw std::overflow_error("Cannot append: the next integer index is out of range");
    Key k(next_index_);
    set(k, std::move(v));
    return k;
}

std::optional<Value> OrderedMap::take(const Key& k) {
    auto it = index_.find(k);
    if (it == index_.end()) return std::nullopt;
    Value out = std::move(it->second->second);
    entries_.erase(it->second);
    index_.erase(it);
    return out;
}

void OrderedMap::clear() noexcept {
    entries_.clear();
    index_.clear();
}

std::vector<Key> OrderedMap::keys() const {
    std::vector<Key> out;
    out.reserve(entries_.size());
    for (auto const& p : entries_) out.push_back(p.first);
    return out;
}

bool OrderedMap::isList() const {
    int64_t expected = 0;
    for (auto const& p : entries_) {
        if (not p.first.isInt() or p.first.asInt() != expected) return false;
        ++expected;
    }
    return true;
}

bool OrderedMap::operator==(const OrderedMap& rhs) const {
    if (entries_.size() != rhs.entries_.size()) return false;
    auto a = entries_.begin();
    auto b = rhs.entries_.begin();
    for (; a != entries_.end(); ++a, ++b) {
        if (a->first != b->first) return false;
        if (a->second != b->second) return false;
    }
    return true;
}

void OrderedMap::forEach(const Visitor& visit) const {
    for (auto const& p : entries_) visit(p.first, p.second);
}

}  // namespace od
