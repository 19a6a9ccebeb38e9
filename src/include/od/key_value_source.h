#pragma once

#include <od/key.h>
#include <od/value.h>

#include <functional>

namespace od {

class OrderedMap;

// Anything bulk import can read from: an ordered sequence of (key, value)
// pairs. OrderedMap and OrderedDictionary implement it directly; standard
// containers of pairs are wrapped in a RangeSource and map-valued Values in
// a ValueSource.
class KeyValueSource {
  public:
    using Visitor = std::function<void(const Key&, const Value&)>;

    virtual ~KeyValueSource() = default;

    // Visit every pair in order.
    virtual void forEach(const Visitor& visit) const = 0;

    // Sources backed by an OrderedMap expose it so callers can read the
    // entries directly instead of materializing a copy.
    virtual const OrderedMap* entries() const noexcept { return nullptr; }
};

// Wraps a map-valued Value. Constructing one from a scalar or null Value
// throws TypeError.
class ValueSource : public KeyValueSource {
  public:
    explicit ValueSource(const Value& v);

    void forEach(const Visitor& visit) const override;
    const OrderedMap* entries() const noexcept override;

  private:
    const Value& v_;
};

// Adapts a standard range of pairs (std::map, std::vector<std::pair<..>>,
// ...) whose first member converts to Key and second to Value.
template <typename Range>
class RangeSource : public KeyValueSource {
  public:
    explicit RangeSource(const Range& r) : r_(r) {}

    void forEach(const Visitor& visit) const override {
        for (auto const& p : r_) visit(Key(p.first), Value(p.second));
    }

  private:
    const Range& r_;
};

}  // namespace od
