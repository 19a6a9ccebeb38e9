#include <od/key_value_source.h>
#include <od/error.h>
#include <od/ordered_map.h>

namespace od {

ValueSource::ValueSource(const Value& v) : v_(v) {
    if (not v_.isMap())
        throw TypeError("Dictionary data must be a map or an iterable key/value source, got " +
                        v_.typeString());
}

void ValueSource::forEach(const Visitor& visit) const { v_.asMap().forEach(visit); }

// the constructor guarantees v_ holds a map
const OrderedMap* ValueSource::entries() const noexcept { return &v_.asMap(); }

}  // namespace od
