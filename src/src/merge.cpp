#include <od/merge.h>

namespace od {

OrderedMap mergeArray(const OrderedMap& base, const OrderedMap& incoming) {
    OrderedMap out = base;
    for (auto const& [k, v] : incoming) {
        if (k.isInt()) {
            if (out.contains(k))
                out.append(v);
            else
                out.set(k, v);
            continue;
        }
        Value* existing = out.find(k);
        if (existing != nullptr and existing->isMap() and v.isMap()) {
            existing->asMap() = mergeArray(existing->asMap(), v.asMap());
        } else {
            out.set(k, v);
        }
    }
    return out;
}

OrderedMap mergeAll(const std::vector<OrderedMap>& sources) {
    OrderedMap out;
    for (auto const& s : sources) out = mergeArray(out, s);
    return out;
}

}  // namespace od
