#pragma once

#include <od/ordered_map.h>

#include <vector>

namespace od {

// Merge `incoming` into a copy of `base` and return the copy. Neither input
// is modified.
//
// Pairs of `incoming` are applied in order:
//  - integer key already present: the value is appended under the next free
//    integer index; an integer key not yet present is written as-is
//  - string key whose value is a map, where the existing value at that key
//    is also a map: the two maps are merged recursively with these rules
//  - anything else: the value overwrites whatever is at the key
//
// Merging a map with itself reproduces it only when it has no integer keys;
// integer-keyed entries are appended a second time.
//
// Nested maps must not contain themselves. Recursion depth follows the
// nesting depth of the operands.
OrderedMap mergeArray(const OrderedMap& base, const OrderedMap& incoming);

// Fold mergeArray over `sources` from left to right, starting from an empty
// map.
OrderedMap mergeAll(const std::vector<OrderedMap>& sources);

}  // namespace od
