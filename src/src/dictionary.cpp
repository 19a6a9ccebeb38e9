#include <od/dictionary.h>
#include <od/json.h>
#include <od/merge.h>

namespace od {

namespace {
    // Consume a source into an OrderedMap, later pairs overwriting earlier
    // ones with the same key.
    OrderedMap materialize(const KeyValueSource& data) {
        if (const OrderedMap* m = data.entries()) return *m;
        OrderedMap out;
        data.forEach([&](const Key& k, const Value& v) { out.set(k, v); });
        return out;
    }
}

OrderedDictionary::OrderedDictionary(const KeyValueSource& data, bool readOnly) {
    copyFrom(data);
    readOnly_ = readOnly;
}

OrderedDictionary::OrderedDictionary(const Value& data, bool readOnly) {
    copyFrom(data);
    readOnly_ = readOnly;
}

OrderedDictionary OrderedDictionary::fromJson(const std::string& text, bool readOnly) {
    return OrderedDictionary(parse_json(text), readOnly);
}

OrderedDictionary OrderedDictionary::clone() const {
    OrderedDictionary out;
    out.entries_ = entries_;
    out.readOnly_ = readOnly_;
    return out;
}

void OrderedDictionary::checkWritable() const {
    if (readOnly_) throw ReadOnlyError();
}

const Value& OrderedDictionary::itemAt(const Key& k) const {
    static const Value null_value;
    const Value* v = entries_.find(k);
    return v != nullptr ? *v : null_value;
}

void OrderedDictionary::add(std::optional<Key> k, Value value) {
    checkWritable();
    if (k)
        entries_.set(*k, std::move(value));
    else
        entries_.append(std::move(value));
}

Key OrderedDictionary::append(Value value) {
    checkWritable();
    return entries_.append(std::move(value));
}

Value OrderedDictionary::remove(const Key& k) {
    checkWritable();
    auto removed = entries_.take(k);
    if (removed) return std::move(*removed);
    return Value::null();
}

void OrderedDictionary::clear() {
    // walk a snapshot of the keys so removal cannot disturb the walk
    for (auto const& k : entries_.keys()) remove(k);
}

void OrderedDictionary::copyFrom(const KeyValueSource& data) {
    // Read the source before clearing: it may be this dictionary.
    OrderedMap incoming = materialize(data);
    checkWritable();
    if (not entries_.empty()) clear();
    for (auto const& [k, v] : incoming) add(k, v);
}

void OrderedDictionary::copyFrom(const Value& data) { copyFrom(ValueSource(data)); }

void OrderedDictionary::mergeWith(const KeyValueSource& data, bool recursive) {
    checkWritable();
    if (recursive) {
        if (const OrderedMap* m = data.entries()) {
            entries_ = mergeArray(entries_, *m);
        } else {
            entries_ = mergeArray(entries_, materialize(data));
        }
        return;
    }
    OrderedMap incoming = materialize(data);
    for (auto const& [k, v] : incoming) add(k, v);
}

void OrderedDictionary::mergeWith(const Value& data, bool recursive) {
    mergeWith(ValueSource(data), recursive);
}

DictionaryIterator OrderedDictionary::iterator() const { return DictionaryIterator(entries_); }

std::string OrderedDictionary::toJson(int indent) const { return dump_json(entries_, indent); }

DictionaryIterator::DictionaryIterator(const OrderedMap& entries)
    : entries_(entries), keys_(entries.keys()) {}

const Value& DictionaryIterator::value() const {
    static const Value null_value;
    const Value* v = entries_.find(key());
    return v != nullptr ? *v : null_value;
}

void DictionaryIterator::next() {
    ++pos_;
    skipRemoved();
}

void DictionaryIterator::skipRemoved() {
    while (pos_ < keys_.size() and not entries_.contains(keys_[pos_])) ++pos_;
}

}  // namespace od
