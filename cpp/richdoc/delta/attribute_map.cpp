#include "richdoc/delta/attribute_map.h"
#include <algorithm>

namespace richdoc::delta {

AttributeMap::AttributeMap(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

bool AttributeMap::contains(std::string_view key) const {
    return find(key) != nullptr;
}

const AttributeValue* AttributeMap::find(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

void AttributeMap::set(std::string key, AttributeValue value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

bool AttributeMap::erase(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
        return e.first == key;
    });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool AttributeMap::operator==(const AttributeMap& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, value] : entries_) {
        const AttributeValue* theirs = other.find(key);
        if (!theirs || *theirs != value) {
            return false;
        }
    }
    return true;
}

AttributeMap AttributeMap::compose(const AttributeMap& base, const AttributeMap& change, bool keepNull) {
    AttributeMap result;
    for (const auto& [key, value] : change) {
        if (!keepNull && isNull(value)) continue;
        result.set(key, value);
    }
    for (const auto& [key, value] : base) {
        if (!change.contains(key)) {
            result.set(key, value);
        }
    }
    return result;
}

} // namespace richdoc::delta
