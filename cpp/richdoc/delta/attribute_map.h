#ifndef RICHDOC_DELTA_ATTRIBUTE_MAP_H
#define RICHDOC_DELTA_ATTRIBUTE_MAP_H

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace richdoc::delta {

// std::monostate is the null value. On a retain it means "clear this attribute".
using AttributeValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

inline bool isNull(const AttributeValue& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * AttributeMap: formatting keys and their values, in insertion order.
 *
 * Order is kept so the wire form serializes keys the way they were written.
 * Equality does not depend on order. An empty map means "no attributes".
 */
class AttributeMap {
public:
    using Entry = std::pair<std::string, AttributeValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    AttributeMap() = default;
    AttributeMap(std::initializer_list<Entry> entries);

    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }

    bool contains(std::string_view key) const;
    const AttributeValue* find(std::string_view key) const;

    /**
     * Set a key. An existing key keeps its position and gets the new value.
     */
    void set(std::string key, AttributeValue value);
    bool erase(std::string_view key);
    void clear() noexcept { entries_.clear(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const AttributeMap& other) const;
    bool operator!=(const AttributeMap& other) const { return !(*this == other); }

    /**
     * Attributes resulting from applying `change` on top of `base`.
     * Keys of `change` come first; null entries are dropped unless keepNull.
     * Keys of `base` that `change` does not mention follow.
     */
    static AttributeMap compose(const AttributeMap& base, const AttributeMap& change, bool keepNull);

private:
    std::vector<Entry> entries_;
};

} // namespace richdoc::delta

#endif // RICHDOC_DELTA_ATTRIBUTE_MAP_H
