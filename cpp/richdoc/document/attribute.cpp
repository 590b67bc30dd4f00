#include "richdoc/document/attribute.h"
#include <algorithm>
#include <stdexcept>

namespace richdoc::document {

namespace {

const std::vector<AttributeInfo>& catalogTable() {
    static const std::vector<AttributeInfo> table = {
        {keys::kBold,        AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kItalic,      AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kSmall,       AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kUnderline,   AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kStrike,      AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kInlineCode,  AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kFont,        AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kSize,        AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kLink,        AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kColor,       AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kBackground,  AttributeScope::Inline, ExclusiveGroup::None},
        {keys::kPlaceholder, AttributeScope::Inline, ExclusiveGroup::None},

        {keys::kHeader,      AttributeScope::Block,  ExclusiveGroup::BlockFormat},
        {keys::kAlign,       AttributeScope::Block,  ExclusiveGroup::None},
        {keys::kDirection,   AttributeScope::Block,  ExclusiveGroup::None},
        {keys::kList,        AttributeScope::Block,  ExclusiveGroup::BlockFormat},
        {keys::kCodeBlock,   AttributeScope::Block,  ExclusiveGroup::BlockFormat},
        {keys::kBlockQuote,  AttributeScope::Block,  ExclusiveGroup::BlockFormat},
        {keys::kIndent,      AttributeScope::Block,  ExclusiveGroup::None},

        {keys::kWidth,       AttributeScope::Embed,  ExclusiveGroup::None},
        {keys::kHeight,      AttributeScope::Embed,  ExclusiveGroup::None},
        {keys::kStyle,       AttributeScope::Embed,  ExclusiveGroup::None},
    };
    return table;
}

// Group members, derived once from the catalog table.
const std::vector<std::string_view>& groupMembers(ExclusiveGroup group) {
    static const std::vector<std::string_view> blockFormat = [] {
        std::vector<std::string_view> members;
        for (const auto& info : catalogTable()) {
            if (info.group == ExclusiveGroup::BlockFormat) {
                members.push_back(info.key);
            }
        }
        return members;
    }();
    static const std::vector<std::string_view> none;
    return group == ExclusiveGroup::BlockFormat ? blockFormat : none;
}

} // namespace

const char* attributeScopeName(AttributeScope scope) noexcept {
    switch (scope) {
        case AttributeScope::Inline: return "inline";
        case AttributeScope::Block: return "block";
        case AttributeScope::Embed: return "embed";
    }
    return "unknown";
}

// =============================================================================
// AttributeCatalog
// =============================================================================

const AttributeInfo* AttributeCatalog::find(std::string_view key) {
    const auto& table = catalogTable();
    auto it = std::find_if(table.begin(), table.end(), [&](const AttributeInfo& info) {
        return info.key == key;
    });
    return it != table.end() ? &*it : nullptr;
}

AttributeScope AttributeCatalog::scopeOf(std::string_view key) {
    const AttributeInfo* info = find(key);
    if (!info) {
        throw std::invalid_argument("Unknown attribute key: " + std::string(key));
    }
    return info->scope;
}

ExclusiveGroup AttributeCatalog::groupOf(std::string_view key) {
    const AttributeInfo* info = find(key);
    return info ? info->group : ExclusiveGroup::None;
}

const std::vector<std::string_view>* AttributeCatalog::exclusiveGroup(std::string_view key) {
    const ExclusiveGroup group = groupOf(key);
    if (group == ExclusiveGroup::None) {
        return nullptr;
    }
    return &groupMembers(group);
}

const std::vector<AttributeInfo>& AttributeCatalog::all() {
    return catalogTable();
}

// =============================================================================
// Attribute
// =============================================================================

Attribute::Attribute(std::string key, AttributeScope scope, AttributeValue value)
    : key(std::move(key)), scope(scope), value(std::move(value)) {}

Attribute Attribute::fromKey(std::string_view key, AttributeValue value) {
    return Attribute(std::string(key), AttributeCatalog::scopeOf(key), std::move(value));
}

Attribute Attribute::unset(const Attribute& attribute) {
    return Attribute(attribute.key, attribute.scope, std::monostate{});
}

Attribute Attribute::unset(std::string_view key) {
    return fromKey(key, std::monostate{});
}

Attribute Attribute::bold() { return fromKey(keys::kBold, true); }
Attribute Attribute::italic() { return fromKey(keys::kItalic, true); }
Attribute Attribute::small() { return fromKey(keys::kSmall, true); }
Attribute Attribute::underline() { return fromKey(keys::kUnderline, true); }
Attribute Attribute::strike() { return fromKey(keys::kStrike, true); }
Attribute Attribute::inlineCode() { return fromKey(keys::kInlineCode, true); }
Attribute Attribute::font(std::string family) { return fromKey(keys::kFont, std::move(family)); }
Attribute Attribute::size(std::string size) { return fromKey(keys::kSize, std::move(size)); }
Attribute Attribute::link(std::string url) { return fromKey(keys::kLink, std::move(url)); }
Attribute Attribute::color(std::string color) { return fromKey(keys::kColor, std::move(color)); }
Attribute Attribute::background(std::string color) { return fromKey(keys::kBackground, std::move(color)); }
Attribute Attribute::placeholder() { return fromKey(keys::kPlaceholder, true); }

Attribute Attribute::header(std::int64_t level) { return fromKey(keys::kHeader, level); }
Attribute Attribute::align(std::string alignment) { return fromKey(keys::kAlign, std::move(alignment)); }
Attribute Attribute::direction(std::string direction) { return fromKey(keys::kDirection, std::move(direction)); }
Attribute Attribute::list(std::string type) { return fromKey(keys::kList, std::move(type)); }
Attribute Attribute::codeBlock() { return fromKey(keys::kCodeBlock, true); }
Attribute Attribute::blockQuote() { return fromKey(keys::kBlockQuote, true); }
Attribute Attribute::indent(std::int64_t level) { return fromKey(keys::kIndent, level); }

Attribute Attribute::width(double width) { return fromKey(keys::kWidth, width); }
Attribute Attribute::height(double height) { return fromKey(keys::kHeight, height); }
Attribute Attribute::style(std::string css) { return fromKey(keys::kStyle, std::move(css)); }

AttributeMap Attribute::toMap() const {
    AttributeMap map;
    map.set(key, value);
    return map;
}

bool Attribute::operator==(const Attribute& other) const {
    return key == other.key && scope == other.scope && value == other.value;
}

} // namespace richdoc::document
