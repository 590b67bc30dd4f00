#ifndef RICHDOC_DOCUMENT_ATTRIBUTE_H
#define RICHDOC_DOCUMENT_ATTRIBUTE_H

#include "richdoc/delta/attribute_map.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace richdoc::document {

using delta::AttributeMap;
using delta::AttributeValue;

enum class AttributeScope : std::uint8_t {
    Inline = 0, // character runs
    Block = 1,  // carried by the line's terminating newline
    Embed = 2,  // carried by an embedded object
};

const char* attributeScopeName(AttributeScope scope) noexcept;

// Groups of block keys of which at most one may be set on a line.
enum class ExclusiveGroup : std::uint8_t {
    None = 0,
    BlockFormat = 1,
};

namespace keys {
inline constexpr std::string_view kBold = "bold";
inline constexpr std::string_view kItalic = "italic";
inline constexpr std::string_view kSmall = "small";
inline constexpr std::string_view kUnderline = "underline";
inline constexpr std::string_view kStrike = "strike";
inline constexpr std::string_view kInlineCode = "code";
inline constexpr std::string_view kFont = "font";
inline constexpr std::string_view kSize = "size";
inline constexpr std::string_view kLink = "link";
inline constexpr std::string_view kColor = "color";
inline constexpr std::string_view kBackground = "background";
inline constexpr std::string_view kPlaceholder = "placeholder";

inline constexpr std::string_view kHeader = "header";
inline constexpr std::string_view kAlign = "align";
inline constexpr std::string_view kDirection = "direction";
inline constexpr std::string_view kList = "list";
inline constexpr std::string_view kCodeBlock = "code-block";
inline constexpr std::string_view kBlockQuote = "blockquote";
inline constexpr std::string_view kIndent = "indent";

inline constexpr std::string_view kWidth = "width";
inline constexpr std::string_view kHeight = "height";
inline constexpr std::string_view kStyle = "style";
} // namespace keys

struct AttributeInfo {
    std::string_view key;
    AttributeScope scope;
    ExclusiveGroup group;
};

/**
 * AttributeCatalog: read-only table of known formatting keys.
 *
 * Adding a key, or a new exclusive group, only touches the tables in
 * attribute.cpp.
 */
class AttributeCatalog {
public:
    static const AttributeInfo* find(std::string_view key);
    static bool isKnown(std::string_view key) { return find(key) != nullptr; }

    /**
     * Scope of a known key. Throws std::invalid_argument for unknown keys.
     */
    static AttributeScope scopeOf(std::string_view key);

    static ExclusiveGroup groupOf(std::string_view key);

    /**
     * Members of the exclusive group `key` belongs to, or nullptr.
     */
    static const std::vector<std::string_view>* exclusiveGroup(std::string_view key);

    static const std::vector<AttributeInfo>& all();
};

/**
 * Attribute: one formatting key with its scope and value.
 * A null value removes the attribute.
 */
struct Attribute {
    std::string key;
    AttributeScope scope = AttributeScope::Inline;
    AttributeValue value;

    Attribute() = default;
    Attribute(std::string key, AttributeScope scope, AttributeValue value);

    /**
     * Attribute for a catalog key; the scope comes from the catalog.
     * Throws std::invalid_argument for unknown keys.
     */
    static Attribute fromKey(std::string_view key, AttributeValue value);

    // Same key and scope with a null value.
    static Attribute unset(const Attribute& attribute);
    static Attribute unset(std::string_view key);

    static Attribute bold();
    static Attribute italic();
    static Attribute small();
    static Attribute underline();
    static Attribute strike();
    static Attribute inlineCode();
    static Attribute font(std::string family);
    static Attribute size(std::string size);
    static Attribute link(std::string url);
    static Attribute color(std::string color);
    static Attribute background(std::string color);
    static Attribute placeholder();

    static Attribute header(std::int64_t level);
    static Attribute align(std::string alignment);
    static Attribute direction(std::string direction);
    static Attribute list(std::string type);
    static Attribute codeBlock();
    static Attribute blockQuote();
    static Attribute indent(std::int64_t level);

    static Attribute width(double width);
    static Attribute height(double height);
    static Attribute style(std::string css);

    bool isUnset() const noexcept { return delta::isNull(value); }
    bool isBlock() const noexcept { return scope == AttributeScope::Block; }
    bool isInline() const noexcept { return scope == AttributeScope::Inline; }

    // {key: value}
    AttributeMap toMap() const;

    bool operator==(const Attribute& other) const;
    bool operator!=(const Attribute& other) const { return !(*this == other); }
};

} // namespace richdoc::document

#endif // RICHDOC_DOCUMENT_ATTRIBUTE_H
