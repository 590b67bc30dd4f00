#ifndef RICHDOC_DELTA_OPERATION_H
#define RICHDOC_DELTA_OPERATION_H

#include "richdoc/delta/attribute_map.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace richdoc::delta {

enum class OpType : std::uint8_t {
    Insert = 0,
    Retain = 1,
    Delete = 2,
};

const char* opTypeName(OpType type) noexcept;

// Non-text content (image, video, formula...) serialized as {type: data}.
struct Embed {
    std::string type;
    std::string data;

    bool operator==(const Embed& other) const { return type == other.type && data == other.data; }
    bool operator!=(const Embed& other) const { return !(*this == other); }
};

/**
 * Operation: one step of a Delta.
 *
 * - Insert carries either text (UTF-8) or an embed; length is the text's
 *   UTF-16 length, or 1 for an embed.
 * - Retain and Delete carry only a length.
 * - Insert and Retain may carry attributes. Delete never does.
 */
struct Operation {
    OpType type = OpType::Retain;
    std::uint32_t length = 0;
    std::string text;
    std::optional<Embed> embed;
    AttributeMap attributes;

    static Operation makeInsert(std::string text, AttributeMap attributes = {});
    static Operation makeInsert(Embed embed, AttributeMap attributes = {});
    static Operation makeRetain(std::uint32_t length, AttributeMap attributes = {});
    static Operation makeDelete(std::uint32_t length);

    bool isInsert() const noexcept { return type == OpType::Insert; }
    bool isRetain() const noexcept { return type == OpType::Retain; }
    bool isDelete() const noexcept { return type == OpType::Delete; }
    bool isEmbed() const noexcept { return type == OpType::Insert && embed.has_value(); }
    bool isTextInsert() const noexcept { return type == OpType::Insert && !embed.has_value(); }

    bool hasAttributes() const noexcept { return !attributes.empty(); }
    bool hasAttribute(std::string_view key) const { return attributes.contains(key); }

    /**
     * Sub-operation covering [offset, offset + count) of this one, with the
     * same type and attributes. Embeds are atomic and returned whole.
     * Text may not be cut inside a surrogate pair (std::invalid_argument).
     */
    Operation slice(std::uint32_t offset, std::uint32_t count) const;

    bool operator==(const Operation& other) const;
    bool operator!=(const Operation& other) const { return !(*this == other); }
};

} // namespace richdoc::delta

#endif // RICHDOC_DELTA_OPERATION_H
