#include "richdoc/delta/operation.h"
#include "richdoc/core/constants.h"
#include "richdoc/core/string_utils.h"
#include <stdexcept>

namespace richdoc::delta {

const char* opTypeName(OpType type) noexcept {
    switch (type) {
        case OpType::Insert: return "insert";
        case OpType::Retain: return "retain";
        case OpType::Delete: return "delete";
    }
    return "unknown";
}

Operation Operation::makeInsert(std::string text, AttributeMap attributes) {
    Operation op;
    op.type = OpType::Insert;
    op.length = utf16Length(text);
    op.text = std::move(text);
    op.attributes = std::move(attributes);
    return op;
}

Operation Operation::makeInsert(Embed embed, AttributeMap attributes) {
    Operation op;
    op.type = OpType::Insert;
    op.length = kEmbedLength;
    op.embed = std::move(embed);
    op.attributes = std::move(attributes);
    return op;
}

Operation Operation::makeRetain(std::uint32_t length, AttributeMap attributes) {
    Operation op;
    op.type = OpType::Retain;
    op.length = length;
    op.attributes = std::move(attributes);
    return op;
}

Operation Operation::makeDelete(std::uint32_t length) {
    Operation op;
    op.type = OpType::Delete;
    op.length = length;
    return op;
}

Operation Operation::slice(std::uint32_t offset, std::uint32_t count) const {
    if (isEmbed()) {
        return *this;
    }
    Operation out;
    out.type = type;
    out.attributes = attributes;
    if (isTextInsert()) {
        if (!isLogicalBoundary(text, offset) || !isLogicalBoundary(text, offset + count)) {
            throw std::invalid_argument("Operation split inside a surrogate pair");
        }
        out.text = sliceLogical(text, offset, count);
        out.length = utf16Length(out.text);
    } else {
        out.length = count;
    }
    return out;
}

bool Operation::operator==(const Operation& other) const {
    return type == other.type
        && length == other.length
        && text == other.text
        && embed == other.embed
        && attributes == other.attributes;
}

} // namespace richdoc::delta
