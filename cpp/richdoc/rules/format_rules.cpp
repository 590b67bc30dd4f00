#include "richdoc/rules/format_rules.h"
#include "richdoc/core/string_utils.h"
#include "richdoc/delta/delta_iterator.h"
#include <algorithm>
#include <stdexcept>

namespace richdoc::rules {

using delta::AttributeMap;
using delta::Delta;
using delta::DeltaIterator;
using delta::Operation;
using document::Attribute;
using document::AttributeCatalog;
using document::AttributeScope;

namespace {

std::optional<std::uint32_t> firstNewline(const Operation& op, std::uint32_t from = 0) {
    if (!op.isTextInsert()) {
        return std::nullopt;
    }
    return findNewline(op.text, from);
}

// Requested attribute, plus a null for every other member of its exclusive
// group already set on `op`.
AttributeMap lineStyleFor(const Attribute& attribute, const Operation& op) {
    AttributeMap style = attribute.toMap();
    const auto* group = AttributeCatalog::exclusiveGroup(attribute.key);
    if (!group || attribute.isUnset()) {
        return style;
    }
    for (const auto& [key, value] : op.attributes) {
        if (key == attribute.key) continue;
        if (std::find(group->begin(), group->end(), key) != group->end()) {
            style.set(key, std::monostate{});
        }
    }
    return style;
}

void applyToNewlines(const Operation& op, const Attribute& attribute, bool firstOnly, Delta& out) {
    const AttributeMap style = lineStyleFor(attribute, op);
    std::uint32_t offset = 0;
    auto lf = firstNewline(op);
    while (lf) {
        out.retain(*lf - offset);
        out.retain(1, style);
        if (firstOnly) {
            return;
        }
        offset = *lf + 1;
        lf = firstNewline(op, offset);
    }
    out.retain(op.length - offset);
}

} // namespace

// =============================================================================
// LineFormatRule
// =============================================================================

std::optional<Delta> LineFormatRule::apply(const FormatContext& ctx) const {
    if (ctx.attribute.scope != AttributeScope::Block) {
        return std::nullopt;
    }

    Delta result;
    result.retain(ctx.index);
    DeltaIterator it(ctx.document);
    it.skip(ctx.index);

    std::uint32_t consumed = 0;
    while (consumed < ctx.length && it.hasNext()) {
        const Operation op = it.next(ctx.length - consumed);
        consumed += op.length;
        if (!firstNewline(op)) {
            result.retain(op.length);
            continue;
        }
        applyToNewlines(op, ctx.attribute, false, result);
    }

    // The newline ending the last touched line, even past the range.
    while (it.hasNext()) {
        const Operation op = it.next();
        if (!firstNewline(op)) {
            result.retain(op.length);
            continue;
        }
        applyToNewlines(op, ctx.attribute, true, result);
        break;
    }

    return result;
}

// =============================================================================
// LinkAtCaretFormatRule
// =============================================================================

std::optional<Delta> LinkAtCaretFormatRule::apply(const FormatContext& ctx) const {
    if (ctx.attribute.key != document::keys::kLink || ctx.length > 0) {
        return std::nullopt;
    }

    DeltaIterator it(ctx.document);
    const std::optional<Operation> before = it.skip(ctx.index);
    std::optional<Operation> after;
    if (it.hasNext()) {
        after = it.next();
    }

    std::uint32_t begin = ctx.index;
    std::uint32_t retain = 0;
    if (before && before->hasAttribute(ctx.attribute.key)) {
        begin -= before->length;
        retain = before->length;
    }
    if (after && after->hasAttribute(ctx.attribute.key)) {
        retain += after->length;
    }
    if (retain == 0) {
        return std::nullopt;
    }

    Delta result;
    result.retain(begin);
    result.retain(retain, ctx.attribute.toMap());
    return result;
}

// =============================================================================
// InlineFormatRule
// =============================================================================

std::optional<Delta> InlineFormatRule::apply(const FormatContext& ctx) const {
    if (ctx.attribute.scope != AttributeScope::Inline) {
        return std::nullopt;
    }

    const AttributeMap style = ctx.attribute.toMap();
    Delta result;
    result.retain(ctx.index);
    DeltaIterator it(ctx.document);
    it.skip(ctx.index);

    std::uint32_t consumed = 0;
    while (consumed < ctx.length && it.hasNext()) {
        const Operation op = it.next(ctx.length - consumed);
        consumed += op.length;

        auto lf = firstNewline(op);
        if (!lf) {
            result.retain(op.length, style);
            continue;
        }

        std::uint32_t pos = 0;
        while (lf) {
            result.retain(*lf - pos, style);
            result.retain(1);
            pos = *lf + 1;
            lf = firstNewline(op, pos);
        }
        if (pos < op.length) {
            result.retain(op.length - pos, style);
        }
    }

    return result;
}

// =============================================================================
// EmbedStyleFormatRule
// =============================================================================

std::optional<Delta> EmbedStyleFormatRule::apply(const FormatContext& ctx) const {
    if (ctx.attribute.key != document::keys::kStyle) {
        return std::nullopt;
    }
    if (ctx.length != 1 || ctx.data.has_value()) {
        throw std::invalid_argument("Embed style requires a length of 1 and no text payload");
    }

    Delta result;
    result.retain(ctx.index);
    result.retain(1, ctx.attribute.toMap());
    return result;
}

} // namespace richdoc::rules
