#ifndef RICHDOC_RULES_FORMAT_RULES_H
#define RICHDOC_RULES_FORMAT_RULES_H

#include "richdoc/rules/format_rule.h"

namespace richdoc::rules {

/**
 * Block attributes land on newline characters only.
 *
 * Every newline inside [index, index + length) gets the attribute, plus the
 * first newline at or after the end of the range, which terminates the last
 * line the range touches. When the attribute belongs to an exclusive group,
 * other members of that group already set on the newline are cleared (null).
 */
class LineFormatRule final : public FormatRule {
public:
    const char* name() const noexcept override { return "line"; }
    std::optional<delta::Delta> apply(const FormatContext& ctx) const override;
};

/**
 * Zero-length link request at the caret: re-targets the link run touching
 * the caret on either side. Declines when neither neighbor is a link.
 */
class LinkAtCaretFormatRule final : public FormatRule {
public:
    const char* name() const noexcept override { return "link-at-caret"; }
    std::optional<delta::Delta> apply(const FormatContext& ctx) const override;
};

// Inline attributes apply to every character in range except newlines.
class InlineFormatRule final : public FormatRule {
public:
    const char* name() const noexcept override { return "inline"; }
    std::optional<delta::Delta> apply(const FormatContext& ctx) const override;
};

/**
 * Style of an embedded object. The request must cover exactly the embed
 * (length 1) and carry no text payload; anything else throws
 * std::invalid_argument.
 */
class EmbedStyleFormatRule final : public FormatRule {
public:
    const char* name() const noexcept override { return "embed-style"; }
    std::optional<delta::Delta> apply(const FormatContext& ctx) const override;
};

} // namespace richdoc::rules

#endif // RICHDOC_RULES_FORMAT_RULES_H
