#pragma once

#include "richdoc/delta/delta.h"
#include "richdoc/document/attribute.h"
#include <cstdint>
#include <optional>
#include <string>

namespace richdoc::rules {

// One format request against a document snapshot. Borrowed for a single call.
struct FormatContext {
    const delta::Delta& document;
    std::uint32_t index;
    std::uint32_t length;
    const document::Attribute& attribute;
    std::optional<std::string> data;
};

/**
 * FormatRule: turns a format request into a patch, or declines with nullopt
 * so the next rule is tried. Rules never mutate the document.
 */
class FormatRule {
public:
    virtual ~FormatRule() = default;
    virtual const char* name() const noexcept = 0;
    virtual std::optional<delta::Delta> apply(const FormatContext& ctx) const = 0;
};

} // namespace richdoc::rules
