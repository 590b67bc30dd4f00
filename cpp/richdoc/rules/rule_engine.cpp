#include "richdoc/rules/rule_engine.h"
#include "richdoc/rules/format_rules.h"
#include "richdoc/core/logging.h"
#include <stdexcept>

namespace richdoc::rules {

RuleEngine::RuleEngine() {
    standardRules_.reserve(4);
    standardRules_.push_back(std::make_unique<LineFormatRule>());
    standardRules_.push_back(std::make_unique<LinkAtCaretFormatRule>());
    standardRules_.push_back(std::make_unique<InlineFormatRule>());
    standardRules_.push_back(std::make_unique<EmbedStyleFormatRule>());
}

RuleEngine::~RuleEngine() = default;
RuleEngine::RuleEngine(RuleEngine&&) noexcept = default;
RuleEngine& RuleEngine::operator=(RuleEngine&&) noexcept = default;

// =============================================================================
// Configuration
// =============================================================================

void RuleEngine::setCustomRules(std::vector<std::unique_ptr<FormatRule>> rules) {
    customRules_.clear();
    for (auto& rule : rules) {
        addCustomRule(std::move(rule));
    }
}

void RuleEngine::addCustomRule(std::unique_ptr<FormatRule> rule) {
    if (!rule) {
        throw std::invalid_argument("RuleEngine: custom rule must not be null");
    }
    customRules_.push_back(std::move(rule));
}

std::vector<std::string> RuleEngine::ruleNames() const {
    std::vector<std::string> names;
    names.reserve(customRules_.size() + standardRules_.size());
    for (const auto& rule : customRules_) names.emplace_back(rule->name());
    for (const auto& rule : standardRules_) names.emplace_back(rule->name());
    return names;
}

// =============================================================================
// Evaluation
// =============================================================================

FormatOutcome RuleEngine::apply(const FormatContext& ctx) const {
    for (const auto* rules : {&customRules_, &standardRules_}) {
        for (const auto& rule : *rules) {
            if (auto patch = rule->apply(ctx)) {
                RICHDOC_LOG_DEBUG("format %s @%u+%u accepted by '%s'",
                    ctx.attribute.key.c_str(), ctx.index, ctx.length, rule->name());
                return FormatOutcome{std::move(*patch), rule->name()};
            }
        }
    }

    RICHDOC_LOG_DEBUG("format %s @%u+%u: no rule accepted, using fallback",
        ctx.attribute.key.c_str(), ctx.index, ctx.length);
    return FormatOutcome{fallback(ctx), "fallback"};
}

delta::Delta RuleEngine::format(
    const delta::Delta& document,
    std::uint32_t index,
    std::uint32_t length,
    const document::Attribute& attribute,
    std::optional<std::string> data
) const {
    const FormatContext ctx{document, index, length, attribute, std::move(data)};
    return apply(ctx).patch;
}

delta::Delta RuleEngine::fallback(const FormatContext& ctx) {
    delta::Delta patch;
    patch.retain(ctx.index);
    patch.retain(ctx.length, ctx.attribute.toMap());
    return patch;
}

} // namespace richdoc::rules
