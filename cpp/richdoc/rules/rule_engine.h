#ifndef RICHDOC_RULES_RULE_ENGINE_H
#define RICHDOC_RULES_RULE_ENGINE_H

#include "richdoc/rules/format_rule.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace richdoc::rules {

struct FormatOutcome {
    delta::Delta patch;
    const char* rule; // name of the rule that accepted, or "fallback"
};

/**
 * RuleEngine: ordered chain of format rules, first acceptance wins.
 *
 * Evaluation order: custom rules (registration order), then
 * line -> link-at-caret -> inline -> embed-style, then the fallback
 * retain(index) + retain(length, attribute).
 *
 * Evaluation is pure: the document is only read.
 */
class RuleEngine {
public:
    RuleEngine();
    ~RuleEngine();

    RuleEngine(const RuleEngine&) = delete;
    RuleEngine& operator=(const RuleEngine&) = delete;
    RuleEngine(RuleEngine&&) noexcept;
    RuleEngine& operator=(RuleEngine&&) noexcept;

    // ==========================================================================
    // Configuration
    // ==========================================================================

    void setCustomRules(std::vector<std::unique_ptr<FormatRule>> rules);
    void addCustomRule(std::unique_ptr<FormatRule> rule);
    void clearCustomRules() noexcept { customRules_.clear(); }

    // Rule names in evaluation order, without the fallback.
    std::vector<std::string> ruleNames() const;

    // ==========================================================================
    // Evaluation
    // ==========================================================================

    FormatOutcome apply(const FormatContext& ctx) const;

    delta::Delta format(
        const delta::Delta& document,
        std::uint32_t index,
        std::uint32_t length,
        const document::Attribute& attribute,
        std::optional<std::string> data = std::nullopt
    ) const;

    static delta::Delta fallback(const FormatContext& ctx);

private:
    std::vector<std::unique_ptr<FormatRule>> customRules_;
    std::vector<std::unique_ptr<FormatRule>> standardRules_;
};

} // namespace richdoc::rules

#endif // RICHDOC_RULES_RULE_ENGINE_H
