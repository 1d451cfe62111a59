#ifndef ZONEFIND_RULE_STATUS_HPP
#define ZONEFIND_RULE_STATUS_HPP

#include <string>

namespace zonefind {
namespace rules {

// Outcome of a rule computation
enum class RuleStatus {
    COMPUTED,           // A value was derived from the rule record
    WAIVED,             // A waiver applies; the value is zero by rule
    NO_RULE,            // No record exists for this zone/use
    INSUFFICIENT_DATA   // A record exists but cannot be evaluated with these inputs
};

std::string ruleStatusToString(RuleStatus status);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_RULE_STATUS_HPP
