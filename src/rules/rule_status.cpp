#include "rules/rule_status.hpp"

namespace zonefind {
namespace rules {

std::string ruleStatusToString(RuleStatus status) {
    switch (status) {
        case RuleStatus::COMPUTED:
            return "computed";
        case RuleStatus::WAIVED:
            return "waived";
        case RuleStatus::NO_RULE:
            return "no_rule";
        case RuleStatus::INSUFFICIENT_DATA:
            return "insufficient_data";
    }
    return "unknown";
}

} // namespace rules
} // namespace zonefind
