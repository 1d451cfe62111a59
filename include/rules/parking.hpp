#ifndef ZONEFIND_PARKING_HPP
#define ZONEFIND_PARKING_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rules/rule_status.hpp"
#include "rules/use_classification.hpp"

namespace zonefind {
namespace rules {

// Base metric meaning "usable floor area in square meters"
extern const char* const USABLE_AREA_METRIC;

// Area range with an optional ratio, used by banded rules
struct AreaBand {
    double min_m2;
    std::optional<double> max_m2;   // nullopt = open-ended
    std::optional<double> per_m2;
    std::string text;

    AreaBand() : min_m2(0.0) {}

    bool contains(double area_m2) const {
        return area_m2 >= min_m2 && (!max_m2 || area_m2 <= max_m2.value());
    }
};

// One entry of a parking rule set, interpreted according to its type tag
struct ParkingRule {
    std::string type;               // fixed, ratio, band_ratio, threshold_fixed, fixed_or_band,
                                    // ratio_above_threshold, per_unit, per_unit_with_condition
    std::string text;
    std::optional<double> value;
    std::optional<double> per_m2;
    std::optional<double> per_units;
    std::optional<double> per_unit;
    std::optional<double> min_m2;
    std::optional<double> max_m2;
    std::optional<double> count;
    std::vector<AreaBand> bands;
    std::string condition;
};

// Parking requirement record for a use type
struct ParkingRuleSet {
    std::string use_code;
    std::string base_metric;        // USABLE_AREA_METRIC or the name of a unit-count input
    std::vector<ParkingRule> rules;
    std::string cargo_loading_text;
    std::vector<std::string> general_notes;
    std::string source_ref;

    /**
     * Parse a parking rule document
     * @param rule_json Object with base_metric, rules[], cargo_loading, general_notes
     * @return Rule set, or nullopt if the document is not an object
     */
    static std::optional<ParkingRuleSet> fromJson(const nlohmann::json& rule_json);
};

// User inputs for parking rules
struct ParkingInputs {
    double usable_area_m2;
    bool near_transit;
    bool local_street;
    std::map<std::string, double> quantities;   // lugares, leitos, unidades_hospedagem, apartamentos, apto_area_m2

    ParkingInputs()
        : usable_area_m2(0.0), near_transit(false), local_street(false) {}

    /**
     * Value of a named input; area_util_m2 maps to the usable area, unknown names are 0
     */
    double get(const std::string& name) const;
};

// Change applied after rounding
struct ParkingAdjustment {
    std::string type;
    int from;
    int to;
};

// Parking requirement
struct ParkingResult {
    RuleStatus status;
    std::string use_code;
    std::string base_metric;
    std::optional<double> raw;
    std::optional<int> required;
    std::string applied_rule_text;
    std::vector<ParkingAdjustment> adjustments;
    std::vector<std::string> notes;
    std::string cargo_loading_text;
    std::vector<std::string> general_notes;

    ParkingResult() : status(RuleStatus::NO_RULE) {}
};

/**
 * Round a raw stall count: a tenths digit of 5 or more rounds up, anything else rounds down.
 * 2.49 -> 2, 2.50 -> 3, 2.51 -> 3. Values <= 0 give 0.
 */
int roundParkingRequirement(double raw);

/**
 * Evaluate a rule condition such as "apto_area_m2 >= 90 and apartamentos > 0".
 * Grammar: comparisons "name op number" (op one of < <= > >= == !=) joined by "and" / "or",
 * "and" binding tighter. An empty condition is true.
 * @param condition Condition text
 * @param inputs Values for the names
 * @return Result, or nullopt if the condition cannot be parsed
 */
std::optional<bool> evaluateCondition(const std::string& condition, const ParkingInputs& inputs);

/**
 * Compute the minimum number of parking stalls
 * @param rule_set Rule set for the use, nullopt when none exists
 * @param inputs Usable area, unit counts and street context
 * @return Requirement with status, applied rule and notes
 */
ParkingResult computeParking(const std::optional<ParkingRuleSet>& rule_set, const ParkingInputs& inputs);

// Older single-metric parking record, used when no rule set exists
struct LegacyParkingRule {
    std::string use_code;
    std::string metric;             // fixed, per_unit, per_area, json_rule
    std::optional<double> value;
    std::optional<double> min_stalls;
    nlohmann::json rule_json;
    std::string source_ref;

    LegacyParkingRule() : rule_json(nlohmann::json::object()) {}

    /**
     * Parse a parking_rules row
     * @param row JSON object with use_type_code, metric, value, min_vagas, rule_json
     * @return Rule, or nullopt if the row is not an object
     */
    static std::optional<LegacyParkingRule> fromJson(const nlohmann::json& row);
};

// Result of the legacy parking computation
struct LegacyParkingResult {
    RuleStatus status;
    std::optional<int> stalls;
    std::string text;
    std::string motorcycle_text;
    std::vector<std::string> notes;

    LegacyParkingResult() : status(RuleStatus::NO_RULE) {}
};

/**
 * Compute stalls with a legacy record
 * @param rule Legacy record, nullopt when none exists
 * @param use Use type (single-family housing owes no stalls)
 * @param lot_area_m2 Lot area
 * @param unit_count Number of dwelling units, if known
 * @param unit_area_m2 Area of each unit, if known
 */
LegacyParkingResult computeLegacyParking(const std::optional<LegacyParkingRule>& rule, const UseType& use,
                                         double lot_area_m2, const std::optional<int>& unit_count,
                                         const std::optional<double>& unit_area_m2);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_PARKING_HPP
