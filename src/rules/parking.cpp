#include "rules/parking.hpp"
#include "geo/common.hpp"
#include <algorithm>
#include <cmath>
#include <regex>
#include <stdexcept>

namespace zonefind {
namespace rules {

const char* const USABLE_AREA_METRIC = "area_util_m2";

namespace {

// Input used as the unit quantity of per-unit rules
const char* const UNIT_COUNT_INPUT = "apartamentos";

const double TRANSIT_FACTOR = 0.8;
const double WAIVER_MAX_AREA_M2 = 100.0;

std::vector<std::string> splitOn(const std::string& text, const std::regex& separator) {
    std::vector<std::string> parts;
    std::sregex_token_iterator it(text.begin(), text.end(), separator, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        parts.push_back(it->str());
    }
    return parts;
}

std::optional<bool> evaluateComparison(const std::string& text, const ParkingInputs& inputs) {
    static const std::regex comparison(
        R"(^\s*([A-Za-z_][A-Za-z0-9_]*)\s*(<=|>=|==|!=|<|>)\s*(-?[0-9]+(?:\.[0-9]+)?)\s*$)");
    std::smatch match;
    if (!std::regex_match(text, match, comparison)) {
        return std::nullopt;
    }

    double lhs = inputs.get(match[1].str());
    double rhs = 0.0;
    try {
        rhs = std::stod(match[3].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
    const std::string op = match[2].str();

    if (op == "<") return lhs < rhs;
    if (op == "<=") return lhs <= rhs;
    if (op == ">") return lhs > rhs;
    if (op == ">=") return lhs >= rhs;
    if (op == "==") return lhs == rhs;
    return lhs != rhs;
}

// Empty when the divisor is missing or not positive
std::optional<double> ratioOf(double quantity, const std::optional<double>& per) {
    if (!per || !(per.value() > 0.0)) {
        return std::nullopt;
    }
    return quantity / per.value();
}

std::optional<AreaBand> parseBand(const nlohmann::json& band_json) {
    if (!band_json.is_object()) {
        return std::nullopt;
    }
    AreaBand band;
    band.min_m2 = geo::getFieldValueAsDouble(band_json, "min_m2").value_or(0.0);
    band.max_m2 = geo::getFieldValueAsDouble(band_json, "max_m2");
    band.per_m2 = geo::getFieldValueAsDouble(band_json, "per_m2");
    band.text = geo::getFieldValueAsString(band_json, "text");
    return band;
}

std::string malformed(size_t index, const std::string& type, const std::string& field) {
    return "Rule " + std::to_string(index + 1) + " (" + type + ") has no valid '" + field + "'; skipped";
}

} // namespace

double ParkingInputs::get(const std::string& name) const {
    if (name == USABLE_AREA_METRIC) {
        return usable_area_m2;
    }
    auto it = quantities.find(name);
    return it != quantities.end() ? it->second : 0.0;
}

std::optional<ParkingRuleSet> ParkingRuleSet::fromJson(const nlohmann::json& rule_json) {
    if (!rule_json.is_object()) {
        return std::nullopt;
    }

    ParkingRuleSet rule_set;
    rule_set.use_code = geo::getFieldValueAsString(rule_json, "use_code");
    rule_set.base_metric = geo::getFieldValueAsString(rule_json, "base_metric");
    rule_set.source_ref = geo::getFieldValueAsString(rule_json, "source_ref");

    if (rule_json.contains("cargo_loading") && rule_json["cargo_loading"].is_object()) {
        rule_set.cargo_loading_text = geo::getFieldValueAsString(rule_json["cargo_loading"], "text");
    }
    if (rule_json.contains("general_notes") && rule_json["general_notes"].is_array()) {
        for (const auto& note : rule_json["general_notes"]) {
            std::string text = geo::scalarToString(note);
            if (!text.empty()) {
                rule_set.general_notes.push_back(text);
            }
        }
    }

    if (rule_json.contains("rules") && rule_json["rules"].is_array()) {
        for (const auto& rule_entry : rule_json["rules"]) {
            if (!rule_entry.is_object()) {
                continue;
            }
            ParkingRule rule;
            rule.type = geo::getFieldValueAsString(rule_entry, "type");
            rule.text = geo::getFieldValueAsString(rule_entry, "text");
            rule.value = geo::getFieldValueAsDouble(rule_entry, "value");
            rule.per_m2 = geo::getFieldValueAsDouble(rule_entry, "per_m2");
            rule.per_units = geo::getFieldValueAsDouble(rule_entry, "per_units");
            rule.per_unit = geo::getFieldValueAsDouble(rule_entry, "per_unit");
            rule.min_m2 = geo::getFieldValueAsDouble(rule_entry, "min_m2");
            rule.max_m2 = geo::getFieldValueAsDouble(rule_entry, "max_m2");
            rule.count = geo::getFieldValueAsDouble(rule_entry, "count");
            rule.condition = geo::getFieldValueAsString(rule_entry, "condition");
            if (rule_entry.contains("bands") && rule_entry["bands"].is_array()) {
                for (const auto& band_json : rule_entry["bands"]) {
                    auto band = parseBand(band_json);
                    if (band) {
                        rule.bands.push_back(band.value());
                    }
                }
            }
            rule_set.rules.push_back(rule);
        }
    }

    return rule_set;
}

int roundParkingRequirement(double raw) {
    if (!(raw > 0.0)) {
        return 0;
    }
    // Truncate to tenths; the epsilon keeps 2.5 stored as 2.4999... at 25
    long long tenths = static_cast<long long>(std::floor(raw * 10.0 + 1e-9));
    return static_cast<int>(tenths / 10 + (tenths % 10 >= 5 ? 1 : 0));
}

std::optional<bool> evaluateCondition(const std::string& condition, const ParkingInputs& inputs) {
    static const std::regex or_separator(R"(\s+or\s+)");
    static const std::regex and_separator(R"(\s+and\s+)");

    if (condition.find_first_not_of(" \t") == std::string::npos) {
        return true;
    }

    bool any = false;
    for (const auto& disjunct : splitOn(condition, or_separator)) {
        bool all = true;
        for (const auto& term : splitOn(disjunct, and_separator)) {
            auto value = evaluateComparison(term, inputs);
            if (!value) {
                return std::nullopt;
            }
            all = all && value.value();
        }
        any = any || all;
    }
    return any;
}

ParkingResult computeParking(const std::optional<ParkingRuleSet>& rule_set, const ParkingInputs& inputs) {
    ParkingResult result;
    if (!rule_set) {
        result.status = RuleStatus::NO_RULE;
        result.notes.push_back("No parking rule registered for this use");
        return result;
    }

    const ParkingRuleSet& rules = rule_set.value();
    result.use_code = rules.use_code;
    result.base_metric = rules.base_metric;
    result.cargo_loading_text = rules.cargo_loading_text;
    result.general_notes = rules.general_notes;

    const bool area_based = rules.base_metric == USABLE_AREA_METRIC;
    const double area = inputs.usable_area_m2;

    // Small non-residential premises on local streets are exempt
    if (inputs.local_street && area_based && area > 0.0 && area <= WAIVER_MAX_AREA_M2 &&
        !isResidentialUse(UseType(rules.use_code))) {
        result.status = RuleStatus::WAIVED;
        result.raw = 0.0;
        result.required = 0;
        result.applied_rule_text = "Waiver: non-residential use up to 100 m2 on a local street";
        return result;
    }

    std::optional<double> raw;
    std::string applied_text;

    for (size_t i = 0; i < rules.rules.size() && !raw; ++i) {
        const ParkingRule& rule = rules.rules[i];

        if (rule.type == "fixed") {
            if (!rule.value) {
                result.notes.push_back(malformed(i, rule.type, "value"));
                continue;
            }
            raw = rule.value;
            applied_text = rule.text;

        } else if (rule.type == "ratio") {
            if (area_based) {
                raw = ratioOf(area, rule.per_m2);
                if (!raw) {
                    result.notes.push_back(malformed(i, rule.type, "per_m2"));
                    continue;
                }
            } else {
                raw = ratioOf(inputs.get(rules.base_metric), rule.per_units);
                if (!raw) {
                    result.notes.push_back(malformed(i, rule.type, "per_units"));
                    continue;
                }
            }
            applied_text = rule.text;

        } else if (rule.type == "band_ratio") {
            if (!area_based) {
                continue;
            }
            for (const auto& band : rule.bands) {
                if (!band.contains(area)) {
                    continue;
                }
                raw = ratioOf(area, band.per_m2);
                if (!raw) {
                    result.notes.push_back(malformed(i, rule.type, "per_m2"));
                } else {
                    applied_text = band.text;
                }
                break;
            }

        } else if (rule.type == "threshold_fixed" || rule.type == "fixed_or_band") {
            if (!area_based) {
                continue;
            }
            if (!rule.max_m2) {
                result.notes.push_back("Rule " + std::to_string(i + 1) + " (" + rule.type +
                                       ") is textual only and needs a computable max_m2");
                continue;
            }
            if (area <= rule.max_m2.value()) {
                if (!rule.count) {
                    result.notes.push_back(malformed(i, rule.type, "count"));
                    continue;
                }
                raw = rule.count;
                applied_text = rule.text;
            }

        } else if (rule.type == "ratio_above_threshold") {
            if (!area_based) {
                continue;
            }
            if (!rule.min_m2) {
                result.notes.push_back(malformed(i, rule.type, "min_m2"));
                continue;
            }
            if (area >= rule.min_m2.value()) {
                raw = ratioOf(area, rule.per_m2);
                if (!raw) {
                    result.notes.push_back(malformed(i, rule.type, "per_m2"));
                    continue;
                }
                applied_text = rule.text;
            }

        } else if (rule.type == "per_unit" || rule.type == "per_unit_with_condition") {
            auto matches = evaluateCondition(rule.condition, inputs);
            if (!matches) {
                result.notes.push_back("Rule " + std::to_string(i + 1) + " (" + rule.type +
                                       ") has an unreadable condition '" + rule.condition + "'; skipped");
                continue;
            }
            if (matches.value()) {
                std::optional<double> per_unit = rule.value ? rule.value : rule.per_unit;
                if (!per_unit) {
                    result.notes.push_back(malformed(i, rule.type, "value"));
                    continue;
                }
                raw = inputs.get(UNIT_COUNT_INPUT) * per_unit.value();
                applied_text = rule.text;
            }

        } else {
            result.notes.push_back("Rule " + std::to_string(i + 1) + " has unknown type '" + rule.type + "'; skipped");
        }
    }

    if (!raw) {
        result.status = RuleStatus::INSUFFICIENT_DATA;
        result.notes.push_back("Not enough data to compute automatically");
        return result;
    }

    result.status = RuleStatus::COMPUTED;
    result.raw = raw;
    result.applied_rule_text = applied_text;

    int required = roundParkingRequirement(raw.value());

    if (inputs.near_transit && required > 0) {
        int reduced = static_cast<int>(std::ceil(required * TRANSIT_FACTOR - 1e-9));
        result.adjustments.push_back(ParkingAdjustment{"transit_20pct", required, reduced});
        required = reduced;
    }

    result.required = required;
    return result;
}

std::optional<LegacyParkingRule> LegacyParkingRule::fromJson(const nlohmann::json& row) {
    if (!row.is_object()) {
        return std::nullopt;
    }

    LegacyParkingRule rule;
    rule.use_code = geo::getFieldValueAsString(row, "use_type_code");
    rule.metric = geo::getFieldValueAsString(row, "metric");
    rule.value = geo::getFieldValueAsDouble(row, "value");
    rule.min_stalls = geo::getFieldValueAsDouble(row, "min_vagas");
    rule.source_ref = geo::getFieldValueAsString(row, "source_ref");
    if (row.contains("rule_json") && row["rule_json"].is_object()) {
        rule.rule_json = row["rule_json"];
    }
    return rule;
}

LegacyParkingResult computeLegacyParking(const std::optional<LegacyParkingRule>& rule, const UseType& use,
                                         double lot_area_m2, const std::optional<int>& unit_count,
                                         const std::optional<double>& unit_area_m2) {
    LegacyParkingResult result;

    if (isSingleFamilyUse(use)) {
        result.status = RuleStatus::WAIVED;
        result.stalls = 0;
        result.text = "Single-family housing: no minimum parking requirement";
        return result;
    }

    if (!rule) {
        result.status = RuleStatus::NO_RULE;
        result.notes.push_back("No parking rule registered for this use");
        return result;
    }

    const int min_stalls = static_cast<int>(rule->min_stalls.value_or(0.0));

    if (rule->metric == "fixed") {
        if (rule->value) {
            result.stalls = static_cast<int>(rule->value.value());
        }
    } else if (rule->metric == "per_unit") {
        if (rule->value) {
            result.stalls = std::max(static_cast<int>(rule->value.value()), min_stalls);
        }
    } else if (rule->metric == "per_area") {
        if (rule->value) {
            result.stalls = static_cast<int>(std::floor(lot_area_m2 * rule->value.value()));
            if (rule->min_stalls) {
                result.stalls = std::max(result.stalls.value(), min_stalls);
            }
        }
    } else if (rule->metric == "json_rule") {
        const nlohmann::json& rule_json = rule->rule_json;
        if (geo::getFieldValueAsString(rule_json, "type") == "per_unit_by_unit_area") {
            result.text = geo::getFieldValueAsString(rule_json, "display_text");

            auto moto_share = geo::getFieldValueAsDouble(rule_json, "moto_percent_max");
            if (moto_share) {
                result.motorcycle_text = "Up to " + std::to_string(static_cast<int>(std::lround(moto_share.value() * 100.0))) +
                                         "% of the stalls may be for motorcycles";
            }

            double threshold = geo::getFieldValueAsDouble(rule_json, "threshold_unit_area_m2").value_or(90.0);
            double rate_below = geo::getFieldValueAsDouble(rule_json, "rate_below").value_or(1.0);
            double rate_at_or_above = geo::getFieldValueAsDouble(rule_json, "rate_at_or_above").value_or(1.5);
            std::string rounding = geo::getFieldValueAsString(rule_json, "rounding", "ceil");

            if (unit_count && unit_count.value() > 0 && unit_area_m2 && unit_area_m2.value() > 0.0) {
                double rate = unit_area_m2.value() < threshold ? rate_below : rate_at_or_above;
                double raw = unit_count.value() * rate;
                int stalls = rounding == "ceil" ? static_cast<int>(std::ceil(raw))
                                                : static_cast<int>(std::lround(raw));
                if (rule->min_stalls) {
                    stalls = std::max(stalls, min_stalls);
                }
                result.stalls = stalls;
            } else {
                result.notes.push_back("Unit count and unit area are required for this rule");
            }
        } else {
            result.notes.push_back("Unsupported rule_json type");
        }
    } else {
        result.notes.push_back("Unsupported parking metric '" + rule->metric + "'");
    }

    result.status = result.stalls ? RuleStatus::COMPUTED : RuleStatus::INSUFFICIENT_DATA;
    return result;
}

} // namespace rules
} // namespace zonefind
