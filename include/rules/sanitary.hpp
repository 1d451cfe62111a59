#ifndef ZONEFIND_SANITARY_HPP
#define ZONEFIND_SANITARY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rules/rule_status.hpp"

namespace zonefind {
namespace rules {

// Fixture types, as keyed in the sanitary profiles
extern const std::vector<std::string> SANITARY_FIXTURE_KEYS;

// How a band defines the count of one fixture type
struct FixtureSpec {
    std::optional<int> count;       // Fixed count
    std::optional<double> divisor;  // ceil(area / divisor)
    std::string formula;            // Formula text as registered
};

// Area band within a fixture group
struct SanitaryBand {
    double min_m2;
    std::optional<double> max_m2;   // nullopt = open-ended
    std::map<std::string, FixtureSpec> fixtures;
    std::string note;

    SanitaryBand() : min_m2(0.0) {}

    bool contains(double area_m2) const {
        return area_m2 >= min_m2 && (!max_m2 || area_m2 <= max_m2.value());
    }
};

// Group of bands (e.g. staff and public)
struct SanitaryGroup {
    std::string name;
    std::vector<SanitaryBand> bands;
};

// Fixture profile for a use type
struct SanitaryProfile {
    std::string code;
    std::string title;
    std::string source_ref;
    std::vector<SanitaryGroup> groups;

    /**
     * Parse a profile document
     * @param rule_json Object with groups[] of {group, bands[]}
     * @return Profile, or nullopt if the document is not an object
     */
    static std::optional<SanitaryProfile> fromJson(const nlohmann::json& rule_json);
};

// Counts chosen for one group
struct SanitaryGroupResult {
    std::string group;
    std::map<std::string, std::optional<int>> fixtures;    // nullopt = not determinable
    std::string note;
};

// Fixture counts for a usable area
struct SanitaryResult {
    RuleStatus status;
    double usable_area_m2;
    std::vector<SanitaryGroupResult> groups;
    std::map<std::string, int> totals;
    std::vector<std::string> notes;

    SanitaryResult() : status(RuleStatus::NO_RULE), usable_area_m2(0.0) {}
};

/**
 * Extract the divisor of a formula such as "1/300,00m² ou fração"
 * ("." is a thousands separator, "," the decimal mark)
 * @param formula Formula text
 * @return Divisor, or nullopt if the text does not match "1 / <number> m"
 */
std::optional<double> parseFormulaDivisor(const std::string& formula);

/**
 * Compute fixture counts for every group with a band matching the area
 * @param profile Profile for the use, nullopt when none exists
 * @param usable_area_m2 Usable floor area
 * @return Per-group counts and totals
 */
SanitaryResult computeSanitary(const std::optional<SanitaryProfile>& profile, double usable_area_m2);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_SANITARY_HPP
