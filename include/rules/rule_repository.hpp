#ifndef ZONEFIND_RULE_REPOSITORY_HPP
#define ZONEFIND_RULE_REPOSITORY_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "rules/parking.hpp"
#include "rules/sanitary.hpp"
#include "rules/urbanism.hpp"

namespace zonefind {
namespace rules {

// Rules repository configuration
struct RulesConfig {
    std::string file_path;          // JSON document with the rule tables
};

/**
 * Source of regulatory, parking and sanitary records.
 * Every lookup returns nullopt when the record does not exist.
 */
class RuleRepository {
public:
    virtual ~RuleRepository() = default;

    virtual std::optional<RegulatoryRecord> getZoneRule(const std::string& zone_code,
                                                        const std::string& use_code) const = 0;
    virtual std::optional<ParkingRuleSet> getParkingRule(const std::string& use_code) const = 0;
    virtual std::optional<LegacyParkingRule> getLegacyParkingRule(const std::string& use_code) const = 0;
    virtual std::optional<SanitaryProfile> getSanitaryProfile(const std::string& use_code) const = 0;
};

/**
 * Repository backed by a JSON export of the rule tables:
 * zone_rules, parking_rules_v2, parking_rules, use_sanitary_profile, sanitary_profiles.
 * Each table is an array of row objects with the database column names.
 */
class JsonRuleRepository : public RuleRepository {
public:
    /**
     * @param document Object holding the table arrays (missing tables are empty)
     */
    explicit JsonRuleRepository(const nlohmann::json& document);

    /**
     * Load the tables from a file
     * @param config Rules configuration
     * @return Repository
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static std::unique_ptr<JsonRuleRepository> fromFile(const RulesConfig& config);

    std::optional<RegulatoryRecord> getZoneRule(const std::string& zone_code,
                                                const std::string& use_code) const override;
    std::optional<ParkingRuleSet> getParkingRule(const std::string& use_code) const override;
    std::optional<LegacyParkingRule> getLegacyParkingRule(const std::string& use_code) const override;
    std::optional<SanitaryProfile> getSanitaryProfile(const std::string& use_code) const override;

private:
    nlohmann::json document_;

    /**
     * Find the first row of a table whose columns equal the given values
     * @return Row, or nullptr if none matches
     */
    const nlohmann::json* findRow(const std::string& table,
                                  const std::vector<std::pair<std::string, std::string>>& match) const;
};

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_RULE_REPOSITORY_HPP
