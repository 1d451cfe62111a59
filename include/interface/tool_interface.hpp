#ifndef ZONEFIND_TOOL_INTERFACE_HPP
#define ZONEFIND_TOOL_INTERFACE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "index/location_resolver.hpp"
#include "rules/rule_repository.hpp"

namespace tool_interface {

// Helper functions to build configurations from JSON objects
zonefind::index::ZoneIndexConfig parseZoneIndexConfig(const nlohmann::json& config_json);
zonefind::index::StreetIndexConfig parseStreetIndexConfig(const nlohmann::json& config_json);
zonefind::index::ResolverConfig parseResolverConfig(const nlohmann::json& query_json);
zonefind::rules::RulesConfig parseRulesConfig(const nlohmann::json& config_json);

/**
 * Lot, use and building inputs of a viability query.
 * Keys: use_code, use_label, use_category, frontage_m, depth_m, is_corner,
 * corner_has_two_frontages, attach_one_side, usable_area_m2, desired_total_area_m2,
 * desired_floors, near_transit, local_street, apartments, apartment_area_m2,
 * lugares, leitos, unidades_hospedagem
 */
zonefind::rules::UrbanismInput parseUrbanismInput(const nlohmann::json& query_json);
zonefind::rules::ParkingInputs parseParkingInputs(const nlohmann::json& query_json);

/**
 * Run the full viability study for a location
 * @param resolver Resolver over the zone and street indexes
 * @param repository Source of zone, parking and sanitary rules
 * @param query_json Query with lat, lon and the lot/use inputs
 * @return Document with location, urbanism, simulation, parking and sanitary sections
 * @throws std::invalid_argument if lat/lon are missing or out of range
 */
nlohmann::json processViability(const zonefind::index::LocationResolver& resolver,
                                const zonefind::rules::RuleRepository& repository,
                                const nlohmann::json& query_json);

/**
 * Location Tool
 * Finds the zone containing a point and the nearest street
 * @param zone_config_json JSON string for the zone dataset configuration (file_path)
 * @param street_config_json JSON string for the street dataset configuration (file_path, projected_epsg)
 * @param query_json JSON string with lat, lon and optional max_street_distance_m
 * @return JSON result or an "Error: ..." message
 */
std::string processLocationTool(
    const std::string& zone_config_json,
    const std::string& street_config_json,
    const std::string& query_json
);

/**
 * Viability Tool
 * Resolves the location and evaluates urbanism, parking and sanitary rules for a lot
 * @param zone_config_json JSON string for the zone dataset configuration (file_path)
 * @param street_config_json JSON string for the street dataset configuration (file_path, projected_epsg)
 * @param rules_config_json JSON string for the rules repository configuration (file_path)
 * @param query_json JSON string with lat, lon and the lot/use inputs
 * @return JSON result or an "Error: ..." message
 */
std::string processViabilityTool(
    const std::string& zone_config_json,
    const std::string& street_config_json,
    const std::string& rules_config_json,
    const std::string& query_json
);

} // namespace tool_interface

#endif // ZONEFIND_TOOL_INTERFACE_HPP
