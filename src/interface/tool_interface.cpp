#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "interface/tool_interface.hpp"
#include "geo/common.hpp"
#include "io/result_writer.hpp"
#include "rules/parking.hpp"
#include "rules/sanitary.hpp"
#include "rules/urbanism.hpp"
#include "rules/use_classification.hpp"

using namespace zonefind;

namespace tool_interface {

namespace {

// Unit-count inputs a parking rule may name
const char* const PARKING_QUANTITY_KEYS[] = {
    "lugares", "leitos", "unidades_hospedagem", "apartamentos", "apto_area_m2"};

double requireCoordinate(const nlohmann::json& query_json, const std::string& key) {
    auto value = geo::getFieldValueAsDouble(query_json, key);
    if (!value) {
        throw std::invalid_argument("Query must contain a numeric '" + key + "'");
    }
    return value.value();
}

nlohmann::json parseJsonArgument(const std::string& text, const std::string& name) {
    // An empty string stands for "not configured"
    if (text.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed = nlohmann::json::parse(text);
    if (!parsed.is_object()) {
        throw std::invalid_argument(name + " must be a JSON object");
    }
    return parsed;
}

} // namespace

// Helper function to parse ZoneIndexConfig from JSON
index::ZoneIndexConfig parseZoneIndexConfig(const nlohmann::json& config_json) {
    index::ZoneIndexConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }

    return config;
}

// Helper function to parse StreetIndexConfig from JSON
index::StreetIndexConfig parseStreetIndexConfig(const nlohmann::json& config_json) {
    index::StreetIndexConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }
    if (config_json.contains("projected_epsg")) {
        config.projected_epsg = config_json["projected_epsg"];
    }

    return config;
}

// Helper function to parse ResolverConfig from a query
index::ResolverConfig parseResolverConfig(const nlohmann::json& query_json) {
    index::ResolverConfig config;

    if (query_json.contains("max_street_distance_m")) {
        config.max_street_distance_m = query_json["max_street_distance_m"];
    }
    if (!(config.max_street_distance_m > 0.0)) {
        throw std::invalid_argument("max_street_distance_m must be positive");
    }

    return config;
}

// Helper function to parse RulesConfig from JSON
rules::RulesConfig parseRulesConfig(const nlohmann::json& config_json) {
    rules::RulesConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }

    return config;
}

rules::UrbanismInput parseUrbanismInput(const nlohmann::json& query_json) {
    rules::UrbanismInput input;

    input.use = rules::UseType(geo::getFieldValueAsString(query_json, "use_code"),
                               geo::getFieldValueAsString(query_json, "use_label"),
                               geo::getFieldValueAsString(query_json, "use_category"));
    input.frontage_m = geo::getFieldValueAsDouble(query_json, "frontage_m").value_or(0.0);
    input.depth_m = geo::getFieldValueAsDouble(query_json, "depth_m").value_or(0.0);
    input.is_corner = geo::getFieldValueAsBool(query_json, "is_corner");
    input.corner_has_two_frontages = geo::getFieldValueAsBool(query_json, "corner_has_two_frontages");
    input.attach_one_side = geo::getFieldValueAsBool(query_json, "attach_one_side");

    return input;
}

rules::ParkingInputs parseParkingInputs(const nlohmann::json& query_json) {
    rules::ParkingInputs inputs;

    inputs.usable_area_m2 = geo::getFieldValueAsDouble(query_json, "usable_area_m2").value_or(0.0);
    inputs.near_transit = geo::getFieldValueAsBool(query_json, "near_transit");
    inputs.local_street = geo::getFieldValueAsBool(query_json, "local_street");

    for (const char* key : PARKING_QUANTITY_KEYS) {
        auto value = geo::getFieldValueAsDouble(query_json, key);
        if (value) {
            inputs.quantities[key] = value.value();
        }
    }

    // English aliases used by the command line
    auto apartments = geo::getFieldValueAsDouble(query_json, "apartments");
    if (apartments) {
        inputs.quantities["apartamentos"] = apartments.value();
    }
    auto apartment_area = geo::getFieldValueAsDouble(query_json, "apartment_area_m2");
    if (apartment_area) {
        inputs.quantities["apto_area_m2"] = apartment_area.value();
    }

    return inputs;
}

nlohmann::json processViability(const index::LocationResolver& resolver,
                                const rules::RuleRepository& repository,
                                const nlohmann::json& query_json) {
    double latitude = requireCoordinate(query_json, "lat");
    double longitude = requireCoordinate(query_json, "lon");

    index::LocationResult location = resolver.resolve(latitude, longitude);

    rules::UrbanismInput urbanism_input = parseUrbanismInput(query_json);
    urbanism_input.zone_code = location.zone_code;
    const rules::UseType& use = urbanism_input.use;

    auto record = repository.getZoneRule(location.zone_code, use.code);
    rules::UrbanismResult urbanism = rules::computeUrbanism(urbanism_input, record);

    rules::ParkingInputs parking_inputs = parseParkingInputs(query_json);
    if (!query_json.contains("local_street")) {
        parking_inputs.local_street = location.street_found &&
                                      rules::isLocalStreetClass(location.street_class);
    }

    nlohmann::json output;
    output["location"] = io::ResultWriter::toJson(location);
    output["urbanism"] = io::ResultWriter::toJson(urbanism);

    // Residential studies carry a simulation that also supplies the usable area
    double effective_usable_area = parking_inputs.usable_area_m2;
    output["simulation"] = nullptr;
    if (rules::isResidentialUse(use)) {
        double desired_total = geo::getFieldValueAsDouble(query_json, "desired_total_area_m2").value_or(0.0);
        int desired_floors = static_cast<int>(
            geo::getFieldValueAsDouble(query_json, "desired_floors").value_or(0.0));
        rules::ViabilitySimulation simulation =
            rules::simulateViability(urbanism, desired_total, desired_floors, parking_inputs.usable_area_m2);
        if (simulation.usable_area_m2 > 0.0) {
            effective_usable_area = simulation.usable_area_m2;
        }
        output["simulation"] = io::ResultWriter::toJson(simulation);
    }
    parking_inputs.usable_area_m2 = effective_usable_area;
    output["effective_usable_area_m2"] = effective_usable_area;
    output["local_street"] = parking_inputs.local_street;

    auto parking_rule = repository.getParkingRule(use.code);
    output["parking"] = nullptr;
    output["legacy_parking"] = nullptr;
    if (parking_rule) {
        output["parking"] = io::ResultWriter::toJson(rules::computeParking(parking_rule, parking_inputs));
        output["parking"]["source_ref"] = parking_rule->source_ref;
    } else {
        std::optional<int> unit_count;
        std::optional<double> unit_area;
        double apartments = parking_inputs.get("apartamentos");
        double apartment_area = parking_inputs.get("apto_area_m2");
        if (apartments > 0.0) {
            unit_count = static_cast<int>(apartments);
        }
        if (apartment_area > 0.0) {
            unit_area = apartment_area;
        }
        auto legacy_rule = repository.getLegacyParkingRule(use.code);
        output["legacy_parking"] = io::ResultWriter::toJson(
            rules::computeLegacyParking(legacy_rule, use, urbanism.lot_area_m2, unit_count, unit_area));
    }

    auto sanitary_profile = repository.getSanitaryProfile(use.code);
    output["sanitary"] = io::ResultWriter::toJson(rules::computeSanitary(sanitary_profile, effective_usable_area));
    if (sanitary_profile) {
        output["sanitary"]["profile"] = sanitary_profile->code;
        output["sanitary"]["title"] = sanitary_profile->title;
        output["sanitary"]["source_ref"] = sanitary_profile->source_ref;
    }

    return output;
}

// Location Tool
std::string processLocationTool(
    const std::string& zone_config_json,
    const std::string& street_config_json,
    const std::string& query_json) {

    try {
        // Parse configurations
        nlohmann::json zone_config = parseJsonArgument(zone_config_json, "Zone configuration");
        nlohmann::json street_config = parseJsonArgument(street_config_json, "Street configuration");
        nlohmann::json query = parseJsonArgument(query_json, "Query");

        // Create configurations
        index::ZoneIndexConfig zone_cfg = parseZoneIndexConfig(zone_config);
        index::StreetIndexConfig street_cfg = parseStreetIndexConfig(street_config);
        index::ResolverConfig resolver_cfg = parseResolverConfig(query);

        if (zone_cfg.file_path.empty()) {
            return "Error: Zone configuration must contain 'file_path'";
        }

        double latitude = requireCoordinate(query, "lat");
        double longitude = requireCoordinate(query, "lon");

        index::LocationResolver resolver(zone_cfg, street_cfg, resolver_cfg);
        index::LocationResult result = resolver.resolve(latitude, longitude);

        return io::ResultWriter::toJson(result).dump(2);

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Viability Tool
std::string processViabilityTool(
    const std::string& zone_config_json,
    const std::string& street_config_json,
    const std::string& rules_config_json,
    const std::string& query_json) {

    try {
        // Parse configurations
        nlohmann::json zone_config = parseJsonArgument(zone_config_json, "Zone configuration");
        nlohmann::json street_config = parseJsonArgument(street_config_json, "Street configuration");
        nlohmann::json rules_config = parseJsonArgument(rules_config_json, "Rules configuration");
        nlohmann::json query = parseJsonArgument(query_json, "Query");

        // Create configurations
        index::ZoneIndexConfig zone_cfg = parseZoneIndexConfig(zone_config);
        index::StreetIndexConfig street_cfg = parseStreetIndexConfig(street_config);
        index::ResolverConfig resolver_cfg = parseResolverConfig(query);
        rules::RulesConfig rules_cfg = parseRulesConfig(rules_config);

        if (zone_cfg.file_path.empty()) {
            return "Error: Zone configuration must contain 'file_path'";
        }
        if (rules_cfg.file_path.empty()) {
            return "Error: Rules configuration must contain 'file_path'";
        }

        std::unique_ptr<rules::JsonRuleRepository> repository = rules::JsonRuleRepository::fromFile(rules_cfg);
        index::LocationResolver resolver(zone_cfg, street_cfg, resolver_cfg);

        nlohmann::json result = processViability(resolver, *repository, query);
        std::cerr << "Viability study completed for zone '" << result["location"]["zone_code"].get<std::string>()
                  << "'" << std::endl;

        return result.dump(2);

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace tool_interface
