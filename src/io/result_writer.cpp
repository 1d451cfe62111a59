#include "io/result_writer.hpp"
#include <fstream>

namespace zonefind {
namespace io {

std::string ResultWriter::last_error_ = "";

namespace {

// Empty optionals are written as null
template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return value.value();
}

nlohmann::json stringsToJson(const std::vector<std::string>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array;
}

nlohmann::json recordToJson(const rules::RegulatoryRecord& record) {
    nlohmann::json json;
    json["zone_code"] = record.zone_code;
    json["use_code"] = record.use_code;
    json["max_occupancy_ratio"] = optionalToJson(record.max_occupancy_ratio);
    json["min_permeability_ratio"] = optionalToJson(record.min_permeability_ratio);
    json["min_floor_area_ratio"] = optionalToJson(record.min_floor_area_ratio);
    json["max_floor_area_ratio"] = optionalToJson(record.max_floor_area_ratio);
    json["max_basement_occupancy_ratio"] = optionalToJson(record.max_basement_occupancy_ratio);
    json["front_setback_m"] = optionalToJson(record.front_setback_m);
    json["side_setback_m"] = optionalToJson(record.side_setback_m);
    json["rear_setback_m"] = optionalToJson(record.rear_setback_m);
    json["height_limit_m"] = optionalToJson(record.height_limit_m);
    json["floor_limit"] = optionalToJson(record.floor_limit);
    json["min_lot_area_m2"] = optionalToJson(record.min_lot_area_m2);
    json["max_lot_area_m2"] = optionalToJson(record.max_lot_area_m2);
    json["min_frontage_mid_block_m"] = optionalToJson(record.min_frontage_mid_block_m);
    json["min_frontage_corner_m"] = optionalToJson(record.min_frontage_corner_m);
    json["max_frontage_m"] = optionalToJson(record.max_frontage_m);
    json["allow_attach_one_side"] = record.allow_attach_one_side;
    json["requires_subzone"] = record.requires_subzone;
    json["subzone_code"] = record.subzone_code;
    json["special_area_tag"] = record.special_area_tag;
    json["notes"] = record.notes;
    json["observations"] = record.observations;
    json["source_ref"] = record.source_ref;
    return json;
}

} // namespace

nlohmann::json ResultWriter::toJson(const index::LocationResult& result) {
    nlohmann::json json;
    json["zone_found"] = result.zone_found;
    json["zone_code"] = result.zone_code;
    json["zone_name"] = result.zone_name;
    json["street_found"] = result.street_found;
    json["street_name"] = result.street_name;
    json["street_class"] = result.street_class;
    json["street_distance_m"] = optionalToJson(result.street_distance_m);
    json["raw_zone_props"] = result.raw_zone_props;
    json["raw_street_props"] = result.raw_street_props;
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::EnvelopeResult& envelope) {
    nlohmann::json json;
    json["usable_width_m"] = envelope.usable_width_m;
    json["usable_depth_m"] = envelope.usable_depth_m;
    json["interior_area_m2"] = envelope.interior_area_m2;
    json["lot_regime"] = rules::lotRegimeToString(envelope.lot_regime);
    json["setback_regime"] = rules::setbackRegimeToString(envelope.setback_regime);
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::FootprintLimit& footprint) {
    nlohmann::json json;
    json["max_footprint_m2"] = optionalToJson(footprint.max_footprint_m2);
    json["occupancy_limit_m2"] = optionalToJson(footprint.occupancy_limit_m2);
    json["envelope_limit_m2"] = optionalToJson(footprint.envelope_limit_m2);
    json["binding"] = rules::bindingConstraintToString(footprint.binding);
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::UrbanismResult& result) {
    nlohmann::json json;
    json["status"] = rules::ruleStatusToString(result.status);
    json["reasons"] = stringsToJson(result.reasons);
    json["zone_code"] = result.zone_code;
    json["use_code"] = result.use.code;
    json["use_label"] = result.use.label;
    json["frontage_m"] = result.frontage_m;
    json["depth_m"] = result.depth_m;
    json["lot_area_m2"] = result.lot_area_m2;
    json["attach_one_side_applied"] = result.attach_one_side_applied;
    json["record"] = result.record ? recordToJson(result.record.value()) : nlohmann::json(nullptr);
    json["max_occupancy_area_m2"] = optionalToJson(result.max_occupancy_area_m2);
    json["min_permeable_area_m2"] = optionalToJson(result.min_permeable_area_m2);
    json["max_total_floor_area_m2"] = optionalToJson(result.max_total_floor_area_m2);
    json["max_basement_area_m2"] = optionalToJson(result.max_basement_area_m2);
    json["envelope"] = result.envelope ? toJson(result.envelope.value()) : nlohmann::json(nullptr);
    json["footprint"] = toJson(result.footprint);
    json["estimated_floors"] = optionalToJson(result.estimated_floors);

    json["lot_conformity"]["conforming"] = result.lot_conformity.conforming;
    json["lot_conformity"]["reasons"] = stringsToJson(result.lot_conformity.reasons);

    nlohmann::json options = nlohmann::json::array();
    for (const auto& option : result.implantation_options) {
        nlohmann::json option_json;
        option_json["name"] = option.name;
        option_json["legal_basis"] = option.legal_basis;
        option_json["front_setback_m"] = option.front_setback_m;
        option_json["side_setback_m"] = option.side_setback_m;
        option_json["rear_setback_m"] = option.rear_setback_m;
        option_json["envelope"] = toJson(option.envelope);
        option_json["max_ground_floor_m2"] = option.max_ground_floor_m2;
        option_json["binding"] = rules::bindingConstraintToString(option.binding);
        if (!option.observation.empty()) {
            option_json["observation"] = option.observation;
        }
        options.push_back(option_json);
    }
    json["implantation_options"] = options;
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::ViabilitySimulation& simulation) {
    nlohmann::json json;
    json["mode"] = rules::simulationModeToString(simulation.mode);
    json["floors_used"] = simulation.floors_used;
    json["total_area_m2"] = simulation.total_area_m2;
    json["footprint_m2"] = simulation.footprint_m2;
    json["usable_area_m2"] = simulation.usable_area_m2;
    json["usable_area_given"] = simulation.usable_area_given;
    json["real_occupancy_ratio"] = optionalToJson(simulation.real_occupancy_ratio);
    json["project_occupancy_ratio"] = optionalToJson(simulation.project_occupancy_ratio);
    json["checks"]["has_occupancy_check"] = simulation.has_occupancy_check;
    json["checks"]["has_floor_area_check"] = simulation.has_floor_area_check;
    json["checks"]["has_permeability_check"] = simulation.has_permeability_check;
    json["checks"]["occupancy_ok"] = optionalToJson(simulation.occupancy_ok);
    json["checks"]["floor_area_ok"] = optionalToJson(simulation.floor_area_ok);
    json["viable"] = simulation.viable;
    json["reasons"] = stringsToJson(simulation.reasons);
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::ParkingResult& result) {
    nlohmann::json json;
    json["status"] = rules::ruleStatusToString(result.status);
    json["use_code"] = result.use_code;
    json["base_metric"] = result.base_metric;
    json["raw"] = optionalToJson(result.raw);
    json["required"] = optionalToJson(result.required);
    json["applied_rule_text"] = result.applied_rule_text;

    nlohmann::json adjustments = nlohmann::json::array();
    for (const auto& adjustment : result.adjustments) {
        adjustments.push_back({{"type", adjustment.type}, {"from", adjustment.from}, {"to", adjustment.to}});
    }
    json["adjustments"] = adjustments;
    json["notes"] = stringsToJson(result.notes);
    json["cargo_loading_text"] = result.cargo_loading_text;
    json["general_notes"] = stringsToJson(result.general_notes);
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::LegacyParkingResult& result) {
    nlohmann::json json;
    json["status"] = rules::ruleStatusToString(result.status);
    json["stalls"] = optionalToJson(result.stalls);
    json["text"] = result.text;
    json["motorcycle_text"] = result.motorcycle_text;
    json["notes"] = stringsToJson(result.notes);
    return json;
}

nlohmann::json ResultWriter::toJson(const rules::SanitaryResult& result) {
    nlohmann::json json;
    json["status"] = rules::ruleStatusToString(result.status);
    json["usable_area_m2"] = result.usable_area_m2;

    nlohmann::json groups = nlohmann::json::array();
    for (const auto& group : result.groups) {
        nlohmann::json group_json;
        group_json["group"] = group.group;
        for (const auto& fixture : group.fixtures) {
            group_json["fixtures"][fixture.first] = optionalToJson(fixture.second);
        }
        if (!group.note.empty()) {
            group_json["note"] = group.note;
        }
        groups.push_back(group_json);
    }
    json["groups"] = groups;

    json["totals"] = nlohmann::json::object();
    for (const auto& total : result.totals) {
        json["totals"][total.first] = total.second;
    }
    json["notes"] = stringsToJson(result.notes);
    return json;
}

bool ResultWriter::writeToFile(const nlohmann::json& document, const std::string& filepath) {
    try {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        file << document.dump(2); // Pretty print with 2-space indentation
        file.close();

        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + filepath + ": " + e.what());
        return false;
    }
}

} // namespace io
} // namespace zonefind
