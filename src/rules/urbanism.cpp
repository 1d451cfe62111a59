#include "rules/urbanism.hpp"
#include "geo/common.hpp"
#include <algorithm>
#include <cmath>

namespace zonefind {
namespace rules {

namespace {

std::optional<double> ratioArea(const std::optional<double>& ratio, double lot_area_m2) {
    if (!ratio) {
        return std::nullopt;
    }
    return ratio.value() * lot_area_m2;
}

LotConformity checkLotConformity(const UrbanismInput& input, double lot_area_m2, const RegulatoryRecord& record) {
    LotConformity conformity;

    if (record.min_lot_area_m2 && lot_area_m2 < record.min_lot_area_m2.value()) {
        conformity.reasons.push_back("Lot area below the minimum for the zone");
    }
    if (record.max_lot_area_m2 && record.max_lot_area_m2.value() > 0.0 &&
        lot_area_m2 > record.max_lot_area_m2.value()) {
        conformity.reasons.push_back("Lot area above the maximum for the zone");
    }

    // Corner lots fall back to the mid-block minimum when no corner value is set
    std::optional<double> min_frontage = record.min_frontage_mid_block_m;
    if (input.is_corner && record.min_frontage_corner_m) {
        min_frontage = record.min_frontage_corner_m;
    }
    if (min_frontage && input.frontage_m < min_frontage.value()) {
        conformity.reasons.push_back(input.is_corner ? "Frontage below the minimum for corner lots"
                                                     : "Frontage below the minimum for mid-block lots");
    }
    if (record.max_frontage_m && record.max_frontage_m.value() > 0.0 &&
        input.frontage_m > record.max_frontage_m.value()) {
        conformity.reasons.push_back("Frontage above the maximum for the zone");
    }

    conformity.conforming = conformity.reasons.empty();
    return conformity;
}

ImplantationOption makeOption(const std::string& name, const std::string& legal_basis,
                              double front, double side, double rear, const EnvelopeResult& envelope,
                              const std::optional<double>& occupancy_limit_m2, BindingConstraint envelope_binding) {
    ImplantationOption option;
    option.name = name;
    option.legal_basis = legal_basis;
    option.front_setback_m = front;
    option.side_setback_m = side;
    option.rear_setback_m = rear;
    option.envelope = envelope;

    if (occupancy_limit_m2 && occupancy_limit_m2.value() <= envelope.interior_area_m2) {
        option.max_ground_floor_m2 = occupancy_limit_m2.value();
        option.binding = BindingConstraint::OCCUPANCY_RATIO;
    } else {
        option.max_ground_floor_m2 = envelope.interior_area_m2;
        option.binding = envelope_binding;
    }
    return option;
}

} // namespace

std::optional<RegulatoryRecord> RegulatoryRecord::fromJson(const nlohmann::json& row) {
    if (!row.is_object()) {
        return std::nullopt;
    }

    RegulatoryRecord record;
    record.zone_code = geo::getFieldValueAsString(row, "zone_sigla");
    record.use_code = geo::getFieldValueAsString(row, "use_type_code");

    record.max_occupancy_ratio = geo::getFieldValueAsDouble(row, "to_max");
    record.min_permeability_ratio = geo::getFieldValueAsDouble(row, "tp_min");
    record.min_floor_area_ratio = geo::getFieldValueAsDouble(row, "ia_min");
    record.max_floor_area_ratio = geo::getFieldValueAsDouble(row, "ia_max");
    record.max_basement_occupancy_ratio = geo::getFieldValueAsDouble(row, "to_sub_max");

    record.front_setback_m = geo::getFieldValueAsDouble(row, "recuo_frontal_m");
    record.side_setback_m = geo::getFieldValueAsDouble(row, "recuo_lateral_m");
    record.rear_setback_m = geo::getFieldValueAsDouble(row, "recuo_fundos_m");

    record.height_limit_m = geo::getFieldValueAsDouble(row, "gabarito_m");
    auto floors = geo::getFieldValueAsDouble(row, "gabarito_pav");
    if (floors) {
        record.floor_limit = static_cast<int>(floors.value());
    }

    record.min_lot_area_m2 = geo::getFieldValueAsDouble(row, "area_min_lote_m2");
    record.max_lot_area_m2 = geo::getFieldValueAsDouble(row, "area_max_lote_m2");
    record.min_frontage_mid_block_m = geo::getFieldValueAsDouble(row, "testada_min_meio_m");
    record.min_frontage_corner_m = geo::getFieldValueAsDouble(row, "testada_min_esquina_m");
    record.max_frontage_m = geo::getFieldValueAsDouble(row, "testada_max_m");

    record.allow_attach_one_side = geo::getFieldValueAsBool(row, "allow_attach_one_side");
    record.requires_subzone = geo::getFieldValueAsBool(row, "requires_subzone");
    record.subzone_code = geo::getFieldValueAsString(row, "subzone_code");
    record.special_area_tag = geo::getFieldValueAsString(row, "special_area_tag");
    record.notes = geo::getFieldValueAsString(row, "notes");
    record.observations = geo::getFieldValueAsString(row, "observacoes");
    record.source_ref = geo::getFieldValueAsString(row, "source_ref");

    return record;
}

std::optional<int> estimateFloors(const std::optional<int>& floor_limit, const std::optional<double>& height_limit_m) {
    if (floor_limit && floor_limit.value() != 0) {
        return floor_limit.value();
    }
    if (!height_limit_m) {
        return std::nullopt;
    }
    int floors = static_cast<int>(std::floor(height_limit_m.value() / 3.0));
    return std::max(floors, 1);
}

UrbanismResult computeUrbanism(const UrbanismInput& input, const std::optional<RegulatoryRecord>& record) {
    UrbanismResult result;
    result.zone_code = input.zone_code;
    result.use = input.use;
    result.frontage_m = input.frontage_m;
    result.depth_m = input.depth_m;
    result.lot_area_m2 = input.frontage_m * input.depth_m;

    if (!record) {
        result.status = RuleStatus::NO_RULE;
        result.reasons.push_back("No regulatory record for zone '" + input.zone_code + "' and use '" +
                                 input.use.code + "'");
        return result;
    }

    const RegulatoryRecord& rule = record.value();
    result.record = rule;
    result.status = RuleStatus::COMPUTED;

    // Multi-family buildings never attach to a side boundary
    result.attach_one_side_applied = input.attach_one_side && rule.allow_attach_one_side &&
                                     !isMultiFamilyUse(input.use);

    result.max_occupancy_area_m2 = ratioArea(rule.max_occupancy_ratio, result.lot_area_m2);
    result.min_permeable_area_m2 = ratioArea(rule.min_permeability_ratio, result.lot_area_m2);
    result.max_total_floor_area_m2 = ratioArea(rule.max_floor_area_ratio, result.lot_area_m2);
    result.max_basement_area_m2 = ratioArea(rule.max_basement_occupancy_ratio, result.lot_area_m2);

    bool setbacks_known = rule.front_setback_m && rule.side_setback_m && rule.rear_setback_m;
    if (setbacks_known) {
        result.envelope = computeEnvelope(input.frontage_m, input.depth_m,
                                          rule.front_setback_m.value(), rule.side_setback_m.value(),
                                          rule.rear_setback_m.value(), input.is_corner,
                                          input.corner_has_two_frontages, result.attach_one_side_applied);
    } else {
        result.reasons.push_back("Setbacks not fully registered; the envelope cannot be computed");
    }

    result.footprint = computeFootprintLimit(result.lot_area_m2, rule.max_occupancy_ratio, result.envelope);
    result.estimated_floors = estimateFloors(rule.floor_limit, rule.height_limit_m);
    result.lot_conformity = checkLotConformity(input, result.lot_area_m2, rule);

    if (setbacks_known && isSingleFamilyUse(input.use)) {
        result.implantation_options.push_back(
            makeOption("Standard zone setbacks", "Zone setbacks",
                       rule.front_setback_m.value(), rule.side_setback_m.value(), rule.rear_setback_m.value(),
                       result.envelope.value(), result.max_occupancy_area_m2, BindingConstraint::SETBACKS));

        EnvelopeResult build_to_line = computeBuildToLineEnvelope(input.frontage_m, input.depth_m,
                                                                  rule.rear_setback_m.value(), input.is_corner,
                                                                  input.corner_has_two_frontages);
        ImplantationOption option =
            makeOption("Build to line (no front or side setbacks)", "LC 90/2023, Art. 112 (single-family)",
                       0.0, 0.0, rule.rear_setback_m.value(), build_to_line, result.max_occupancy_area_m2,
                       BindingConstraint::REAR_SETBACK);
        option.observation = "Front and side setbacks may be zero as long as the zone occupancy and "
                             "permeability ratios are kept.";
        result.implantation_options.push_back(option);
    }

    return result;
}

ViabilitySimulation simulateViability(const UrbanismResult& urbanism, double desired_total_area_m2,
                                      int desired_floors, double usable_area_m2) {
    ViabilitySimulation sim;

    int estimated = urbanism.estimated_floors.value_or(1);
    sim.floors_used = std::max(desired_floors > 0 ? desired_floors : estimated, 1);

    const std::optional<double>& max_total = urbanism.max_total_floor_area_m2;
    const std::optional<double>& max_footprint = urbanism.footprint.max_footprint_m2;

    if (desired_total_area_m2 > 0.0) {
        sim.mode = SimulationMode::PROJECT;
        sim.total_area_m2 = desired_total_area_m2;
    } else {
        sim.mode = SimulationMode::AUTOMATIC_LIMITS;
        std::vector<double> candidates;
        if (max_total && max_total.value() > 0.0) {
            candidates.push_back(max_total.value());
        }
        if (max_footprint && max_footprint.value() > 0.0) {
            candidates.push_back(max_footprint.value() * sim.floors_used);
        }
        sim.total_area_m2 = candidates.empty() ? 0.0 : *std::min_element(candidates.begin(), candidates.end());
    }

    sim.footprint_m2 = sim.total_area_m2 / sim.floors_used;

    if (usable_area_m2 > 0.0) {
        sim.usable_area_m2 = usable_area_m2;
        sim.usable_area_given = true;
    } else {
        sim.usable_area_m2 = sim.total_area_m2;
    }

    double lot_area = urbanism.lot_area_m2;
    if (lot_area > 0.0) {
        if (max_footprint) {
            sim.real_occupancy_ratio = max_footprint.value() / lot_area;
        }
        sim.project_occupancy_ratio = sim.footprint_m2 / lot_area;
    }

    const auto& record = urbanism.record;
    sim.has_occupancy_check = record && record->max_occupancy_ratio && max_footprint;
    sim.has_floor_area_check = record && record->max_floor_area_ratio && max_total;
    sim.has_permeability_check = record && record->min_permeability_ratio && urbanism.min_permeable_area_m2;

    const double tolerance = 1e-9;
    if (sim.has_occupancy_check) {
        sim.occupancy_ok = sim.footprint_m2 <= max_footprint.value() + tolerance;
    }
    if (sim.has_floor_area_check) {
        sim.floor_area_ok = sim.total_area_m2 <= max_total.value() + tolerance;
    }

    if (urbanism.status == RuleStatus::NO_RULE) {
        sim.viable = false;
        sim.reasons.push_back("Use not registered for this zone; viability cannot be assessed");
        return sim;
    }

    sim.viable = true;
    if (sim.mode == SimulationMode::PROJECT) {
        if (sim.floor_area_ok && !sim.floor_area_ok.value()) {
            sim.viable = false;
            sim.reasons.push_back("Total floor area above the maximum allowed by the floor-area ratio");
        }
        if (sim.occupancy_ok && !sim.occupancy_ok.value()) {
            sim.viable = false;
            sim.reasons.push_back("Ground-floor footprint above the maximum allowed by occupancy and setbacks");
        }
        if (!sim.has_floor_area_check) {
            sim.reasons.push_back("Maximum floor-area ratio not registered; the total limit cannot be confirmed");
        }
        if (!sim.has_occupancy_check) {
            sim.reasons.push_back("Occupancy ratio or setbacks not registered; the footprint cannot be checked");
        }
        if (!sim.has_permeability_check) {
            sim.reasons.push_back("Minimum permeability ratio not registered; the permeable area cannot be computed");
        }
    } else {
        if (!sim.has_floor_area_check) {
            sim.reasons.push_back("Maximum floor-area ratio not registered; the total limit may be incomplete");
        }
        if (!sim.has_occupancy_check) {
            sim.reasons.push_back("Occupancy ratio or setbacks not registered; the ground-floor limit may be incomplete");
        }
        if (!sim.has_permeability_check) {
            sim.reasons.push_back("Minimum permeability ratio not registered; the permeable area cannot be computed");
        }
    }

    return sim;
}

std::string simulationModeToString(SimulationMode mode) {
    switch (mode) {
        case SimulationMode::AUTOMATIC_LIMITS:
            return "automatic_limits";
        case SimulationMode::PROJECT:
            return "project";
    }
    return "unknown";
}

} // namespace rules
} // namespace zonefind
