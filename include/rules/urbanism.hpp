#ifndef ZONEFIND_URBANISM_HPP
#define ZONEFIND_URBANISM_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rules/envelope.hpp"
#include "rules/rule_status.hpp"
#include "rules/use_classification.hpp"

namespace zonefind {
namespace rules {

// Regulatory parameters for one (zone, use type) pair
struct RegulatoryRecord {
    std::string zone_code;
    std::string use_code;

    std::optional<double> max_occupancy_ratio;          // to_max
    std::optional<double> min_permeability_ratio;       // tp_min
    std::optional<double> min_floor_area_ratio;         // ia_min
    std::optional<double> max_floor_area_ratio;         // ia_max
    std::optional<double> max_basement_occupancy_ratio; // to_sub_max

    std::optional<double> front_setback_m;
    std::optional<double> side_setback_m;
    std::optional<double> rear_setback_m;

    std::optional<double> height_limit_m;
    std::optional<int> floor_limit;

    std::optional<double> min_lot_area_m2;
    std::optional<double> max_lot_area_m2;
    std::optional<double> min_frontage_mid_block_m;
    std::optional<double> min_frontage_corner_m;
    std::optional<double> max_frontage_m;

    bool allow_attach_one_side;
    bool requires_subzone;
    std::string subzone_code;
    std::string special_area_tag;
    std::string notes;
    std::string observations;
    std::string source_ref;

    RegulatoryRecord()
        : allow_attach_one_side(false), requires_subzone(false) {}

    /**
     * Parse a zone_rules row
     * @param row JSON object with the zone_rules columns
     * @return Record, or nullopt if the row is not an object
     */
    static std::optional<RegulatoryRecord> fromJson(const nlohmann::json& row);
};

// User-supplied lot and use
struct UrbanismInput {
    std::string zone_code;
    UseType use;
    double frontage_m;
    double depth_m;
    bool is_corner;
    bool corner_has_two_frontages;
    bool attach_one_side;           // Requested; applied only when the record allows it

    UrbanismInput()
        : frontage_m(0.0), depth_m(0.0), is_corner(false), corner_has_two_frontages(false),
          attach_one_side(false) {}
};

// One way of placing a single-family house on the lot
struct ImplantationOption {
    std::string name;
    std::string legal_basis;
    double front_setback_m;
    double side_setback_m;
    double rear_setback_m;
    EnvelopeResult envelope;
    double max_ground_floor_m2;
    BindingConstraint binding;
    std::string observation;

    ImplantationOption()
        : front_setback_m(0.0), side_setback_m(0.0), rear_setback_m(0.0),
          max_ground_floor_m2(0.0), binding(BindingConstraint::UNDETERMINED) {}
};

// Lot dimension checks against the record
struct LotConformity {
    bool conforming;
    std::vector<std::string> reasons;

    LotConformity() : conforming(true) {}
};

// Derived urbanistic metrics for a lot
struct UrbanismResult {
    RuleStatus status;
    std::vector<std::string> reasons;

    std::string zone_code;
    UseType use;
    double frontage_m;
    double depth_m;
    double lot_area_m2;
    bool attach_one_side_applied;

    std::optional<RegulatoryRecord> record;

    std::optional<double> max_occupancy_area_m2;
    std::optional<double> min_permeable_area_m2;
    std::optional<double> max_total_floor_area_m2;
    std::optional<double> max_basement_area_m2;

    std::optional<EnvelopeResult> envelope;
    FootprintLimit footprint;
    std::optional<int> estimated_floors;
    LotConformity lot_conformity;
    std::vector<ImplantationOption> implantation_options;

    UrbanismResult()
        : status(RuleStatus::NO_RULE), frontage_m(0.0), depth_m(0.0), lot_area_m2(0.0),
          attach_one_side_applied(false) {}
};

// How the viability simulation chose the total floor area
enum class SimulationMode {
    AUTOMATIC_LIMITS,   // Largest total allowed by the floor-area ratio and footprint
    PROJECT             // Total given by the user, checked against the limits
};

// Layperson viability check of a proposed (or maximal) building
struct ViabilitySimulation {
    SimulationMode mode;
    int floors_used;
    double total_area_m2;
    double footprint_m2;
    double usable_area_m2;
    bool usable_area_given;

    std::optional<double> real_occupancy_ratio;     // footprint limit / lot area
    std::optional<double> project_occupancy_ratio;  // footprint / lot area

    bool has_occupancy_check;
    bool has_floor_area_check;
    bool has_permeability_check;
    std::optional<bool> occupancy_ok;
    std::optional<bool> floor_area_ok;

    bool viable;
    std::vector<std::string> reasons;

    ViabilitySimulation()
        : mode(SimulationMode::AUTOMATIC_LIMITS), floors_used(1), total_area_m2(0.0), footprint_m2(0.0),
          usable_area_m2(0.0), usable_area_given(false), has_occupancy_check(false),
          has_floor_area_check(false), has_permeability_check(false), viable(false) {}
};

/**
 * Estimate the number of floors allowed
 * @param floor_limit Floor count limit (used when set and non-zero)
 * @param height_limit_m Height limit in meters (floor(height / 3), at least 1)
 * @return Floor count, or nullopt if neither limit is known
 */
std::optional<int> estimateFloors(const std::optional<int>& floor_limit, const std::optional<double>& height_limit_m);

/**
 * Compute the urbanistic metrics of a lot under a regulatory record
 * @param input Lot dimensions and use
 * @param record Record for the zone and use, nullopt when none exists
 * @return Metrics; status NO_RULE when the record is missing
 */
UrbanismResult computeUrbanism(const UrbanismInput& input, const std::optional<RegulatoryRecord>& record);

/**
 * Simulate the buildable total area
 * @param urbanism Result of computeUrbanism
 * @param desired_total_area_m2 Proposed total floor area (0 = automatic mode)
 * @param desired_floors Proposed floor count (0 = estimated floors, or 1)
 * @param usable_area_m2 Usable area for parking/sanitary rules (0 = same as total area)
 * @return Simulation with checks and reasons
 */
ViabilitySimulation simulateViability(const UrbanismResult& urbanism, double desired_total_area_m2,
                                      int desired_floors, double usable_area_m2);

std::string simulationModeToString(SimulationMode mode);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_URBANISM_HPP
