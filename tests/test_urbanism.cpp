#include <doctest/doctest.h>
#include <optional>
#include <nlohmann/json.hpp>
#include "rules/urbanism.hpp"
#include "rules/use_classification.hpp"

using nlohmann::json;

using zonefind::rules::BindingConstraint;
using zonefind::rules::RegulatoryRecord;
using zonefind::rules::RuleStatus;
using zonefind::rules::SimulationMode;
using zonefind::rules::UrbanismInput;
using zonefind::rules::UrbanismResult;
using zonefind::rules::UseType;
using zonefind::rules::ViabilitySimulation;

using zonefind::rules::computeUrbanism;
using zonefind::rules::estimateFloors;
using zonefind::rules::simulateViability;

namespace {

RegulatoryRecord singleFamilyRecord() {
    auto record = RegulatoryRecord::fromJson(json::parse(R"({
        "zone_sigla": "ZA", "use_type_code": "RES_UNI",
        "to_max": 0.5, "tp_min": 0.2, "ia_max": 1.2, "to_sub_max": "0,8",
        "recuo_frontal_m": 5, "recuo_lateral_m": 1.5, "recuo_fundos_m": 3,
        "gabarito_m": 9, "testada_min_meio_m": 8, "allow_attach_one_side": true
    })"));
    REQUIRE(record.has_value());
    return record.value();
}

UrbanismInput lot(const std::string& use_code, double frontage, double depth) {
    UrbanismInput input;
    input.zone_code = "ZA";
    input.use = UseType(use_code);
    input.frontage_m = frontage;
    input.depth_m = depth;
    return input;
}

} // namespace

// -----------------------------------------------------------------------------
// Tests for use classification
// -----------------------------------------------------------------------------

TEST_CASE("use types are classified by code and label") {
    using zonefind::rules::isMultiFamilyUse;
    using zonefind::rules::isResidentialUse;
    using zonefind::rules::isSingleFamilyUse;
    using zonefind::rules::isLocalStreetClass;

    CHECK(isSingleFamilyUse(UseType("RES_UNI")));
    CHECK(isSingleFamilyUse(UseType("X1", "Residencial Unifamiliar (Casa)")));
    CHECK(isMultiFamilyUse(UseType("RES_MULTI")));
    CHECK(isMultiFamilyUse(UseType("X2", "Edifício multifamiliar")));
    CHECK_FALSE(isSingleFamilyUse(UseType("COM_VAREJO", "Comércio varejista")));
    CHECK(isResidentialUse(UseType("RESIDENCIAL_MISTO")));
    CHECK_FALSE(isResidentialUse(UseType("COM_VAREJO")));

    CHECK(isLocalStreetClass("Local"));
    CHECK(isLocalStreetClass(" VIA LOCAL "));
    CHECK_FALSE(isLocalStreetClass("Arterial"));
    CHECK_FALSE(isLocalStreetClass(""));
}

// -----------------------------------------------------------------------------
// Tests for estimateFloors and RegulatoryRecord::fromJson
// -----------------------------------------------------------------------------

TEST_CASE("estimateFloors prefers the floor limit over the height") {
    CHECK(estimateFloors(4, 9.0).value() == 4);
    CHECK(estimateFloors(std::nullopt, 9.0).value() == 3);
    CHECK(estimateFloors(0, 10.5).value() == 3);
    CHECK(estimateFloors(std::nullopt, 2.0).value() == 1);
    CHECK_FALSE(estimateFloors(std::nullopt, std::nullopt).has_value());
}

TEST_CASE("fromJson maps the zone_rules columns") {
    RegulatoryRecord record = singleFamilyRecord();

    CHECK(record.zone_code == "ZA");
    CHECK(record.max_occupancy_ratio.value() == doctest::Approx(0.5));
    CHECK(record.max_basement_occupancy_ratio.value() == doctest::Approx(0.8));
    CHECK(record.side_setback_m.value() == doctest::Approx(1.5));
    CHECK(record.allow_attach_one_side);
    CHECK_FALSE(record.min_floor_area_ratio.has_value());
    CHECK_FALSE(RegulatoryRecord::fromJson(json::array()).has_value());
}

// -----------------------------------------------------------------------------
// Tests for computeUrbanism
// -----------------------------------------------------------------------------

TEST_CASE("computeUrbanism derives areas, envelope and footprint") {
    UrbanismResult result = computeUrbanism(lot("RES_UNI", 10.0, 30.0), singleFamilyRecord());

    CHECK(result.status == RuleStatus::COMPUTED);
    CHECK(result.lot_area_m2 == doctest::Approx(300.0));
    CHECK(result.max_occupancy_area_m2.value() == doctest::Approx(150.0));
    CHECK(result.min_permeable_area_m2.value() == doctest::Approx(60.0));
    CHECK(result.max_total_floor_area_m2.value() == doctest::Approx(360.0));
    CHECK(result.max_basement_area_m2.value() == doctest::Approx(240.0));
    REQUIRE(result.envelope.has_value());
    CHECK(result.envelope->interior_area_m2 == doctest::Approx(154.0));
    CHECK(result.footprint.max_footprint_m2.value() == doctest::Approx(150.0));
    CHECK(result.footprint.binding == BindingConstraint::OCCUPANCY_RATIO);
    CHECK(result.estimated_floors.value() == 3);
    CHECK(result.lot_conformity.conforming);
}

TEST_CASE("computeUrbanism without a record reports no rule") {
    UrbanismResult result = computeUrbanism(lot("RES_UNI", 10.0, 30.0), std::nullopt);

    CHECK(result.status == RuleStatus::NO_RULE);
    CHECK_FALSE(result.reasons.empty());
    CHECK(result.lot_area_m2 == doctest::Approx(300.0));
    CHECK_FALSE(result.envelope.has_value());
    CHECK_FALSE(result.max_occupancy_area_m2.has_value());
}

TEST_CASE("single-family lots get standard and build-to-line options") {
    UrbanismResult result = computeUrbanism(lot("RES_UNI", 10.0, 30.0), singleFamilyRecord());

    REQUIRE(result.implantation_options.size() == 2);
    CHECK(result.implantation_options[0].envelope.interior_area_m2 == doctest::Approx(154.0));
    CHECK(result.implantation_options[0].max_ground_floor_m2 == doctest::Approx(150.0));
    CHECK(result.implantation_options[1].front_setback_m == doctest::Approx(0.0));
    CHECK(result.implantation_options[1].envelope.interior_area_m2 == doctest::Approx(270.0));
    CHECK(result.implantation_options[1].binding == BindingConstraint::OCCUPANCY_RATIO);
}

TEST_CASE("build-to-line option is bound by the rear setback without an occupancy ratio") {
    RegulatoryRecord record = singleFamilyRecord();
    record.max_occupancy_ratio.reset();

    UrbanismResult result = computeUrbanism(lot("RES_UNI", 10.0, 30.0), record);
    REQUIRE(result.implantation_options.size() == 2);
    CHECK(result.implantation_options[0].binding == BindingConstraint::SETBACKS);
    CHECK(result.implantation_options[1].binding == BindingConstraint::REAR_SETBACK);
    CHECK(result.implantation_options[1].max_ground_floor_m2 == doctest::Approx(270.0));
}

TEST_CASE("other uses and incomplete setbacks get no implantation options") {
    UrbanismResult commerce = computeUrbanism(lot("COM_VAREJO", 10.0, 30.0), singleFamilyRecord());
    CHECK(commerce.implantation_options.empty());

    RegulatoryRecord record = singleFamilyRecord();
    record.rear_setback_m.reset();
    UrbanismResult incomplete = computeUrbanism(lot("RES_UNI", 10.0, 30.0), record);
    CHECK(incomplete.implantation_options.empty());
    CHECK_FALSE(incomplete.envelope.has_value());
    CHECK(incomplete.footprint.binding == BindingConstraint::OCCUPANCY_RATIO);
}

TEST_CASE("attach-one-side is applied only where the record allows it and never to multi-family") {
    UrbanismInput input = lot("RES_UNI", 10.0, 30.0);
    input.attach_one_side = true;
    UrbanismResult attached = computeUrbanism(input, singleFamilyRecord());
    CHECK(attached.attach_one_side_applied);
    CHECK(attached.envelope->usable_width_m == doctest::Approx(8.5));

    input.use = UseType("RES_MULTI");
    CHECK_FALSE(computeUrbanism(input, singleFamilyRecord()).attach_one_side_applied);

    RegulatoryRecord forbidden = singleFamilyRecord();
    forbidden.allow_attach_one_side = false;
    input.use = UseType("RES_UNI");
    CHECK_FALSE(computeUrbanism(input, forbidden).attach_one_side_applied);
}

TEST_CASE("lot conformity checks frontage and area limits") {
    UrbanismResult narrow = computeUrbanism(lot("RES_UNI", 6.0, 30.0), singleFamilyRecord());
    CHECK_FALSE(narrow.lot_conformity.conforming);
    CHECK(narrow.lot_conformity.reasons.size() == 1);

    // Corner lots without their own minimum use the mid-block one
    UrbanismInput corner = lot("RES_UNI", 6.0, 30.0);
    corner.is_corner = true;
    CHECK_FALSE(computeUrbanism(corner, singleFamilyRecord()).lot_conformity.conforming);

    RegulatoryRecord record = singleFamilyRecord();
    record.min_frontage_corner_m = 5.0;
    record.min_lot_area_m2 = 150.0;
    CHECK(computeUrbanism(corner, record).lot_conformity.conforming);

    UrbanismResult small = computeUrbanism(lot("RES_UNI", 8.0, 15.0), record);
    CHECK_FALSE(small.lot_conformity.conforming);
}

// -----------------------------------------------------------------------------
// Tests for simulateViability
// -----------------------------------------------------------------------------

TEST_CASE("automatic mode takes the smallest total allowed") {
    UrbanismResult urbanism = computeUrbanism(lot("RES_UNI", 10.0, 30.0), singleFamilyRecord());
    ViabilitySimulation sim = simulateViability(urbanism, 0.0, 0, 0.0);

    CHECK(sim.mode == SimulationMode::AUTOMATIC_LIMITS);
    CHECK(sim.floors_used == 3);
    CHECK(sim.total_area_m2 == doctest::Approx(360.0));
    CHECK(sim.footprint_m2 == doctest::Approx(120.0));
    CHECK(sim.usable_area_m2 == doctest::Approx(360.0));
    CHECK_FALSE(sim.usable_area_given);
    CHECK(sim.real_occupancy_ratio.value() == doctest::Approx(0.5));
    CHECK(sim.project_occupancy_ratio.value() == doctest::Approx(0.4));
    CHECK(sim.occupancy_ok.value());
    CHECK(sim.floor_area_ok.value());
    CHECK(sim.viable);
}

TEST_CASE("automatic mode with one floor is limited by the footprint") {
    UrbanismResult urbanism = computeUrbanism(lot("RES_UNI", 10.0, 30.0), singleFamilyRecord());
    ViabilitySimulation sim = simulateViability(urbanism, 0.0, 1, 90.0);

    CHECK(sim.total_area_m2 == doctest::Approx(150.0));
    CHECK(sim.usable_area_m2 == doctest::Approx(90.0));
    CHECK(sim.usable_area_given);
}

TEST_CASE("project mode flags totals and footprints above the limits") {
    UrbanismResult urbanism = computeUrbanism(lot("RES_UNI", 10.0, 30.0), singleFamilyRecord());

    ViabilitySimulation fits = simulateViability(urbanism, 280.0, 2, 0.0);
    CHECK(fits.mode == SimulationMode::PROJECT);
    CHECK(fits.footprint_m2 == doctest::Approx(140.0));
    CHECK(fits.viable);

    ViabilitySimulation too_large = simulateViability(urbanism, 400.0, 3, 0.0);
    CHECK_FALSE(too_large.floor_area_ok.value());
    CHECK_FALSE(too_large.viable);

    ViabilitySimulation too_wide = simulateViability(urbanism, 300.0, 1, 0.0);
    CHECK(too_wide.floor_area_ok.value());
    CHECK_FALSE(too_wide.occupancy_ok.value());
    CHECK_FALSE(too_wide.viable);
    CHECK_FALSE(too_wide.reasons.empty());
}

TEST_CASE("missing ratios are reported without failing the simulation") {
    RegulatoryRecord record = singleFamilyRecord();
    record.max_floor_area_ratio.reset();
    record.min_permeability_ratio.reset();

    UrbanismResult urbanism = computeUrbanism(lot("RES_UNI", 10.0, 30.0), record);
    ViabilitySimulation sim = simulateViability(urbanism, 0.0, 2, 0.0);

    CHECK(sim.total_area_m2 == doctest::Approx(300.0));
    CHECK_FALSE(sim.has_floor_area_check);
    CHECK_FALSE(sim.has_permeability_check);
    CHECK_FALSE(sim.floor_area_ok.has_value());
    CHECK(sim.viable);
    CHECK(sim.reasons.size() == 2);
}

TEST_CASE("simulation without a record is not viable") {
    UrbanismResult urbanism = computeUrbanism(lot("RES_UNI", 10.0, 30.0), std::nullopt);
    ViabilitySimulation sim = simulateViability(urbanism, 0.0, 0, 0.0);

    CHECK_FALSE(sim.viable);
    CHECK(sim.total_area_m2 == doctest::Approx(0.0));
    CHECK_FALSE(sim.reasons.empty());
}
