#include <doctest/doctest.h>
#include <optional>
#include "rules/envelope.hpp"

using zonefind::rules::BindingConstraint;
using zonefind::rules::EnvelopeResult;
using zonefind::rules::FootprintLimit;
using zonefind::rules::LotRegime;
using zonefind::rules::SetbackRegime;

using zonefind::rules::computeBuildToLineEnvelope;
using zonefind::rules::computeEnvelope;
using zonefind::rules::computeFootprintLimit;

// -----------------------------------------------------------------------------
// Tests for computeEnvelope
// -----------------------------------------------------------------------------

TEST_CASE("mid-block lot subtracts both sides, front and rear") {
    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, false);

    CHECK(envelope.usable_width_m == doctest::Approx(7.0));
    CHECK(envelope.usable_depth_m == doctest::Approx(22.0));
    CHECK(envelope.interior_area_m2 == doctest::Approx(154.0));
    CHECK(envelope.lot_regime == LotRegime::MID_BLOCK);
    CHECK(envelope.setback_regime == SetbackRegime::STANDARD);
}

TEST_CASE("attaching to one side zeroes a single side setback") {
    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, true);

    CHECK(envelope.usable_width_m == doctest::Approx(8.5));
    CHECK(envelope.interior_area_m2 == doctest::Approx(187.0));
}

TEST_CASE("corner lot with two frontages treats the secondary frontage as a front") {
    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, true, true, false);

    CHECK(envelope.usable_width_m == doctest::Approx(3.5));
    CHECK(envelope.usable_depth_m == doctest::Approx(22.0));
    CHECK(envelope.lot_regime == LotRegime::CORNER_TWO_FRONTAGES);

    // Attaching only removes the remaining true side, never the secondary front
    EnvelopeResult attached = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, true, true, true);
    CHECK(attached.usable_width_m == doctest::Approx(5.0));
}

TEST_CASE("corner lot with a single frontage uses the mid-block formula") {
    EnvelopeResult corner = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, true, false, false);
    EnvelopeResult mid_block = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, false);

    CHECK(corner.lot_regime == LotRegime::CORNER_SINGLE_FRONTAGE);
    CHECK(corner.interior_area_m2 == doctest::Approx(mid_block.interior_area_m2));
}

TEST_CASE("over-constrained lots clamp to zero") {
    EnvelopeResult narrow = computeEnvelope(2.0, 30.0, 5.0, 1.5, 3.0, false, false, false);
    CHECK(narrow.usable_width_m == doctest::Approx(0.0));
    CHECK(narrow.usable_depth_m == doctest::Approx(22.0));
    CHECK(narrow.interior_area_m2 == doctest::Approx(0.0));

    EnvelopeResult shallow = computeEnvelope(10.0, 8.0, 5.0, 1.5, 3.0, false, false, false);
    CHECK(shallow.usable_depth_m == doctest::Approx(0.0));
    CHECK(shallow.interior_area_m2 == doctest::Approx(0.0));

    EnvelopeResult both = computeEnvelope(1.0, 1.0, 5.0, 5.0, 5.0, true, true, false);
    CHECK(both.usable_width_m >= 0.0);
    CHECK(both.usable_depth_m >= 0.0);
    CHECK(both.interior_area_m2 == doctest::Approx(0.0));
}

TEST_CASE("build-to-line keeps only the rear setback") {
    EnvelopeResult envelope = computeBuildToLineEnvelope(10.0, 30.0, 3.0, false, false);

    CHECK(envelope.usable_width_m == doctest::Approx(10.0));
    CHECK(envelope.usable_depth_m == doctest::Approx(27.0));
    CHECK(envelope.interior_area_m2 == doctest::Approx(270.0));
    CHECK(envelope.setback_regime == SetbackRegime::BUILD_TO_LINE);

    EnvelopeResult corner = computeBuildToLineEnvelope(10.0, 30.0, 3.0, true, true);
    CHECK(corner.lot_regime == LotRegime::CORNER_TWO_FRONTAGES);
    CHECK(corner.interior_area_m2 == doctest::Approx(270.0));
}

// -----------------------------------------------------------------------------
// Tests for computeFootprintLimit
// -----------------------------------------------------------------------------

TEST_CASE("occupancy ratio binds when it is the smaller limit") {
    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, false);
    FootprintLimit limit = computeFootprintLimit(300.0, 0.5, envelope);

    REQUIRE(limit.max_footprint_m2.has_value());
    CHECK(limit.max_footprint_m2.value() == doctest::Approx(150.0));
    CHECK(limit.occupancy_limit_m2.value() == doctest::Approx(150.0));
    CHECK(limit.envelope_limit_m2.value() == doctest::Approx(154.0));
    CHECK(limit.binding == BindingConstraint::OCCUPANCY_RATIO);
}

TEST_CASE("setbacks bind when the envelope is smaller") {
    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, false);
    FootprintLimit limit = computeFootprintLimit(300.0, 0.6, envelope);

    CHECK(limit.max_footprint_m2.value() == doctest::Approx(154.0));
    CHECK(limit.binding == BindingConstraint::SETBACKS);
}

TEST_CASE("footprint limit with a single known constraint") {
    FootprintLimit ratio_only = computeFootprintLimit(300.0, 0.5, std::nullopt);
    CHECK(ratio_only.max_footprint_m2.value() == doctest::Approx(150.0));
    CHECK(ratio_only.binding == BindingConstraint::OCCUPANCY_RATIO);

    EnvelopeResult envelope = computeEnvelope(10.0, 30.0, 5.0, 1.5, 3.0, false, false, false);
    FootprintLimit envelope_only = computeFootprintLimit(300.0, std::nullopt, envelope);
    CHECK(envelope_only.max_footprint_m2.value() == doctest::Approx(154.0));
    CHECK(envelope_only.binding == BindingConstraint::SETBACKS);

    FootprintLimit unknown = computeFootprintLimit(300.0, std::nullopt, std::nullopt);
    CHECK_FALSE(unknown.max_footprint_m2.has_value());
    CHECK(unknown.binding == BindingConstraint::UNDETERMINED);
}
