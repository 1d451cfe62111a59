#include "rules/envelope.hpp"
#include <algorithm>

namespace zonefind {
namespace rules {

EnvelopeResult computeEnvelope(double frontage_m, double depth_m,
                               double front_setback_m, double side_setback_m, double rear_setback_m,
                               bool is_corner, bool corner_has_two_frontages, bool attach_one_side) {
    EnvelopeResult result;

    // The side that may be attached; the other one always keeps its setback
    double attached_side = attach_one_side ? 0.0 : side_setback_m;
    double other_side = side_setback_m;

    if (!is_corner) {
        result.lot_regime = LotRegime::MID_BLOCK;
    } else if (corner_has_two_frontages) {
        // Secondary frontage is a front, not a side
        other_side = front_setback_m;
        result.lot_regime = LotRegime::CORNER_TWO_FRONTAGES;
    } else {
        result.lot_regime = LotRegime::CORNER_SINGLE_FRONTAGE;
    }

    result.usable_width_m = std::max(frontage_m - (attached_side + other_side), 0.0);
    result.usable_depth_m = std::max(depth_m - front_setback_m - rear_setback_m, 0.0);
    result.interior_area_m2 = result.usable_width_m * result.usable_depth_m;
    result.setback_regime = SetbackRegime::STANDARD;
    return result;
}

EnvelopeResult computeBuildToLineEnvelope(double frontage_m, double depth_m, double rear_setback_m,
                                          bool is_corner, bool corner_has_two_frontages) {
    EnvelopeResult result = computeEnvelope(frontage_m, depth_m, 0.0, 0.0, rear_setback_m,
                                            is_corner, corner_has_two_frontages, false);
    result.setback_regime = SetbackRegime::BUILD_TO_LINE;
    return result;
}

FootprintLimit computeFootprintLimit(double lot_area_m2,
                                     const std::optional<double>& max_occupancy_ratio,
                                     const std::optional<EnvelopeResult>& envelope) {
    FootprintLimit limit;
    if (max_occupancy_ratio) {
        limit.occupancy_limit_m2 = lot_area_m2 * max_occupancy_ratio.value();
    }
    if (envelope) {
        limit.envelope_limit_m2 = envelope->interior_area_m2;
    }

    if (limit.occupancy_limit_m2 && limit.envelope_limit_m2) {
        if (limit.occupancy_limit_m2.value() <= limit.envelope_limit_m2.value()) {
            limit.max_footprint_m2 = limit.occupancy_limit_m2;
            limit.binding = BindingConstraint::OCCUPANCY_RATIO;
        } else {
            limit.max_footprint_m2 = limit.envelope_limit_m2;
            limit.binding = BindingConstraint::SETBACKS;
        }
    } else if (limit.occupancy_limit_m2) {
        limit.max_footprint_m2 = limit.occupancy_limit_m2;
        limit.binding = BindingConstraint::OCCUPANCY_RATIO;
    } else if (limit.envelope_limit_m2) {
        limit.max_footprint_m2 = limit.envelope_limit_m2;
        limit.binding = BindingConstraint::SETBACKS;
    }

    return limit;
}

std::string lotRegimeToString(LotRegime regime) {
    switch (regime) {
        case LotRegime::MID_BLOCK:
            return "mid_block";
        case LotRegime::CORNER_TWO_FRONTAGES:
            return "corner_two_frontages";
        case LotRegime::CORNER_SINGLE_FRONTAGE:
            return "corner_single_frontage";
    }
    return "unknown";
}

std::string setbackRegimeToString(SetbackRegime regime) {
    switch (regime) {
        case SetbackRegime::STANDARD:
            return "standard";
        case SetbackRegime::BUILD_TO_LINE:
            return "build_to_line";
    }
    return "unknown";
}

std::string bindingConstraintToString(BindingConstraint binding) {
    switch (binding) {
        case BindingConstraint::OCCUPANCY_RATIO:
            return "occupancy_ratio";
        case BindingConstraint::SETBACKS:
            return "setbacks";
        case BindingConstraint::REAR_SETBACK:
            return "rear_setback";
        case BindingConstraint::UNDETERMINED:
            return "undetermined";
    }
    return "unknown";
}

} // namespace rules
} // namespace zonefind
