#ifndef ZONEFIND_ENVELOPE_HPP
#define ZONEFIND_ENVELOPE_HPP

#include <optional>
#include <string>

namespace zonefind {
namespace rules {

// Lot position within the block
enum class LotRegime {
    MID_BLOCK,
    CORNER_TWO_FRONTAGES,
    CORNER_SINGLE_FRONTAGE
};

// Which setbacks were applied
enum class SetbackRegime {
    STANDARD,
    BUILD_TO_LINE       // Front and side setbacks waived, rear kept
};

// Constraint that limits the ground-floor footprint
enum class BindingConstraint {
    OCCUPANCY_RATIO,
    SETBACKS,
    REAR_SETBACK,
    UNDETERMINED
};

// Interior rectangle left after setbacks
struct EnvelopeResult {
    double usable_width_m;
    double usable_depth_m;
    double interior_area_m2;
    LotRegime lot_regime;
    SetbackRegime setback_regime;

    EnvelopeResult()
        : usable_width_m(0.0), usable_depth_m(0.0), interior_area_m2(0.0),
          lot_regime(LotRegime::MID_BLOCK), setback_regime(SetbackRegime::STANDARD) {}
};

// Maximum ground-floor footprint and what limits it
struct FootprintLimit {
    std::optional<double> max_footprint_m2;     // min of the two limits, or whichever is known
    std::optional<double> occupancy_limit_m2;   // lot area x occupancy ratio
    std::optional<double> envelope_limit_m2;    // interior area of the envelope
    BindingConstraint binding;

    FootprintLimit()
        : binding(BindingConstraint::UNDETERMINED) {}
};

/**
 * Compute the buildable envelope of a rectangular lot.
 * Mid-block: width = frontage - 2 x side (one side zeroed when attached), depth = depth - front - rear.
 * Corner with two frontages: the secondary frontage takes the front setback, only the remaining
 * true side may be zeroed by attach_one_side. Corner with a single frontage uses the mid-block formula.
 * Negative dimensions clamp to zero.
 * @param frontage_m Lot frontage (width along the street)
 * @param depth_m Lot depth
 * @param front_setback_m Front setback
 * @param side_setback_m Side setback
 * @param rear_setback_m Rear setback
 * @param is_corner Lot borders two streets
 * @param corner_has_two_frontages Corner lot regulated as having two fronts
 * @param attach_one_side Build on one side boundary
 * @return Envelope dimensions and regime tags
 */
EnvelopeResult computeEnvelope(double frontage_m, double depth_m,
                               double front_setback_m, double side_setback_m, double rear_setback_m,
                               bool is_corner, bool corner_has_two_frontages, bool attach_one_side);

/**
 * Build-to-line variant: front and side setbacks are zero, the rear setback is kept
 * and the attach flag is irrelevant.
 */
EnvelopeResult computeBuildToLineEnvelope(double frontage_m, double depth_m, double rear_setback_m,
                                          bool is_corner, bool corner_has_two_frontages);

/**
 * Compare the occupancy-ratio limit with the envelope area
 * @param lot_area_m2 Lot area
 * @param max_occupancy_ratio Maximum occupancy ratio, if regulated
 * @param envelope Setback envelope, if the setbacks are known
 * @return Smaller limit and the binding constraint (occupancy ratio wins ties)
 */
FootprintLimit computeFootprintLimit(double lot_area_m2,
                                     const std::optional<double>& max_occupancy_ratio,
                                     const std::optional<EnvelopeResult>& envelope);

std::string lotRegimeToString(LotRegime regime);
std::string setbackRegimeToString(SetbackRegime regime);
std::string bindingConstraintToString(BindingConstraint binding);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_ENVELOPE_HPP
