/**
 * @file ValveGeometry.hpp
 * @brief Valve and port area models
 *
 * Lengths may be given in any consistent unit (the screens use mm or in);
 * areas come back in that unit squared.
 *
 * Area models:
 * - Curtain: cylindrical shell at the seat line, pi * d * lift
 * - Throat: net passage area excluding the valve stem
 * - Seat-limited: curtain growth capped by the seat at low lift
 * - Port window: rounded-rectangle entry area, only ever used as a cap
 * - Effective: smooth blend of seat-capped curtain and throat
 */

#ifndef VALVE_GEOMETRY_HPP
#define VALVE_GEOMETRY_HPP

#include <optional>
#include <string>

namespace CHPT {

/**
 * @brief Blend strategy between curtain and throat area
 */
enum class AreaBlendMethod {
    SMOOTH_MIN,     // Power-mean soft minimum (A1^-n + A2^-n)^(-1/n)
    LOGISTIC        // Logistic weight over L/D
};

AreaBlendMethod parseAreaBlendMethod(const std::string& str);
std::string toString(AreaBlendMethod method);

/**
 * @brief Parameters of the effective-area blend
 */
struct EffectiveAreaOptions {
    AreaBlendMethod method = AreaBlendMethod::LOGISTIC;
    int smoothmin_n = 6;            // Power-mean exponent, n >= 1
    double logistic_ld0 = 0.30;     // L/D at the logistic midpoint
    double logistic_k = 12.0;       // Logistic steepness
};

/**
 * @brief Valve geometry of one side (intake or exhaust)
 *
 * Only the valve diameter is mandatory. Throat data enables throat and
 * effective areas; seat data enables the low-lift seat cap.
 */
struct ValveGeometry {
    double valve_diameter = 0.0;
    std::optional<double> throat_diameter;
    double stem_diameter = 0.0;
    std::optional<double> seat_angle_deg;
    std::optional<double> seat_width;

    bool hasThroat() const { return throat_diameter.has_value(); }
    bool hasSeat() const {
        return seat_angle_deg.has_value() && seat_width.has_value() && *seat_width > 0.0;
    }

    /**
     * @throws InvalidGeometry for non-positive diameters, stem >= throat,
     *         negative seat width or a seat angle outside (0, 90) deg
     */
    void validate() const;

    double throatArea() const;
    double seatLiftThreshold() const;
};

/**
 * @brief Port entry window (rectangle with rounded top/bottom corners)
 */
struct PortWindow {
    double width = 0.0;
    double height = 0.0;
    double r_top = 0.0;
    double r_bot = 0.0;

    double area() const;
};

// =============================================================================
// Basic areas
// =============================================================================

/**
 * @brief Curtain area pi * d * lift
 * @throws InvalidGeometry unless d > 0 and lift >= 0
 */
double curtainArea(double d_valve, double lift);

/**
 * @brief Throat area pi/4 * (d_throat^2 - d_stem^2)
 * @throws InvalidGeometry unless 0 <= d_stem < d_throat
 */
double throatArea(double d_throat, double d_stem = 0.0);

/**
 * @brief Lift-to-diameter ratio
 */
double ldRatio(double lift, double d_valve);

/**
 * @brief Ceil an L/D value to the next 0.01 (axis ticks of the flow graphs)
 */
double ldAxisTick(double ld);

/**
 * @brief Lift at which the seat stops limiting the curtain: w * tan(angle)
 */
double seatLiftThreshold(double seat_width, double seat_angle_deg);

/**
 * @brief Port window area w*h - 2*(1 - pi/4)*(r_top^2 + r_bot^2)
 *
 * Approximation with both top corners of radius r_top and both bottom
 * corners of radius r_bot.
 *
 * @throws InvalidGeometry for non-positive size, negative radii or a
 *         non-positive resulting area
 */
double portWindowArea(double width, double height, double r_top, double r_bot);

// =============================================================================
// Blends
// =============================================================================

/**
 * @brief Soft minimum (A1^-n + A2^-n)^(-1/n); 0 when A1 == 0
 */
double areaSmoothMin(double a1, double a2, int n = 6);

/**
 * @brief Logistic blend (1-w)*A1 + w*A2, w = 1/(1+exp(-k(L/D - L/D0)))
 */
double areaLogistic(double a1, double a2, double ld, double ld0 = 0.30, double k = 12.0);

double blendAreas(double a1, double a2, double ld, const EffectiveAreaOptions& options);

/**
 * @brief Legacy seat-limited area
 *
 * Below seat_width * tan(seat_angle) the pure curtain area; above it the
 * blend between the curtain area at the threshold and the throat area.
 *
 * @throws InvalidGeometry when seat or throat data is missing or invalid
 */
double seatLimitedArea(double lift, const ValveGeometry& geometry,
                       const EffectiveAreaOptions& options = EffectiveAreaOptions());

/**
 * @brief Effective flow area at a lift
 *
 * Blends the seat-capped curtain area curtain(min(lift, threshold)) with
 * the throat area and clamps the result to [0, min(throat, window)].
 * Non-decreasing in lift, zero at zero lift.
 */
double effectiveArea(double lift, const ValveGeometry& geometry,
                     const EffectiveAreaOptions& options = EffectiveAreaOptions(),
                     const std::optional<PortWindow>& window = std::nullopt);

/**
 * @brief Effective area of n identical valves, capped at n * throat area
 */
double effectiveAreaMultiValve(int n_valves, double lift, const ValveGeometry& geometry,
                               const EffectiveAreaOptions& options = EffectiveAreaOptions(),
                               const std::optional<PortWindow>& window = std::nullopt);

// =============================================================================
// Port volume / centreline length / mean area
// =============================================================================

double portVolumeFromAreaLength(double mean_area, double length);
double meanAreaFromVolumeLength(double volume, double length);
double lengthFromVolumeArea(double volume, double mean_area);

/**
 * @brief Port descriptor triad; any two determine the third
 *
 * Units: volume [cc], length [mm], mean area [mm²] (cc = mm² * mm / 1000).
 */
struct PortDescriptor {
    std::optional<double> volume_cc;
    std::optional<double> length_mm;
    std::optional<double> area_mm2;

    /**
     * @brief Fill in the missing member when exactly two are known
     * @throws InvalidArgument for non-positive members
     */
    PortDescriptor completed() const;

    bool isComplete() const { return volume_cc && length_mm && area_mm2; }
};

} // namespace CHPT

#endif // VALVE_GEOMETRY_HPP
