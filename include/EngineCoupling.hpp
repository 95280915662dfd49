/**
 * @file EngineCoupling.hpp
 * @brief Engine airflow demand, port-limited RPM and power limits
 *
 * Four-stroke engine: one intake event per cylinder every two crank
 * revolutions, so the swept-volume demand is displacement/2 per rev.
 *
 * The port-supply model is the calibrated main-screen balance
 * "port supply meets engine demand at peak power":
 *
 *   Q_port  = A_mean * mach * a0          (per port)
 *   Q_chain = Q_port * n_ports_eff
 *   Q_dist  = Q_chain * K_PORT_DIST
 *   RPM     = Q_dist * C / (displacement * VE)
 *
 * with C = 3456 (2 * 1728 in³/ft³) for CFM and in³, and C = 2 for m³/min
 * and m³. a0 is the GUI-fixed speed of sound of the unit system.
 */

#ifndef ENGINE_COUPLING_HPP
#define ENGINE_COUPLING_HPP

#include "CalibrationRegistry.hpp"
#include "UnitSystem.hpp"

namespace CHPT {

// =============================================================================
// Swept-volume demand
// =============================================================================

/**
 * @brief Engine volumetric demand Q = displacement/2 * rpm/60 * VE
 *
 * Units follow the displacement: m³ gives m³/s, in³ gives in³/s.
 *
 * @throws InvalidArgument unless displacement > 0, rpm >= 0, VE >= 0
 */
double engineVolumetricFlow(double displacement, double rpm, double ve);

/**
 * @brief RPM at which the engine demand equals a flow (inverse of the above)
 * @param q Flow [displacement unit per second]
 * @throws InvalidArgument unless q, displacement, VE > 0
 */
double rpmFromFlow(double q, double displacement, double ve);

/**
 * @brief RPM at which a port area passes the demand at a target mean velocity
 * @throws InvalidArgument unless area, displacement, VE, velocity > 0
 */
double rpmFromAreaAndTargetVelocity(double area, double displacement, double ve,
                                    double v_target);

// =============================================================================
// Calibrated port supply
// =============================================================================

/**
 * @brief Port flow capacity at the main-screen operating point
 *
 * US: area [in²], velocity [ft/s], flows [CFM].
 * SI: area [mm²], velocity [m/s], flows [m³/min].
 */
struct PortSupply {
    double velocity = 0.0;      // Mean port velocity mach * a0
    double per_port = 0.0;
    double chain = 0.0;         // per_port * n_ports_eff
    double distributed = 0.0;   // chain * K_PORT_DIST
};

/**
 * @throws InvalidArgument unless area > 0, 0 <= mach <= 1, n_ports_eff > 0
 */
PortSupply portSupplyFlow(double area, double mach, double n_ports_eff,
                          UnitBasis basis, const CalibrationRegistry& cal);

/**
 * @brief Peak-power RPM supported by a mean port area
 * @param displacement Engine displacement, in³ (US) or m³ (SI)
 */
double peakRpmFromPortArea(double area, double mach, double n_ports_eff,
                           double displacement, double ve,
                           UnitBasis basis, const CalibrationRegistry& cal);

/**
 * @brief Mean port area needed for a peak-power RPM (exact inverse)
 * @throws InvalidArgument unless rpm, mach, n_ports_eff, displacement, VE > 0
 */
double portAreaFromPeakRpm(double rpm, double mach, double n_ports_eff,
                           double displacement, double ve,
                           UnitBasis basis, const CalibrationRegistry& cal);

/**
 * @brief Shift RPM = peak * (1 + SHIFT_ALPHA)
 */
double shiftRpm(double peak_rpm, const CalibrationRegistry& cal);

/**
 * @brief Mean piston speed 2 * stroke * rpm / 60 [stroke unit per second]
 */
double meanPistonSpeed(double stroke, double rpm);

// =============================================================================
// Power limits (pure linear calibrations)
// =============================================================================

double hpLimitFromAirflow(double q_cfm, const CalibrationRegistry& cal);
double hpLimitFromPortArea(double q_chain_cfm, const CalibrationRegistry& cal);
double kwLimitFromAirflow(double q_m3min, const CalibrationRegistry& cal);
double kwLimitFromPortArea(double q_chain_m3min, const CalibrationRegistry& cal);

/**
 * @brief f_cr = K_CR * (1 + K_CR_SLOPE * (cr - K_CR_REF))
 * @throws InvalidArgument if cr <= 0
 */
double compressionRatioFactor(double cr, const CalibrationRegistry& cal);

// =============================================================================
// Exhaust / intake ratio models
// =============================================================================

/**
 * @brief Calibrated existing E/I ratio min(1, raw * K_EXINT_RATIO)
 */
double existingExIntRatio(double raw_ratio, const CalibrationRegistry& cal);

/**
 * @brief Required E/I ratio, linear in compression ratio and max lift
 *
 * K_REQ_EI_BASE + K_REQ_EI_CR * (cr - K_CR_REF)
 *               + K_REQ_EI_LIFT * (max_lift_mm - K_REQ_EI_LIFT_REF_MM)
 */
double requiredExIntRatio(double cr, double max_lift_mm, const CalibrationRegistry& cal);

/**
 * @brief Exhaust collector cross-section A = Q / v_target
 * @throws InvalidArgument unless Q, v_target > 0
 */
double exhaustCollectorArea(double q, double v_target);

} // namespace CHPT

#endif // ENGINE_COUPLING_HPP
