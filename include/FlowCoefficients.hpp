/**
 * @file FlowCoefficients.hpp
 * @brief Discharge coefficients of a valve/port at a bench point
 *
 * All inputs SI: flow [m³/s], area [m²], depression [Pa], density [kg/m³].
 */

#ifndef FLOW_COEFFICIENTS_HPP
#define FLOW_COEFFICIENTS_HPP

#include "AirState.hpp"
#include <optional>

namespace CHPT {

/**
 * @brief Discharge coefficient Cd = Q / (A * sqrt(2 * dp / rho))
 * @throws InvalidArgument unless Q >= 0 and A, dp, rho > 0
 */
double cd(double q, double area, double dp, double rho);

/**
 * @brief Reference-corrected ("SAE") discharge coefficient
 *
 * The measured flow is first rescaled to the reference depression and
 * density (flowReferenced), then Cd is evaluated at that reference.
 */
double cdSAE(double q_meas, double dp_meas, double rho_meas,
             double area, double dp_ref, double rho_ref);

/**
 * @brief SAE Cd against the blended effective area
 *
 * Normalization metric rather than a physical coefficient: values above
 * 1.0 are legitimate once the effective area drops below the curtain.
 */
double effectiveCd(double q_meas, double dp_meas, double rho_meas,
                   double effective_area, double dp_ref, double rho_ref);

/**
 * @brief SAE Cd of one bench point given in bench units
 * @param q_cfm Measured flow [CFM]
 * @param dp_in_h2o Measured depression [inH2O]
 * @param area_m2 Reference area [m²]
 * @param state_meas Air during the measurement
 * @param state_ref Reference air (defaults to the measured air)
 * @return Cd at 28 inH2O and the reference density
 */
double saeCdFromPointCFM(double q_cfm, double dp_in_h2o, double area_m2,
                         const AirState& state_meas,
                         const std::optional<AirState>& state_ref = std::nullopt);

} // namespace CHPT

#endif // FLOW_COEFFICIENTS_HPP
