#ifndef FLOW_CORRECTION_HPP
#define FLOW_CORRECTION_HPP

#include "AirState.hpp"
#include <optional>

namespace CHPT {

// Industry-standard bench depression
constexpr double STANDARD_DEPRESSION_IN_H2O = 28.0;

/**
 * @brief Rescale a measured flow to a reference depression and density
 *
 * Q* = Q_meas * sqrt(dp_ref / dp_meas) * sqrt(rho_meas / rho_ref)
 *
 * Flow may be in any unit; the result is in the same unit.
 *
 * @throws InvalidArgument unless dp_meas, rho_meas, dp_ref, rho_ref > 0
 */
double flowReferenced(double q_meas, double dp_meas, double rho_meas,
                      double dp_ref, double rho_ref);

/**
 * @brief Correct a flow to 28 inH2O
 * @param q_meas Measured flow (any unit)
 * @param dp_meas_in_h2o Measured depression [inH2O]
 * @param state_meas Air state during the measurement
 * @param state_ref Reference air state; when absent only depression is
 *        corrected (reference density = measured density)
 */
double flowTo28InH2O(double q_meas, double dp_meas_in_h2o,
                     const AirState& state_meas,
                     const std::optional<AirState>& state_ref = std::nullopt);

/**
 * @brief Same as flowTo28InH2O with explicit densities [kg/m³]
 */
double flowTo28InH2O(double q_meas, double dp_meas_in_h2o,
                     double rho_meas, double rho_ref);

/**
 * @brief Bench point (CFM, inH2O) corrected to 28 inH2O, returned in m³/s
 */
double correctPointToReference(double q_meas_cfm, double dp_meas_in_h2o,
                               const AirState& state_meas,
                               const std::optional<AirState>& state_ref = std::nullopt);

} // namespace CHPT

#endif // FLOW_CORRECTION_HPP
