#include "FlowCorrection.hpp"
#include "ErrorTypes.hpp"
#include "UnitSystem.hpp"
#include <cmath>

namespace CHPT {

double flowReferenced(double q_meas, double dp_meas, double rho_meas,
                      double dp_ref, double rho_ref) {
    if (!(dp_meas > 0.0) || !(dp_ref > 0.0) || !(rho_meas > 0.0) || !(rho_ref > 0.0)) {
        throw InvalidArgument("flowReferenced: depressions and densities must be > 0");
    }
    return q_meas * std::sqrt(dp_ref / dp_meas) * std::sqrt(rho_meas / rho_ref);
}

double flowTo28InH2O(double q_meas, double dp_meas_in_h2o,
                     const AirState& state_meas,
                     const std::optional<AirState>& state_ref) {
    double rho_meas = airDensity(state_meas);
    double rho_ref = state_ref ? airDensity(*state_ref) : rho_meas;
    return flowTo28InH2O(q_meas, dp_meas_in_h2o, rho_meas, rho_ref);
}

double flowTo28InH2O(double q_meas, double dp_meas_in_h2o,
                     double rho_meas, double rho_ref) {
    double dp_meas = Units::inH2OToPa(dp_meas_in_h2o);
    double dp_ref = Units::inH2OToPa(STANDARD_DEPRESSION_IN_H2O);
    return flowReferenced(q_meas, dp_meas, rho_meas, dp_ref, rho_ref);
}

double correctPointToReference(double q_meas_cfm, double dp_meas_in_h2o,
                               const AirState& state_meas,
                               const std::optional<AirState>& state_ref) {
    return flowTo28InH2O(Units::cfmToM3s(q_meas_cfm), dp_meas_in_h2o,
                         state_meas, state_ref.value_or(state_meas));
}

} // namespace CHPT
