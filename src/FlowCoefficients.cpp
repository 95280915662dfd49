#include "FlowCoefficients.hpp"
#include "FlowCorrection.hpp"
#include "ErrorTypes.hpp"
#include "UnitSystem.hpp"
#include <cmath>

namespace CHPT {

double cd(double q, double area, double dp, double rho) {
    if (q < 0.0 || !(area > 0.0) || !(dp > 0.0) || !(rho > 0.0)) {
        throw InvalidArgument("cd: requires Q >= 0 and A, dp, rho > 0");
    }
    return q / (area * std::sqrt(2.0 * dp / rho));
}

double cdSAE(double q_meas, double dp_meas, double rho_meas,
             double area, double dp_ref, double rho_ref) {
    double q_ref = flowReferenced(q_meas, dp_meas, rho_meas, dp_ref, rho_ref);
    return cd(q_ref, area, dp_ref, rho_ref);
}

double effectiveCd(double q_meas, double dp_meas, double rho_meas,
                   double effective_area, double dp_ref, double rho_ref) {
    return cdSAE(q_meas, dp_meas, rho_meas, effective_area, dp_ref, rho_ref);
}

double saeCdFromPointCFM(double q_cfm, double dp_in_h2o, double area_m2,
                         const AirState& state_meas,
                         const std::optional<AirState>& state_ref) {
    double rho_meas = airDensity(state_meas);
    double rho_ref = state_ref ? airDensity(*state_ref) : rho_meas;
    return cdSAE(Units::cfmToM3s(q_cfm), Units::inH2OToPa(dp_in_h2o), rho_meas,
                 area_m2, Units::inH2OToPa(STANDARD_DEPRESSION_IN_H2O), rho_ref);
}

} // namespace CHPT
