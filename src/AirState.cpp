#include "AirState.hpp"
#include "ErrorTypes.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace CHPT {

void AirState::validate() const {
    if (!(p_tot > 0.0)) {
        throw InvalidArgument("AirState: pressure must be > 0 Pa");
    }
    if (!(T > 0.0)) {
        throw InvalidArgument("AirState: temperature must be > 0 K");
    }
    if (RH < 0.0 || RH > 1.0) {
        throw InvalidArgument("AirState: relative humidity must be within [0, 1]");
    }
}

double AirState::density() const {
    return airDensity(*this);
}

double AirState::speedOfSound() const {
    return CHPT::speedOfSound(T);
}

std::string AirState::toString() const {
    std::ostringstream ss;
    ss << "AirState(p=" << p_tot << " Pa, T=" << T << " K, RH=" << RH << ")";
    return ss.str();
}

double saturationVaporPressure(double T) {
    double Tc = T - 273.15;
    return AirConstants::TETENS_P0 *
           std::exp((AirConstants::TETENS_A * Tc) / (Tc + AirConstants::TETENS_B));
}

double airDensity(const AirState& state) {
    if (!(state.T > 0.0)) {
        throw InvalidArgument("airDensity: temperature must be > 0 K");
    }
    double pv = state.RH * saturationVaporPressure(state.T);
    double pdry = std::max(AirConstants::MIN_DRY_PRESSURE, state.p_tot - pv);
    return pdry / (AirConstants::R_AIR * state.T);
}

double speedOfSound(double T, double gamma, double R) {
    if (!(T > 0.0) || !(gamma > 0.0) || !(R > 0.0)) {
        throw InvalidArgument("speedOfSound: T, gamma and R must be > 0");
    }
    return std::sqrt(gamma * R * T);
}

} // namespace CHPT
