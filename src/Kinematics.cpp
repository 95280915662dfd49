#include "Kinematics.hpp"
#include "AirState.hpp"
#include "ErrorTypes.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace CHPT {

namespace {

double flowWeightedMoment(const std::vector<VelocitySample>& samples, double R,
                          const char* name) {
    double num = 0.0;
    double den = 0.0;
    for (const auto& s : samples) {
        num += s.u_tangential * s.u_axial * s.radius * s.area_weight;
        den += s.u_axial * s.u_axial * s.area_weight;
    }
    if (!(R > 0.0) || !(den > 0.0)) {
        throw InvalidArgument(std::string(name) +
                              ": requires R > 0 and a positive axial momentum flux");
    }
    return num / (R * den);
}

} // anonymous namespace

double velocityFromFlow(double q, double area) {
    if (!(area > 0.0)) {
        throw InvalidArgument("velocityFromFlow: area must be > 0");
    }
    return q / area;
}

double machFromVelocity(double v, double T) {
    return v / speedOfSound(T);
}

double velocityPitot(double dp, double rho, double c_probe) {
    if (dp < 0.0 || !(rho > 0.0) || !(c_probe > 0.0)) {
        throw InvalidArgument("velocityPitot: requires dp >= 0, rho > 0, C > 0");
    }
    return c_probe * std::sqrt(2.0 * dp / rho);
}

double swirlNumber(const std::vector<VelocitySample>& samples, double R) {
    return flowWeightedMoment(samples, R, "swirlNumber");
}

double tumbleNumber(const std::vector<VelocitySample>& samples, double R) {
    return flowWeightedMoment(samples, R, "tumbleNumber");
}

double swirlRatioFromWheelRpm(double rpm_wheel, double bore, double q) {
    if (!(bore > 0.0)) {
        throw InvalidArgument("swirlRatioFromWheelRpm: bore must be > 0");
    }
    double a_cyl = M_PI * bore * bore / 4.0;
    double v_bar = velocityFromFlow(q, a_cyl);
    double omega = 2.0 * M_PI * rpm_wheel / 60.0;
    return omega * (0.5 * bore) / std::max(1e-12, v_bar);
}

double portEnergyDensity(double rho, double v) {
    if (!(rho > 0.0) || v < 0.0) {
        throw InvalidArgument("portEnergyDensity: requires rho > 0 and v >= 0");
    }
    return 0.5 * rho * v * v;
}

double machAtMinimumArea(double q, double area_min, double T) {
    return machFromVelocity(velocityFromFlow(q, area_min), T);
}

double eiRatio(double q_ex, double q_in) {
    if (!(q_in > 0.0)) {
        throw InvalidArgument("eiRatio: intake flow must be > 0");
    }
    return q_ex / q_in;
}

double percentChange(double after, double before) {
    if (before == 0.0) {
        throw InvalidArgument("percentChange: reference value must be != 0");
    }
    return 100.0 * (after - before) / before;
}

} // namespace CHPT
