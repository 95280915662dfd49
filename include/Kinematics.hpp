/**
 * @file Kinematics.hpp
 * @brief Port velocities, Mach numbers, swirl/tumble and jet energy
 *
 * SI throughout unless a function says otherwise.
 */

#ifndef KINEMATICS_HPP
#define KINEMATICS_HPP

#include <vector>

namespace CHPT {

/**
 * @brief One sample of a discretized velocity field over a cylinder plane
 *
 * For swirl u_tangential is the circumferential component and radius the
 * distance from the bore axis; for tumble they are the transverse
 * component and the distance from the tumble axis.
 */
struct VelocitySample {
    double u_tangential;
    double u_axial;
    double radius;
    double area_weight;
};

/**
 * @brief Mean velocity V = Q / A
 * @throws InvalidArgument if A <= 0
 */
double velocityFromFlow(double q, double area);

/**
 * @brief Mach = v / a(T)
 */
double machFromVelocity(double v, double T);

/**
 * @brief Pitot-probe velocity V = C * sqrt(2 * dp / rho)
 * @throws InvalidArgument unless dp >= 0, rho > 0, C > 0
 */
double velocityPitot(double dp, double rho, double c_probe = 1.0);

/**
 * @brief Discrete swirl number S = sum(u_t u_z r dA) / (R sum(u_z^2 dA))
 * @throws InvalidArgument unless R > 0 and the denominator is positive
 */
double swirlNumber(const std::vector<VelocitySample>& samples, double R);

/**
 * @brief Discrete tumble number, same integral about a transverse axis
 */
double tumbleNumber(const std::vector<VelocitySample>& samples, double R);

/**
 * @brief Swirl ratio from a paddle-wheel swirl meter
 *
 * SR = omega * (bore/2) / Vbar with omega = 2*pi*rpm/60 and
 * Vbar = Q / (pi/4 * bore^2).
 *
 * @param rpm_wheel Paddle wheel speed [rpm]
 * @param bore Cylinder bore [m]
 * @param q Flow through the bore [m³/s]
 */
double swirlRatioFromWheelRpm(double rpm_wheel, double bore, double q);

/**
 * @brief Kinetic energy density of the port jet 0.5 * rho * v^2 [J/m³]
 * @throws InvalidArgument unless rho > 0 and v >= 0
 */
double portEnergyDensity(double rho, double v);

/**
 * @brief Mach number at the minimum cross-section for flow Q
 */
double machAtMinimumArea(double q, double area_min, double T);

/**
 * @brief Exhaust-to-intake flow ratio
 * @throws InvalidArgument if q_in <= 0
 */
double eiRatio(double q_ex, double q_in);

/**
 * @brief 100 * (after - before) / before
 * @throws InvalidArgument if before == 0
 */
double percentChange(double after, double before);

} // namespace CHPT

#endif // KINEMATICS_HPP
