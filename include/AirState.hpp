/**
 * @file AirState.hpp
 * @brief Bench air thermodynamics: density and speed of sound
 *
 * Moist-air density from total pressure, temperature and relative
 * humidity, with the water-vapour saturation pressure taken from the
 * Tetens approximation (adequate over the 0..50 degC bench range).
 */

#ifndef AIR_STATE_HPP
#define AIR_STATE_HPP

#include <string>

namespace CHPT {

// =============================================================================
// Physical Constants (fixed, never calibration knobs)
// =============================================================================
namespace AirConstants {
    constexpr double GAMMA_AIR = 1.4;              // Ratio of specific heats
    constexpr double R_AIR = 287.058;              // J/(kg·K) dry air
    constexpr double P_STD = 101325.0;             // Pa
    constexpr double T_STD = 293.15;               // K (20°C bench room)
    constexpr double MIN_DRY_PRESSURE = 1.0;       // Pa, floor of the dry partial pressure

    // Tetens saturation pressure coefficients
    constexpr double TETENS_P0 = 610.78;           // Pa
    constexpr double TETENS_A = 17.27;
    constexpr double TETENS_B = 237.3;             // °C
}

/**
 * @brief Immutable air state of a bench measurement
 *
 * All fields SI: total static pressure [Pa], temperature [K],
 * relative humidity [0..1]. RH = 0 ignores water vapour.
 */
struct AirState {
    double p_tot;
    double T;
    double RH;

    AirState(double pressure = AirConstants::P_STD,
             double temperature = AirConstants::T_STD,
             double humidity = 0.0)
        : p_tot(pressure), T(temperature), RH(humidity) {}

    /**
     * @brief Check ranges (p > 0, T > 0, 0 <= RH <= 1)
     * @throws InvalidArgument on violation
     */
    void validate() const;

    double density() const;
    double speedOfSound() const;

    std::string toString() const;
};

/**
 * @brief Water-vapour saturation pressure [Pa] at T [K] (Tetens)
 */
double saturationVaporPressure(double T);

/**
 * @brief Air density [kg/m³]
 *
 * rho = max(1 Pa, p_tot - RH * p_sat(T)) / (R_air * T).
 * The dry partial pressure is floored instead of raising so that the
 * function stays total over physically odd humidity inputs.
 *
 * @throws InvalidArgument if T <= 0
 */
double airDensity(const AirState& state);

/**
 * @brief Speed of sound a = sqrt(gamma * R * T) [m/s]
 * @throws InvalidArgument if T <= 0
 */
double speedOfSound(double T,
                    double gamma = AirConstants::GAMMA_AIR,
                    double R = AirConstants::R_AIR);

} // namespace CHPT

#endif // AIR_STATE_HPP
