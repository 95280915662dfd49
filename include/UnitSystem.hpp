#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <ostream>
#include <stdexcept>
#include <cmath>

namespace CHPT {

/**
 * @brief The two parallel unit systems of the flow-bench screens
 *
 * US: inches, in², CFM, ft/s, in³, HP.
 * SI: millimetres, mm², m³/min, m/s, litres, kW.
 */
enum class UnitBasis {
    US,
    SI
};

std::string toString(UnitBasis basis);
UnitBasis parseUnitBasis(const std::string& str);

// =============================================================================
// Fixed conversion factors
// =============================================================================
namespace Units {
    constexpr double MM_PER_IN = 25.4;
    constexpr double MM2_PER_IN2 = 645.16;
    constexpr double CC_PER_IN3 = 16.387064;
    constexpr double IN3_PER_FT3 = 1728.0;
    constexpr double M3MIN_PER_CFM = 0.028316846592;
    constexpr double S_PER_MIN = 60.0;
    constexpr double MS_PER_FTS = 0.3048;
    constexpr double PA_PER_IN_H2O = 249.0889;     // 1 inH2O at ~4 degC, bench standard
    constexpr double KELVIN_OFFSET = 273.15;
    constexpr double RANKINE_OFFSET = 459.67;
    constexpr double W_PER_HP = 745.69987158227022;

    // Length
    inline double mmToIn(double mm) { return mm / MM_PER_IN; }
    inline double inToMm(double in) { return in * MM_PER_IN; }
    inline double mmToM(double mm) { return mm * 1e-3; }
    inline double mToMm(double m) { return m * 1e3; }

    // Area
    inline double mm2ToIn2(double mm2) { return mm2 / MM2_PER_IN2; }
    inline double in2ToMm2(double in2) { return in2 * MM2_PER_IN2; }
    inline double mm2ToM2(double mm2) { return mm2 * 1e-6; }
    inline double m2ToMm2(double m2) { return m2 * 1e6; }

    // Volume
    inline double ccToIn3(double cc) { return cc / CC_PER_IN3; }
    inline double in3ToCc(double in3) { return in3 * CC_PER_IN3; }

    // Volumetric flow
    inline double cfmToM3min(double cfm) { return cfm * M3MIN_PER_CFM; }
    inline double m3minToCfm(double m3min) { return m3min / M3MIN_PER_CFM; }
    inline double m3minToM3s(double m3min) { return m3min / S_PER_MIN; }
    inline double m3sToM3min(double m3s) { return m3s * S_PER_MIN; }
    inline double cfmToM3s(double cfm) { return m3minToM3s(cfmToM3min(cfm)); }
    inline double m3sToCfm(double m3s) { return m3minToCfm(m3sToM3min(m3s)); }

    // Velocity
    inline double ftsToMs(double fts) { return fts * MS_PER_FTS; }
    inline double msToFts(double ms) { return ms / MS_PER_FTS; }

    // Pressure (bench depression)
    inline double inH2OToPa(double in_h2o) { return in_h2o * PA_PER_IN_H2O; }
    inline double paToInH2O(double pa) { return pa / PA_PER_IN_H2O; }

    // Temperature
    inline double cToK(double t_c) { return t_c + KELVIN_OFFSET; }
    inline double fToK(double t_f) { return (t_f + RANKINE_OFFSET) * 5.0 / 9.0; }
    inline double kToC(double t_k) { return t_k - KELVIN_OFFSET; }

    // Power
    inline double hpToKw(double hp) { return hp * W_PER_HP * 1e-3; }
    inline double kwToHp(double kw) { return kw * 1e3 / W_PER_HP; }
}

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temp = 0)
        : L(length), M(mass), T(time), Theta(temp) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units
 *
 * Base units: m, kg, s, K. Affine units (degC, degF) carry an offset
 * that is added before scaling: base = (value + offset) * to_base.
 */
struct Unit {
    std::string name;
    std::string symbol;
    Dimension dimension;
    double to_base;
    double offset;
    std::string category;
    std::vector<std::string> aliases;

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}

    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database for flow-bench quantities
 *
 * Provides conversion between any compatible registered units and the
 * display unit (label) of every screen quantity in each unit basis.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    std::vector<std::string> getCategories() const;

    Dimension getDimension(const std::string& unit_name) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::invalid_argument for unknown units or incompatible dimensions
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Display units
    // =========================================================================

    /**
     * @brief Unit symbol a screen quantity is reported in
     * @param quantity Quantity key, e.g. "lift", "flow", "velocity"
     * @return Unit symbol, or empty string for unknown quantities
     */
    std::string getDisplayUnit(const std::string& quantity, UnitBasis basis) const;

    /**
     * @brief Convert a value of a screen quantity from SI display units to US
     */
    double displaySIToUS(double value, const std::string& quantity) const;

    /**
     * @brief "value unit" with the given significant digits
     */
    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

    /**
     * @brief Every registered unit, grouped by category
     */
    void printDatabase(std::ostream& os) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    // quantity -> {SI symbol, US symbol}
    std::map<std::string, std::pair<std::string, std::string>> display_units_;

    void initializeDatabase();

    void addLengthUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addVolumetricRateUnits();
    void addVelocityUnits();
    void addPressureUnits();
    void addDensityUnits();
    void addTemperatureUnits();
    void addPowerUnits();
    void addForceUnits();
    void addRotationalUnits();
    void addDisplayUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
};

/**
 * @brief Global unit database (read-only after construction)
 */
class UnitSystemManager {
public:
    static const UnitSystem& getInstance() {
        static const UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

} // namespace CHPT

#endif // UNIT_SYSTEM_HPP
