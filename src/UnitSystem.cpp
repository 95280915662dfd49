#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace CHPT {

std::string toString(UnitBasis basis) {
    return basis == UnitBasis::US ? "US" : "SI";
}

UnitBasis parseUnitBasis(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "US") return UnitBasis::US;
    if (upper == "SI") return UnitBasis::SI;
    throw std::invalid_argument("units must be 'US' or 'SI', got: " + str);
}

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto append = [&](const char* sym, double exponent) {
        if (std::abs(exponent) <= 1e-10) return;
        if (!first) ss << " ";
        ss << sym;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    append("L", L);
    append("M", M);
    append("T", T);
    append("Theta", Theta);

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addAreaUnits();
    addVolumeUnits();
    addVolumetricRateUnits();
    addVelocityUnits();
    addPressureUnits();
    addDensityUnits();
    addTemperatureUnits();
    addPowerUnits();
    addForceUnits();
    addRotationalUnits();

    registerUnit(Unit("dimensionless", "-", Dimension(), 1.0, "dimensionless"));
    registerUnit(Unit("percent", "%", Dimension(), 1.0, "dimensionless"));

    addDisplayUnits();
}

// =============================================================================
// Length / Area / Volume
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length"));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 1e-3, "length"));
    registerUnit(Unit("inch", "in", length, Units::MM_PER_IN * 1e-3, "length"));
    registerUnit(Unit("foot", "ft", length, 12.0 * Units::MM_PER_IN * 1e-3, "length"));
}

void UnitSystem::addAreaUnits() {
    Dimension area(2, 0, 0);

    registerUnit(Unit("square meter", "m2", area, 1.0, "area"));
    registerUnit(Unit("square centimeter", "cm2", area, 1e-4, "area"));
    registerUnit(Unit("square millimeter", "mm2", area, 1e-6, "area"));
    registerUnit(Unit("square inch", "in2", area, Units::MM2_PER_IN2 * 1e-6, "area"));
    registerUnit(Unit("square foot", "ft2", area, 144.0 * Units::MM2_PER_IN2 * 1e-6, "area"));
}

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    registerUnit(Unit("cubic meter", "m3", volume, 1.0, "volume"));
    registerUnit(Unit("liter", "L", volume, 1e-3, "volume"));

    Unit cc("cubic centimeter", "cc", volume, 1e-6, "volume");
    cc.aliases = {"cm3", "mL"};
    registerUnit(cc);

    Unit in3("cubic inch", "in3", volume, Units::CC_PER_IN3 * 1e-6, "volume");
    in3.aliases = {"cid", "ci"};
    registerUnit(in3);

    registerUnit(Unit("cubic foot", "ft3", volume,
                      Units::IN3_PER_FT3 * Units::CC_PER_IN3 * 1e-6, "volume"));
}

void UnitSystem::addVolumetricRateUnits() {
    Dimension rate(3, 0, -1);

    registerUnit(Unit("cubic meter per second", "m3/s", rate, 1.0, "volumetric_rate"));
    registerUnit(Unit("cubic meter per minute", "m3/min", rate, 1.0 / Units::S_PER_MIN,
                      "volumetric_rate"));
    registerUnit(Unit("liter per second", "L/s", rate, 1e-3, "volumetric_rate"));

    Unit cfm("cubic foot per minute", "cfm", rate,
             Units::M3MIN_PER_CFM / Units::S_PER_MIN, "volumetric_rate");
    cfm.aliases = {"ft3/min"};
    registerUnit(cfm);
}

void UnitSystem::addVelocityUnits() {
    Dimension velocity(1, 0, -1);

    registerUnit(Unit("meter per second", "m/s", velocity, 1.0, "velocity"));
    registerUnit(Unit("foot per second", "ft/s", velocity, Units::MS_PER_FTS, "velocity"));
    registerUnit(Unit("foot per minute", "ft/min", velocity,
                      Units::MS_PER_FTS / Units::S_PER_MIN, "velocity"));
    registerUnit(Unit("kilometer per hour", "km/h", velocity, 1.0 / 3.6, "velocity"));

    // Observed flow per unit curtain area has velocity dimension
    registerUnit(Unit("cubic meter per minute per square millimeter", "m3/min/mm2",
                      velocity, 1.0 / (Units::S_PER_MIN * 1e-6), "velocity"));
    registerUnit(Unit("cfm per square inch", "cfm/in2", velocity,
                      (Units::M3MIN_PER_CFM / Units::S_PER_MIN) / (Units::MM2_PER_IN2 * 1e-6),
                      "velocity"));
}

// =============================================================================
// Pressure / Density / Temperature
// =============================================================================

void UnitSystem::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1e3, "pressure"));
    registerUnit(Unit("bar", "bar", pressure, 1e5, "pressure"));
    registerUnit(Unit("psi", "psi", pressure, 6894.757293168, "pressure"));
    registerUnit(Unit("inch of mercury", "inHg", pressure, 3386.389, "pressure"));

    Unit in_h2o("inch of water", "inH2O", pressure, Units::PA_PER_IN_H2O, "pressure");
    in_h2o.aliases = {"inwc", "in H2O"};
    registerUnit(in_h2o);

    // Kinetic energy densities are reported as pressures
    registerUnit(Unit("joule per cubic meter", "J/m3", pressure, 1.0, "energy_density"));
    registerUnit(Unit("foot pound-force per square inch foot", "ft-lbf/in2/ft", pressure,
                      6894.757293168, "energy_density"));
}

void UnitSystem::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density"));
    registerUnit(Unit("slug per cubic foot", "slug/ft3", density, 515.3788184, "density"));
    registerUnit(Unit("pound mass per cubic foot", "lbm/ft3", density, 16.01846337, "density"));
}

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));
    registerUnit(Unit("rankine", "R", temperature, 5.0 / 9.0, "temperature"));

    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.offset = Units::KELVIN_OFFSET;
    registerUnit(celsius);

    Unit fahrenheit("fahrenheit", "degF", temperature, 5.0 / 9.0, "temperature");
    fahrenheit.offset = Units::RANKINE_OFFSET;
    registerUnit(fahrenheit);
}

// =============================================================================
// Power / Force / Rotation
// =============================================================================

void UnitSystem::addPowerUnits() {
    Dimension power(2, 1, -3);

    registerUnit(Unit("watt", "W", power, 1.0, "power"));
    registerUnit(Unit("kilowatt", "kW", power, 1e3, "power"));

    Unit hp("horsepower", "hp", power, Units::W_PER_HP, "power");
    hp.aliases = {"HP"};
    registerUnit(hp);
}

void UnitSystem::addForceUnits() {
    Dimension force(1, 1, -2);

    registerUnit(Unit("newton", "N", force, 1.0, "force"));
    registerUnit(Unit("pound force", "lbf", force, 4.4482216152605, "force"));

    // Port energy per unit length
    registerUnit(Unit("joule per meter", "J/m", force, 1.0, "energy_per_length"));
    registerUnit(Unit("foot pound-force per foot", "ft-lbf/ft", force, 4.4482216152605,
                      "energy_per_length"));
}

void UnitSystem::addRotationalUnits() {
    Dimension frequency(0, 0, -1);

    registerUnit(Unit("revolution per second", "rev/s", frequency, 1.0, "rotation"));

    Unit rpm("revolution per minute", "rpm", frequency, 1.0 / Units::S_PER_MIN, "rotation");
    rpm.aliases = {"RPM"};
    registerUnit(rpm);
}

// =============================================================================
// Display units of screen quantities
// =============================================================================

void UnitSystem::addDisplayUnits() {
    display_units_["lift"] = {"mm", "in"};
    display_units_["length"] = {"mm", "in"};
    display_units_["ld"] = {"-", "-"};
    display_units_["flow"] = {"m3/min", "cfm"};
    display_units_["area"] = {"mm2", "in2"};
    display_units_["velocity"] = {"m/s", "ft/s"};
    display_units_["mach"] = {"-", "-"};
    display_units_["cd"] = {"-", "-"};
    display_units_["energy_density"] = {"J/m3", "ft-lbf/in2/ft"};
    display_units_["energy"] = {"J/m", "ft-lbf/ft"};
    display_units_["observed_flow_area"] = {"m3/min/mm2", "cfm/in2"};
    display_units_["displacement"] = {"L", "in3"};
    display_units_["port_volume"] = {"cc", "in3"};
    display_units_["rpm"] = {"rpm", "rpm"};
    display_units_["power"] = {"kW", "hp"};
    display_units_["piston_speed"] = {"m/s", "ft/min"};
    display_units_["ratio"] = {"-", "-"};
    display_units_["count"] = {"-", "-"};
    display_units_["swirl"] = {"-", "-"};
    display_units_["percent"] = {"%", "%"};
    display_units_["pressure"] = {"inH2O", "inH2O"};
}

// =============================================================================
// Helpers
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbols are case-sensitive (mm vs Mm would differ); keep exact match only
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(key);
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        return unit->dimension;
    }
    throw std::invalid_argument("Unit not found: " + unit_name);
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::invalid_argument("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::invalid_argument("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::invalid_argument("Incompatible dimensions: " +
                                    from->dimension.toString() + " vs " +
                                    to->dimension.toString());
    }

    if (from == to) return value;

    double base_value = from->convertToBase(value);
    return to->convertFromBase(base_value);
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::invalid_argument("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

// =============================================================================
// Display units
// =============================================================================

std::string UnitSystem::getDisplayUnit(const std::string& quantity, UnitBasis basis) const {
    auto it = display_units_.find(quantity);
    if (it == display_units_.end()) {
        return "";
    }
    return basis == UnitBasis::SI ? it->second.first : it->second.second;
}

double UnitSystem::displaySIToUS(double value, const std::string& quantity) const {
    auto it = display_units_.find(quantity);
    if (it == display_units_.end()) {
        throw std::invalid_argument("No display unit for quantity: " + quantity);
    }
    return convert(value, it->second.first, it->second.second);
}

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::stringstream ss;
    ss << std::setprecision(precision) << value << " " << unit;
    return ss.str();
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(45) << std::left << u.name
                   << " [" << std::setw(14) << u.symbol << "] "
                   << " = " << u.to_base << " * base SI"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace CHPT
