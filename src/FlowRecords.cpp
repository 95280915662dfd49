#include "FlowRecords.hpp"
#include "ErrorTypes.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CHPT {

ExIntRatioMode parseExIntRatioMode(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "AVG" || upper == "AVERAGE") return ExIntRatioMode::AVG;
    if (upper == "TOTAL") return ExIntRatioMode::TOTAL;
    throw std::invalid_argument("E/I ratio mode must be 'AVG' or 'TOTAL', got: " + str);
}

std::string toString(ExIntRatioMode mode) {
    return mode == ExIntRatioMode::AVG ? "AVG" : "TOTAL";
}

namespace {

void requirePositive(double value, const char* field) {
    if (!(value > 0.0)) {
        throw InvalidArgument(std::string(field) + " must be > 0");
    }
}

void requireNonNegative(double value, const char* field) {
    if (value < 0.0) {
        throw InvalidArgument(std::string(field) + " must be >= 0");
    }
}

void requirePositive(const std::optional<double>& value, const char* field) {
    if (value) requirePositive(*value, field);
}

std::optional<double> convertOptional(const std::optional<double>& value,
                                      const std::string& from, const std::string& to) {
    if (!value) return std::nullopt;
    return UnitSystemManager::getInstance().convert(*value, from, to);
}

double lengthToMm(double value_in) {
    return UnitSystemManager::getInstance().convert(value_in, "in", "mm");
}

ValveGeometry valveToMm(const ValveGeometry& g) {
    ValveGeometry out;
    out.valve_diameter = lengthToMm(g.valve_diameter);
    out.throat_diameter = convertOptional(g.throat_diameter, "in", "mm");
    out.stem_diameter = lengthToMm(g.stem_diameter);
    out.seat_angle_deg = g.seat_angle_deg;
    out.seat_width = convertOptional(g.seat_width, "in", "mm");
    return out;
}

std::optional<PortWindow> windowToMm(const std::optional<PortWindow>& w) {
    if (!w) return std::nullopt;
    PortWindow out;
    out.width = lengthToMm(w->width);
    out.height = lengthToMm(w->height);
    out.r_top = lengthToMm(w->r_top);
    out.r_bot = lengthToMm(w->r_bot);
    return out;
}

void validateSide(const ValveGeometry& valve, const std::optional<PortWindow>& window,
                  int n_valves, const std::string& side) {
    if (valve.valve_diameter == 0.0) {
        throw MissingInput(side + ".valve_diameter");
    }
    valve.validate();
    if (window) {
        // Throws InvalidGeometry for a degenerate window
        static_cast<void>(window->area());
    }
    if (n_valves < 1) {
        throw InvalidArgument(side + " valve count must be >= 1");
    }
}

void validateRowCommon(double lift, double q_in, double q_ex, double dp,
                       const std::optional<AirState>& air) {
    requirePositive(lift, "lift");
    requireNonNegative(q_in, "intake flow");
    requireNonNegative(q_ex, "exhaust flow");
    requirePositive(dp, "depression");
    if (air) air->validate();
}

} // anonymous namespace

// =============================================================================
// Main screen
// =============================================================================

void MainInputsSI::validate() const {
    if (mach < 0.0 || mach > 1.0) {
        throw InvalidArgument("mach must be within [0, 1]");
    }
    requirePositive(mean_port_area_mm2, "mean_port_area_mm2");
    requirePositive(bore_mm, "bore_mm");
    requirePositive(stroke_mm, "stroke_mm");
    if (n_cyl < 1) {
        throw InvalidArgument("n_cyl must be >= 1");
    }
    requirePositive(ve, "ve");
    requirePositive(n_ports_eff, "n_ports_eff");
    requirePositive(cr, "cr");
    if (n_int_valves_per_cyl && *n_int_valves_per_cyl < 1) {
        throw InvalidArgument("n_int_valves_per_cyl must be >= 1");
    }
}

void MainInputsUS::validate() const {
    toSI().validate();
}

MainInputsSI MainInputsUS::toSI() const {
    const UnitSystem& units = UnitSystemManager::getInstance();

    MainInputsSI si;
    si.mach = mach;
    si.mean_port_area_mm2 = units.convert(mean_port_area_in2, "in2", "mm2");
    si.bore_mm = units.convert(bore_in, "in", "mm");
    si.stroke_mm = units.convert(stroke_in, "in", "mm");
    si.n_cyl = n_cyl;
    si.ve = ve;
    si.n_ports_eff = n_ports_eff;
    si.cr = cr;
    si.n_int_valves_per_cyl = n_int_valves_per_cyl;
    si.siamesed_intake = siamesed_intake;
    si.extras = extras;
    return si;
}

// =============================================================================
// Flow test rows
// =============================================================================

void FlowRowSI::validate() const {
    validateRowCommon(lift_mm, q_in_m3min, q_ex_m3min, dp_inH2O, air);
    requirePositive(a_mean_mm2, "a_mean_mm2");
    requirePositive(a_eff_mm2, "a_eff_mm2");
    requirePositive(d_valve_mm, "d_valve_mm");
}

void FlowRowUS::validate() const {
    validateRowCommon(lift_in, q_in_cfm, q_ex_cfm, dp_inH2O, air);
    requirePositive(a_mean_in2, "a_mean_in2");
    requirePositive(a_eff_in2, "a_eff_in2");
    requirePositive(d_valve_in, "d_valve_in");
}

FlowRowSI FlowRowUS::toSI() const {
    const UnitSystem& units = UnitSystemManager::getInstance();

    FlowRowSI si;
    si.lift_mm = units.convert(lift_in, "in", "mm");
    si.q_in_m3min = units.convert(q_in_cfm, "cfm", "m3/min");
    si.q_ex_m3min = units.convert(q_ex_cfm, "cfm", "m3/min");
    si.dp_inH2O = dp_inH2O;
    si.a_mean_mm2 = convertOptional(a_mean_in2, "in2", "mm2");
    si.a_eff_mm2 = convertOptional(a_eff_in2, "in2", "mm2");
    si.d_valve_mm = convertOptional(d_valve_in, "in", "mm");
    si.air = air;
    si.swirl_in = swirl_in;
    si.swirl_ex = swirl_ex;
    si.wheel_rpm_in = wheel_rpm_in;
    si.wheel_rpm_ex = wheel_rpm_ex;
    si.extras = extras;
    return si;
}

// =============================================================================
// Flow test header
// =============================================================================

void FlowHeaderSI::validate() const {
    validateSide(intake, intake_window, n_int_valves, "intake");
    validateSide(exhaust, exhaust_window, n_ex_valves, "exhaust");

    requirePositive(cr, "cr");
    requirePositive(max_lift_mm, "max_lift_mm");
    requirePositive(port_volume_cc, "port_volume_cc");
    requirePositive(port_length_mm, "port_length_mm");
    requirePositive(port_area_mm2, "port_area_mm2");
    requirePositive(bore_mm, "bore_mm");

    if (air) air->validate();
    if (reference_air) reference_air->validate();

    if (ratio_rows && *ratio_rows < 1) {
        throw InvalidArgument("ratio_rows must be >= 1");
    }
    if (area_options.smoothmin_n < 1) {
        throw InvalidArgument("smoothmin_n must be >= 1");
    }
}

void FlowHeaderUS::validate() const {
    toSI().validate();
}

FlowHeaderSI FlowHeaderUS::toSI() const {
    const UnitSystem& units = UnitSystemManager::getInstance();

    FlowHeaderSI si;
    si.intake = valveToMm(intake);
    si.exhaust = valveToMm(exhaust);
    si.intake_window = windowToMm(intake_window);
    si.exhaust_window = windowToMm(exhaust_window);
    si.n_int_valves = n_int_valves;
    si.n_ex_valves = n_ex_valves;
    si.cr = cr;
    si.max_lift_mm = units.convert(max_lift_in, "in", "mm");
    si.port_volume_cc = convertOptional(port_volume_in3, "in3", "cc");
    si.port_length_mm = convertOptional(port_length_in, "in", "mm");
    si.port_area_mm2 = convertOptional(port_area_in2, "in2", "mm2");
    si.bore_mm = convertOptional(bore_in, "in", "mm");
    si.air = air;
    si.reference_air = reference_air;
    si.ratio_mode = ratio_mode;
    si.ratio_rows = ratio_rows;
    si.apply_exint_calibration = apply_exint_calibration;
    si.ex_pipe_used = ex_pipe_used;
    si.area_options = area_options;
    si.extras = extras;
    return si;
}

FlowTestSI FlowTestUS::toSI() const {
    FlowTestSI si;
    si.header = header.toSI();
    for (const auto& row : rows) {
        si.rows.push_back(row.toSI());
    }
    return si;
}

// =============================================================================
// ScreenResult
// =============================================================================

bool ScreenResult::hasScalar(const std::string& name) const {
    return scalars.find(name) != scalars.end();
}

bool ScreenResult::hasSeries(const std::string& name) const {
    return series.find(name) != series.end();
}

double ScreenResult::getScalar(const std::string& name) const {
    auto it = scalars.find(name);
    if (it == scalars.end()) {
        throw std::out_of_range("No scalar named " + name);
    }
    return it->second;
}

const Series& ScreenResult::getSeries(const std::string& name) const {
    auto it = series.find(name);
    if (it == series.end()) {
        throw std::out_of_range("No series named " + name);
    }
    return it->second;
}

} // namespace CHPT
