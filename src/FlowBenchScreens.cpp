#include "FlowBenchScreens.hpp"
#include "EngineCoupling.hpp"
#include "ErrorTypes.hpp"
#include "Kinematics.hpp"
#include "UnitSystem.hpp"
#include "ValveGeometry.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace CHPT {

CompareMode parseCompareMode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "lift") return CompareMode::LIFT;
    if (lower == "ld" || lower == "l/d") return CompareMode::LD;
    throw std::invalid_argument("mode must be 'lift' or 'ld', got: " + str);
}

std::string toString(CompareMode mode) {
    return mode == CompareMode::LIFT ? "lift" : "ld";
}

double effectivePortCount(const MainInputsSI& inputs) {
    if (inputs.n_ports_eff) {
        return *inputs.n_ports_eff;
    }
    double n = std::max(1.0, inputs.n_cyl / 2.0);
    if (inputs.siamesed_intake) {
        n = std::max(1.0, n / 2.0);
    }
    return n;
}

std::string scalarQuantity(const std::string& scalar_name) {
    static const std::map<std::string, std::string> quantities = {
        // Main screen
        {"displacement", "displacement"},
        {"mean_port_velocity", "velocity"},
        {"port_flow_per_port", "flow"},
        {"port_flow_chain", "flow"},
        {"port_flow_distributed", "flow"},
        {"n_ports_eff", "count"},
        {"peak_rpm", "rpm"},
        {"shift_rpm", "rpm"},
        {"mean_piston_speed", "piston_speed"},
        {"engine_demand_at_peak", "flow"},
        {"power_limit_port_area", "power"},
        {"power_limit_airflow", "power"},
        {"power_limit_cr", "power"},
        {"compression_ratio_factor", "ratio"},
        {"port_area_per_valve", "area"},
        // Flow test header
        {"max_lift", "lift"},
        {"ld_max", "ld"},
        {"curtain_area_max", "area"},
        {"throat_area", "area"},
        {"window_area", "area"},
        {"a_eff_max", "area"},
        {"flow_total", "flow"},
        {"flow_mean", "flow"},
        {"flow_peak", "flow"},
        {"ei_ratio_raw", "ratio"},
        {"ei_ratio_existing", "ratio"},
        {"ei_ratio_required", "ratio"},
        {"ei_ratio_margin", "ratio"},
        {"port_volume", "port_volume"},
        {"port_length", "length"},
        {"port_area", "area"},
        {"v_mean_peak", "velocity"},
        {"ex_pipe_used", "count"},
        {"n_points", "count"},
    };

    auto it = quantities.find(scalar_name);
    if (it != quantities.end()) return it->second;

    if (scalar_name.size() > 3) {
        std::string tail = scalar_name.substr(scalar_name.size() - 3);
        if (tail == "_in" || tail == "_ex") {
            it = quantities.find(scalar_name.substr(0, scalar_name.size() - 3));
            if (it != quantities.end()) return it->second;
        }
    }
    return "";
}

namespace {

std::string labelFor(const std::string& quantity, UnitBasis basis) {
    std::string unit = UnitSystemManager::getInstance().getDisplayUnit(quantity, basis);
    return unit.empty() ? "-" : unit;
}

// SI display value -> display value of the basis
double toDisplay(double value_si, const std::string& quantity, UnitBasis basis) {
    if (basis == UnitBasis::SI || quantity.empty()) {
        return value_si;
    }
    const UnitSystem& units = UnitSystemManager::getInstance();
    if (units.getDisplayUnit(quantity, UnitBasis::SI) ==
        units.getDisplayUnit(quantity, UnitBasis::US)) {
        return value_si;
    }
    return units.displaySIToUS(value_si, quantity);
}

void labelScalars(ScreenResult& result) {
    for (const auto& pair : result.scalars) {
        result.unit_labels[pair.first] = labelFor(scalarQuantity(pair.first), result.units);
    }
}

void labelSeries(ScreenResult& result) {
    for (const auto& pair : result.series) {
        result.unit_labels[pair.first] =
            labelFor(SeriesBuilder::quantityOf(pair.first), result.units);
    }
    result.unit_labels["ei_ratio"] = labelFor("ratio", result.units);
}

// US kinetic energy of the port jet with the GUI slug density:
// 0.5 * rho[slug/ft³] * v[ft/s]² / 144 -> ft-lbf/in²/ft, times A[in²] -> ft-lbf/ft
void recomputeEnergyUS(SeriesMap& series, const std::string& sfx, double rho_slug) {
    auto v_it = series.find("v_mean" + sfx);
    auto a_it = series.find("a_mean" + sfx);
    if (v_it == series.end() || a_it == series.end()) return;

    Series& density = series["energy_density" + sfx];
    Series& energy = series["energy" + sfx];
    for (size_t i = 0; i < v_it->second.size(); ++i) {
        const auto& v = v_it->second[i];
        if (!v || *v < 0.0) {
            density[i] = std::nullopt;
            energy[i] = std::nullopt;
            continue;
        }
        double ed = 0.5 * rho_slug * (*v) * (*v) / 144.0;
        density[i] = ed;
        const auto& a = a_it->second[i];
        energy[i] = a ? std::optional<double>(ed * (*a)) : std::nullopt;
    }
}

Series columnOf(const RowTable& rows, const std::string& column) {
    Series out;
    for (const auto& row : rows) {
        auto it = row.find(column);
        out.push_back(it != row.end() ? it->second : std::nullopt);
    }
    return out;
}

ScreenResult compareResults(const ScreenResult& a, const ScreenResult& b, CompareMode mode) {
    ScreenResult result;
    result.units = a.units;
    result.series = compareSeries(a.series, b.series);
    result.series["ei_ratio"] = percentDelta(columnOf(a.rows, "ei_ratio"),
                                             columnOf(b.rows, "ei_ratio"));

    const std::string axis = mode == CompareMode::LIFT ? "x_lift" : "x_ld_in";
    Series x = a.getSeries(axis);
    size_t n = std::min(a.rows.size(), b.rows.size());
    x.resize(std::min(x.size(), n));
    result.series["x"] = x;

    for (const auto& pair : result.series) {
        result.unit_labels[pair.first] = labelFor("percent", result.units);
    }
    result.unit_labels["x"] = labelFor(mode == CompareMode::LIFT ? "lift" : "ld", result.units);

    for (size_t i = 0; i < n; ++i) {
        std::map<std::string, std::optional<double>> row;
        for (const auto& pair : result.series) {
            if (i < pair.second.size()) row[pair.first] = pair.second[i];
        }
        result.rows.push_back(row);
    }

    result.scalars["n_points"] = static_cast<double>(n);
    result.unit_labels["n_points"] = labelFor("count", result.units);
    return result;
}

} // anonymous namespace

// =============================================================================
// Main screen
// =============================================================================

ScreenResult computeMainScreenSI(const MainInputsSI& inputs, const CalibrationRegistry& cal) {
    inputs.validate();

    const double n_eff = effectivePortCount(inputs);
    const double bore_m = inputs.bore_mm * 1e-3;
    const double stroke_m = inputs.stroke_mm * 1e-3;
    const double displacement_m3 = inputs.n_cyl * M_PI / 4.0 * bore_m * bore_m * stroke_m;

    PortSupply supply = portSupplyFlow(inputs.mean_port_area_mm2, inputs.mach, n_eff,
                                       UnitBasis::SI, cal);
    double peak = peakRpmFromPortArea(inputs.mean_port_area_mm2, inputs.mach, n_eff,
                                      displacement_m3, inputs.ve, UnitBasis::SI, cal);

    double kw_port = kwLimitFromPortArea(supply.chain, cal);
    double kw_air = kwLimitFromAirflow(supply.distributed, cal);
    double f_cr = compressionRatioFactor(inputs.cr, cal);

    ScreenResult result;
    result.units = UnitBasis::SI;
    result.scalars["displacement"] = displacement_m3 * 1e3;
    result.scalars["mean_port_velocity"] = supply.velocity;
    result.scalars["port_flow_per_port"] = supply.per_port;
    result.scalars["port_flow_chain"] = supply.chain;
    result.scalars["port_flow_distributed"] = supply.distributed;
    result.scalars["n_ports_eff"] = n_eff;
    result.scalars["peak_rpm"] = peak;
    result.scalars["shift_rpm"] = shiftRpm(peak, cal);
    result.scalars["mean_piston_speed"] = meanPistonSpeed(stroke_m, peak);
    result.scalars["engine_demand_at_peak"] =
        engineVolumetricFlow(displacement_m3, peak, inputs.ve) * Units::S_PER_MIN;
    result.scalars["power_limit_port_area"] = kw_port;
    result.scalars["power_limit_airflow"] = kw_air;
    result.scalars["compression_ratio_factor"] = f_cr;
    result.scalars["power_limit_cr"] = std::min(kw_port, kw_air) * f_cr;
    if (inputs.n_int_valves_per_cyl) {
        result.scalars["port_area_per_valve"] =
            inputs.mean_port_area_mm2 / *inputs.n_int_valves_per_cyl;
    }

    labelScalars(result);
    return result;
}

ScreenResult computeMainScreenUS(const MainInputsUS& inputs, const CalibrationRegistry& cal) {
    inputs.validate();

    const double n_eff = effectivePortCount(inputs.toSI());
    const double displacement_in3 =
        inputs.n_cyl * M_PI / 4.0 * inputs.bore_in * inputs.bore_in * inputs.stroke_in;

    PortSupply supply = portSupplyFlow(inputs.mean_port_area_in2, inputs.mach, n_eff,
                                       UnitBasis::US, cal);
    double peak = peakRpmFromPortArea(inputs.mean_port_area_in2, inputs.mach, n_eff,
                                      displacement_in3, inputs.ve, UnitBasis::US, cal);

    double hp_port = hpLimitFromPortArea(supply.chain, cal);
    double hp_air = hpLimitFromAirflow(supply.distributed, cal);
    double f_cr = compressionRatioFactor(inputs.cr, cal);

    ScreenResult result;
    result.units = UnitBasis::US;
    result.scalars["displacement"] = displacement_in3;
    result.scalars["mean_port_velocity"] = supply.velocity;
    result.scalars["port_flow_per_port"] = supply.per_port;
    result.scalars["port_flow_chain"] = supply.chain;
    result.scalars["port_flow_distributed"] = supply.distributed;
    result.scalars["n_ports_eff"] = n_eff;
    result.scalars["peak_rpm"] = peak;
    result.scalars["shift_rpm"] = shiftRpm(peak, cal);
    // in/s -> ft/min
    result.scalars["mean_piston_speed"] =
        meanPistonSpeed(inputs.stroke_in, peak) * Units::S_PER_MIN / 12.0;
    // in³/s -> ft³/min
    result.scalars["engine_demand_at_peak"] =
        engineVolumetricFlow(displacement_in3, peak, inputs.ve) * Units::S_PER_MIN /
        Units::IN3_PER_FT3;
    result.scalars["power_limit_port_area"] = hp_port;
    result.scalars["power_limit_airflow"] = hp_air;
    result.scalars["compression_ratio_factor"] = f_cr;
    result.scalars["power_limit_cr"] = std::min(hp_port, hp_air) * f_cr;
    if (inputs.n_int_valves_per_cyl) {
        result.scalars["port_area_per_valve"] =
            inputs.mean_port_area_in2 / *inputs.n_int_valves_per_cyl;
    }

    labelScalars(result);
    return result;
}

// =============================================================================
// Flow test
// =============================================================================

std::map<std::string, double> flowTestHeaderMetricsSI(const FlowHeaderSI& header,
                                                      const std::vector<FlowRowSI>& rows,
                                                      const CalibrationRegistry& cal) {
    header.validate();
    if (rows.empty()) {
        throw MissingInput("rows");
    }
    for (const auto& row : rows) {
        row.validate();
    }

    SeriesBuilder builder(header, cal);
    std::map<std::string, double> m;
    m["max_lift"] = header.max_lift_mm;

    std::map<PortSide, std::vector<double>> corrected;

    for (PortSide side : {PortSide::INTAKE, PortSide::EXHAUST}) {
        const std::string sfx = "_" + sideSuffix(side);
        const bool intake = side == PortSide::INTAKE;
        const ValveGeometry& valve = intake ? header.intake : header.exhaust;
        const auto& window = intake ? header.intake_window : header.exhaust_window;
        const int n_valves = intake ? header.n_int_valves : header.n_ex_valves;

        m["ld_max" + sfx] = ldRatio(header.max_lift_mm, valve.valve_diameter);
        m["curtain_area_max" + sfx] = n_valves * curtainArea(valve.valve_diameter,
                                                             header.max_lift_mm);
        if (valve.hasThroat()) {
            m["throat_area" + sfx] = n_valves * valve.throatArea();
            m["a_eff_max" + sfx] = effectiveAreaMultiValve(n_valves, header.max_lift_mm, valve,
                                                           header.area_options, window);
        }
        if (window) {
            m["window_area" + sfx] = window->area();
        }

        std::vector<double>& q = corrected[side];
        for (const auto& row : rows) {
            q.push_back(builder.correctedFlow(row, side));
        }
        double total = 0.0;
        for (double v : q) total += v;
        m["flow_total" + sfx] = total;
        m["flow_mean" + sfx] = total / q.size();
        m["flow_peak" + sfx] = *std::max_element(q.begin(), q.end());
    }

    // Exhaust / intake ratio over the leading rows
    const auto& q_in = corrected[PortSide::INTAKE];
    const auto& q_ex = corrected[PortSide::EXHAUST];
    size_t n_used = q_in.size();
    if (header.ratio_rows) {
        n_used = std::min(n_used, static_cast<size_t>(*header.ratio_rows));
    }

    // Without intake flow the ratio is unavailable; only the requirement is reported
    std::optional<double> raw;
    if (header.ratio_mode == ExIntRatioMode::TOTAL) {
        double sum_in = 0.0;
        double sum_ex = 0.0;
        for (size_t i = 0; i < n_used; ++i) {
            sum_in += q_in[i];
            sum_ex += q_ex[i];
        }
        if (sum_in > 0.0) {
            raw = eiRatio(sum_ex, sum_in);
        }
    } else {
        double sum = 0.0;
        int count = 0;
        for (size_t i = 0; i < n_used; ++i) {
            if (q_in[i] > 0.0) {
                sum += eiRatio(q_ex[i], q_in[i]);
                ++count;
            }
        }
        if (count > 0) {
            raw = sum / count;
        }
    }

    double required = requiredExIntRatio(header.cr, header.max_lift_mm, cal);
    m["ei_ratio_required"] = required;
    if (raw) {
        double existing = header.apply_exint_calibration ? existingExIntRatio(*raw, cal) : *raw;
        m["ei_ratio_raw"] = *raw;
        m["ei_ratio_existing"] = existing;
        m["ei_ratio_margin"] = existing - required;
    }

    // Port volume / length / area: any two determine the third
    PortDescriptor port{header.port_volume_cc, header.port_length_mm, header.port_area_mm2};
    int known = (port.volume_cc ? 1 : 0) + (port.length_mm ? 1 : 0) + (port.area_mm2 ? 1 : 0);
    if (known >= 2) {
        port = port.completed();
    }
    if (port.volume_cc) m["port_volume"] = *port.volume_cc;
    if (port.length_mm) m["port_length"] = *port.length_mm;
    if (port.area_mm2) {
        m["port_area"] = *port.area_mm2;
        m["v_mean_peak_in"] = velocityFromFlow(m["flow_peak_in"] / Units::S_PER_MIN,
                                               *port.area_mm2 * 1e-6);
    }

    m["ex_pipe_used"] = header.ex_pipe_used ? 1.0 : 0.0;
    return m;
}

namespace {

// Series and rows of one flow test (SI); header aggregates are not required
ScreenResult flowTestSeriesSI(const FlowTestSI& test, const CalibrationRegistry& cal) {
    for (const auto& row : test.rows) {
        row.validate();
    }

    ScreenResult result;
    result.units = UnitBasis::SI;
    SeriesBuilder builder(test.header, cal);
    result.series = builder.buildAll(test.rows);
    result.rows = SeriesBuilder::rowTable(result.series);
    return result;
}

// SI screen values -> US display values; energy is recomputed in ft-lbf
ScreenResult toDisplayUS(const ScreenResult& si, const CalibrationRegistry& cal) {
    ScreenResult result;
    result.units = UnitBasis::US;

    for (const auto& pair : si.scalars) {
        result.scalars[pair.first] =
            toDisplay(pair.second, scalarQuantity(pair.first), UnitBasis::US);
    }

    for (const auto& pair : si.series) {
        const std::string quantity = SeriesBuilder::quantityOf(pair.first);
        Series& out = result.series[pair.first];
        for (const auto& value : pair.second) {
            out.push_back(value ? std::optional<double>(toDisplay(*value, quantity, UnitBasis::US))
                                : std::nullopt);
        }
    }

    const double rho_slug = cal.get("RHO_SLUG_FT3");
    for (PortSide side : {PortSide::INTAKE, PortSide::EXHAUST}) {
        recomputeEnergyUS(result.series, "_" + sideSuffix(side), rho_slug);
    }

    result.rows = SeriesBuilder::rowTable(result.series);
    return result;
}

} // anonymous namespace

ScreenResult computeFlowTestSI(const FlowTestSI& test, const CalibrationRegistry& cal) {
    ScreenResult result = flowTestSeriesSI(test, cal);
    result.scalars = flowTestHeaderMetricsSI(test.header, test.rows, cal);

    labelScalars(result);
    labelSeries(result);
    return result;
}

ScreenResult computeFlowTestUS(const FlowTestUS& test, const CalibrationRegistry& cal) {
    for (const auto& row : test.rows) {
        row.validate();
    }
    ScreenResult result = toDisplayUS(computeFlowTestSI(test.toSI(), cal), cal);

    labelScalars(result);
    labelSeries(result);
    return result;
}

// =============================================================================
// Compare
// =============================================================================

ScreenResult compareTestsSI(const FlowTestSI& a, const FlowTestSI& b, CompareMode mode,
                            const CalibrationRegistry& cal) {
    return compareResults(flowTestSeriesSI(a, cal), flowTestSeriesSI(b, cal), mode);
}

ScreenResult compareTestsUS(const FlowTestUS& a, const FlowTestUS& b, CompareMode mode,
                            const CalibrationRegistry& cal) {
    for (const FlowTestUS* test : {&a, &b}) {
        for (const auto& row : test->rows) {
            row.validate();
        }
    }
    return compareResults(toDisplayUS(flowTestSeriesSI(a.toSI(), cal), cal),
                          toDisplayUS(flowTestSeriesSI(b.toSI(), cal), cal), mode);
}

} // namespace CHPT
