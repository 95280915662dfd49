#include "SeriesBuilder.hpp"
#include "ErrorTypes.hpp"
#include "FlowCoefficients.hpp"
#include "FlowCorrection.hpp"
#include "Kinematics.hpp"
#include "UnitSystem.hpp"
#include "ValveGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace CHPT {

std::string sideSuffix(PortSide side) {
    return side == PortSide::INTAKE ? "in" : "ex";
}

namespace {

// Evaluates one point of one series; impossible inputs make only that point unavailable
template <typename Fn>
std::optional<double> tryPoint(Fn fn) {
    try {
        return fn();
    } catch (const InvalidArgument&) {
        return std::nullopt;
    }
}

} // anonymous namespace

SeriesBuilder::SeriesBuilder(const FlowHeaderSI& header, const CalibrationRegistry& cal)
    : header_(header), cal_(cal) {}

const ValveGeometry& SeriesBuilder::valve(PortSide side) const {
    return side == PortSide::INTAKE ? header_.intake : header_.exhaust;
}

const std::optional<PortWindow>& SeriesBuilder::window(PortSide side) const {
    return side == PortSide::INTAKE ? header_.intake_window : header_.exhaust_window;
}

int SeriesBuilder::valveCount(PortSide side) const {
    return side == PortSide::INTAKE ? header_.n_int_valves : header_.n_ex_valves;
}

double SeriesBuilder::valveDiameter(const FlowRowSI& row, PortSide side) const {
    if (side == PortSide::INTAKE && row.d_valve_mm) {
        return *row.d_valve_mm;
    }
    return valve(side).valve_diameter;
}

double SeriesBuilder::measuredDensity(const FlowRowSI& row) const {
    if (row.air) return airDensity(*row.air);
    if (header_.air) return airDensity(*header_.air);
    return cal_.get("RHO_KGM3_STD");
}

double SeriesBuilder::referenceDensity(const FlowRowSI& row) const {
    if (header_.reference_air) return airDensity(*header_.reference_air);
    return measuredDensity(row);
}

double SeriesBuilder::correctedFlow(const FlowRowSI& row, PortSide side) const {
    double q = side == PortSide::INTAKE ? row.q_in_m3min : row.q_ex_m3min;
    return flowTo28InH2O(q, row.dp_inH2O, measuredDensity(row), referenceDensity(row));
}

// =============================================================================
// Series
// =============================================================================

SeriesMap SeriesBuilder::buildSide(const std::vector<FlowRowSI>& rows, PortSide side) const {
    const std::string sfx = "_" + sideSuffix(side);
    const bool intake = side == PortSide::INTAKE;
    const double dp_ref = Units::inH2OToPa(STANDARD_DEPRESSION_IN_H2O);
    const double rho_std = cal_.get("RHO_KGM3_STD");
    const double a0 = cal_.get("A0_M_S");
    const int n_valves = valveCount(side);

    SeriesMap out;
    Series& flow = out["flow" + sfx];
    Series& flow28 = out["flow28" + sfx];
    Series& curtain = out["curtain_area" + sfx];
    Series& sae_cd = out["sae_cd" + sfx];
    Series& a_eff = out["a_eff" + sfx];
    Series& a_mean_series = out["a_mean" + sfx];
    Series& eff_cd = out["eff_cd" + sfx];
    Series& v_mean = out["v_mean" + sfx];
    Series& v_eff = out["v_eff" + sfx];
    Series& mach = out["mach" + sfx];
    Series& energy_density = out["energy_density" + sfx];
    Series& energy = out["energy" + sfx];
    Series& observed = out["observed_area" + sfx];
    Series& swirl = out["swirl" + sfx];

    for (const auto& row : rows) {
        const double q = intake ? row.q_in_m3min : row.q_ex_m3min;
        const double dp = Units::inH2OToPa(row.dp_inH2O);
        const double rho_m = measuredDensity(row);
        const double rho_r = referenceDensity(row);
        const double d = valveDiameter(row, side);

        flow.push_back(q);

        auto q28 = tryPoint([&]() -> std::optional<double> {
            return flowTo28InH2O(q, row.dp_inH2O, rho_m, rho_r);
        });
        flow28.push_back(q28);

        auto a_curtain = tryPoint([&]() -> std::optional<double> {
            return n_valves * curtainArea(d, row.lift_mm);
        });
        curtain.push_back(a_curtain);

        sae_cd.push_back(tryPoint([&]() -> std::optional<double> {
            if (!a_curtain) return std::nullopt;
            return cdSAE(q / 60.0, dp, rho_m, *a_curtain * 1e-6, dp_ref, rho_r);
        }));

        // Measured effective area first, else the geometric model
        auto a_effective = tryPoint([&]() -> std::optional<double> {
            if (intake && row.a_eff_mm2) return *row.a_eff_mm2;
            if (!valve(side).hasThroat()) return std::nullopt;
            ValveGeometry g = valve(side);
            g.valve_diameter = d;
            return effectiveAreaMultiValve(n_valves, row.lift_mm, g,
                                           header_.area_options, window(side));
        });
        a_eff.push_back(a_effective);

        eff_cd.push_back(tryPoint([&]() -> std::optional<double> {
            if (!a_effective) return std::nullopt;
            return effectiveCd(q / 60.0, dp, rho_m, *a_effective * 1e-6, dp_ref, rho_r);
        }));

        // Mean port cross-section belongs to the intake port
        std::optional<double> a_mean;
        if (intake) {
            a_mean = row.a_mean_mm2 ? row.a_mean_mm2 : header_.port_area_mm2;
        }
        a_mean_series.push_back(a_mean);

        auto velocity = tryPoint([&]() -> std::optional<double> {
            if (!a_mean || !q28) return std::nullopt;
            return velocityFromFlow(*q28 / 60.0, *a_mean * 1e-6);
        });
        v_mean.push_back(velocity);

        v_eff.push_back(tryPoint([&]() -> std::optional<double> {
            if (!a_effective || !q28) return std::nullopt;
            return velocityFromFlow(*q28 / 60.0, *a_effective * 1e-6);
        }));

        mach.push_back(tryPoint([&]() -> std::optional<double> {
            if (!velocity) return std::nullopt;
            if (row.air) return machFromVelocity(*velocity, row.air->T);
            if (header_.air) return machFromVelocity(*velocity, header_.air->T);
            return *velocity / a0;
        }));

        auto e_density = tryPoint([&]() -> std::optional<double> {
            if (!velocity) return std::nullopt;
            return portEnergyDensity(rho_std, *velocity);
        });
        energy_density.push_back(e_density);

        energy.push_back(e_density && a_mean
                         ? std::optional<double>(*e_density * *a_mean * 1e-6)
                         : std::nullopt);

        observed.push_back(tryPoint([&]() -> std::optional<double> {
            if (!q28 || !a_curtain) return std::nullopt;
            if (!(*a_curtain > 0.0)) {
                throw InvalidArgument("observed flow: curtain area must be > 0");
            }
            return *q28 / *a_curtain;
        }));

        swirl.push_back(tryPoint([&]() -> std::optional<double> {
            const auto& measured = intake ? row.swirl_in : row.swirl_ex;
            if (measured) return measured;
            const auto& wheel_rpm = intake ? row.wheel_rpm_in : row.wheel_rpm_ex;
            if (!wheel_rpm || !header_.bore_mm || !q28) return std::nullopt;
            return swirlRatioFromWheelRpm(*wheel_rpm, *header_.bore_mm * 1e-3, *q28 / 60.0);
        }));
    }

    return out;
}

SeriesMap SeriesBuilder::buildAll(const std::vector<FlowRowSI>& rows) const {
    SeriesMap out;
    Series& x_lift = out["x_lift"];
    Series& x_ld_in = out["x_ld_in"];
    Series& x_ld_ex = out["x_ld_ex"];

    for (const auto& row : rows) {
        x_lift.push_back(row.lift_mm);
        x_ld_in.push_back(tryPoint([&]() -> std::optional<double> {
            return ldAxisTick(ldRatio(row.lift_mm, valveDiameter(row, PortSide::INTAKE)));
        }));
        x_ld_ex.push_back(tryPoint([&]() -> std::optional<double> {
            return ldAxisTick(ldRatio(row.lift_mm, valveDiameter(row, PortSide::EXHAUST)));
        }));
    }

    for (PortSide side : {PortSide::INTAKE, PortSide::EXHAUST}) {
        SeriesMap side_series = buildSide(rows, side);
        out.insert(side_series.begin(), side_series.end());
    }
    return out;
}

std::string SeriesBuilder::quantityOf(const std::string& series_name) {
    static const std::map<std::string, std::string> quantities = {
        {"x_lift", "lift"},
        {"x_ld", "ld"},
        {"flow", "flow"},
        {"flow28", "flow"},
        {"curtain_area", "area"},
        {"sae_cd", "cd"},
        {"a_eff", "area"},
        {"a_mean", "area"},
        {"eff_cd", "cd"},
        {"v_mean", "velocity"},
        {"v_eff", "velocity"},
        {"mach", "mach"},
        {"energy_density", "energy_density"},
        {"energy", "energy"},
        {"observed_area", "observed_flow_area"},
        {"swirl", "swirl"},
        {"ei_ratio", "ratio"},
    };

    std::string base = series_name;
    if (base.size() > 3) {
        std::string tail = base.substr(base.size() - 3);
        if (tail == "_in" || tail == "_ex") {
            base = base.substr(0, base.size() - 3);
        }
    }

    auto it = quantities.find(base);
    return it != quantities.end() ? it->second : "";
}

RowTable SeriesBuilder::rowTable(const SeriesMap& series) {
    size_t n_rows = 0;
    for (const auto& pair : series) {
        n_rows = std::max(n_rows, pair.second.size());
    }

    RowTable table(n_rows);
    for (const auto& pair : series) {
        for (size_t i = 0; i < pair.second.size(); ++i) {
            table[i][pair.first] = pair.second[i];
        }
    }

    for (auto& row : table) {
        auto q_in = row.find("flow28_in");
        auto q_ex = row.find("flow28_ex");
        std::optional<double> ratio;
        if (q_in != row.end() && q_ex != row.end() && q_in->second && q_ex->second) {
            ratio = tryPoint([&]() -> std::optional<double> {
                return eiRatio(*q_ex->second, *q_in->second);
            });
        }
        row["ei_ratio"] = ratio;
    }

    return table;
}

// =============================================================================
// Comparison
// =============================================================================

Series percentDelta(const Series& a, const Series& b) {
    size_t n = std::min(a.size(), b.size());
    Series out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (!a[i] || !b[i] || *b[i] == 0.0) {
            out.push_back(std::nullopt);
            continue;
        }
        double delta = percentChange(*a[i], *b[i]);
        out.push_back(std::isfinite(delta) ? std::optional<double>(delta) : std::nullopt);
    }
    return out;
}

SeriesMap compareSeries(const SeriesMap& a, const SeriesMap& b) {
    SeriesMap out;
    for (const auto& pair : a) {
        if (pair.first.compare(0, 2, "x_") == 0) continue;
        auto it = b.find(pair.first);
        if (it != b.end()) {
            out[pair.first] = percentDelta(pair.second, it->second);
        }
    }
    return out;
}

} // namespace CHPT
