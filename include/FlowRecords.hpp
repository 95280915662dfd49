/**
 * @file FlowRecords.hpp
 * @brief Input records of the flow-bench screens and their result container
 *
 * Records come in a US and an SI variant. Upstream parsers fill them;
 * the screens validate them and convert US records to SI before any
 * computation. Fields the engine never reads travel in `extras`.
 */

#ifndef FLOW_RECORDS_HPP
#define FLOW_RECORDS_HPP

#include "AirState.hpp"
#include "UnitSystem.hpp"
#include "ValveGeometry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CHPT {

/**
 * @brief Upstream fields carried through untouched
 */
using Extras = std::map<std::string, std::string>;

/**
 * @brief One output series; nullopt marks an unavailable point
 */
using Series = std::vector<std::optional<double>>;

/**
 * @brief How the raw exhaust/intake ratio is aggregated over the rows
 */
enum class ExIntRatioMode {
    AVG,        // Mean of the per-row ratios
    TOTAL       // Ratio of the summed flows
};

ExIntRatioMode parseExIntRatioMode(const std::string& str);
std::string toString(ExIntRatioMode mode);

// =============================================================================
// Main screen
// =============================================================================

struct MainInputsSI {
    double mach = 0.0;                          // [0, 1]
    double mean_port_area_mm2 = 0.0;
    double bore_mm = 0.0;
    double stroke_mm = 0.0;
    int n_cyl = 0;
    double ve = 1.0;
    std::optional<double> n_ports_eff;          // Default max(1, n_cyl / 2)
    double cr = 10.5;
    std::optional<int> n_int_valves_per_cyl;
    bool siamesed_intake = false;               // Two cylinders share one port
    Extras extras;

    /**
     * @throws InvalidArgument for out-of-range fields
     */
    void validate() const;
};

struct MainInputsUS {
    double mach = 0.0;
    double mean_port_area_in2 = 0.0;
    double bore_in = 0.0;
    double stroke_in = 0.0;
    int n_cyl = 0;
    double ve = 1.0;
    std::optional<double> n_ports_eff;
    double cr = 10.5;
    std::optional<int> n_int_valves_per_cyl;
    bool siamesed_intake = false;
    Extras extras;

    void validate() const;
    MainInputsSI toSI() const;
};

// =============================================================================
// Flow test rows
// =============================================================================

/**
 * @brief One bench point: intake and exhaust flow at a lift
 */
struct FlowRowSI {
    double lift_mm = 0.0;
    double q_in_m3min = 0.0;
    double q_ex_m3min = 0.0;
    double dp_inH2O = 28.0;
    std::optional<double> a_mean_mm2;           // Mean port cross-section
    std::optional<double> a_eff_mm2;            // Measured effective area
    std::optional<double> d_valve_mm;           // Overrides the header valve for L/D
    std::optional<AirState> air;                // Air during this point
    std::optional<double> swirl_in;
    std::optional<double> swirl_ex;
    std::optional<double> wheel_rpm_in;         // Paddle-wheel swirl meter
    std::optional<double> wheel_rpm_ex;
    Extras extras;

    void validate() const;
};

struct FlowRowUS {
    double lift_in = 0.0;
    double q_in_cfm = 0.0;
    double q_ex_cfm = 0.0;
    double dp_inH2O = 28.0;
    std::optional<double> a_mean_in2;
    std::optional<double> a_eff_in2;
    std::optional<double> d_valve_in;
    std::optional<AirState> air;
    std::optional<double> swirl_in;
    std::optional<double> swirl_ex;
    std::optional<double> wheel_rpm_in;
    std::optional<double> wheel_rpm_ex;
    Extras extras;

    void validate() const;
    FlowRowSI toSI() const;
};

// =============================================================================
// Flow test header
// =============================================================================

/**
 * @brief Flow test header, lengths in mm
 *
 * A zero valve diameter means "not supplied"; header aggregates then
 * fail with MissingInput.
 */
struct FlowHeaderSI {
    ValveGeometry intake;
    ValveGeometry exhaust;
    std::optional<PortWindow> intake_window;
    std::optional<PortWindow> exhaust_window;
    int n_int_valves = 1;
    int n_ex_valves = 1;

    double cr = 0.0;
    double max_lift_mm = 0.0;

    std::optional<double> port_volume_cc;
    std::optional<double> port_length_mm;       // Centreline length
    std::optional<double> port_area_mm2;        // Mean cross-section

    std::optional<double> bore_mm;              // Swirl meter bore
    std::optional<AirState> air;                // Measured air (all rows)
    std::optional<AirState> reference_air;      // Correction target

    ExIntRatioMode ratio_mode = ExIntRatioMode::AVG;
    std::optional<int> ratio_rows;              // Leading rows used for E/I
    bool apply_exint_calibration = true;
    bool ex_pipe_used = false;

    EffectiveAreaOptions area_options;
    Extras extras;

    /**
     * @throws MissingInput if a valve diameter was not supplied
     * @throws InvalidArgument / InvalidGeometry for out-of-range fields
     */
    void validate() const;
};

/**
 * @brief Flow test header, lengths in inches
 */
struct FlowHeaderUS {
    ValveGeometry intake;
    ValveGeometry exhaust;
    std::optional<PortWindow> intake_window;
    std::optional<PortWindow> exhaust_window;
    int n_int_valves = 1;
    int n_ex_valves = 1;

    double cr = 0.0;
    double max_lift_in = 0.0;

    std::optional<double> port_volume_in3;
    std::optional<double> port_length_in;
    std::optional<double> port_area_in2;

    std::optional<double> bore_in;
    std::optional<AirState> air;
    std::optional<AirState> reference_air;

    ExIntRatioMode ratio_mode = ExIntRatioMode::AVG;
    std::optional<int> ratio_rows;
    bool apply_exint_calibration = true;
    bool ex_pipe_used = false;

    EffectiveAreaOptions area_options;
    Extras extras;

    void validate() const;
    FlowHeaderSI toSI() const;
};

/**
 * @brief A complete flow test: header plus ordered rows
 */
struct FlowTestSI {
    FlowHeaderSI header;
    std::vector<FlowRowSI> rows;
};

struct FlowTestUS {
    FlowHeaderUS header;
    std::vector<FlowRowUS> rows;

    FlowTestSI toSI() const;
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Output of one screen computation
 *
 * Values are in the display units of `units`; `unit_labels` maps each
 * scalar, series and row column to its unit symbol.
 */
struct ScreenResult {
    UnitBasis units = UnitBasis::SI;
    std::map<std::string, double> scalars;
    std::map<std::string, Series> series;
    std::vector<std::map<std::string, std::optional<double>>> rows;
    std::map<std::string, std::string> unit_labels;

    bool hasScalar(const std::string& name) const;
    bool hasSeries(const std::string& name) const;

    /**
     * @throws std::out_of_range for unknown names
     */
    double getScalar(const std::string& name) const;
    const Series& getSeries(const std::string& name) const;
};

} // namespace CHPT

#endif // FLOW_RECORDS_HPP
