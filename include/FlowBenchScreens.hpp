/**
 * @file FlowBenchScreens.hpp
 * @brief Entry points of the three flow-bench screens
 *
 * One entry point per screen per unit system:
 * - Main screen: port-limited peak RPM and power limits
 * - Flow test: header aggregates, per-lift series and row table
 * - Compare: percent deltas between two flow tests
 *
 * US inputs are validated, converted to SI and computed there; results
 * come back in the display units of the caller's unit system. The main
 * screen is the exception: its calibration is unit specific (a0 and the
 * HP/kW slopes), so the US variant is evaluated with the US constants.
 * CalibrationRegistry::crossUnitDiscrepancies() reports the differences.
 */

#ifndef FLOW_BENCH_SCREENS_HPP
#define FLOW_BENCH_SCREENS_HPP

#include "CalibrationRegistry.hpp"
#include "FlowRecords.hpp"
#include "SeriesBuilder.hpp"
#include <map>
#include <string>

namespace CHPT {

enum class CompareMode {
    LIFT,       // Pair points by lift order, x axis = lift
    LD          // Pair points by lift order, x axis = intake L/D
};

CompareMode parseCompareMode(const std::string& str);
std::string toString(CompareMode mode);

/**
 * @brief Effective intake port count of the main screen
 *
 * Explicit n_ports_eff if given, else max(1, n_cyl / 2); halved (not
 * below 1) for siamesed intake ports.
 */
double effectivePortCount(const MainInputsSI& inputs);

// =============================================================================
// Main screen
// =============================================================================

/**
 * @brief Main screen in SI (mm, m³/min, m/s, L, kW)
 * @throws InvalidArgument for invalid inputs
 */
ScreenResult computeMainScreenSI(const MainInputsSI& inputs, const CalibrationRegistry& cal);

/**
 * @brief Main screen in US (in, CFM, ft/s, in³, hp)
 */
ScreenResult computeMainScreenUS(const MainInputsUS& inputs, const CalibrationRegistry& cal);

// =============================================================================
// Flow test
// =============================================================================

/**
 * @brief Header aggregates of a flow test (SI display units)
 *
 * Fails hard where the per-lift series degrade: missing valve diameters
 * raise MissingInput, an empty row list raises MissingInput("rows").
 *
 * Scalars: ld_max_*, curtain_area_max_*, throat_area_*, window_area_*,
 * a_eff_max_*, flow_total_*, flow_mean_*, flow_peak_*, ei_ratio_raw,
 * ei_ratio_existing, ei_ratio_required, ei_ratio_margin, port_volume,
 * port_length, port_area, v_mean_peak_in.
 *
 * ei_ratio_raw / _existing / _margin are left out when none of the rows
 * used for the ratio has intake flow.
 */
std::map<std::string, double> flowTestHeaderMetricsSI(const FlowHeaderSI& header,
                                                      const std::vector<FlowRowSI>& rows,
                                                      const CalibrationRegistry& cal);

ScreenResult computeFlowTestSI(const FlowTestSI& test, const CalibrationRegistry& cal);
ScreenResult computeFlowTestUS(const FlowTestUS& test, const CalibrationRegistry& cal);

// =============================================================================
// Compare
// =============================================================================

/**
 * @brief Percent deltas of test A against test B
 *
 * Points are paired by index. Series "x" holds the x axis of test A
 * (lift or L/D); every other series is a percent delta. Only the per-lift
 * series are compared, so header aggregates need not be computable.
 */
ScreenResult compareTestsSI(const FlowTestSI& a, const FlowTestSI& b, CompareMode mode,
                            const CalibrationRegistry& cal);
ScreenResult compareTestsUS(const FlowTestUS& a, const FlowTestUS& b, CompareMode mode,
                            const CalibrationRegistry& cal);

// =============================================================================
// Unit labels
// =============================================================================

/**
 * @brief Quantity key of a screen scalar (for unit labels)
 */
std::string scalarQuantity(const std::string& scalar_name);

} // namespace CHPT

#endif // FLOW_BENCH_SCREENS_HPP
