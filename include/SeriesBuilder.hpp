/**
 * @file SeriesBuilder.hpp
 * @brief Per-lift series of a flow test and two-test comparisons
 *
 * Series are computed in SI (lengths mm, areas mm², flows m³/min,
 * velocities m/s). Names carry a side suffix, e.g. "sae_cd_in",
 * "v_mean_ex"; the x axes are "x_lift", "x_ld_in" and "x_ld_ex".
 *
 * Missing optional inputs (no effective area, no port area, no swirl
 * data) degrade only the affected entries to nullopt; a point whose
 * inputs are impossible for one quantity (e.g. zero flow for Cd) loses
 * only that quantity.
 */

#ifndef SERIES_BUILDER_HPP
#define SERIES_BUILDER_HPP

#include "CalibrationRegistry.hpp"
#include "FlowRecords.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CHPT {

enum class PortSide {
    INTAKE,
    EXHAUST
};

/**
 * @brief Series name suffix of a side: "in" or "ex"
 */
std::string sideSuffix(PortSide side);

using SeriesMap = std::map<std::string, Series>;
using RowTable = std::vector<std::map<std::string, std::optional<double>>>;

/**
 * @brief Builds the per-lift series of one flow test
 *
 * The header is copied; the registry is referenced and must outlive
 * the builder.
 */
class SeriesBuilder {
public:
    SeriesBuilder(const FlowHeaderSI& header, const CalibrationRegistry& cal);

    /**
     * @brief Series of one side
     *
     * flow, flow28, curtain_area, sae_cd, a_eff, a_mean, eff_cd, v_mean, v_eff,
     * mach, energy_density, energy, observed_area, swirl (each suffixed).
     */
    SeriesMap buildSide(const std::vector<FlowRowSI>& rows, PortSide side) const;

    /**
     * @brief Both sides plus the x axes
     */
    SeriesMap buildAll(const std::vector<FlowRowSI>& rows) const;

    /**
     * @brief Air density of a row's measurement [kg/m³]
     *
     * Row air, then header air, then the standard density RHO_KGM3_STD.
     */
    double measuredDensity(const FlowRowSI& row) const;

    /**
     * @brief Reference density: header reference air, else the measured density
     */
    double referenceDensity(const FlowRowSI& row) const;

    /**
     * @brief Row flow of a side corrected to 28 inH2O [m³/min]
     */
    double correctedFlow(const FlowRowSI& row, PortSide side) const;

    /**
     * @brief Quantity key of a series (for unit labels), e.g. "flow" for "flow28_in"
     */
    static std::string quantityOf(const std::string& series_name);

    /**
     * @brief Transpose series into rows and add the per-row E/I ratio
     *
     * The E/I ratio uses "flow28_ex" / "flow28_in" and is nullopt where
     * the intake flow is zero or either flow is unavailable.
     */
    static RowTable rowTable(const SeriesMap& series);

private:
    FlowHeaderSI header_;
    const CalibrationRegistry& cal_;

    const ValveGeometry& valve(PortSide side) const;
    const std::optional<PortWindow>& window(PortSide side) const;
    int valveCount(PortSide side) const;
    double valveDiameter(const FlowRowSI& row, PortSide side) const;
};

// =============================================================================
// Comparison
// =============================================================================

/**
 * @brief Element-wise 100 * (a - b) / b, paired by index
 *
 * The result has the length of the shorter input. An element is nullopt
 * when either operand is unavailable, b == 0, or the delta is not finite.
 */
Series percentDelta(const Series& a, const Series& b);

/**
 * @brief Percent deltas of every series present in both maps
 *
 * Axis series (names starting with "x_") are not compared.
 */
SeriesMap compareSeries(const SeriesMap& a, const SeriesMap& b);

} // namespace CHPT

#endif // SERIES_BUILDER_HPP
