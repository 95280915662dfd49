/**
 * @file test_series_builder.cpp
 * @brief Unit tests for per-lift series and series comparison
 */

#include <gtest/gtest.h>
#include "SeriesBuilder.hpp"
#include "ErrorTypes.hpp"
#include "Kinematics.hpp"
#include <cmath>

using namespace CHPT;

class SeriesBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        header.intake.valve_diameter = 44.0;
        header.exhaust.valve_diameter = 38.0;
        header.cr = 10.5;
        header.max_lift_mm = 12.0;

        FlowRowSI row;
        row.lift_mm = 6.0;
        row.q_in_m3min = 0.5;
        row.q_ex_m3min = 0.4;
        row.dp_inH2O = 28.0;
        rows.push_back(row);
    }

    FlowHeaderSI header;
    std::vector<FlowRowSI> rows;
    CalibrationRegistry cal;
};

// ============================================================================
// Discharge coefficients
// ============================================================================

TEST_F(SeriesBuilderTest, SaeCdEndToEnd) {
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);

    double expected = (0.5 / 60.0) /
        (M_PI * 0.044 * 0.006 * std::sqrt(2.0 * 249.0889 * 28.0 / 1.225));
    ASSERT_TRUE(series["sae_cd_in"][0].has_value());
    EXPECT_NEAR(*series["sae_cd_in"][0], expected, 1e-6 * expected);
}

TEST_F(SeriesBuilderTest, BuilderOwnsItsHeader) {
    FlowTestSI test;
    test.header = header;
    test.rows = rows;

    // Header from a temporary
    SeriesBuilder builder(FlowTestSI(test).header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);
    EXPECT_NEAR(*series["curtain_area_in"][0], M_PI * 44.0 * 6.0, 1e-9);
}

TEST_F(SeriesBuilderTest, CurtainAreaScalesWithValveCount) {
    header.n_int_valves = 2;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);
    EXPECT_NEAR(*series["curtain_area_in"][0], 2.0 * M_PI * 44.0 * 6.0, 1e-9);
}

TEST_F(SeriesBuilderTest, LowDepressionCorrectedTo28) {
    rows[0].dp_inH2O = 10.0;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);
    EXPECT_DOUBLE_EQ(*series["flow_in"][0], 0.5);
    EXPECT_NEAR(*series["flow28_in"][0], 0.5 * std::sqrt(2.8), 1e-12);
}

// ============================================================================
// Degraded series
// ============================================================================

TEST_F(SeriesBuilderTest, MissingOptionalInputsDegradeToNullopt) {
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);

    // No throat, no port area, no swirl data
    EXPECT_FALSE(series["a_eff_in"][0].has_value());
    EXPECT_FALSE(series["eff_cd_in"][0].has_value());
    EXPECT_FALSE(series["v_mean_in"][0].has_value());
    EXPECT_FALSE(series["mach_in"][0].has_value());
    EXPECT_FALSE(series["energy_in"][0].has_value());
    EXPECT_FALSE(series["swirl_in"][0].has_value());
    EXPECT_TRUE(series["observed_area_in"][0].has_value());
}

TEST_F(SeriesBuilderTest, ZeroFlowLosesOnlyImpossiblePoints) {
    FlowRowSI closed = rows[0];
    closed.q_in_m3min = 0.0;
    rows.push_back(closed);

    SeriesBuilder builder(header, cal);
    RowTable table = SeriesBuilder::rowTable(builder.buildAll(rows));
    ASSERT_EQ(table.size(), 2u);

    EXPECT_TRUE(table[0]["ei_ratio"].has_value());
    EXPECT_FALSE(table[1]["ei_ratio"].has_value());
    ASSERT_TRUE(table[1]["sae_cd_in"].has_value());
    EXPECT_DOUBLE_EQ(*table[1]["sae_cd_in"], 0.0);
    EXPECT_TRUE(table[1]["sae_cd_ex"].has_value());
}

// ============================================================================
// Geometry-driven series
// ============================================================================

TEST_F(SeriesBuilderTest, EffectiveAreaFromGeometry) {
    header.intake.throat_diameter = 39.0;
    header.intake.stem_diameter = 7.0;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);

    ASSERT_TRUE(series["a_eff_in"][0].has_value());
    EXPECT_NEAR(*series["a_eff_in"][0], effectiveArea(6.0, header.intake), 1e-9);
    EXPECT_GT(*series["eff_cd_in"][0], 0.0);
}

TEST_F(SeriesBuilderTest, MeasuredEffectiveAreaWins) {
    header.intake.throat_diameter = 39.0;
    rows[0].a_eff_mm2 = 700.0;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);
    EXPECT_DOUBLE_EQ(*series["a_eff_in"][0], 700.0);
}

TEST_F(SeriesBuilderTest, PortVelocityMachAndEnergy) {
    header.port_area_mm2 = 1250.0;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);

    double v = (0.5 / 60.0) / 1250e-6;
    EXPECT_NEAR(*series["v_mean_in"][0], v, 1e-9);
    EXPECT_NEAR(*series["mach_in"][0], v / 343.2, 1e-12);
    EXPECT_NEAR(*series["energy_density_in"][0], 0.5 * 1.225 * v * v, 1e-9);
    EXPECT_NEAR(*series["energy_in"][0], 0.5 * 1.225 * v * v * 1250e-6, 1e-9);

    // Port area belongs to the intake
    SeriesMap exhaust = builder.buildSide(rows, PortSide::EXHAUST);
    EXPECT_FALSE(exhaust["v_mean_ex"][0].has_value());
}

TEST_F(SeriesBuilderTest, MachUsesMeasuredAirTemperature) {
    header.port_area_mm2 = 1250.0;
    rows[0].air = AirState(101325.0, 300.0, 0.0);
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildSide(rows, PortSide::INTAKE);

    double v = *series["v_mean_in"][0];
    EXPECT_NEAR(*series["mach_in"][0], v / speedOfSound(300.0), 1e-12);
}

TEST_F(SeriesBuilderTest, SwirlFromPaddleWheel) {
    header.bore_mm = 100.0;
    rows[0].wheel_rpm_in = 1500.0;
    rows[0].swirl_ex = 0.3;
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildAll(rows);

    EXPECT_NEAR(*series["swirl_in"][0], swirlRatioFromWheelRpm(1500.0, 0.1, 0.5 / 60.0), 1e-12);
    EXPECT_DOUBLE_EQ(*series["swirl_ex"][0], 0.3);
}

TEST_F(SeriesBuilderTest, AxesAndUnits) {
    SeriesBuilder builder(header, cal);
    SeriesMap series = builder.buildAll(rows);

    EXPECT_DOUBLE_EQ(*series["x_lift"][0], 6.0);
    EXPECT_NEAR(*series["x_ld_in"][0], 0.14, 1e-12);     // 6/44 = 0.136 -> 0.14
    EXPECT_NEAR(*series["x_ld_ex"][0], 0.16, 1e-12);     // 6/38 = 0.158 -> 0.16

    EXPECT_EQ(SeriesBuilder::quantityOf("flow28_ex"), "flow");
    EXPECT_EQ(SeriesBuilder::quantityOf("sae_cd_in"), "cd");
    EXPECT_EQ(SeriesBuilder::quantityOf("x_lift"), "lift");
    EXPECT_EQ(SeriesBuilder::quantityOf("unknown"), "");
}

TEST_F(SeriesBuilderTest, DensityFallbackChain) {
    SeriesBuilder defaults(header, cal);
    EXPECT_DOUBLE_EQ(defaults.measuredDensity(rows[0]), 1.225);

    header.air = AirState(95000.0, 295.0, 0.0);
    SeriesBuilder with_header(header, cal);
    EXPECT_NEAR(with_header.measuredDensity(rows[0]), airDensity(*header.air), 1e-12);

    rows[0].air = AirState(99000.0, 290.0, 0.0);
    EXPECT_NEAR(with_header.measuredDensity(rows[0]), airDensity(*rows[0].air), 1e-12);
    EXPECT_NEAR(with_header.referenceDensity(rows[0]), airDensity(*rows[0].air), 1e-12);
}

// ============================================================================
// Comparison
// ============================================================================

TEST_F(SeriesBuilderTest, PercentDelta) {
    Series a = {110.0, 50.0, std::nullopt, 5.0};
    Series b = {100.0, 0.0, 10.0};
    Series d = percentDelta(a, b);

    ASSERT_EQ(d.size(), 3u);
    EXPECT_NEAR(*d[0], 10.0, 1e-12);
    EXPECT_FALSE(d[1].has_value());
    EXPECT_FALSE(d[2].has_value());
}

TEST_F(SeriesBuilderTest, PercentDeltaNeverInfinite) {
    // A subnormal baseline would overflow the ratio
    Series d = percentDelta({1.0, -1.0}, {1e-320, 1e-320});
    ASSERT_EQ(d.size(), 2u);
    EXPECT_FALSE(d[0].has_value());
    EXPECT_FALSE(d[1].has_value());
}

TEST_F(SeriesBuilderTest, CompareSeriesSkipsAxes) {
    SeriesBuilder builder(header, cal);
    SeriesMap a = builder.buildAll(rows);
    rows[0].q_in_m3min = 0.4;
    SeriesMap b = builder.buildAll(rows);

    SeriesMap delta = compareSeries(a, b);
    EXPECT_EQ(delta.count("x_lift"), 0u);
    EXPECT_NEAR(*delta["flow28_in"][0], 25.0, 1e-9);
    EXPECT_NEAR(*delta["flow28_ex"][0], 0.0, 1e-12);
}
