/**
 * @file test_flow_records.cpp
 * @brief Unit tests for screen input validation and US -> SI conversion
 */

#include <gtest/gtest.h>
#include "FlowRecords.hpp"
#include "ErrorTypes.hpp"
#include <stdexcept>

using namespace CHPT;

class FlowRecordsTest : public ::testing::Test {
protected:
    void SetUp() override {
        inputs.mach = 0.55;
        inputs.mean_port_area_in2 = 2.75;
        inputs.bore_in = 4.0;
        inputs.stroke_in = 3.48;
        inputs.n_cyl = 8;

        header.intake.valve_diameter = 2.02;
        header.intake.throat_diameter = 1.78;
        header.intake.stem_diameter = 0.34;
        header.exhaust.valve_diameter = 1.60;
        header.cr = 10.5;
        header.max_lift_in = 0.6;
        header.port_volume_in3 = 11.0;
    }

    MainInputsUS inputs;
    FlowHeaderUS header;
};

// ============================================================================
// Main screen inputs
// ============================================================================

TEST_F(FlowRecordsTest, MainInputsConvertToSI) {
    MainInputsSI si = inputs.toSI();
    EXPECT_NEAR(si.mean_port_area_mm2, 2.75 * 645.16, 1e-9);
    EXPECT_NEAR(si.bore_mm, 101.6, 1e-9);
    EXPECT_NEAR(si.stroke_mm, 3.48 * 25.4, 1e-9);
    EXPECT_EQ(si.n_cyl, 8);
    EXPECT_DOUBLE_EQ(si.cr, 10.5);
}

TEST_F(FlowRecordsTest, MainInputsValidation) {
    EXPECT_NO_THROW(inputs.validate());

    MainInputsUS bad = inputs;
    bad.mach = 1.2;
    EXPECT_THROW(bad.validate(), InvalidArgument);

    bad = inputs;
    bad.n_cyl = 0;
    EXPECT_THROW(bad.validate(), InvalidArgument);

    bad = inputs;
    bad.n_ports_eff = 0.0;
    EXPECT_THROW(bad.validate(), InvalidArgument);

    bad = inputs;
    bad.mean_port_area_in2 = -1.0;
    EXPECT_THROW(bad.validate(), InvalidArgument);
}

// ============================================================================
// Flow test rows and header
// ============================================================================

TEST_F(FlowRecordsTest, RowConvertsToSI) {
    FlowRowUS row;
    row.lift_in = 0.5;
    row.q_in_cfm = 250.0;
    row.q_ex_cfm = 180.0;
    row.dp_inH2O = 10.0;
    row.a_mean_in2 = 2.0;
    row.extras["note"] = "ported";

    FlowRowSI si = row.toSI();
    EXPECT_NEAR(si.lift_mm, 12.7, 1e-12);
    EXPECT_NEAR(si.q_in_m3min, 250.0 * 0.028316846592, 1e-12);
    EXPECT_DOUBLE_EQ(si.dp_inH2O, 10.0);
    EXPECT_NEAR(*si.a_mean_mm2, 1290.32, 1e-9);
    EXPECT_FALSE(si.a_eff_mm2.has_value());
    EXPECT_EQ(si.extras.at("note"), "ported");
}

TEST_F(FlowRecordsTest, RowValidation) {
    FlowRowSI row;
    row.lift_mm = 5.0;
    row.q_in_m3min = 3.0;
    EXPECT_NO_THROW(row.validate());

    row.dp_inH2O = 0.0;
    EXPECT_THROW(row.validate(), InvalidArgument);

    row.dp_inH2O = 28.0;
    row.q_ex_m3min = -1.0;
    EXPECT_THROW(row.validate(), InvalidArgument);
}

TEST_F(FlowRecordsTest, HeaderConvertsToSI) {
    FlowHeaderSI si = header.toSI();
    EXPECT_NEAR(si.intake.valve_diameter, 51.308, 1e-9);
    EXPECT_NEAR(*si.intake.throat_diameter, 45.212, 1e-9);
    EXPECT_NEAR(si.max_lift_mm, 15.24, 1e-9);
    EXPECT_NEAR(*si.port_volume_cc, 11.0 * 16.387064, 1e-9);
    EXPECT_FALSE(si.port_area_mm2.has_value());
    EXPECT_NO_THROW(si.validate());
}

TEST_F(FlowRecordsTest, MissingValveDiameterReported) {
    header.exhaust.valve_diameter = 0.0;
    try {
        header.validate();
        FAIL() << "validate() should throw MissingInput";
    } catch (const MissingInput& e) {
        EXPECT_EQ(e.getField(), "exhaust.valve_diameter");
    }
}

TEST_F(FlowRecordsTest, HeaderRejectsBadGeometry) {
    header.intake.stem_diameter = 1.9;
    EXPECT_THROW(header.validate(), InvalidGeometry);

    header.intake.stem_diameter = 0.34;
    PortWindow window;
    window.width = 0.2;
    window.height = 0.2;
    window.r_top = 0.5;
    window.r_bot = 0.5;
    header.intake_window = window;
    EXPECT_THROW(header.validate(), InvalidGeometry);
}

TEST_F(FlowRecordsTest, RatioMode) {
    EXPECT_EQ(parseExIntRatioMode("avg"), ExIntRatioMode::AVG);
    EXPECT_EQ(parseExIntRatioMode("Total"), ExIntRatioMode::TOTAL);
    EXPECT_EQ(toString(ExIntRatioMode::TOTAL), "TOTAL");
    EXPECT_THROW(parseExIntRatioMode("median"), std::invalid_argument);
}

TEST_F(FlowRecordsTest, ScreenResultAccessors) {
    ScreenResult result;
    result.scalars["peak_rpm"] = 7037.0;
    result.series["flow_in"] = {1.0, std::nullopt};

    EXPECT_TRUE(result.hasScalar("peak_rpm"));
    EXPECT_DOUBLE_EQ(result.getScalar("peak_rpm"), 7037.0);
    EXPECT_EQ(result.getSeries("flow_in").size(), 2u);
    EXPECT_THROW(result.getScalar("missing"), std::out_of_range);
    EXPECT_THROW(result.getSeries("missing"), std::out_of_range);
}
