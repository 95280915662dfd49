/**
 * @file test_valve_geometry.cpp
 * @brief Unit tests for curtain, throat and effective flow areas
 */

#include <gtest/gtest.h>
#include "ValveGeometry.hpp"
#include "FlowRecords.hpp"
#include "ErrorTypes.hpp"
#include <cmath>
#include <stdexcept>

using namespace CHPT;

class ValveGeometryTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 2.02" intake, 1.78" throat, 11/32" stem (mm)
        intake.valve_diameter = 51.3;
        intake.throat_diameter = 45.2;
        intake.stem_diameter = 8.7;
        intake.seat_angle_deg = 45.0;
        intake.seat_width = 1.4;
    }

    ValveGeometry intake;
};

// ============================================================================
// Basic areas
// ============================================================================

TEST_F(ValveGeometryTest, CurtainArea) {
    EXPECT_NEAR(curtainArea(44.0, 6.0), M_PI * 44.0 * 6.0, 1e-12);
    EXPECT_DOUBLE_EQ(curtainArea(44.0, 0.0), 0.0);
    EXPECT_THROW(curtainArea(0.0, 1.0), InvalidGeometry);
    EXPECT_THROW(curtainArea(44.0, -1.0), InvalidGeometry);
}

TEST_F(ValveGeometryTest, ThroatArea) {
    EXPECT_NEAR(throatArea(40.0, 0.0), M_PI * 400.0, 1e-9);
    EXPECT_NEAR(throatArea(40.0, 8.0), M_PI * (1600.0 - 64.0) / 4.0, 1e-9);
}

TEST_F(ValveGeometryTest, StemNotSmallerThanThroatIsRejected) {
    EXPECT_THROW(throatArea(8.0, 8.0), InvalidArgument);
    EXPECT_THROW(throatArea(8.0, 9.0), InvalidArgument);

    intake.stem_diameter = 46.0;
    EXPECT_THROW(intake.validate(), InvalidGeometry);
}

TEST_F(ValveGeometryTest, LdRatioAndAxisTick) {
    EXPECT_NEAR(ldRatio(12.7, 50.8), 0.25, 1e-12);
    EXPECT_THROW(ldRatio(1.0, 0.0), InvalidGeometry);

    EXPECT_NEAR(ldAxisTick(0.101), 0.11, 1e-12);
    EXPECT_NEAR(ldAxisTick(0.25), 0.25, 1e-12);
}

TEST_F(ValveGeometryTest, SeatLiftThreshold) {
    EXPECT_NEAR(seatLiftThreshold(1.4, 45.0), 1.4, 1e-12);
    EXPECT_NEAR(intake.seatLiftThreshold(), 1.4, 1e-12);

    ValveGeometry no_seat;
    no_seat.valve_diameter = 40.0;
    EXPECT_TRUE(std::isinf(no_seat.seatLiftThreshold()));
}

TEST_F(ValveGeometryTest, PortWindowArea) {
    EXPECT_NEAR(portWindowArea(30.0, 50.0, 0.0, 0.0), 1500.0, 1e-12);

    double expected = 1500.0 - 2.0 * (1.0 - M_PI / 4.0) * (25.0 + 16.0);
    EXPECT_NEAR(portWindowArea(30.0, 50.0, 5.0, 4.0), expected, 1e-9);

    EXPECT_THROW(portWindowArea(10.0, 10.0, 20.0, 20.0), InvalidGeometry);
    EXPECT_THROW(portWindowArea(0.0, 10.0, 0.0, 0.0), InvalidGeometry);
}

TEST_F(ValveGeometryTest, ValidateGeometry) {
    EXPECT_NO_THROW(intake.validate());

    ValveGeometry bad = intake;
    bad.seat_angle_deg = 90.0;
    EXPECT_THROW(bad.validate(), InvalidGeometry);

    bad = intake;
    bad.valve_diameter = 0.0;
    EXPECT_THROW(bad.validate(), InvalidGeometry);
}

// ============================================================================
// Blends
// ============================================================================

TEST_F(ValveGeometryTest, SmoothMinBelowBothAreas) {
    double a = areaSmoothMin(100.0, 120.0, 6);
    EXPECT_LT(a, 100.0);
    EXPECT_NEAR(a, std::pow(std::pow(100.0, -6) + std::pow(120.0, -6), -1.0 / 6.0), 1e-9);
    EXPECT_DOUBLE_EQ(areaSmoothMin(0.0, 120.0, 6), 0.0);
    EXPECT_THROW(areaSmoothMin(10.0, 0.0, 6), InvalidArgument);
    EXPECT_THROW(areaSmoothMin(10.0, 20.0, 0), InvalidArgument);
}

TEST_F(ValveGeometryTest, SmoothMinStableForTinyAreas) {
    double a = areaSmoothMin(1e-80, 2e-80, 12);
    EXPECT_TRUE(std::isfinite(a));
    EXPECT_GT(a, 0.0);
}

TEST_F(ValveGeometryTest, LogisticMidpointAverages) {
    EXPECT_NEAR(areaLogistic(100.0, 200.0, 0.30, 0.30, 12.0), 150.0, 1e-12);
    EXPECT_LT(areaLogistic(100.0, 200.0, 0.05), 150.0);
    EXPECT_GT(areaLogistic(100.0, 200.0, 0.55), 150.0);
}

TEST_F(ValveGeometryTest, ParseBlendMethod) {
    EXPECT_EQ(parseAreaBlendMethod("SmoothMin"), AreaBlendMethod::SMOOTH_MIN);
    EXPECT_EQ(parseAreaBlendMethod("blend"), AreaBlendMethod::LOGISTIC);
    EXPECT_EQ(toString(AreaBlendMethod::SMOOTH_MIN), "smoothmin");
    EXPECT_THROW(parseAreaBlendMethod("linear"), std::invalid_argument);
}

TEST_F(ValveGeometryTest, ParseBlendMethodNonAscii) {
    // Latin-1 bytes are negative as plain char
    EXPECT_THROW(parseAreaBlendMethod("logistic\xE9"), std::invalid_argument);
    EXPECT_THROW(parseAreaBlendMethod("\xC9\xFF"), std::invalid_argument);
    EXPECT_THROW(parseExIntRatioMode("\xE0vg"), std::invalid_argument);
    EXPECT_EQ(parseAreaBlendMethod("LOGISTIC"), AreaBlendMethod::LOGISTIC);
}

// ============================================================================
// Effective area
// ============================================================================

TEST_F(ValveGeometryTest, EffectiveAreaClosedValveIsZero) {
    EXPECT_DOUBLE_EQ(effectiveArea(0.0, intake), 0.0);
}

TEST_F(ValveGeometryTest, EffectiveAreaMonotoneAndBoundedByThroat) {
    for (AreaBlendMethod method : {AreaBlendMethod::LOGISTIC, AreaBlendMethod::SMOOTH_MIN}) {
        EffectiveAreaOptions options;
        options.method = method;

        ValveGeometry no_seat = intake;
        no_seat.seat_width.reset();

        for (const ValveGeometry& g : {intake, no_seat}) {
            double prev = 0.0;
            for (int i = 0; i <= 40; ++i) {
                double lift = 0.5 * i;
                double a = effectiveArea(lift, g, options);
                EXPECT_GE(a, prev - 1e-9) << "lift " << lift;
                EXPECT_LE(a, g.throatArea() + 1e-9);
                prev = a;
            }
        }
    }
}

TEST_F(ValveGeometryTest, EffectiveAreaCappedByWindow) {
    PortWindow window;
    window.width = 20.0;
    window.height = 30.0;
    double a = effectiveArea(15.0, intake, EffectiveAreaOptions(), window);
    EXPECT_LE(a, window.area() + 1e-9);
}

TEST_F(ValveGeometryTest, EffectiveAreaRequiresThroat) {
    ValveGeometry g;
    g.valve_diameter = 44.0;
    EXPECT_THROW(effectiveArea(5.0, g), InvalidGeometry);
}

TEST_F(ValveGeometryTest, MultiValveScalesAndCaps) {
    double one = effectiveArea(6.0, intake);
    EXPECT_NEAR(effectiveAreaMultiValve(2, 6.0, intake), 2.0 * one, 1e-9);
    EXPECT_LE(effectiveAreaMultiValve(2, 25.0, intake), 2.0 * intake.throatArea() + 1e-9);
    EXPECT_THROW(effectiveAreaMultiValve(0, 6.0, intake), InvalidGeometry);
}

TEST_F(ValveGeometryTest, SeatLimitedAreaFollowsCurtainBelowThreshold) {
    EXPECT_NEAR(seatLimitedArea(1.0, intake), curtainArea(51.3, 1.0), 1e-9);

    ValveGeometry no_seat = intake;
    no_seat.seat_width.reset();
    EXPECT_THROW(seatLimitedArea(1.0, no_seat), InvalidGeometry);
}

// ============================================================================
// Port volume / length / area
// ============================================================================

TEST_F(ValveGeometryTest, PortDescriptorCompletesMissingMember) {
    PortDescriptor from_area_length;
    from_area_length.length_mm = 130.0;
    from_area_length.area_mm2 = 1400.0;
    EXPECT_NEAR(*from_area_length.completed().volume_cc, 182.0, 1e-9);

    PortDescriptor from_volume_length;
    from_volume_length.volume_cc = 182.0;
    from_volume_length.length_mm = 130.0;
    EXPECT_NEAR(*from_volume_length.completed().area_mm2, 1400.0, 1e-9);

    PortDescriptor from_volume_area;
    from_volume_area.volume_cc = 182.0;
    from_volume_area.area_mm2 = 1400.0;
    PortDescriptor full = from_volume_area.completed();
    EXPECT_TRUE(full.isComplete());
    EXPECT_NEAR(*full.length_mm, 130.0, 1e-9);
}

TEST_F(ValveGeometryTest, PortDescriptorRejectsNonPositive) {
    PortDescriptor bad;
    bad.volume_cc = 182.0;
    bad.length_mm = 0.0;
    EXPECT_THROW(bad.completed(), InvalidArgument);
    EXPECT_THROW(meanAreaFromVolumeLength(10.0, 0.0), InvalidArgument);
}
