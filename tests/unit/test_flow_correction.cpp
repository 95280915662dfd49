/**
 * @file test_flow_correction.cpp
 * @brief Unit tests for depression and density correction of bench flow
 */

#include <gtest/gtest.h>
#include "FlowCorrection.hpp"
#include "ErrorTypes.hpp"
#include "UnitSystem.hpp"
#include <cmath>

using namespace CHPT;

TEST(FlowCorrectionTest, SquareRootOfDepression) {
    // 10 inH2O -> 28 inH2O at constant density
    double q = flowReferenced(100.0, 10.0, 1.2, 28.0, 1.2);
    EXPECT_NEAR(q, 100.0 * std::sqrt(2.8), 1e-12);
}

TEST(FlowCorrectionTest, DensityRatio) {
    double q = flowReferenced(100.0, 28.0, 1.10, 28.0, 1.21);
    EXPECT_NEAR(q, 100.0 * std::sqrt(1.10 / 1.21), 1e-12);
}

TEST(FlowCorrectionTest, SelfCorrectionIsNoOp) {
    AirState air(98000.0, 300.0, 0.4);
    EXPECT_DOUBLE_EQ(flowTo28InH2O(231.0, 28.0, air), 231.0);
    EXPECT_DOUBLE_EQ(flowTo28InH2O(231.0, 28.0, air, air), 231.0);
    EXPECT_DOUBLE_EQ(flowTo28InH2O(231.0, 28.0, 1.18, 1.18), 231.0);
}

TEST(FlowCorrectionTest, LowDepressionTestScalesUp) {
    AirState air;
    double q10 = 150.0;
    double q28 = flowTo28InH2O(q10, 10.0, air);
    EXPECT_GT(q28, q10);
    EXPECT_NEAR(q28, q10 * std::sqrt(28.0 / 10.0), 1e-9);
}

TEST(FlowCorrectionTest, PointCorrectionReturnsCubicMetresPerSecond) {
    AirState air;
    double q = correctPointToReference(250.0, 28.0, air);
    EXPECT_NEAR(q, Units::cfmToM3s(250.0), 1e-12);
}

TEST(FlowCorrectionTest, RejectsNonPositiveInputs) {
    EXPECT_THROW(flowReferenced(100.0, 0.0, 1.2, 28.0, 1.2), InvalidArgument);
    EXPECT_THROW(flowReferenced(100.0, 28.0, 1.2, 28.0, 0.0), InvalidArgument);
    EXPECT_THROW(flowTo28InH2O(100.0, -5.0, 1.2, 1.2), InvalidArgument);
}
