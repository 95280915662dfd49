/**
 * @file test_flow_coefficients.cpp
 * @brief Unit tests for discharge coefficients
 */

#include <gtest/gtest.h>
#include "FlowCoefficients.hpp"
#include "ErrorTypes.hpp"
#include "UnitSystem.hpp"
#include <cmath>

using namespace CHPT;

class FlowCoefficientsTest : public ::testing::Test {
protected:
    const double dp28 = 28.0 * 249.0889;
    const double rho = 1.225;
    const double area = M_PI * 0.044 * 0.006;     // 44 mm valve at 6 mm lift
};

TEST_F(FlowCoefficientsTest, IdealNozzleHasUnitCd) {
    double v_ideal = std::sqrt(2.0 * dp28 / rho);
    double q = area * v_ideal;
    EXPECT_NEAR(cd(q, area, dp28, rho), 1.0, 1e-12);
}

TEST_F(FlowCoefficientsTest, CdScalesLinearlyWithFlow) {
    double c1 = cd(0.005, area, dp28, rho);
    double c2 = cd(0.010, area, dp28, rho);
    EXPECT_NEAR(c2, 2.0 * c1, 1e-12);
    EXPECT_DOUBLE_EQ(cd(0.0, area, dp28, rho), 0.0);
}

TEST_F(FlowCoefficientsTest, SaeCdAtReferenceConditions) {
    double q = 0.5 / 60.0;
    double expected = q / (area * std::sqrt(2.0 * dp28 / rho));
    EXPECT_NEAR(cdSAE(q, dp28, rho, area, dp28, rho), expected, 1e-12);
}

TEST_F(FlowCoefficientsTest, SaeCdIndependentOfTestDepression) {
    // The same orifice tested at 10 and 28 inH2O reports the same Cd
    double dp10 = 10.0 * 249.0889;
    double q28 = 0.5 / 60.0;
    double q10 = q28 * std::sqrt(dp10 / dp28);
    EXPECT_NEAR(cdSAE(q10, dp10, rho, area, dp28, rho),
                cdSAE(q28, dp28, rho, area, dp28, rho), 1e-12);
}

TEST_F(FlowCoefficientsTest, EffectiveCdUsesEffectiveArea) {
    double q = 0.5 / 60.0;
    double a_eff = 0.8 * area;
    EXPECT_NEAR(effectiveCd(q, dp28, rho, a_eff, dp28, rho),
                cdSAE(q, dp28, rho, area, dp28, rho) / 0.8, 1e-12);
}

TEST_F(FlowCoefficientsTest, PointCdFromCfm) {
    AirState air(101325.0, 293.15, 0.0);
    double rho_air = air.density();
    double q_m3s = Units::cfmToM3s(150.0);
    double expected = q_m3s / (area * std::sqrt(2.0 * dp28 / rho_air));
    EXPECT_NEAR(saeCdFromPointCFM(150.0, 28.0, area, air), expected, 1e-12);
}

TEST_F(FlowCoefficientsTest, RejectsImpossibleInputs) {
    EXPECT_THROW(cd(-0.1, area, dp28, rho), InvalidArgument);
    EXPECT_THROW(cd(0.1, 0.0, dp28, rho), InvalidArgument);
    EXPECT_THROW(cd(0.1, area, 0.0, rho), InvalidArgument);
    EXPECT_THROW(cdSAE(0.1, 0.0, rho, area, dp28, rho), InvalidArgument);
}
