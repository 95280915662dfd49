#include "EngineCoupling.hpp"
#include "ErrorTypes.hpp"
#include <algorithm>
#include <string>

namespace CHPT {

namespace {

// RPM = Q_dist * C / (displacement * VE)
double rpmConstant(UnitBasis basis) {
    return basis == UnitBasis::US ? 2.0 * Units::IN3_PER_FT3 : 2.0;
}

// Converts area * velocity into the flow unit of the basis
double flowPerAreaVelocity(UnitBasis basis) {
    // in² * ft/s -> ft³/min ; mm² * m/s -> m³/min
    return basis == UnitBasis::US ? Units::S_PER_MIN / 144.0 : Units::S_PER_MIN * 1e-6;
}

double speedOfSoundFor(UnitBasis basis, const CalibrationRegistry& cal) {
    return basis == UnitBasis::US ? cal.get("A0_FT_S") : cal.get("A0_M_S");
}

void requireNonNegativeFlow(double q, const char* what) {
    if (q < 0.0) {
        throw InvalidArgument(std::string(what) + ": flow must be >= 0");
    }
}

} // anonymous namespace

// =============================================================================
// Swept-volume demand
// =============================================================================

double engineVolumetricFlow(double displacement, double rpm, double ve) {
    if (!(displacement > 0.0) || rpm < 0.0 || ve < 0.0) {
        throw InvalidArgument("engineVolumetricFlow: requires displacement > 0, rpm >= 0, VE >= 0");
    }
    return displacement / 2.0 * rpm / 60.0 * ve;
}

double rpmFromFlow(double q, double displacement, double ve) {
    if (!(q > 0.0) || !(displacement > 0.0) || !(ve > 0.0)) {
        throw InvalidArgument("rpmFromFlow: requires Q, displacement, VE > 0");
    }
    return q * 60.0 * 2.0 / (displacement * ve);
}

double rpmFromAreaAndTargetVelocity(double area, double displacement, double ve,
                                    double v_target) {
    if (!(area > 0.0) || !(v_target > 0.0)) {
        throw InvalidArgument("rpmFromAreaAndTargetVelocity: requires area, velocity > 0");
    }
    return rpmFromFlow(area * v_target, displacement, ve);
}

// =============================================================================
// Calibrated port supply
// =============================================================================

PortSupply portSupplyFlow(double area, double mach, double n_ports_eff,
                          UnitBasis basis, const CalibrationRegistry& cal) {
    if (!(area > 0.0)) {
        throw InvalidArgument("portSupplyFlow: mean port area must be > 0");
    }
    if (mach < 0.0 || mach > 1.0) {
        throw InvalidArgument("portSupplyFlow: Mach must be within [0, 1]");
    }
    if (!(n_ports_eff > 0.0)) {
        throw InvalidArgument("portSupplyFlow: effective port count must be > 0");
    }

    PortSupply supply;
    supply.velocity = mach * speedOfSoundFor(basis, cal);
    supply.per_port = area * supply.velocity * flowPerAreaVelocity(basis);
    supply.chain = supply.per_port * n_ports_eff;
    supply.distributed = supply.chain * cal.get("K_PORT_DIST");
    return supply;
}

double peakRpmFromPortArea(double area, double mach, double n_ports_eff,
                           double displacement, double ve,
                           UnitBasis basis, const CalibrationRegistry& cal) {
    if (!(displacement > 0.0) || !(ve > 0.0)) {
        throw InvalidArgument("peakRpmFromPortArea: requires displacement, VE > 0");
    }
    PortSupply supply = portSupplyFlow(area, mach, n_ports_eff, basis, cal);
    return supply.distributed * rpmConstant(basis) / (displacement * ve);
}

double portAreaFromPeakRpm(double rpm, double mach, double n_ports_eff,
                           double displacement, double ve,
                           UnitBasis basis, const CalibrationRegistry& cal) {
    if (!(rpm > 0.0) || !(mach > 0.0) || mach > 1.0 || !(n_ports_eff > 0.0) ||
        !(displacement > 0.0) || !(ve > 0.0)) {
        throw InvalidArgument(
            "portAreaFromPeakRpm: requires rpm, n_ports_eff, displacement, VE > 0 and 0 < Mach <= 1");
    }
    double q_dist = rpm * displacement * ve / rpmConstant(basis);
    double per_port = q_dist / (cal.get("K_PORT_DIST") * n_ports_eff);
    double velocity = mach * speedOfSoundFor(basis, cal);
    return per_port / (velocity * flowPerAreaVelocity(basis));
}

double shiftRpm(double peak_rpm, const CalibrationRegistry& cal) {
    return peak_rpm * (1.0 + cal.get("SHIFT_ALPHA"));
}

double meanPistonSpeed(double stroke, double rpm) {
    if (!(stroke > 0.0) || rpm < 0.0) {
        throw InvalidArgument("meanPistonSpeed: requires stroke > 0 and rpm >= 0");
    }
    return 2.0 * stroke * rpm / 60.0;
}

// =============================================================================
// Power limits
// =============================================================================

double hpLimitFromAirflow(double q_cfm, const CalibrationRegistry& cal) {
    requireNonNegativeFlow(q_cfm, "hpLimitFromAirflow");
    return cal.get("K_CFM_TO_HP") * q_cfm;
}

double hpLimitFromPortArea(double q_chain_cfm, const CalibrationRegistry& cal) {
    requireNonNegativeFlow(q_chain_cfm, "hpLimitFromPortArea");
    return cal.get("K_CSA_HP") * q_chain_cfm;
}

double kwLimitFromAirflow(double q_m3min, const CalibrationRegistry& cal) {
    requireNonNegativeFlow(q_m3min, "kwLimitFromAirflow");
    return cal.get("K_FLOW_kW") * q_m3min;
}

double kwLimitFromPortArea(double q_chain_m3min, const CalibrationRegistry& cal) {
    requireNonNegativeFlow(q_chain_m3min, "kwLimitFromPortArea");
    return cal.get("K_CSA_kW") * q_chain_m3min;
}

double compressionRatioFactor(double cr, const CalibrationRegistry& cal) {
    if (!(cr > 0.0)) {
        throw InvalidArgument("compressionRatioFactor: compression ratio must be > 0");
    }
    return cal.get("K_CR") * (1.0 + cal.get("K_CR_SLOPE") * (cr - cal.get("K_CR_REF")));
}

// =============================================================================
// Exhaust / intake ratio models
// =============================================================================

double existingExIntRatio(double raw_ratio, const CalibrationRegistry& cal) {
    if (raw_ratio < 0.0) {
        throw InvalidArgument("existingExIntRatio: ratio must be >= 0");
    }
    return std::min(1.0, raw_ratio * cal.get("K_EXINT_RATIO"));
}

double requiredExIntRatio(double cr, double max_lift_mm, const CalibrationRegistry& cal) {
    if (!(cr > 0.0) || max_lift_mm < 0.0) {
        throw InvalidArgument("requiredExIntRatio: requires cr > 0 and max lift >= 0");
    }
    return cal.get("K_REQ_EI_BASE")
         + cal.get("K_REQ_EI_CR") * (cr - cal.get("K_CR_REF"))
         + cal.get("K_REQ_EI_LIFT") * (max_lift_mm - cal.get("K_REQ_EI_LIFT_REF_MM"));
}

double exhaustCollectorArea(double q, double v_target) {
    if (!(q > 0.0) || !(v_target > 0.0)) {
        throw InvalidArgument("exhaustCollectorArea: requires Q, v_target > 0");
    }
    return q / v_target;
}

} // namespace CHPT
