/**
 * @file CHPT.hpp
 * @brief Cylinder Head Porting Toolkit - single include for applications
 *
 * Layers, bottom up:
 * - UnitSystem, AirState: conversions and air properties
 * - FlowCorrection, ValveGeometry, FlowCoefficients, Kinematics: bench physics
 * - CalibrationRegistry, EngineCoupling: calibrated engine-side estimates
 * - FlowRecords, SeriesBuilder, FlowBenchScreens: screen inputs and results
 * - ConfigReader: INI configuration
 */

#ifndef CHPT_HPP
#define CHPT_HPP

#include "ErrorTypes.hpp"
#include "UnitSystem.hpp"
#include "AirState.hpp"
#include "FlowCorrection.hpp"
#include "ValveGeometry.hpp"
#include "FlowCoefficients.hpp"
#include "Kinematics.hpp"
#include "CalibrationRegistry.hpp"
#include "EngineCoupling.hpp"
#include "FlowRecords.hpp"
#include "SeriesBuilder.hpp"
#include "FlowBenchScreens.hpp"
#include "ConfigReader.hpp"

#endif // CHPT_HPP
