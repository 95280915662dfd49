/**
 * @file flowbench_demo.cpp
 * @brief Runs the three screens on a small-block Chevrolet style head
 *
 * Usage:
 *   ./chpt_flowbench_demo [config_file]
 *
 * The optional config file selects the calibration profile, the
 * effective-area blend and the reference air (see ConfigReader).
 */

#include "CHPT.hpp"
#include <iostream>
#include <iomanip>
#include <string>

using namespace CHPT;

namespace {

void printScalars(const ScreenResult& result) {
    for (const auto& pair : result.scalars) {
        std::cout << "  " << std::setw(26) << std::left << pair.first
                  << std::setw(14) << pair.second
                  << result.unit_labels.at(pair.first) << "\n";
    }
}

void printRows(const ScreenResult& result, const std::vector<std::string>& columns) {
    std::cout << "  ";
    for (const auto& c : columns) {
        std::cout << std::setw(14) << std::left << c;
    }
    std::cout << "\n";
    for (const auto& row : result.rows) {
        std::cout << "  ";
        for (const auto& c : columns) {
            auto it = row.find(c);
            if (it != row.end() && it->second) {
                std::cout << std::setw(14) << std::left << *it->second;
            } else {
                std::cout << std::setw(14) << std::left << "-";
            }
        }
        std::cout << "\n";
    }
}

FlowTestUS sampleTest(double flow_scale) {
    FlowTestUS test;
    test.header.intake.valve_diameter = 2.02;
    test.header.intake.throat_diameter = 1.78;
    test.header.intake.stem_diameter = 0.34;
    test.header.intake.seat_angle_deg = 45.0;
    test.header.intake.seat_width = 0.055;
    test.header.exhaust.valve_diameter = 1.60;
    test.header.exhaust.throat_diameter = 1.36;
    test.header.exhaust.stem_diameter = 0.34;
    test.header.cr = 10.5;
    test.header.max_lift_in = 0.600;
    test.header.port_volume_in3 = 11.0;
    test.header.port_length_in = 5.2;
    test.header.bore_in = 4.0;

    const double lifts[] = {0.100, 0.200, 0.300, 0.400, 0.500, 0.600};
    const double q_in[] = {68.0, 135.0, 190.0, 232.0, 258.0, 270.0};
    const double q_ex[] = {55.0, 108.0, 145.0, 170.0, 185.0, 192.0};
    for (int i = 0; i < 6; ++i) {
        FlowRowUS row;
        row.lift_in = lifts[i];
        row.q_in_cfm = q_in[i] * flow_scale;
        row.q_ex_cfm = q_ex[i];
        row.dp_inH2O = 28.0;
        test.rows.push_back(row);
    }
    return test;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CalibrationRegistry& cal = CalibrationRegistryManager::getInstance();
    EffectiveAreaOptions area_options;
    std::optional<AirState> reference_air;

    try {
        if (argc >= 2) {
            ConfigReader config;
            if (!config.loadFile(argv[1])) {
                std::cerr << "Error: Could not load config file: " << argv[1] << "\n";
                return 1;
            }
            cal.applyConfig(config.parseCalibrationConfig());
            area_options = config.parseAreaModelConfig();
            reference_air = config.parseReferenceAir();
        }

        cal.verify();

        // Main screen
        MainInputsUS engine;
        engine.mach = 0.5475;
        engine.mean_port_area_in2 = 2.75;
        engine.bore_in = 4.125;
        engine.stroke_in = 4.0;
        engine.n_cyl = 8;
        engine.n_ports_eff = 4.0;

        std::cout << "Main screen (US, " << toString(cal.getProfile()) << " profile)\n";
        std::cout << std::string(60, '=') << "\n";
        printScalars(computeMainScreenUS(engine, cal));

        std::cout << "\nMain screen (SI)\n";
        std::cout << std::string(60, '=') << "\n";
        printScalars(computeMainScreenSI(engine.toSI(), cal));

        // Flow test
        FlowTestUS baseline = sampleTest(1.0);
        baseline.header.area_options = area_options;
        baseline.header.reference_air = reference_air;

        ScreenResult flow = computeFlowTestUS(baseline, cal);
        std::cout << "\nFlow test (US)\n";
        std::cout << std::string(60, '=') << "\n";
        printScalars(flow);
        std::cout << "\n";
        printRows(flow, {"x_lift", "flow28_in", "sae_cd_in", "a_eff_in", "eff_cd_in",
                         "flow28_ex", "ei_ratio"});

        // Compare a ported head against the baseline
        FlowTestUS ported = sampleTest(1.06);
        ported.header.area_options = area_options;
        ported.header.reference_air = reference_air;

        ScreenResult delta = compareTestsUS(ported, baseline, CompareMode::LIFT, cal);
        std::cout << "\nCompare ported vs baseline (%)\n";
        std::cout << std::string(60, '=') << "\n";
        printRows(delta, {"x", "flow28_in", "sae_cd_in", "flow28_ex", "ei_ratio"});

    } catch (const CalibrationDrift& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const MissingInput& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
