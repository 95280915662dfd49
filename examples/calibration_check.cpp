/**
 * @file calibration_check.cpp
 * @brief Loads a calibration configuration and verifies it against the anchors
 *
 * Usage:
 *   ./chpt_calibration_check [config_file]
 *   ./chpt_calibration_check --template <output_file>
 *
 * Prints the active constant table, the differences between the two
 * calibration profiles and the US/SI disagreement of the main screen.
 * Exits with status 1 when a pinned configuration has drifted.
 */

#include "CalibrationRegistry.hpp"
#include "ConfigReader.hpp"
#include "ErrorTypes.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace CHPT;

void printProfileDifferences() {
    auto diffs = CalibrationRegistry::compareProfiles(CalibrationProfile::REPORT,
                                                      CalibrationProfile::SCREEN);
    std::cout << "\nProfile differences (report vs screen):\n";
    for (const auto& d : diffs) {
        std::cout << "  " << std::setw(22) << std::left << d.name
                  << std::setw(12) << d.value_a << d.value_b << "\n";
    }
}

void printDiscrepancies(const CalibrationRegistry& cal) {
    std::cout << "\nUS / SI main screen disagreement:\n";
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& d : cal.crossUnitDiscrepancies()) {
        std::cout << "  " << std::setw(22) << std::left << d.quantity
                  << std::setw(10) << d.unit
                  << "US " << std::setw(12) << d.us_factor
                  << "SI " << std::setw(12) << d.si_factor
                  << std::showpos << d.percent << std::noshowpos << " %\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

int main(int argc, char* argv[]) {
    if (argc == 3 && strcmp(argv[1], "--template") == 0) {
        ConfigReader::generateTemplate(argv[2]);
        std::cout << "Template written to " << argv[2] << "\n";
        return 0;
    }

    CalibrationRegistry& cal = CalibrationRegistryManager::getInstance();

    if (argc >= 2) {
        ConfigReader config;
        if (!config.loadFile(argv[1])) {
            std::cerr << "Error: Could not load config file: " << argv[1] << "\n";
            return 1;
        }

        ConfigReader::ValidationResult check = config.validate();
        for (const auto& w : check.warnings) {
            std::cerr << "Warning: " << w << "\n";
        }
        if (!check.valid) {
            for (const auto& e : check.errors) {
                std::cerr << "Error: " << e << "\n";
            }
            return 1;
        }

        cal.applyConfig(config.parseCalibrationConfig());
    }

    cal.print(std::cout);

    if (!cal.getAuditLog().empty()) {
        std::cout << "\nOverrides:\n";
        for (const auto& o : cal.getAuditLog()) {
            std::cout << "  " << o.name << ": " << o.old_value << " -> " << o.new_value
                      << " (" << o.reason << ")\n";
        }
    }

    printProfileDifferences();
    printDiscrepancies(cal);

    try {
        cal.verify();
    } catch (const CalibrationDrift& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nCalibration verified\n";
    return 0;
}
