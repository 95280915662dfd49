/**
 * @file unit_converter.cpp
 * @brief Command-line converter for flow-bench units
 *
 * Usage:
 *   ./chpt_unit_converter <value> <from_unit> <to_unit>
 *   ./chpt_unit_converter --list [category]
 *   ./chpt_unit_converter --all
 *   ./chpt_unit_converter --display
 *   ./chpt_unit_converter --help
 *
 * Examples:
 *   ./chpt_unit_converter 250 cfm m3/min
 *   ./chpt_unit_converter 2.75 in2 mm2
 *   ./chpt_unit_converter 28 inH2O Pa
 *   ./chpt_unit_converter --list volumetric_rate
 */

#include "UnitSystem.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace CHPT;

void printHelp() {
    std::cout << "\n";
    std::cout << "CHPT Unit Converter\n";
    std::cout << "===================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  chpt_unit_converter <value> <from_unit> <to_unit>\n";
    std::cout << "  chpt_unit_converter --list [category]\n";
    std::cout << "  chpt_unit_converter --all\n";
    std::cout << "  chpt_unit_converter --display\n";
    std::cout << "  chpt_unit_converter --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  chpt_unit_converter 250 cfm m3/min\n";
    std::cout << "  chpt_unit_converter 2.75 in2 mm2\n";
    std::cout << "  chpt_unit_converter 28 inH2O Pa\n";
    std::cout << "  chpt_unit_converter 68 degF K\n";
    std::cout << "  chpt_unit_converter --list velocity\n\n";
    std::cout << "Common Units:\n";
    std::cout << "  Length: mm, in, m, ft\n";
    std::cout << "  Area: mm2, in2, m2\n";
    std::cout << "  Volume: cc, in3, L, m3\n";
    std::cout << "  Flow: cfm, m3/min, m3/s\n";
    std::cout << "  Velocity: m/s, ft/s, ft/min\n";
    std::cout << "  Pressure: Pa, kPa, inH2O, psi\n";
    std::cout << "  Temperature: K, degC, degF\n";
    std::cout << "  Power: W, kW, hp\n\n";
}

void listUnits(const UnitSystem& units, const std::string& category = "") {
    std::cout << "\n";

    if (category.empty()) {
        std::cout << "Available Unit Categories:\n";
        std::cout << "==========================\n\n";

        auto categories = units.getCategories();
        for (const auto& cat : categories) {
            auto cat_units = units.getUnitsInCategory(cat);
            std::cout << std::setw(25) << std::left << cat
                     << " (" << cat_units.size() << " units)\n";
        }
        std::cout << "\nUse: chpt_unit_converter --list <category> to see units in a category\n\n";
        return;
    }

    auto cat_units = units.getUnitsInCategory(category);
    if (cat_units.empty()) {
        std::cout << "Category '" << category << "' not found.\n";
        std::cout << "Use: chpt_unit_converter --list to see available categories\n\n";
        return;
    }

    std::cout << "Units in category: " << category << "\n";
    std::cout << std::string(50, '=') << "\n\n";
    std::cout << std::setw(25) << std::left << "Name"
             << std::setw(12) << "Symbol"
             << "To SI Base\n";
    std::cout << std::string(50, '-') << "\n";

    for (const auto* unit : cat_units) {
        std::cout << std::setw(25) << std::left << unit->name
                 << std::setw(12) << unit->symbol
                 << std::scientific << std::setprecision(6) << unit->to_base;
        if (unit->offset != 0.0) {
            std::cout << " (offset: " << unit->offset << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void listDisplayUnits(const UnitSystem& units) {
    static const char* quantities[] = {
        "lift", "length", "area", "flow", "velocity", "energy_density", "energy",
        "observed_flow_area", "displacement", "port_volume", "power", "piston_speed"
    };

    std::cout << "\nScreen Display Units:\n";
    std::cout << "=====================\n\n";
    std::cout << std::setw(22) << std::left << "Quantity"
              << std::setw(16) << "SI" << "US\n";
    std::cout << std::string(50, '-') << "\n";
    for (const char* q : quantities) {
        std::cout << std::setw(22) << std::left << q
                  << std::setw(16) << units.getDisplayUnit(q, UnitBasis::SI)
                  << units.getDisplayUnit(q, UnitBasis::US) << "\n";
    }
    std::cout << "\n";
}

int performConversion(const UnitSystem& units, double value,
                      const std::string& from_unit,
                      const std::string& to_unit) {
    if (!units.hasUnit(from_unit)) {
        std::cerr << "Error: Unknown source unit '" << from_unit << "'\n";
        std::cerr << "Use --list to see available units\n";
        return 1;
    }

    if (!units.hasUnit(to_unit)) {
        std::cerr << "Error: Unknown destination unit '" << to_unit << "'\n";
        std::cerr << "Use --list to see available units\n";
        return 1;
    }

    if (!units.areCompatible(from_unit, to_unit)) {
        auto from_dim = units.getDimension(from_unit);
        auto to_dim = units.getDimension(to_unit);
        std::cerr << "Error: Incompatible units\n";
        std::cerr << "  " << from_unit << " has dimension: " << from_dim.toString() << "\n";
        std::cerr << "  " << to_unit << " has dimension: " << to_dim.toString() << "\n";
        return 1;
    }

    double result = units.convert(value, from_unit, to_unit);
    double base_value = units.toBase(value, from_unit);

    std::cout << "\n";
    std::cout << "Conversion Result:\n";
    std::cout << "==================\n\n";
    std::cout << "  Input:   " << units.formatValue(value, from_unit, 9) << "\n";
    std::cout << "  Output:  " << units.formatValue(result, to_unit, 9) << "\n";
    std::cout << "\n";
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "  SI Base: " << base_value << " ("
              << units.getDimension(from_unit).toString() << ")\n";
    std::cout << "\n";

    if (value != 0.0 && units.getUnit(from_unit)->offset == 0.0) {
        double factor = result / value;
        std::cout << "Conversion Factor: 1 " << from_unit << " = "
                 << std::scientific << std::setprecision(9) << factor
                 << " " << to_unit << "\n\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    const UnitSystem& units = UnitSystemManager::getInstance();

    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (argc >= 2 && strcmp(argv[1], "--list") == 0) {
        if (argc == 2) {
            listUnits(units);
        } else {
            listUnits(units, argv[2]);
        }
        return 0;
    }

    if (argc == 2 && strcmp(argv[1], "--all") == 0) {
        units.printDatabase(std::cout);
        return 0;
    }

    if (argc == 2 && strcmp(argv[1], "--display") == 0) {
        listDisplayUnits(units);
        return 0;
    }

    if (argc != 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    double value = 0.0;
    try {
        value = std::stod(argv[1]);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value '" << argv[1] << "'\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    }

    try {
        return performConversion(units, value, argv[2], argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
