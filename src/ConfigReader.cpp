#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CHPT {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Domain Parsing Methods
// =============================================================================

CalibrationConfig ConfigReader::parseCalibrationConfig() const {
    CalibrationConfig config;

    std::string profile = getString("calibration", "profile", "report");
    try {
        config.profile = parseCalibrationProfile(profile);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << " - using 'report'" << std::endl;
        config.profile = CalibrationProfile::REPORT;
    }

    config.pinned = getBool("calibration", "pinned", true);

    for (const auto& pair : getSectionData("calibration.overrides")) {
        try {
            config.overrides[pair.first] = std::stod(pair.second);
        } catch (const std::exception&) {
            std::cerr << "Warning: Ignoring calibration override " << pair.first
                      << " = '" << pair.second << "' (not a number)" << std::endl;
        }
    }

    return config;
}

EffectiveAreaOptions ConfigReader::parseAreaModelConfig() const {
    EffectiveAreaOptions options;
    if (!hasSection("area_model")) {
        return options;
    }

    std::string method = getString("area_model", "method", toString(options.method));
    try {
        options.method = parseAreaBlendMethod(method);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << " - using '"
                  << toString(options.method) << "'" << std::endl;
    }

    options.smoothmin_n = getInt("area_model", "smoothmin_n", options.smoothmin_n);
    if (options.smoothmin_n < 1) {
        std::cerr << "Warning: smoothmin_n must be >= 1 - using 6" << std::endl;
        options.smoothmin_n = 6;
    }
    options.logistic_ld0 = getDouble("area_model", "logistic_ld0", options.logistic_ld0);
    options.logistic_k = getDouble("area_model", "logistic_k", options.logistic_k);

    return options;
}

std::optional<AirState> ConfigReader::parseReferenceAir() const {
    if (!hasSection("reference_air")) {
        return std::nullopt;
    }

    AirState state(getDouble("reference_air", "pressure_pa", AirConstants::P_STD),
                   getDouble("reference_air", "temperature_k", AirConstants::T_STD),
                   getDouble("reference_air", "humidity", 0.0));
    state.validate();
    return state;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);

    file << "# CHPT Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[calibration]\n";
    file << "profile = report                     # report (default) or screen\n";
    file << "pinned = true                        # verify() fails on any drift\n\n";

    file << "[calibration.overrides]\n";
    file << "# K_CFM_TO_HP = 0.43\n\n";

    file << "[area_model]\n";
    file << "method = logistic                    # logistic or smoothmin\n";
    file << "smoothmin_n = 6\n";
    file << "logistic_ld0 = 0.30\n";
    file << "logistic_k = 12.0\n\n";

    file << "[reference_air]\n";
    file << "pressure_pa = 101325.0\n";
    file << "temperature_k = 293.15\n";
    file << "humidity = 0.0\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    static const std::vector<std::string> known = {
        "calibration", "calibration.overrides", "area_model", "reference_air"
    };
    for (const auto& section : getSections()) {
        if (std::find(known.begin(), known.end(), section) == known.end()) {
            result.warnings.push_back("Unknown section [" + section + "] ignored");
        }
    }

    if (hasKey("calibration", "profile")) {
        try {
            parseCalibrationProfile(getString("calibration", "profile"));
        } catch (const std::invalid_argument& e) {
            result.errors.push_back(e.what());
            result.valid = false;
        }
    }

    CalibrationRegistry anchors;
    for (const auto& key : getKeys("calibration.overrides")) {
        if (!anchors.has(key)) {
            result.errors.push_back("Unknown calibration constant: " + key);
            result.valid = false;
        }
    }

    if (hasKey("area_model", "method")) {
        try {
            parseAreaBlendMethod(getString("area_model", "method"));
        } catch (const std::invalid_argument& e) {
            result.errors.push_back(e.what());
            result.valid = false;
        }
    }

    if (hasSection("reference_air")) {
        double humidity = getDouble("reference_air", "humidity", 0.0);
        if (humidity < 0.0 || humidity > 1.0) {
            result.errors.push_back("Invalid reference humidity (must be 0-1)");
            result.valid = false;
        }
        if (getDouble("reference_air", "temperature_k", AirConstants::T_STD) <= 0.0) {
            result.errors.push_back("Invalid reference temperature (must be > 0 K)");
            result.valid = false;
        }
        if (getDouble("reference_air", "pressure_pa", AirConstants::P_STD) <= 0.0) {
            result.errors.push_back("Invalid reference pressure (must be > 0 Pa)");
            result.valid = false;
        }
    }

    return result;
}

} // namespace CHPT
