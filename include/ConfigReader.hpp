#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "AirState.hpp"
#include "CalibrationRegistry.hpp"
#include "ValveGeometry.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <istream>

namespace CHPT {

/**
 * @brief INI-style configuration reader
 *
 * Recognized sections:
 *
 * [calibration]            profile = report|screen, pinned = true|false
 * [calibration.overrides]  CONSTANT_NAME = value
 * [area_model]             method, smoothmin_n, logistic_ld0, logistic_k
 * [reference_air]          pressure_pa, temperature_k, humidity
 *
 * Lines starting with # or ; are comments; inline # comments are stripped.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration from in-memory text (same syntax as a file)
    bool loadString(const std::string& text);

    // =========================================================================
    // Domain Parsing Methods
    // =========================================================================

    /**
     * @brief Calibration profile, pinning and overrides
     *
     * Unknown profiles fall back to REPORT with a warning; override values
     * that do not parse as numbers are skipped with a warning.
     */
    CalibrationConfig parseCalibrationConfig() const;

    /**
     * @brief Effective-area blend options (defaults when the section is absent)
     */
    EffectiveAreaOptions parseAreaModelConfig() const;

    /**
     * @brief Reference air state, if the section is present
     * @throws InvalidArgument if the configured state is out of range
     */
    std::optional<AirState> parseReferenceAir() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Utility Methods
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace CHPT

#endif // CONFIG_READER_HPP
