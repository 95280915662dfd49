/**
 * @file CalibrationRegistry.hpp
 * @brief Named, anchor-documented calibration constants
 *
 * Every empirical constant of the screens (port distribution factor,
 * HP/kW limit slopes, E/I ratio model, GUI-fixed speed of sound and
 * density) lives here together with the frozen anchor value it was
 * tuned to and a note on where the anchor came from.
 *
 * Two anchor tables are kept:
 * - REPORT: the frozen table of the legacy report screens (default)
 * - SCREEN: the manually matched main-screen constants
 *
 * Computations never read a global; they receive a registry reference.
 * The process-wide instance is only a convenience for tools.
 */

#ifndef CALIBRATION_REGISTRY_HPP
#define CALIBRATION_REGISTRY_HPP

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace CHPT {

/**
 * @brief Anchor table a registry is built from
 */
enum class CalibrationProfile {
    REPORT,     // Frozen anchor table of the report screens
    SCREEN      // Manually matched main-screen constants
};

CalibrationProfile parseCalibrationProfile(const std::string& str);
std::string toString(CalibrationProfile profile);

/**
 * @brief One calibration constant
 */
struct CalibrationConstant {
    std::string name;
    double value = 0.0;         // Live value
    double anchor = 0.0;        // Frozen reference value
    std::string unit;
    std::string origin;         // Where the anchor came from

    bool isAtAnchor() const { return value == anchor; }
};

/**
 * @brief Audit record of one override
 */
struct CalibrationOverride {
    std::string name;
    double old_value;
    double new_value;
    std::string reason;
};

/**
 * @brief Calibration settings as read from a configuration file
 */
struct CalibrationConfig {
    CalibrationProfile profile = CalibrationProfile::REPORT;
    bool pinned = true;
    std::map<std::string, double> overrides;
};

/**
 * @brief A constant whose value differs between two profiles
 */
struct ProfileDifference {
    std::string name;
    double value_a;
    double value_b;
};

/**
 * @brief Same quantity calibrated differently in the US and SI screens
 *
 * Both sides are expressed in US units per unit of the driving quantity,
 * e.g. hp per CFM, so that they can be compared directly.
 */
struct UnitDiscrepancy {
    std::string quantity;
    std::string unit;
    double us_factor;
    double si_factor;
    double percent;             // 100 * (si - us) / us
};

/**
 * @brief Registry of named calibration constants
 *
 * Constants start at their anchors. The only mutation path is
 * overrideValue(), which records an audit entry and logs a warning.
 * While pinned, verify() raises CalibrationDrift for any constant whose
 * value differs from its anchor.
 *
 * Concurrent reads are safe. Overrides are not synchronized: apply them
 * before any concurrent computation starts.
 */
class CalibrationRegistry {
public:
    explicit CalibrationRegistry(CalibrationProfile profile = CalibrationProfile::REPORT);

    CalibrationProfile getProfile() const { return profile_; }

    /**
     * @brief Live value of a constant
     * @throws std::out_of_range for unknown names
     */
    double get(const std::string& name) const;

    bool has(const std::string& name) const;

    /**
     * @throws std::out_of_range for unknown names
     */
    const CalibrationConstant& getConstant(const std::string& name) const;

    std::vector<std::string> getNames() const;

    /**
     * @brief Change the live value of a constant
     *
     * The anchor is left untouched, so a pinned registry will fail
     * verification afterwards.
     *
     * @throws std::out_of_range for unknown names
     * @throws InvalidArgument for non-finite values
     */
    void overrideValue(const std::string& name, double value, const std::string& reason);

    const std::vector<CalibrationOverride>& getAuditLog() const { return audit_log_; }

    /**
     * @brief Names of constants whose value differs from the anchor
     */
    std::vector<std::string> findDrift() const;

    /**
     * @brief Compare live values against anchors
     * @throws CalibrationDrift if pinned and any constant drifted
     */
    void verify() const;

    /**
     * @brief Restore every value to its anchor (audited)
     */
    void resetToAnchors();

    void setPinned(bool pinned) { pinned_ = pinned; }
    bool isPinned() const { return pinned_; }

    /**
     * @brief Load a profile's anchor table, then apply pinning and overrides
     *
     * Switching profile replaces all constants; the audit log is kept.
     */
    void applyConfig(const CalibrationConfig& config);

    /**
     * @brief US vs SI calibrations of the main-screen power limits and a0
     */
    std::vector<UnitDiscrepancy> crossUnitDiscrepancies() const;

    /**
     * @brief Constants whose anchors differ between two profiles
     */
    static std::vector<ProfileDifference> compareProfiles(CalibrationProfile a,
                                                          CalibrationProfile b);

    /**
     * @brief Anchor table of a profile
     */
    static std::vector<CalibrationConstant> anchorTable(CalibrationProfile profile);

    void print(std::ostream& os) const;

private:
    CalibrationProfile profile_;
    bool pinned_;
    std::map<std::string, CalibrationConstant> constants_;
    std::vector<CalibrationOverride> audit_log_;

    void loadProfile(CalibrationProfile profile);
    CalibrationConstant& lookup(const std::string& name);
};

/**
 * @brief Process-wide registry, initialized from the REPORT anchors on first use
 */
class CalibrationRegistryManager {
public:
    static CalibrationRegistry& getInstance() {
        static CalibrationRegistry instance;
        return instance;
    }

private:
    CalibrationRegistryManager() = default;
};

} // namespace CHPT

#endif // CALIBRATION_REGISTRY_HPP
