#ifndef ERROR_TYPES_HPP
#define ERROR_TYPES_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace CHPT {

/**
 * @brief Geometrically or physically impossible input
 *
 * Negative lengths, zero divisors, non-positive depressions and similar.
 * Raised synchronously by the formula layer; the series layer turns it
 * into an "unavailable" entry for the affected point only.
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/**
 * @brief Invalid valve or port geometry (diameters, lift, seat, window)
 */
class InvalidGeometry : public InvalidArgument {
public:
    explicit InvalidGeometry(const std::string& msg)
        : InvalidArgument(msg) {}
};

/**
 * @brief A required header-level input is missing
 *
 * Header aggregates fail hard on missing geometry, unlike per-point series.
 */
class MissingInput : public std::runtime_error {
public:
    explicit MissingInput(const std::string& field)
        : std::runtime_error("Missing required input: " + field), field_(field) {}

    const std::string& getField() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Live calibration constants disagree with their frozen anchors
 *
 * Fatal. Only raised by CalibrationRegistry::verify(); callers must stop.
 */
class CalibrationDrift : public std::runtime_error {
public:
    CalibrationDrift(const std::string& msg, const std::vector<std::string>& names)
        : std::runtime_error(msg), drifted_(names) {}

    const std::vector<std::string>& getDriftedNames() const { return drifted_; }

private:
    std::vector<std::string> drifted_;
};

} // namespace CHPT

#endif // ERROR_TYPES_HPP
