#include "ValveGeometry.hpp"
#include "ErrorTypes.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace CHPT {

AreaBlendMethod parseAreaBlendMethod(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "smoothmin" || lower == "smooth_min") return AreaBlendMethod::SMOOTH_MIN;
    if (lower == "logistic" || lower == "blend") return AreaBlendMethod::LOGISTIC;
    throw std::invalid_argument("Unknown area blend method: " + str);
}

std::string toString(AreaBlendMethod method) {
    return method == AreaBlendMethod::SMOOTH_MIN ? "smoothmin" : "logistic";
}

// =============================================================================
// ValveGeometry / PortWindow
// =============================================================================

void ValveGeometry::validate() const {
    if (!(valve_diameter > 0.0)) {
        throw InvalidGeometry("valve diameter must be > 0");
    }
    if (stem_diameter < 0.0) {
        throw InvalidGeometry("stem diameter must be >= 0");
    }
    if (throat_diameter) {
        if (!(*throat_diameter > 0.0) || stem_diameter >= *throat_diameter) {
            throw InvalidGeometry("throat diameter must satisfy 0 <= d_stem < d_throat");
        }
    }
    if (seat_width && *seat_width < 0.0) {
        throw InvalidGeometry("seat width must be >= 0");
    }
    if (seat_angle_deg && (*seat_angle_deg <= 0.0 || *seat_angle_deg >= 90.0)) {
        throw InvalidGeometry("seat angle must be within (0, 90) deg");
    }
}

double ValveGeometry::throatArea() const {
    if (!throat_diameter) {
        throw InvalidGeometry("throat diameter required for throat area");
    }
    return CHPT::throatArea(*throat_diameter, stem_diameter);
}

double ValveGeometry::seatLiftThreshold() const {
    if (!hasSeat()) {
        return std::numeric_limits<double>::infinity();
    }
    return CHPT::seatLiftThreshold(*seat_width, *seat_angle_deg);
}

double PortWindow::area() const {
    return portWindowArea(width, height, r_top, r_bot);
}

// =============================================================================
// Basic areas
// =============================================================================

double curtainArea(double d_valve, double lift) {
    if (!(d_valve > 0.0) || lift < 0.0) {
        throw InvalidGeometry("curtainArea: requires d_valve > 0 and lift >= 0");
    }
    return M_PI * d_valve * lift;
}

double throatArea(double d_throat, double d_stem) {
    if (!(d_throat > 0.0) || d_stem < 0.0 || d_stem >= d_throat) {
        throw InvalidGeometry("throatArea: requires d_throat > 0 and 0 <= d_stem < d_throat");
    }
    return M_PI * (d_throat * d_throat - d_stem * d_stem) / 4.0;
}

double ldRatio(double lift, double d_valve) {
    if (!(d_valve > 0.0)) {
        throw InvalidGeometry("ldRatio: requires d_valve > 0");
    }
    return lift / d_valve;
}

double ldAxisTick(double ld) {
    return std::ceil(ld * 100.0) / 100.0;
}

double seatLiftThreshold(double seat_width, double seat_angle_deg) {
    if (seat_width < 0.0) {
        throw InvalidGeometry("seatLiftThreshold: seat width must be >= 0");
    }
    double theta = std::max(1e-6, seat_angle_deg * M_PI / 180.0);
    return seat_width * std::tan(theta);
}

double portWindowArea(double width, double height, double r_top, double r_bot) {
    if (!(width > 0.0) || !(height > 0.0) || r_top < 0.0 || r_bot < 0.0) {
        throw InvalidGeometry("portWindowArea: requires width, height > 0 and radii >= 0");
    }
    double area = width * height - 2.0 * (1.0 - M_PI / 4.0) * (r_top * r_top + r_bot * r_bot);
    if (!(area > 0.0)) {
        throw InvalidGeometry("portWindowArea: corner radii exceed the window");
    }
    return area;
}

// =============================================================================
// Blends
// =============================================================================

double areaSmoothMin(double a1, double a2, int n) {
    if (a1 < 0.0 || !(a2 > 0.0)) {
        throw InvalidArgument("areaSmoothMin: requires a1 >= 0 and a2 > 0");
    }
    if (n < 1) {
        throw InvalidArgument("areaSmoothMin: requires n >= 1");
    }
    if (a1 == 0.0) return 0.0;

    // Scale by the smaller area so the powers stay finite for tiny inputs
    double lo = std::min(a1, a2);
    double hi = std::max(a1, a2);
    double ratio = std::pow(lo / hi, n);
    return lo * std::pow(1.0 + ratio, -1.0 / n);
}

double areaLogistic(double a1, double a2, double ld, double ld0, double k) {
    if (a1 < 0.0 || !(a2 > 0.0)) {
        throw InvalidArgument("areaLogistic: requires a1 >= 0 and a2 > 0");
    }
    double w = 1.0 / (1.0 + std::exp(-k * (ld - ld0)));
    return (1.0 - w) * a1 + w * a2;
}

double blendAreas(double a1, double a2, double ld, const EffectiveAreaOptions& options) {
    if (options.method == AreaBlendMethod::SMOOTH_MIN) {
        return areaSmoothMin(a1, a2, options.smoothmin_n);
    }
    return areaLogistic(a1, a2, ld, options.logistic_ld0, options.logistic_k);
}

double seatLimitedArea(double lift, const ValveGeometry& geometry,
                       const EffectiveAreaOptions& options) {
    geometry.validate();
    if (lift < 0.0) {
        throw InvalidGeometry("seatLimitedArea: lift must be >= 0");
    }
    if (!geometry.hasSeat()) {
        throw InvalidGeometry("seatLimitedArea: seat angle and width required");
    }

    double a_throat = geometry.throatArea();
    double threshold = geometry.seatLiftThreshold();
    if (lift <= threshold) {
        return curtainArea(geometry.valve_diameter, lift);
    }

    double a_seat = curtainArea(geometry.valve_diameter, threshold);
    double ld = ldRatio(lift, geometry.valve_diameter);
    return blendAreas(a_seat, a_throat, ld, options);
}

double effectiveArea(double lift, const ValveGeometry& geometry,
                     const EffectiveAreaOptions& options,
                     const std::optional<PortWindow>& window) {
    geometry.validate();
    if (lift < 0.0) {
        throw InvalidGeometry("effectiveArea: lift must be >= 0");
    }

    double a_throat = geometry.throatArea();
    double cap = a_throat;
    if (window) {
        cap = std::min(cap, window->area());
    }

    // Closed valve passes nothing regardless of the blend weight
    if (lift == 0.0) return 0.0;

    double capped_lift = std::min(lift, geometry.seatLiftThreshold());
    double a_curtain = curtainArea(geometry.valve_diameter, capped_lift);
    double ld = ldRatio(lift, geometry.valve_diameter);

    double a_eff = blendAreas(a_curtain, a_throat, ld, options);
    return std::clamp(a_eff, 0.0, cap);
}

double effectiveAreaMultiValve(int n_valves, double lift, const ValveGeometry& geometry,
                               const EffectiveAreaOptions& options,
                               const std::optional<PortWindow>& window) {
    if (n_valves < 1) {
        throw InvalidGeometry("effectiveAreaMultiValve: requires n_valves >= 1");
    }
    double per_valve = effectiveArea(lift, geometry, options);
    double total = std::min(n_valves * per_valve, n_valves * geometry.throatArea());
    if (window) {
        total = std::min(total, window->area());
    }
    return total;
}

// =============================================================================
// Port volume / centreline length / mean area
// =============================================================================

double portVolumeFromAreaLength(double mean_area, double length) {
    if (mean_area < 0.0 || length < 0.0) {
        throw InvalidArgument("portVolumeFromAreaLength: requires non-negative inputs");
    }
    return mean_area * length;
}

double meanAreaFromVolumeLength(double volume, double length) {
    if (length == 0.0) {
        throw InvalidArgument("meanAreaFromVolumeLength: length must be != 0");
    }
    return volume / length;
}

double lengthFromVolumeArea(double volume, double mean_area) {
    if (mean_area == 0.0) {
        throw InvalidArgument("lengthFromVolumeArea: mean area must be != 0");
    }
    return volume / mean_area;
}

PortDescriptor PortDescriptor::completed() const {
    for (const auto& member : {volume_cc, length_mm, area_mm2}) {
        if (member && !(*member > 0.0)) {
            throw InvalidArgument("PortDescriptor: volume, length and area must be > 0");
        }
    }

    PortDescriptor out = *this;
    if (!volume_cc && length_mm && area_mm2) {
        out.volume_cc = portVolumeFromAreaLength(*area_mm2, *length_mm) / 1000.0;
    } else if (volume_cc && !length_mm && area_mm2) {
        out.length_mm = lengthFromVolumeArea(*volume_cc * 1000.0, *area_mm2);
    } else if (volume_cc && length_mm && !area_mm2) {
        out.area_mm2 = meanAreaFromVolumeLength(*volume_cc * 1000.0, *length_mm);
    }
    return out;
}

} // namespace CHPT
